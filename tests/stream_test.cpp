// tests/stream_test.cpp - Writable stream and storage facade tests
#include "test_support.hpp"
#include "core/android_fs.hpp"
#include <unistd.h>

using namespace safio;

// Wires a facade to a FakeBridge. The pool is declared after everything
// its tasks touch so it drains first on destruction.
struct Fixture {
    TempDir dir;
    FakeBridge bridge;
    InlineRunner runner;
    ScratchFiles scratch;
    WorkerPool pool;
    AndroidFs afs;

    explicit Fixture(int api_level = 35)
        : bridge(dir.path, api_level),
          scratch(make_scratch_resolver(bridge, runner, Config())),
          pool(2),
          afs(bridge, scratch, runner, pool, {cloud_prefix(dir.path)}) {}

    // References under <dir>/cloud behave like a provider that drops raw writes
    static std::string cloud_prefix(const fs::path& root) {
        return EntryRef::from_path(root / "cloud").uri;
    }

    EntryRef cloud(const std::string& name) {
        fs::create_directories(dir / "cloud");
        return EntryRef::from_path(dir / ("cloud/" + name));
    }

    EntryRef local(const std::string& name) { return EntryRef::from_path(dir / name); }

    size_t scratch_files() { return count_files(scratch.temp_root()); }
};

TEST(indirect_write_detection) {
    Fixture f;
    CHECK(f.afs.needs_indirect_write(
        EntryRef{"content://com.google.android.apps.docs.storage/document/acc%3D1%3Bdoc%3D2",
                 std::nullopt}));
    CHECK(f.afs.needs_indirect_write(f.cloud("a.txt")));
    CHECK(!f.afs.needs_indirect_write(f.local("a.txt")));
    CHECK(!f.afs.needs_indirect_write(
        EntryRef{"content://com.android.externalstorage.documents/document/primary%3Aa", std::nullopt}));
}

TEST(direct_stream_writes_target) {
    Fixture f;
    write_text(f.dir / "a.txt", "previous longer contents");

    WritableStream stream = f.afs.create_writable_stream_auto(f.local("a.txt"));
    CHECK(!stream.is_buffered());
    stream.write(std::string("hello"));
    stream.flush();
    stream.sync_all();
    stream.reflect();

    CHECK(stream.is_disposed());
    CHECK_EQ(read_text(f.dir / "a.txt"), std::string("hello"));
    CHECK_EQ(f.bridge.count(bridge_cmd::COPY_FILE), 0u);
}

TEST(buffered_stream_reflects_to_target) {
    Fixture f;
    EntryRef target = f.cloud("report.csv");
    write_text(f.dir / "cloud/report.csv", "stale");

    WritableStream stream = f.afs.create_writable_stream_auto(target);
    CHECK(stream.is_buffered());
    CHECK(f.bridge.modes().empty());
    CHECK_EQ(f.scratch_files(), 1u);

    stream.write(std::string("a,b\n"));
    stream.write(std::string("1,2\n"));
    stream.sync_data();
    // The target is untouched until reflect
    CHECK_EQ(read_text(f.dir / "cloud/report.csv"), std::string("stale"));

    stream.reflect();
    CHECK_EQ(read_text(f.dir / "cloud/report.csv"), std::string("a,b\n1,2\n"));
    CHECK_EQ(f.scratch_files(), 0u);
    CHECK_EQ(f.bridge.count(bridge_cmd::COPY_FILE), 1u);
}

TEST(forced_buffered_stream) {
    Fixture f;
    WritableStream stream = f.afs.create_writable_stream_via_bridge(f.local("b.txt"));
    CHECK(stream.is_buffered());
    stream.write(std::string("via bridge"));
    stream.reflect();
    CHECK_EQ(read_text(f.dir / "b.txt"), std::string("via bridge"));
    CHECK_EQ(f.scratch_files(), 0u);
}

TEST(dispose_leaves_target_unchanged) {
    Fixture f;
    write_text(f.dir / "cloud/keep.txt", "original");

    WritableStream stream = f.afs.create_writable_stream_auto(f.cloud("keep.txt"));
    stream.write(std::string("replacement"));
    stream.dispose_without_reflect();

    CHECK_EQ(read_text(f.dir / "cloud/keep.txt"), std::string("original"));
    CHECK_EQ(f.scratch_files(), 0u);
    CHECK_EQ(f.bridge.count(bridge_cmd::COPY_FILE), 0u);
}

TEST(disposed_stream_rejects_io) {
    Fixture f;
    WritableStream stream = f.afs.create_writable_stream_via_bridge(f.local("c.txt"));
    stream.dispose_without_reflect();

    CHECK_ERROR(stream.write(std::string("x")), ErrorKind::InvalidState);
    CHECK_ERROR(stream.flush(), ErrorKind::InvalidState);
    CHECK_ERROR(stream.sync_all(), ErrorKind::InvalidState);
    // Terminal calls on a disposed stream do nothing
    stream.reflect();
    stream.dispose_without_reflect();
    CHECK(!fs::exists(f.dir / "c.txt"));
}

TEST(dispose_removes_scratch_when_close_fails) {
    Fixture f;
    ScratchFile file = f.scratch.create();
    // A descriptor that is already closed makes close() fail with EBADF
    int fd = file.handle.release();
    ::close(fd);

    StreamContext ctx{&f.bridge, &f.scratch, &f.runner, &f.pool};
    WritableStream stream(ctx, WritableStream::Buffered{FileHandle(fd), file.path,
                                                        f.cloud("i.txt")});
    CHECK_ERROR(stream.dispose_without_reflect(), ErrorKind::LocalIoFailure);

    CHECK(stream.is_disposed());
    CHECK(!fs::exists(file.path));
    CHECK(!fs::exists(f.dir / "cloud/i.txt"));
}

TEST(reflect_runs_every_step_after_failure) {
    Fixture f;
    f.bridge.failing_commands = {bridge_cmd::COPY_FILE};

    WritableStream stream = f.afs.create_writable_stream_auto(f.cloud("d.txt"));
    stream.write(std::string("lost"));
    CHECK_ERROR(stream.reflect(), ErrorKind::BridgeInvocationFailed);

    // Scratch removal still ran
    CHECK_EQ(f.scratch_files(), 0u);
    CHECK(stream.is_disposed());
}

TEST(implicit_disposal_reflects_in_background) {
    Fixture f;
    {
        WritableStream stream = f.afs.create_writable_stream_auto(f.cloud("e.txt"));
        stream.write(std::string("saved anyway"));
    }
    f.pool.drain();

    CHECK_EQ(read_text(f.dir / "cloud/e.txt"), std::string("saved anyway"));
    CHECK_EQ(f.scratch_files(), 0u);
}

TEST(implicit_disposal_swallows_errors) {
    Fixture f;
    f.bridge.failing_commands = {bridge_cmd::COPY_FILE};
    {
        WritableStream stream = f.afs.create_writable_stream_auto(f.cloud("f.txt"));
        stream.write(std::string("nowhere to go"));
    }
    f.pool.drain();
    CHECK_EQ(f.scratch_files(), 0u);
    CHECK(!fs::exists(f.dir / "cloud/f.txt"));
}

TEST(implicit_disposal_of_direct_stream) {
    Fixture f;
    {
        WritableStream stream = f.afs.create_writable_stream_auto(f.local("g.txt"));
        stream.write(std::string("direct"));
    }
    f.pool.drain();
    CHECK_EQ(read_text(f.dir / "g.txt"), std::string("direct"));
    CHECK_EQ(f.bridge.count(bridge_cmd::COPY_FILE), 0u);
}

TEST(moved_stream_keeps_state) {
    Fixture f;
    WritableStream first = f.afs.create_writable_stream_auto(f.cloud("h.txt"));
    first.write(std::string("part one, "));
    WritableStream second = std::move(first);
    CHECK(first.is_disposed());
    CHECK(second.is_buffered());
    second.write(std::string("part two"));
    second.reflect();
    CHECK_EQ(read_text(f.dir / "cloud/h.txt"), std::string("part one, part two"));
}

TEST(facade_file_operations) {
    Fixture f;
    EntryRef plain = f.local("notes.txt");
    EntryRef cloud = f.cloud("notes.txt");

    f.afs.write_file(plain, "first draft");
    CHECK_EQ(f.afs.read_file_to_string(plain), std::string("first draft"));
    f.afs.write_file(plain, "short");
    CHECK_EQ(f.afs.read_file_to_string(plain), std::string("short"));

    f.afs.write_file(cloud, "in the cloud");
    CHECK_EQ(read_text(f.dir / "cloud/notes.txt"), std::string("in the cloud"));

    EntryRef copy = f.local("copy.txt");
    f.afs.copy_file(plain, copy);
    CHECK_EQ(f.afs.read_file_to_string(copy), std::string("short"));
    CHECK_EQ(f.afs.get_name(copy), std::string("copy.txt"));
    CHECK_EQ(f.afs.get_len(copy), 5u);
    CHECK(f.afs.get_entry_kind(copy) == EntryKind::File);
    CHECK(f.afs.get_entry_kind(f.local("cloud")) == EntryKind::Dir);

    f.afs.remove_file(copy);
    CHECK(!fs::exists(f.dir / "copy.txt"));
    CHECK_ERROR(f.afs.remove_file(copy), ErrorKind::BridgeInvocationFailed);
}

TEST(api_level_requirement) {
    Fixture f(28);
    CHECK_EQ(f.afs.api_level(), 28);
    f.afs.require_api_level(26);
    CHECK_ERROR(f.afs.require_api_level(API_LEVEL_ANDROID_10), ErrorKind::UnsupportedPlatform);
}

int main() {
    std::cout << "=== stream tests ===\n";

    RUN_TEST(indirect_write_detection);
    RUN_TEST(direct_stream_writes_target);
    RUN_TEST(buffered_stream_reflects_to_target);
    RUN_TEST(forced_buffered_stream);
    RUN_TEST(dispose_leaves_target_unchanged);
    RUN_TEST(disposed_stream_rejects_io);
    RUN_TEST(dispose_removes_scratch_when_close_fails);
    RUN_TEST(reflect_runs_every_step_after_failure);
    RUN_TEST(implicit_disposal_reflects_in_background);
    RUN_TEST(implicit_disposal_swallows_errors);
    RUN_TEST(implicit_disposal_of_direct_stream);
    RUN_TEST(moved_stream_keeps_state);
    RUN_TEST(facade_file_operations);
    RUN_TEST(api_level_requirement);

    return report();
}
