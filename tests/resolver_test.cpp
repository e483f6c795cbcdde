// tests/resolver_test.cpp - Child reference resolution tests
#include "test_support.hpp"
#include "core/resolver.hpp"

using namespace safio;

static const char* EXTERNAL_TREE =
    "content://com.android.externalstorage.documents/tree/primary%3AApp/document/primary%3AApp";

TEST(rejects_escaping_segments_without_calls) {
    TempDir dir;
    FakeBridge bridge(dir.path);
    InlineRunner runner;
    PathResolver resolver(bridge, runner);
    EntryRef base = EntryRef::from_path("/storage/emulated/0/App");
    EntryRef opaque{"content://com.example.cloud/document/17", std::nullopt};

    CHECK_ERROR(resolver.resolve(base, "../etc"), ErrorKind::InvalidRelativePath);
    CHECK_ERROR(resolver.resolve(base, "a/./b"), ErrorKind::InvalidRelativePath);
    CHECK_ERROR(resolver.resolve(base, "/etc/passwd"), ErrorKind::InvalidRelativePath);
    CHECK_ERROR(resolver.resolve(opaque, "x/..", EntryKind::File),
                ErrorKind::InvalidRelativePath);
    CHECK_EQ(bridge.call_count(), 0u);
}

TEST(file_base_joins_directly) {
    TempDir dir;
    FakeBridge bridge(dir.path);
    InlineRunner runner;
    PathResolver resolver(bridge, runner);

    EntryRef base = EntryRef::from_path("/storage/emulated/0/App");
    EntryRef child = resolver.resolve(base, "notes/todo.txt");
    CHECK_EQ(child.uri, std::string("file:///storage/emulated/0/App/notes/todo.txt"));

    // Repeated and trailing separators collapse
    CHECK_EQ(resolver.resolve(base, "notes//todo.txt/").uri, child.uri);
    CHECK_EQ(resolver.resolve(EntryRef::from_path("/storage/emulated/0/App/"), "notes/todo.txt").uri,
             child.uri);
    CHECK_EQ(bridge.call_count(), 0u);
}

TEST(empty_relative_path_is_base) {
    TempDir dir;
    FakeBridge bridge(dir.path);
    InlineRunner runner;
    PathResolver resolver(bridge, runner);

    EntryRef base{EXTERNAL_TREE, std::string("content://grant")};
    EntryRef same = resolver.resolve(base, "");
    CHECK(same == base);
    CHECK(same.root_grant == base.root_grant);
    CHECK_EQ(bridge.call_count(), 0u);
}

TEST(structured_provider_encodes_child) {
    TempDir dir;
    FakeBridge bridge(dir.path);
    InlineRunner runner;
    PathResolver resolver(bridge, runner);

    EntryRef base{EXTERNAL_TREE, std::string("content://grant")};
    EntryRef child = resolver.resolve(base, "notes/my file.txt");
    CHECK_EQ(child.uri, std::string(EXTERNAL_TREE) + "%2Fnotes%2Fmy%20file.txt");
    CHECK(child.root_grant == base.root_grant);

    EntryRef doc{"content://com.android.externalstorage.documents/document/primary%3ADownload",
                 std::nullopt};
    CHECK_EQ(resolver.resolve(doc, "a.txt").uri, doc.uri + "%2Fa.txt");
    CHECK_EQ(bridge.call_count(), 0u);
}

TEST(hierarchical_pattern_detection) {
    CHECK(is_hierarchical_document(EntryRef{EXTERNAL_TREE, std::nullopt}));
    CHECK(!is_hierarchical_document(
        EntryRef{"content://com.android.externalstorage.documents/tree/primary%3AApp", std::nullopt}));
    CHECK(!is_hierarchical_document(
        EntryRef{"content://com.google.android.apps.docs.storage/document/acc%3D1", std::nullopt}));
    CHECK(!is_hierarchical_document(EntryRef::from_path("/sdcard")));
}

// readDir answers for a two-level opaque provider tree
static json::Value opaque_listing(const json::Value& payload) {
    std::string uri = payload.at("uri").at("uri").as_string();
    json::Value entries = json::Value::array();
    auto add = [&entries](const std::string& child_uri, const std::string& name,
                          const json::Value& mime) {
        json::Value entry = json::Value::object();
        json::Value ref = json::Value::object();
        ref["uri"] = json::Value(child_uri);
        ref["documentTopTreeUri"] = json::Value();
        entry["uri"] = ref;
        entry["name"] = json::Value(name);
        entry["mimeType"] = mime;
        entries.push_back(entry);
    };
    if (uri == "content://com.example.cloud/document/root") {
        add("content://com.example.cloud/document/100", "photos", json::Value());
        add("content://com.example.cloud/document/101", "notes", json::Value());
    } else if (uri == "content://com.example.cloud/document/101") {
        add("content://com.example.cloud/document/200", "todo.txt", json::Value("text/plain"));
    }
    json::Value res = json::Value::object();
    res["entries"] = entries;
    return res;
}

TEST(opaque_reference_walks_segments) {
    TempDir dir;
    FakeBridge bridge(dir.path);
    bridge.handlers[bridge_cmd::READ_DIR] = opaque_listing;
    InlineRunner runner;
    PathResolver resolver(bridge, runner);

    EntryRef base{"content://com.example.cloud/document/root", std::string("content://grant")};
    EntryRef child = resolver.resolve(base, "notes/todo.txt");
    CHECK_EQ(child.uri, std::string("content://com.example.cloud/document/200"));
    CHECK(child.root_grant == base.root_grant);
    CHECK_EQ(bridge.count(bridge_cmd::READ_DIR), 2u);
    CHECK_EQ(bridge.call_count(), 2u);
}

TEST(opaque_walk_stops_at_missing_segment) {
    TempDir dir;
    FakeBridge bridge(dir.path);
    bridge.handlers[bridge_cmd::READ_DIR] = opaque_listing;
    InlineRunner runner;
    PathResolver resolver(bridge, runner);

    EntryRef base{"content://com.example.cloud/document/root", std::nullopt};
    CHECK_ERROR(resolver.resolve(base, "music/a.mp3/b"), ErrorKind::NotFound);
    CHECK_EQ(bridge.count(bridge_cmd::READ_DIR), 1u);
}

TEST(type_check_issues_one_query) {
    TempDir dir;
    write_text(dir / "App/notes/todo.txt", "x");
    FakeBridge bridge(dir.path);
    InlineRunner runner;
    PathResolver resolver(bridge, runner);
    EntryRef base = EntryRef::from_path(dir / "App");

    EntryRef file = resolver.resolve_file(base, "notes/todo.txt");
    CHECK_EQ(file.uri, base.uri + "/notes/todo.txt");
    CHECK_EQ(bridge.count(bridge_cmd::GET_MIME_TYPE), 1u);
    CHECK_EQ(bridge.call_count(), 1u);

    EntryRef notes = resolver.resolve_dir(base, "notes");
    CHECK_EQ(notes.uri, base.uri + "/notes");
    CHECK_EQ(bridge.call_count(), 2u);
}

TEST(type_check_mismatch) {
    TempDir dir;
    write_text(dir / "App/notes/todo.txt", "x");
    FakeBridge bridge(dir.path);
    InlineRunner runner;
    PathResolver resolver(bridge, runner);
    EntryRef base = EntryRef::from_path(dir / "App");

    CHECK_ERROR(resolver.resolve_file(base, "notes"), ErrorKind::TypeMismatch);
    CHECK_ERROR(resolver.resolve_dir(base, "notes/todo.txt"), ErrorKind::TypeMismatch);
    // A missing entry fails the type query itself
    CHECK_ERROR(resolver.resolve_file(base, "nope.txt"), ErrorKind::BridgeInvocationFailed);
    CHECK_EQ(resolver.resolve_unchecked(base, "nope.txt").uri, base.uri + "/nope.txt");
}

int main() {
    std::cout << "=== resolver tests ===\n";

    RUN_TEST(rejects_escaping_segments_without_calls);
    RUN_TEST(file_base_joins_directly);
    RUN_TEST(empty_relative_path_is_base);
    RUN_TEST(structured_provider_encodes_child);
    RUN_TEST(hierarchical_pattern_detection);
    RUN_TEST(opaque_reference_walks_segments);
    RUN_TEST(opaque_walk_stops_at_missing_segment);
    RUN_TEST(type_check_issues_one_query);
    RUN_TEST(type_check_mismatch);

    return report();
}
