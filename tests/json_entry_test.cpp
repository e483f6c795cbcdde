// tests/json_entry_test.cpp - Payload model and entry reference tests
#include "test_support.hpp"
#include "core/entry.hpp"
#include "core/json.hpp"

using namespace safio;

TEST(json_parse_object) {
    json::Value v = json::parse(R"({"fd": 12, "name": "a \"b\"", "ok": true, "none": null})");
    CHECK(v.is_object());
    CHECK_EQ(v.at("fd").as_int(), 12);
    CHECK_EQ(v.at("name").as_string(), std::string("a \"b\""));
    CHECK(v.at("ok").as_bool());
    CHECK(v.at("none").is_null());
    CHECK(v.get("missing").is_null());
}

TEST(json_parse_nested_array) {
    json::Value v = json::parse(R"({"entries": [{"name": "x"}, {"name": "y"}]})");
    const auto& entries = v.at("entries").as_array();
    CHECK_EQ(entries.size(), 2u);
    CHECK_EQ(entries[1].at("name").as_string(), std::string("y"));
}

TEST(json_dump_escapes_strings) {
    json::Value v = json::Value::object();
    v["text"] = json::Value("line\nbreak");
    std::string out = json::dump(v);
    CHECK(out.find("\\n") != std::string::npos);
    CHECK_EQ(json::parse(out).at("text").as_string(), std::string("line\nbreak"));
}

TEST(json_rejects_garbage) {
    bool threw = false;
    try {
        json::parse("{\"a\": ");
    } catch (const std::exception&) {
        threw = true;
    }
    CHECK(threw);
}

static bool parse_throws(const std::string& text) {
    try {
        json::parse(text);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

TEST(json_unicode_escapes) {
    CHECK_EQ(json::parse(R"("caf\u00e9")").as_string(), std::string("caf\xC3\xA9"));
    // Surrogate pair decodes to one 4-byte sequence
    CHECK_EQ(json::parse(R"("\ud83d\ude00")").as_string(), std::string("\xF0\x9F\x98\x80"));
    CHECK(parse_throws(R"("\uZZZZ")"));
    CHECK(parse_throws(R"("\u12")"));
    CHECK(parse_throws(R"("\ud83d")"));
    CHECK(parse_throws(R"("\ud83d\u0041")"));
    CHECK(parse_throws(R"("\ude00")"));
}

TEST(json_type_mismatch_throws) {
    json::Value v(42);
    bool threw = false;
    try {
        v.as_string();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}

TEST(entry_from_path_is_file_uri) {
    EntryRef ref = EntryRef::from_path("/storage/emulated/0/App");
    CHECK_EQ(ref.uri, std::string("file:///storage/emulated/0/App"));
    CHECK(ref.is_file_uri());
    CHECK(ref.as_path().has_value());
    CHECK_EQ(ref.as_path()->string(), std::string("/storage/emulated/0/App"));
    CHECK(!ref.root_grant.has_value());
}

TEST(entry_content_uri_has_no_path) {
    EntryRef ref{"content://com.example.provider/document/42", std::nullopt};
    CHECK(!ref.is_file_uri());
    CHECK(!ref.as_path().has_value());
}

TEST(entry_wire_shape) {
    EntryRef ref{"content://a/document/1", std::string("content://a/tree/1")};
    json::Value v = ref.to_json();
    CHECK_EQ(v.at("uri").as_string(), ref.uri);
    CHECK_EQ(v.at("documentTopTreeUri").as_string(), std::string("content://a/tree/1"));

    EntryRef back = EntryRef::from_string(ref.to_string());
    CHECK(back == ref);
    CHECK(back.root_grant == ref.root_grant);

    EntryRef plain = EntryRef::from_json(json::parse(R"({"uri": "file:///x", "documentTopTreeUri": null})"));
    CHECK(!plain.root_grant.has_value());
}

TEST(entry_equality_ignores_grant) {
    EntryRef a{"content://a/document/1", std::string("content://a/tree/1")};
    EntryRef b{"content://a/document/1", std::nullopt};
    CHECK(a == b);
    CHECK(a != EntryRef::from_path("/a"));
}

TEST(entry_malformed_is_invalid_argument) {
    CHECK_ERROR(EntryRef::from_string("not json"), ErrorKind::InvalidArgument);
    CHECK_ERROR(EntryRef::from_string(R"({"name": "x"})"), ErrorKind::InvalidArgument);
}

TEST(access_mode_strings) {
    CHECK_EQ(std::string(access_mode_string(AccessMode::WriteTruncate)), std::string("wt"));
    CHECK(access_mode_from_string("rwt") == AccessMode::ReadWriteTruncate);
    CHECK(access_mode_from_string("wa") == AccessMode::WriteAppend);
    CHECK(!is_truncating(AccessMode::Write));
    CHECK(is_truncating(AccessMode::WriteTruncate));
    CHECK(is_truncating(AccessMode::ReadWriteTruncate));
    CHECK_ERROR(access_mode_from_string("x"), ErrorKind::InvalidArgument);
}

TEST(uri_component_encoding) {
    CHECK_EQ(encode_uri_component("notes/my file.txt"), std::string("notes%2Fmy%20file.txt"));
    CHECK_EQ(encode_uri_component("a-b_c.d~e!f'g(h)i*"), std::string("a-b_c.d~e!f'g(h)i*"));
    CHECK_EQ(encode_uri_component("\xC3\xA9"), std::string("%C3%A9"));
    CHECK_EQ(decode_uri_component("primary%3ADownload%2Fa"), std::string("primary:Download/a"));
}

int main() {
    std::cout << "=== json / entry tests ===\n";

    RUN_TEST(json_parse_object);
    RUN_TEST(json_parse_nested_array);
    RUN_TEST(json_dump_escapes_strings);
    RUN_TEST(json_rejects_garbage);
    RUN_TEST(json_unicode_escapes);
    RUN_TEST(json_type_mismatch_throws);
    RUN_TEST(entry_from_path_is_file_uri);
    RUN_TEST(entry_content_uri_has_no_path);
    RUN_TEST(entry_wire_shape);
    RUN_TEST(entry_equality_ignores_grant);
    RUN_TEST(entry_malformed_is_invalid_argument);
    RUN_TEST(access_mode_strings);
    RUN_TEST(uri_component_encoding);

    return report();
}
