// Tests for the Json value type: parsing, typed getters and serialization

#include <engram/core/json.hpp>
#include "test_helpers.hpp"
#include <stdexcept>

using namespace engram;

void test_parse_object() {
    printf("Testing object parsing...\n");
    
    Json j = Json::parse("{\"name\": \"harbor\", \"count\": 3, \"ratio\": 0.25,"
                         " \"ok\": true, \"tags\": [\"a\", 7, \"b\"], \"none\": null}");
    TEST_ASSERT(j.is_object(), "Root should be an object");
    TEST_ASSERT(j.get_string("name") == "harbor", "String member");
    TEST_ASSERT(j.get_int("count") == 3, "Integer member");
    TEST_ASSERT(j.get_double("ratio") == 0.25, "Double member");
    TEST_ASSERT(j.get_bool("ok") == true, "Bool member");
    TEST_ASSERT(j["none"].is_null(), "Null member");
    TEST_ASSERT(j.get_string("missing", "dflt") == "dflt", "Missing key falls back to default");
    
    std::vector<std::string> tags = j.get_string_list("tags");
    TEST_ASSERT(tags.size() == 2, "Non-string elements are skipped");
    TEST_ASSERT(tags[0] == "a" && tags[1] == "b", "String elements keep their order");
    
    printf("  PASS\n");
}

void test_parse_unicode_escapes() {
    printf("Testing unicode escapes...\n");
    
    Json j = Json::parse("\"caf\\u00e9 \\u2192 \\ud83c\\udf05\"");
    TEST_ASSERT(j.as_string() == "caf\xC3\xA9 \xE2\x86\x92 \xF0\x9F\x8C\x85",
                "Escapes decode to UTF-8, surrogate pairs included");
    
    printf("  PASS\n");
}

void test_parse_rejects_malformed() {
    printf("Testing malformed input...\n");
    
    TEST_THROWS(Json::parse("{\"a\": 1"), std::runtime_error, "Unterminated object");
    TEST_THROWS(Json::parse("[1, 2"), std::runtime_error, "Unterminated array");
    TEST_THROWS(Json::parse("\"open"), std::runtime_error, "Unterminated string");
    TEST_THROWS(Json::parse("{\"a\" 1}"), std::runtime_error, "Missing colon");
    TEST_THROWS(Json::parse("{} extra"), std::runtime_error, "Trailing data");
    
    printf("  PASS\n");
}

void test_dump() {
    printf("Testing serialization...\n");
    
    Json j;
    j.set("id", "x\"y");
    j.set("n", static_cast<int64_t>(1700000000000LL));
    j.set("f", 0.5);
    Json arr = Json::array();
    arr.push(Json(1));
    arr.push(Json("two"));
    j.set("list", arr);
    
    std::string compact = j.dump();
    TEST_ASSERT(compact == "{\"f\":0.5,\"id\":\"x\\\"y\",\"list\":[1,\"two\"],\"n\":1700000000000}",
                "Compact dump with sorted keys and escaped quotes");
    
    std::string pretty = j.dump(2);
    TEST_ASSERT(pretty.find("\n  \"id\"") != std::string::npos, "Indented dump");
    
    Json back = Json::parse(pretty);
    TEST_ASSERT(back.get_int64("n") == 1700000000000LL, "Large integers survive a round trip");
    
    printf("  PASS\n");
}

int main() {
    printf("=== Json Tests ===\n\n");
    
    test_parse_object();
    test_parse_unicode_escapes();
    test_parse_rejects_malformed();
    test_dump();
    
    printf("\n=== All Json tests passed ===\n");
    return 0;
}
