#include <iostream>
#include <string>
#include <optional>
#include <stdexcept>
#include "net/MiniJson.h"

int main() {
    auto e1 = json_escape_resp("abc");
    if (e1 != "abc") { std::cerr << "json_escape_resp changed plain text\n"; return 1; }
    auto e2 = json_escape_resp("a\"b");
    if (e2 != "a\\\"b") { std::cerr << "json_escape_resp did not escape quote\n"; return 1; }
    auto e3 = json_escape_resp("a\\b");
    if (e3 != "a\\\\b") { std::cerr << "json_escape_resp did not escape backslash\n"; return 1; }
    auto e4 = json_escape_resp("\n\t\r");
    if (e4 != "\\n\\t\\r") { std::cerr << "json_escape_resp did not escape control chars\n"; return 1; }
    auto e5 = json_escape_resp(std::string("\x01", 1));
    if (e5 != "\\u0001") { std::cerr << "json_escape_resp low control char: " << e5 << "\n"; return 1; }
    auto e6 = json_escape_resp("Zoë");
    if (e6 != "Zoë") { std::cerr << "json_escape_resp mangled utf-8\n"; return 1; }

    {
        auto pr = json_extract_string_opt_present("{\"name\":\"Alice\"}", "name");
        if (!pr.first) { std::cerr << "json_extract_string_opt_present missing key 'name'\n"; return 1; }
        if (pr.second != std::string("Alice")) { std::cerr << "json_extract_string_opt_present wrong value: " << pr.second.value_or("<null>") << "\n"; return 1; }
    }
    {
        auto s = json_extract_string("{\"status\":\"confirmed\"}", "status");
        if (s != "confirmed") { std::cerr << "json_extract_string wrong value\n"; return 1; }
        auto s2 = json_extract_string("{}", "nope");
        if (!s2.empty()) { std::cerr << "json_extract_string expected empty for missing key\n"; return 1; }
        auto s3 = json_extract_string("{\"name\":null}", "name");
        if (!s3.empty()) { std::cerr << "json_extract_string expected empty for null\n"; return 1; }
    }
    {
        auto s = json_extract_string("{\"name\":\"caf\\u00e9 \\\"bar\\\"\"}", "name");
        if (s != "café \"bar\"") { std::cerr << "escape decoding wrong: " << s << "\n"; return 1; }
        auto s2 = json_extract_string("{\"name\":\"\\u0041\\u0042\",\"x\":\"y\"}", "name");
        if (s2 != "AB") { std::cerr << "adjacent unicode escapes wrong: " << s2 << "\n"; return 1; }
    }
    // nested keys with the same name do not count
    {
        auto pr = json_extract_string_opt_present("{\"meta\":{\"name\":\"inner\"},\"name\":\"outer\"}", "name");
        if (!pr.first || pr.second != std::string("outer")) { std::cerr << "nested key leaked: " << pr.second.value_or("<null>") << "\n"; return 1; }
        auto pr2 = json_extract_string_opt_present("{\"meta\":{\"name\":\"inner\"}}", "name");
        if (pr2.first) { std::cerr << "nested-only key reported present\n"; return 1; }
    }
    // a string value equal to the key is not a key
    {
        auto pr = json_extract_string_opt_present("{\"other\":\"name\"}", "name");
        if (pr.first) { std::cerr << "value mistaken for key\n"; return 1; }
    }

    bool threw = false;
    try { json_extract_string_opt_present("{\"name\":123}", "name"); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) { std::cerr << "numeric value accepted as string\n"; return 1; }
    threw = false;
    try { json_extract_string_opt_present("{\"name\":\"open", "name"); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) { std::cerr << "unterminated string accepted\n"; return 1; }
    threw = false;
    try { json_extract_string_opt_present("{\"name\":\"bad\\q\"}", "name"); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) { std::cerr << "unsupported escape accepted\n"; return 1; }

    // surrogate pairs become one 4-byte UTF-8 sequence
    {
        auto s = json_extract_string("{\"name\": \"\\ud83c\\udf89\"}", "name");
        if (s != "\xF0\x9F\x8E\x89") { std::cerr << "surrogate pair not combined, size " << s.size() << "\n"; return 1; }
        auto s2 = json_extract_string("{\"name\":\"a\\uD83D\\uDE00b\"}", "name");
        if (s2 != "a\xF0\x9F\x98\x80" "b") { std::cerr << "upper-case surrogate pair\n"; return 1; }
    }
    const char* rejected[] = {
        "{\"name\":\"\\ud83c\"}",          // lone high surrogate
        "{\"name\":\"\\ud83cx\"}",         // high surrogate followed by text
        "{\"name\":\"\\ud83c\\u0041\"}",   // high surrogate followed by a non-surrogate
        "{\"name\":\"\\udf89\"}",          // lone low surrogate
        "{\"name\":\"a\\u0000b\"}",        // NUL
        "{\"name\":\"a\x01" "b\"}",        // raw control character
    };
    for (const char* body : rejected) {
        threw = false;
        try { json_extract_string(body, "name"); } catch (const std::runtime_error&) { threw = true; }
        if (!threw) { std::cerr << "accepted invalid string: " << body << "\n"; return 1; }
    }

    if (!json_is_object("{}") || !json_is_object("  {\"a\":\"b\"}\n")) { std::cerr << "json_is_object rejected object\n"; return 1; }
    if (json_is_object("") || json_is_object("[]") || json_is_object("\"x\"") || json_is_object("{")) { std::cerr << "json_is_object accepted non-object\n"; return 1; }

    auto i1 = json_parse_int_strict(std::string("42"));
    if (!i1 || *i1 != 42) { std::cerr << "json_parse_int_strict 42\n"; return 1; }
    if (json_parse_int_strict(std::nullopt) || json_parse_int_strict(std::string("4x")) || json_parse_int_strict(std::string("-"))) {
        std::cerr << "json_parse_int_strict accepted garbage\n"; return 1;
    }

    std::cout << "minijson_unit ok\n";
    return 0;
}
