#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <limits>
#include <string>
#include <iostream>
#include "net/MiniJson.h"

void test_present_valid() {
    auto p = json_extract_string_opt_present("{\"k\":\"v\"}", "k"); assert(p.first && p.second == std::string("v"));
    p = json_extract_string_opt_present("{ \"k\" :  \"\" }", "k"); assert(p.first && p.second == std::string());
    p = json_extract_string_opt_present("{\"a\":\"x\", \"k\": \"42\"}", "k"); assert(p.first && p.second == std::string("42"));
    p = json_extract_string_opt_present("{\"a\":[\"k\"], \"k\": \"w\"}", "k"); assert(p.first && p.second == std::string("w"));
}

void test_present_malformed() {
    try { json_extract_string_opt_present("{\"k\":}", "k"); assert(false); } catch(const std::runtime_error&) {}
    try { json_extract_string_opt_present("{\"k\":true}", "k"); assert(false); } catch(const std::runtime_error&) {}
    try { json_extract_string_opt_present("{\"k\":[\"v\"]}", "k"); assert(false); } catch(const std::runtime_error&) {}
    try { json_extract_string_opt_present("{\"k\" \"v\"}", "k"); assert(false); } catch(const std::runtime_error&) {}
    try { json_extract_string_opt_present("{\"k\":\"\\u12\"}", "k"); assert(false); } catch(const std::runtime_error&) {}
}

void test_absent() {
    auto o = json_extract_string_opt_present("{}", "k"); assert(!o.first && !o.second.has_value());
    assert(json_extract_string("{}", "k").empty());
}

void test_null() {
    auto o = json_extract_string_opt_present("{\"k\":null}", "k"); assert(o.first && !o.second.has_value());
    assert(json_extract_string("{\"k\":null}", "k").empty());
}

void test_parse_int64_strict_sv_edges() {
    using std::int64_t; using std::numeric_limits;
    auto a = parse_int64_strict_sv("-9223372036854775808"); assert(a.has_value() && *a == numeric_limits<int64_t>::min());
    auto b = parse_int64_strict_sv("9223372036854775807"); assert(b.has_value() && *b == numeric_limits<int64_t>::max());
    auto c = parse_int64_strict_sv("9223372036854775808"); assert(!c.has_value());
    auto d = parse_int64_strict_sv("-9223372036854775809"); assert(!d.has_value());
    auto e = parse_int64_strict_sv("-0"); assert(e.has_value() && *e == 0);
}

void test_parse_id_sv() {
    auto a = parse_id_sv("17"); assert(a.has_value() && *a == 17);
    assert(!parse_id_sv("").has_value());
    assert(!parse_id_sv("-3").has_value());
    assert(!parse_id_sv("+3").has_value());
    assert(!parse_id_sv("abc").has_value());
    assert(!parse_id_sv("1.5").has_value());
    assert(!parse_id_sv("99999999999999999999").has_value());
}

int main() {
    test_present_valid();
    test_present_malformed();
    test_absent();
    test_null();
    test_parse_int64_strict_sv_edges();
    test_parse_id_sv();
    std::cout << "json_parse_unit ok\n";
    return 0;
}
