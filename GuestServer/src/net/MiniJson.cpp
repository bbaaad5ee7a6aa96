#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <vector>

static int hex4(const std::string& js, size_t at) {
    if (at + 4 > js.size()) throw std::runtime_error("invalid unicode escape in json string");
    int code = 0;
    for (size_t k = at; k < at + 4; ++k) {
        char ch = js[k];
        code <<= 4;
        if (ch >= '0' && ch <= '9') code += ch - '0';
        else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
        else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
        else throw std::runtime_error("invalid hex in unicode escape");
    }
    return code;
}

static void append_utf8(std::string& out, uint32_t code) {
    if (code <= 0x7f) out.push_back((char)code);
    else if (code <= 0x7ff) {
        out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    } else if (code <= 0xffff) {
        out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    } else {
        out.push_back((char)(0xf0 | ((code >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((code >> 12) & 0x3f)));
        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
        out.push_back((char)(0x80 | (code & 0x3f)));
    }
}

// start points to the first character after the opening '"'; returns the
// decoded text and the index of the closing quote. NUL and other control
// characters are rejected whether raw or escaped, since libpq text
// parameters end at the first NUL.
static std::pair<std::string,size_t> decode_string(const std::string& js, size_t start) {
    const size_t n = js.size();
    std::string out;
    size_t i = start;
    for (;; ++i) {
        if (i >= n) throw std::runtime_error("unterminated json string");
        char c = js[i];
        if (c == '"') return {out, i};
        if ((unsigned char)c < 0x20) throw std::runtime_error("control character in json string");
        if (c == '\\') {
            if (i + 1 >= n) throw std::runtime_error("unterminated escape in json string");
            char e = js[i+1];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    uint32_t code = static_cast<uint32_t>(hex4(js, i + 2));
                    if (code == 0) throw std::runtime_error("NUL in json string");
                    if (code >= 0xdc00 && code <= 0xdfff) throw std::runtime_error("unpaired low surrogate in json string");
                    if (code >= 0xd800 && code <= 0xdbff) {
                        // must be followed by \uDC00-\uDFFF
                        if (i + 7 >= n || js[i+6] != '\\' || js[i+7] != 'u') throw std::runtime_error("unpaired high surrogate in json string");
                        uint32_t low = static_cast<uint32_t>(hex4(js, i + 8));
                        if (low < 0xdc00 || low > 0xdfff) throw std::runtime_error("unpaired high surrogate in json string");
                        code = 0x10000 + ((code - 0xd800) << 10) + (low - 0xdc00);
                        i += 6; // the second escape
                    }
                    append_utf8(out, code);
                    i += 4; // hex digits; the escape letter is skipped below
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
            ++i; // skip escape char
            continue;
        }
        out.push_back(c);
    }
}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    const size_t n = js.size();
    std::vector<char> stack; 

    for (size_t i = 0; i < n; ++i) {
        char c = js[i];
        if (c == '"') {
            auto dec = decode_string(js, i+1);
            const std::string& decoded = dec.first;
            size_t closing = dec.second;

            // a key sits right after '{' or ',' and is followed by ':'
            size_t before = i;
            while (before > 0 && isspace((unsigned char)js[before-1])) --before;
            bool prev_obj_or_comma = (before > 0 && (js[before-1] == '{' || js[before-1] == ','));

            size_t after = closing + 1;
            while (after < n && isspace((unsigned char)js[after])) ++after;

            bool in_object = (!stack.empty() && stack.back() == '{');
            bool key_candidate = in_object && prev_obj_or_comma;

            // only top-level keys count
            if (key_candidate && after < n && js[after] == ':') {
                if (decoded == key && stack.size() == 1) {
                    size_t valpos = after + 1;
                    while (valpos < n && isspace((unsigned char)js[valpos])) ++valpos;
                    if (valpos >= n) throw std::runtime_error("missing value for string field");
                    if (js.compare(valpos, 4, "null") == 0) return {true, std::nullopt};
                    if (js[valpos] != '"') throw std::runtime_error("invalid type for json string field");
                    auto val_dec = decode_string(js, valpos+1);
                    return {true, val_dec.first};
                }
            } else if (prev_obj_or_comma && after < n && js[after] != ':') {
                if (in_object) throw std::runtime_error("missing ':' after string field");
            }

            i = closing;
            continue;
        }

        if (c == '{' || c == '[') { stack.push_back(c); }
        else if (c == '}' || c == ']') { if (!stack.empty()) stack.pop_back(); }
    }

    return {false, std::nullopt};
}

// empty string on not-found or explicit null
std::string json_extract_string(const std::string& js, const std::string& key) {
    auto pr = json_extract_string_opt_present(js, key);
    if (!pr.first) return std::string();
    if (!pr.second.has_value()) return std::string();
    return pr.second.value();
}

bool json_is_object(const std::string& js) {
    size_t b = 0, e = js.size();
    while (b < e && isspace((unsigned char)js[b])) ++b;
    while (e > b && isspace((unsigned char)js[e-1])) --e;
    return e - b >= 2 && js[b] == '{' && js[e-1] == '}';
}

// escapes control chars < 0x20 as \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

static bool is_int_strict(const std::string& s) {
    if (s.empty()) return false;
    size_t i = 0;
    if (s[0] == '-') { if (s.size() == 1) return false; i = 1; }
    for (; i < s.size(); ++i) if (s[i] < '0' || s[i] > '9') return false;
    return true;
}

std::optional<int64_t> json_parse_int_strict(const std::optional<std::string>& o) {
    if (!o.has_value() || o->empty() || !is_int_strict(*o)) return std::nullopt;
    return parse_int64_strict_sv(std::string_view(*o));
}
