#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace regwire::serde {

inline constexpr int kMaxNestingDepth = 64;

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

// Forward-only cursor over a JSON text. string() returns the raw (still escaped)
// contents between the quotes; use decode_string() to get the value.
struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start;

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}
    explicit json_cursor(std::string_view sv) : json_cursor(sv.data(), sv.data() + sv.size()) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    void skip_ws() noexcept {
        while (!eof() && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
    }

    bool peek(char c) noexcept {
        skip_ws();
        return !eof() && *ptr == c;
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    std::optional<std::string_view> string() noexcept {
        skip_ws();
        if (eof() || *ptr != '\"') {
            return std::nullopt;
        }
        ++ptr;
        const char* str_start = ptr;
        while (!eof() && *ptr != '\"') {
            if (*ptr == '\\' && (ptr + 1) < end) {
                ptr += 2;
                continue;
            }
            ++ptr;
        }
        if (eof()) {
            return std::nullopt;
        }
        const char* stop = ptr;
        ++ptr; // closing quote
        return std::string_view(str_start, static_cast<size_t>(stop - str_start));
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }

    // Skips one complete value. Returns false on malformed input.
    bool skip_value(int depth = 0) noexcept {
        if (depth > kMaxNestingDepth) {
            return false;
        }
        skip_ws();
        if (eof()) {
            return false;
        }
        if (try_object_start()) {
            if (try_object_end()) {
                return true;
            }
            while (true) {
                if (!string() || !consume(':') || !skip_value(depth + 1)) {
                    return false;
                }
                if (try_comma()) {
                    continue;
                }
                return try_object_end();
            }
        }
        if (try_array_start()) {
            if (try_array_end()) {
                return true;
            }
            while (true) {
                if (!skip_value(depth + 1)) {
                    return false;
                }
                if (try_comma()) {
                    continue;
                }
                return try_array_end();
            }
        }
        if (*ptr == '\"') {
            return string().has_value();
        }
        const char* scalar_start = ptr;
        while (!eof() && *ptr != ',' && *ptr != '}' && *ptr != ']' &&
               !std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
        return ptr != scalar_start;
    }
};

// Walks the members of an object. on_member(key) must consume the value and
// return false to abort.
template <typename OnMember> bool parse_object_members(json_cursor& cur, OnMember&& on_member) {
    if (!cur.try_object_start()) {
        return false;
    }
    if (cur.try_object_end()) {
        return true;
    }
    while (true) {
        auto key = cur.string();
        if (!key || !cur.consume(':')) {
            return false;
        }
        if (!on_member(*key)) {
            return false;
        }
        if (cur.try_comma()) {
            continue;
        }
        return cur.try_object_end();
    }
}

template <typename OnElement> bool parse_array_elements(json_cursor& cur, OnElement&& on_element) {
    if (!cur.try_array_start()) {
        return false;
    }
    if (cur.try_array_end()) {
        return true;
    }
    while (true) {
        if (!on_element()) {
            return false;
        }
        if (cur.try_comma()) {
            continue;
        }
        return cur.try_array_end();
    }
}

inline std::optional<bool> parse_bool(json_cursor& cur) noexcept {
    cur.skip_ws();
    std::string_view rest(cur.ptr, static_cast<size_t>(cur.end - cur.ptr));
    if (rest.starts_with("true")) {
        cur.ptr += 4;
        return true;
    }
    if (rest.starts_with("false")) {
        cur.ptr += 5;
        return false;
    }
    return std::nullopt;
}

inline std::optional<uint32_t> parse_uint(json_cursor& cur) noexcept {
    cur.skip_ws();
    uint32_t value = 0;
    auto fc = std::from_chars(cur.ptr, cur.end, value);
    if (fc.ec != std::errc() || fc.ptr == cur.ptr) {
        return std::nullopt;
    }
    cur.ptr = fc.ptr;
    return value;
}

namespace detail {

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::optional<uint32_t> parse_hex4(std::string_view sv) noexcept {
    if (sv.size() < 4) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto fc = std::from_chars(sv.data(), sv.data() + 4, value, 16);
    if (fc.ec != std::errc() || fc.ptr != sv.data() + 4) {
        return std::nullopt;
    }
    return value;
}

} // namespace detail

// Decodes the raw contents of a JSON string (as returned by json_cursor::string).
inline std::optional<std::string> decode_string(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= raw.size()) {
            return std::nullopt;
        }
        switch (raw[i]) {
        case '\"':
            out.push_back('\"');
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '/':
            out.push_back('/');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'u': {
            auto cp = detail::parse_hex4(raw.substr(i + 1));
            if (!cp) {
                return std::nullopt;
            }
            i += 4;
            if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                // high surrogate, expect "\uDC00".."\uDFFF" next
                if (i + 2 >= raw.size() || raw[i + 1] != '\\' || raw[i + 2] != 'u') {
                    return std::nullopt;
                }
                auto low = detail::parse_hex4(raw.substr(i + 3));
                if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                    return std::nullopt;
                }
                i += 6;
                detail::append_utf8(out, 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00));
            } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                // low surrogate without a preceding high one
                return std::nullopt;
            } else {
                detail::append_utf8(out, *cp);
            }
            break;
        }
        default:
            return std::nullopt;
        }
    }
    return out;
}

inline std::optional<std::string> parse_string(json_cursor& cur) {
    auto raw = cur.string();
    if (!raw) {
        return std::nullopt;
    }
    return decode_string(*raw);
}

inline std::string escape_json_string(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                static constexpr char hex[] = "0123456789abcdef";
                out += "\\u00";
                out.push_back(hex[(c >> 4) & 0xF]);
                out.push_back(hex[c & 0xF]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

} // namespace regwire::serde
