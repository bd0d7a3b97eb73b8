#include "text/TextUtil.hpp"

#include <cctype>
#include <cstdio>

namespace textutil {

static const char32_t kReplacement = 0xFFFD;

static std::string describe_byte(unsigned char byte, size_t offset) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "invalid UTF-8 byte 0x%02x at offset %zu", byte, offset);
    return buf;
}

Utf8Error::Utf8Error(unsigned char byte, size_t offset)
    : std::runtime_error(describe_byte(byte, offset)), m_offset(offset) {}

// Decodes one sequence starting at s[i]. On success sets cp and returns the
// sequence length. On failure returns 0 and sets bad_len to the length of the
// maximal invalid subpart (at least 1).
static size_t decode_one(const std::string& s, size_t i, char32_t& cp, size_t& bad_len) {
    const unsigned char b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    size_t need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
        cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 2;
        cp = b0 & 0x0F;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;  // no surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 3;
        cp = b0 & 0x07;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        bad_len = 1;
        return 0;
    }

    size_t j = 1;
    for (; j <= need; ++j) {
        if (i + j >= s.size()) break;
        const unsigned char b = static_cast<unsigned char>(s[i + j]);
        const unsigned char min = (j == 1) ? lo : 0x80;
        const unsigned char max = (j == 1) ? hi : 0xBF;
        if (b < min || b > max) break;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (j <= need) {
        bad_len = j;
        return 0;
    }
    return need + 1;
}

static void append_utf8(std::string& out, char32_t cp) {
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

std::u32string to_code_points(const std::string& bytes, DecodeMode mode) {
    std::u32string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        char32_t cp = 0;
        size_t bad_len = 0;
        const size_t n = decode_one(bytes, i, cp, bad_len);
        if (n > 0) {
            out.push_back(cp);
            i += n;
            continue;
        }
        if (mode == DecodeMode::Strict) {
            throw Utf8Error(static_cast<unsigned char>(bytes[i]), i);
        }
        out.push_back(kReplacement);
        i += bad_len;
    }
    return out;
}

std::string to_utf8(const std::u32string& cps) {
    std::string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) append_utf8(out, cp);
    return out;
}

std::string decode_utf8(const std::string& bytes, DecodeMode mode) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        char32_t cp = 0;
        size_t bad_len = 0;
        const size_t n = decode_one(bytes, i, cp, bad_len);
        if (n > 0) {
            out.append(bytes, i, n);
            i += n;
            continue;
        }
        if (mode == DecodeMode::Strict) {
            throw Utf8Error(static_cast<unsigned char>(bytes[i]), i);
        }
        append_utf8(out, kReplacement);
        i += bad_len;
    }
    return out;
}

std::string strip_bom(const std::string& s) {
    if (s.size() >= 3 && s.compare(0, 3, "\xEF\xBB\xBF") == 0) return s.substr(3);
    return s;
}

std::string normalize_newlines(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim_ascii(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_ws(s[i])) ++i;
    size_t j = s.size();
    while (j > i && is_ws(s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string rtrim_ascii(const std::string& s) {
    size_t j = s.size();
    while (j > 0 && is_ws(s[j - 1])) --j;
    return s.substr(0, j);
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    size_t i = 0;
    while (i < s.size()) {
        char32_t cp = 0;
        size_t bad_len = 0;
        const size_t len = decode_one(s, i, cp, bad_len);
        i += (len > 0) ? len : 1;
        ++n;
    }
    return n;
}

bool looks_numeric(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;

    bool digits = false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; digits = true; }
    }
    if (!digits) return false;

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        bool exp_digits = false;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; exp_digits = true; }
        if (!exp_digits) return false;
    }
    return i == s.size();
}

bool is_unicode_space(char32_t c) {
    switch (c) {
        case U' ': case U'\t': case U'\n': case U'\r': case U'\f': case U'\v':
        case 0x1C: case 0x1D: case 0x1E: case 0x1F:
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

}  // namespace textutil
