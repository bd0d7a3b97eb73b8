#include "text/Slug.hpp"
#include "text/TextUtil.hpp"

namespace textutil {

static const char32_t kReplacement = 0xFFFD;

// \w in the Unicode sense, approximated: ASCII alnum, '_', and any decoded
// non-ASCII code point that is not whitespace or a replacement character.
static bool is_word(char32_t c) {
    if (c < 0x80) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }
    return c != kReplacement && !is_unicode_space(c);
}

static bool is_allowed(char32_t c) {
    return is_word(c) || c == U'-' || c == U'.' || c == U' ';
}

static std::u32string strip_underscores(const std::u32string& s) {
    size_t i = 0;
    while (i < s.size() && s[i] == U'_') ++i;
    size_t j = s.size();
    while (j > i && s[j - 1] == U'_') --j;
    return s.substr(i, j - i);
}

std::string slugify(const std::string& name, size_t max_len) {
    std::u32string in = to_code_points(name, DecodeMode::Replace);

    // trim
    size_t b = 0;
    while (b < in.size() && is_unicode_space(in[b])) ++b;
    size_t e = in.size();
    while (e > b && is_unicode_space(in[e - 1])) --e;
    in = in.substr(b, e - b);

    // separators
    for (char32_t& c : in) {
        if (c == U'/' || c == U'\\') c = U'_';
    }

    // runs of disallowed characters -> single '_'
    std::u32string cleaned;
    cleaned.reserve(in.size());
    bool in_run = false;
    for (char32_t c : in) {
        if (is_allowed(c)) {
            cleaned.push_back(c);
            in_run = false;
        } else if (!in_run) {
            cleaned.push_back(U'_');
            in_run = true;
        }
    }

    // whitespace runs -> single '_' (only plain spaces survive the pass above)
    std::u32string collapsed;
    collapsed.reserve(cleaned.size());
    bool in_space = false;
    for (char32_t c : cleaned) {
        if (c == U' ') {
            if (!in_space) collapsed.push_back(U'_');
            in_space = true;
        } else {
            collapsed.push_back(c);
            in_space = false;
        }
    }

    std::u32string out = strip_underscores(collapsed);
    if (out.size() > max_len) {
        // truncation can expose a trailing '_'; strip again to stay idempotent
        out = strip_underscores(out.substr(0, max_len));
    }

    // "." and ".." are not usable as file or directory names
    if (out.find_first_not_of(U'.') == std::u32string::npos) return "untitled";
    return to_utf8(out);
}

}  // namespace textutil
