#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace textutil {

// How invalid UTF-8 input is handled while decoding.
enum class DecodeMode {
    Strict,  // throw Utf8Error at the first invalid sequence
    Replace  // substitute U+FFFD for each maximal invalid subpart
};

class Utf8Error : public std::runtime_error {
public:
    Utf8Error(unsigned char byte, size_t offset);
    size_t offset() const { return m_offset; }

private:
    size_t m_offset;
};

// validate / repair UTF-8; the returned string is always well-formed
std::string decode_utf8(const std::string& bytes, DecodeMode mode);

// same, as code points
std::u32string to_code_points(const std::string& bytes, DecodeMode mode = DecodeMode::Replace);
std::string to_utf8(const std::u32string& cps);

// strips a leading UTF-8 byte order mark if present
std::string strip_bom(const std::string& s);

// "\r\n" and lone "\r" become "\n"
std::string normalize_newlines(const std::string& s);

// whitespace here means ' ', \t, \n, \r, \f, \v
std::string trim_ascii(const std::string& s);
std::string rtrim_ascii(const std::string& s);

std::string to_lower_ascii(std::string s);

// number of code points (bytes of malformed sequences count one each)
size_t utf8_length(const std::string& s);

// true for things like "42", "-3.5", "1e6", "+.5"
bool looks_numeric(const std::string& s);

// code points treated as whitespace by the slug and trim rules
bool is_unicode_space(char32_t c);

}  // namespace textutil
