#pragma once
#include <cstddef>
#include <string>

namespace textutil {

// Filesystem-safe path component for Windows/Linux. Never empty, never
// contains '/' or '\\', and slugify(slugify(s)) == slugify(s).
std::string slugify(const std::string& name, size_t max_len = 120);

}  // namespace textutil
