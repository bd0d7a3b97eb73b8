#pragma once

#include <ostream>

namespace io {

// Writes to a console stream and, when set, mirrors to a log stream.
struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;

    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
    Printer& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (a) manip(*a);
        if (b) manip(*b);
        return *this;
    }
};

}  // namespace io
