#pragma once
#include <stdexcept>
#include <string>

namespace extract {

// A single input could not be turned into text: unreadable file, corrupt
// container, unsupported structure, invalid encoding.
class ExtractionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The build lacks a library needed for this input kind (e.g. no PDF support).
class CapabilityError : public ExtractionError {
public:
    using ExtractionError::ExtractionError;
};

}  // namespace extract
