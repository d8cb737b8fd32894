#pragma once

#include <stdexcept>
#include <string>

namespace vcsv {

// Raised when the underlying file or stream cannot be opened or read.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

// Raised by a reader whose cancellation source was triggered. Records
// returned before the signal remain valid.
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

}  // namespace vcsv
