#pragma once
#include <stdexcept>
#include <string>

namespace reverie::memory {

class MemoryError : public std::runtime_error {
public:
    explicit MemoryError(const std::string& what) : std::runtime_error(what) {}
};

// The persistence medium could not be read or written. The attempt failed,
// state is unchanged, the process may continue.
class StorageUnavailable : public MemoryError {
public:
    explicit StorageUnavailable(const std::string& what)
        : MemoryError("storage unavailable: " + what) {}
};

// Malformed entity fields or an illegal transition. Raised before any write.
class ValidationFailure : public MemoryError {
public:
    explicit ValidationFailure(const std::string& what)
        : MemoryError("validation failed: " + what) {}
};

} // namespace reverie::memory
