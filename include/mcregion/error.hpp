#pragma once

#include <stdexcept>
#include <string>

namespace mcregion {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    Zlib,
    CorruptRegion,
    CorruptChunk,
    CorruptNbt,
};

const char* to_string(ErrorKind k) noexcept;

class NbtError : public std::runtime_error {
public:
    NbtError(ErrorKind k, const std::string& msg);
    // Wraps an inner failure; cause() reports the inner kind.
    NbtError(ErrorKind k, const std::string& msg, ErrorKind cause);

    ErrorKind kind() const noexcept;
    ErrorKind cause() const noexcept;

private:
    ErrorKind kind_;
    ErrorKind cause_;
};

} // namespace mcregion
