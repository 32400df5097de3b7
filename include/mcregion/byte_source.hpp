#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <vector>

namespace mcregion {

// ------------------------------
// Byte sources
// ------------------------------

/// Sequential byte supplier. read_exact either fills all `n` bytes or throws
/// NbtError(ErrorKind::Io).
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual void read_exact(std::uint8_t* dst, std::size_t n) = 0;
    virtual std::vector<std::uint8_t> read_to_end() = 0;
};

/// Reads from a std::istream, either borrowed or opened from a path.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& is);
    explicit StreamSource(const std::filesystem::path& file);

    void read_exact(std::uint8_t* dst, std::size_t n) override;
    std::vector<std::uint8_t> read_to_end() override;

private:
    std::unique_ptr<std::ifstream> owned_;
    std::istream* is_{nullptr};
};

/// Non-owning view over bytes held elsewhere.
class MemorySource : public ByteSource {
public:
    MemorySource(const std::uint8_t* data, std::size_t size);
    explicit MemorySource(const std::vector<std::uint8_t>& bytes);

    void read_exact(std::uint8_t* dst, std::size_t n) override;
    std::vector<std::uint8_t> read_to_end() override;

    std::size_t remaining() const noexcept { return size_ - pos_; }

private:
    const std::uint8_t* data_{nullptr};
    std::size_t size_{0};
    std::size_t pos_{0};
};

enum class Framing {
    Gzip, // RFC 1952 header + deflate
    Zlib, // RFC 1950 header + deflate
};

/// Inflates an in-memory compressed buffer on demand. The buffer must outlive
/// the source.
class InflateSource : public ByteSource {
public:
    InflateSource(const std::uint8_t* data, std::size_t size, Framing framing);
    ~InflateSource() override;

    InflateSource(const InflateSource&) = delete;
    InflateSource& operator=(const InflateSource&) = delete;

    void read_exact(std::uint8_t* dst, std::size_t n) override;
    std::vector<std::uint8_t> read_to_end() override;

private:
    struct Stream;

    // Returns the number of bytes produced; 0 only at end of stream.
    std::size_t inflate_some(std::uint8_t* dst, std::size_t n);

    std::unique_ptr<Stream> strm_;
    bool finished_{false};
};

} // namespace mcregion
