#include "mcregion/byte_source.hpp"

#include "mcregion/error.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <string>

#include <zlib.h>

namespace mcregion {

// ------------------------------
// StreamSource
// ------------------------------

StreamSource::StreamSource(std::istream& is) : is_(&is) {}

StreamSource::StreamSource(const std::filesystem::path& file)
    : owned_(std::make_unique<std::ifstream>(file, std::ios::binary)) {
    if (!*owned_) {
        throw NbtError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    is_ = owned_.get();
}

void StreamSource::read_exact(std::uint8_t* dst, std::size_t n) {
    if (n == 0) return;
    is_->read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    if (!*is_) {
        const auto got = static_cast<std::size_t>(is_->gcount());
        throw NbtError(ErrorKind::Io,
            "unexpected EOF: wanted " + std::to_string(n) + " bytes, got " + std::to_string(got));
    }
}

std::vector<std::uint8_t> StreamSource::read_to_end() {
    std::vector<std::uint8_t> out;
    std::array<char, 64 * 1024> buf{};
    while (true) {
        is_->read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = static_cast<std::size_t>(is_->gcount());
        out.insert(out.end(), buf.data(), buf.data() + got);
        if (is_->bad()) {
            throw NbtError(ErrorKind::Io, "read failed");
        }
        if (is_->eof()) break;
    }
    return out;
}

// ------------------------------
// MemorySource
// ------------------------------

MemorySource::MemorySource(const std::uint8_t* data, std::size_t size)
    : data_(data), size_(size) {}

MemorySource::MemorySource(const std::vector<std::uint8_t>& bytes)
    : data_(bytes.data()), size_(bytes.size()) {}

void MemorySource::read_exact(std::uint8_t* dst, std::size_t n) {
    if (n > remaining()) {
        throw NbtError(ErrorKind::Io,
            "unexpected end of buffer: wanted " + std::to_string(n) + " bytes, " +
            std::to_string(remaining()) + " left");
    }
    if (n == 0) return;
    std::memcpy(dst, data_ + pos_, n);
    pos_ += n;
}

std::vector<std::uint8_t> MemorySource::read_to_end() {
    std::vector<std::uint8_t> out(data_ + pos_, data_ + size_);
    pos_ = size_;
    return out;
}

// ------------------------------
// InflateSource
// ------------------------------

struct InflateSource::Stream {
    z_stream z{};
};

static NbtError zlib_error(int rc, const z_stream& z) {
    std::string msg = "inflate failed (" + std::to_string(rc) + ")";
    if (z.msg) {
        msg += ": ";
        msg += z.msg;
    }
    return NbtError(ErrorKind::Zlib, msg);
}

InflateSource::InflateSource(const std::uint8_t* data, std::size_t size, Framing framing)
    : strm_(std::make_unique<Stream>()) {
    if (size > static_cast<std::size_t>((std::numeric_limits<uInt>::max)())) {
        throw NbtError(ErrorKind::Zlib, "compressed buffer too large");
    }
    z_stream& z = strm_->z;
    z.zalloc = Z_NULL;
    z.zfree = Z_NULL;
    z.opaque = Z_NULL;
    z.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    z.avail_in = static_cast<uInt>(size);

    // 15 = 32 KiB window; +16 selects gzip framing.
    const int window_bits = (framing == Framing::Gzip) ? (15 + 16) : 15;
    int rc = ::inflateInit2(&z, window_bits);
    if (rc != Z_OK) {
        NbtError err = zlib_error(rc, z);
        strm_.reset();
        throw err;
    }
}

InflateSource::~InflateSource() {
    if (strm_) ::inflateEnd(&strm_->z);
}

std::size_t InflateSource::inflate_some(std::uint8_t* dst, std::size_t n) {
    if (finished_ || n == 0) return 0;

    z_stream& z = strm_->z;
    const std::size_t cap = static_cast<std::size_t>((std::numeric_limits<uInt>::max)());
    const uInt want = static_cast<uInt>(std::min(n, cap));
    z.next_out = reinterpret_cast<Bytef*>(dst);
    z.avail_out = want;

    while (z.avail_out > 0) {
        int rc = ::inflate(&z, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            finished_ = true;
            break;
        }
        if (rc == Z_OK) continue;
        if (rc == Z_BUF_ERROR) {
            if (z.avail_in == 0) {
                throw NbtError(ErrorKind::Zlib, "truncated compressed stream");
            }
            break;
        }
        throw zlib_error(rc, z);
    }
    return static_cast<std::size_t>(want - z.avail_out);
}

void InflateSource::read_exact(std::uint8_t* dst, std::size_t n) {
    std::size_t done = 0;
    while (done < n) {
        std::size_t got = inflate_some(dst + done, n - done);
        if (got == 0) {
            throw NbtError(ErrorKind::Io,
                "unexpected end of decompressed data: wanted " + std::to_string(n) +
                " bytes, got " + std::to_string(done));
        }
        done += got;
    }
}

std::vector<std::uint8_t> InflateSource::read_to_end() {
    std::vector<std::uint8_t> out;
    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        std::size_t got = inflate_some(buf.data(), buf.size());
        if (got == 0) break;
        out.insert(out.end(), buf.data(), buf.data() + got);
    }
    return out;
}

} // namespace mcregion
