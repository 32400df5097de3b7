#pragma once

#include "mcregion/byte_source.hpp"
#include "mcregion/nbt.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace mcregion {

// ------------------------------
// Region container
// ------------------------------
//
// Layout:
//   [0, 4096)     1024 x u32 BE location words (sector offset << 8 | sector count)
//   [4096, 8192)  1024 x i32 BE timestamps
//   [8192, ...)   chunk payloads at (location >> 8) * 4096 from file start:
//                 [u32 BE length incl. compression byte][u8 compression][length-1 bytes]

constexpr int kRegionChunksPerAxis = 32;
constexpr std::size_t kRegionSlots = 1024;
constexpr std::size_t kSectorBytes = 4096;
constexpr std::size_t kRegionHeaderBytes = 2 * kSectorBytes;

enum class ChunkCompression : std::uint8_t {
    Gzip = 1,
    Zlib = 2,
};

struct ChunkPos {
    int x{0};
    int z{0};
};

bool operator==(const ChunkPos& a, const ChunkPos& b) noexcept;

struct ChunkLocation {
    std::uint32_t sector_offset{0}; // in 4 KiB sectors from file start
    std::uint8_t sector_count{0};   // informational only
};

struct RegionOptions {
    DecodeOptions decode{};
};

/// Wraps x and z into [0, 32) and returns the slot index.
std::size_t region_slot(int x, int z) noexcept;

/// Reader for a 32x32 chunk region file. The header tables are read by open();
/// the remaining bytes are read once, on the first load_chunk() that needs
/// them, and then shared read-only. A failed body read is final: every later
/// load_chunk() of an occupied slot rethrows it. load_chunk() is safe to call
/// from several threads at once.
class RegionFile {
public:
    static RegionFile open(const std::filesystem::path& file, const RegionOptions& opts = RegionOptions{});
    static RegionFile open(std::unique_ptr<ByteSource> source, const RegionOptions& opts = RegionOptions{});

    RegionFile(RegionFile&&) noexcept;
    RegionFile& operator=(RegionFile&&) noexcept;
    ~RegionFile();

    /// Occupied slots in x-major order, local coordinates.
    std::vector<ChunkPos> list_chunks() const;

    bool chunk_exists(int x, int z) const noexcept;

    /// Last-modified marker. Meaningless for unoccupied slots.
    std::int32_t chunk_timestamp(int x, int z) const noexcept;

    ChunkLocation chunk_location(int x, int z) const noexcept;

    /// Decoded chunk, or nullopt if the slot is empty. Coordinates wrap.
    std::optional<Document> load_chunk(int x, int z) const;

    bool body_loaded() const noexcept;

private:
    struct Body;

    RegionFile(
        std::unique_ptr<ByteSource> source,
        const std::array<std::uint32_t, kRegionSlots>& locations,
        const std::array<std::int32_t, kRegionSlots>& timestamps,
        const RegionOptions& opts
    );

    const std::vector<std::uint8_t>& body() const;

    std::array<std::uint32_t, kRegionSlots> locations_{};
    std::array<std::int32_t, kRegionSlots> timestamps_{};
    RegionOptions opts_;
    std::unique_ptr<Body> body_;
};

} // namespace mcregion
