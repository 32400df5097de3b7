#include "mcregion/region.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <utility>

namespace mcregion {

// ------------------------------
// Small helpers
// ------------------------------

static int wrap_coord(int v) noexcept {
    const int m = v % kRegionChunksPerAxis;
    return m < 0 ? m + kRegionChunksPerAxis : m;
}

std::size_t region_slot(int x, int z) noexcept {
    return static_cast<std::size_t>(wrap_coord(x) + wrap_coord(z) * kRegionChunksPerAxis);
}

bool operator==(const ChunkPos& a, const ChunkPos& b) noexcept {
    return a.x == b.x && a.z == b.z;
}

static std::uint32_t read_u32_be_from(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) <<  8) |
           (static_cast<std::uint32_t>(p[3])      );
}

static std::string chunk_label(int x, int z) {
    std::ostringstream oss;
    oss << "chunk (" << x << ", " << z << ")";
    return oss.str();
}

// ------------------------------
// RegionFile
// ------------------------------

// Everything a body load touches lives here so the RegionFile stays movable.
struct RegionFile::Body {
    std::unique_ptr<ByteSource> source;
    std::once_flag once;
    std::vector<std::uint8_t> bytes;
    std::atomic<bool> loaded{false};
    // Set when the load failed; the source is then partly consumed and the
    // failure is final.
    std::optional<NbtError> error;
};

RegionFile::RegionFile(
    std::unique_ptr<ByteSource> source,
    const std::array<std::uint32_t, kRegionSlots>& locations,
    const std::array<std::int32_t, kRegionSlots>& timestamps,
    const RegionOptions& opts
)
    : locations_(locations),
      timestamps_(timestamps),
      opts_(opts),
      body_(std::make_unique<Body>()) {
    body_->source = std::move(source);
}

RegionFile::RegionFile(RegionFile&&) noexcept = default;
RegionFile& RegionFile::operator=(RegionFile&&) noexcept = default;
RegionFile::~RegionFile() = default;

RegionFile RegionFile::open(const std::filesystem::path& file, const RegionOptions& opts) {
    return open(std::make_unique<StreamSource>(file), opts);
}

RegionFile RegionFile::open(std::unique_ptr<ByteSource> source, const RegionOptions& opts) {
    if (!source) {
        throw NbtError(ErrorKind::Io, "region source is null");
    }

    std::array<std::uint8_t, kSectorBytes> table{};
    std::array<std::uint32_t, kRegionSlots> locations{};
    std::array<std::int32_t, kRegionSlots> timestamps{};

    try {
        source->read_exact(table.data(), table.size());
    } catch (const NbtError& e) {
        throw NbtError(ErrorKind::CorruptRegion,
            std::string("error reading location table: ") + e.what(), e.kind());
    }
    for (std::size_t i = 0; i < kRegionSlots; ++i) {
        locations[i] = read_u32_be_from(&table[4 * i]);
    }

    try {
        source->read_exact(table.data(), table.size());
    } catch (const NbtError& e) {
        throw NbtError(ErrorKind::CorruptRegion,
            std::string("error reading timestamp table: ") + e.what(), e.kind());
    }
    for (std::size_t i = 0; i < kRegionSlots; ++i) {
        timestamps[i] = static_cast<std::int32_t>(read_u32_be_from(&table[4 * i]));
    }

    return RegionFile(std::move(source), locations, timestamps, opts);
}

std::vector<ChunkPos> RegionFile::list_chunks() const {
    std::vector<ChunkPos> out;
    out.reserve(kRegionSlots);
    for (int x = 0; x < kRegionChunksPerAxis; ++x) {
        for (int z = 0; z < kRegionChunksPerAxis; ++z) {
            if ((locations_[region_slot(x, z)] >> 8) != 0) {
                out.push_back(ChunkPos{x, z});
            }
        }
    }
    return out;
}

bool RegionFile::chunk_exists(int x, int z) const noexcept {
    return (locations_[region_slot(x, z)] >> 8) != 0;
}

std::int32_t RegionFile::chunk_timestamp(int x, int z) const noexcept {
    return timestamps_[region_slot(x, z)];
}

ChunkLocation RegionFile::chunk_location(int x, int z) const noexcept {
    const std::uint32_t loc = locations_[region_slot(x, z)];
    return ChunkLocation{loc >> 8, static_cast<std::uint8_t>(loc & 0xFFu)};
}

bool RegionFile::body_loaded() const noexcept {
    return body_ && body_->loaded.load(std::memory_order_acquire);
}

const std::vector<std::uint8_t>& RegionFile::body() const {
    if (!body_) {
        throw NbtError(ErrorKind::Io, "region file was moved from");
    }
    Body& b = *body_;
    std::call_once(b.once, [&b] {
        try {
            b.bytes = b.source->read_to_end();
            b.loaded.store(true, std::memory_order_release);
        } catch (const NbtError& e) {
            b.error.emplace(ErrorKind::Io,
                std::string("failed to read region data: ") + e.what(), e.cause());
        }
        b.source.reset();
    });
    if (b.error) {
        throw *b.error;
    }
    return b.bytes;
}

std::optional<Document> RegionFile::load_chunk(int x, int z) const {
    const std::uint32_t location = locations_[region_slot(x, z)];
    const std::uint64_t sector_offset = static_cast<std::uint64_t>(location >> 8) * kSectorBytes;
    if (sector_offset == 0) {
        return std::nullopt;
    }

    const std::string label = chunk_label(x, z);
    if (sector_offset < kRegionHeaderBytes) {
        throw NbtError(ErrorKind::CorruptRegion,
            label + ": sector offset " + std::to_string(location >> 8) + " points into the header");
    }

    const std::vector<std::uint8_t>& data = body();

    // Offsets in the location table count from file start; the body begins after the header.
    const std::uint64_t body_offset = sector_offset - kRegionHeaderBytes;
    if (body_offset + 5 > data.size()) {
        throw NbtError(ErrorKind::CorruptRegion,
            label + ": chunk header at body offset " + std::to_string(body_offset) +
            " is past the end of the file");
    }

    const std::uint8_t* p = data.data() + body_offset;
    const std::uint32_t length = read_u32_be_from(p);
    const std::uint8_t compression = p[4];

    Framing framing = Framing::Zlib;
    switch (compression) {
        case static_cast<std::uint8_t>(ChunkCompression::Gzip):
            framing = Framing::Gzip;
            break;
        case static_cast<std::uint8_t>(ChunkCompression::Zlib):
            framing = Framing::Zlib;
            break;
        default:
            throw NbtError(ErrorKind::CorruptRegion,
                label + ": unsupported compression type: " + std::to_string(compression) +
                " (should be 1 or 2)");
    }

    // The length includes the compression byte.
    if (length == 0 || body_offset + static_cast<std::uint64_t>(length) + 4 > data.size()) {
        throw NbtError(ErrorKind::CorruptRegion,
            label + ": chunk length is invalid (" + std::to_string(length) + ")");
    }

    try {
        InflateSource src(p + 5, static_cast<std::size_t>(length) - 1, framing);
        return read_document(src, opts_.decode);
    } catch (const NbtError& e) {
        throw NbtError(ErrorKind::CorruptChunk,
            label + ": could not parse chunk NBT: " + e.what(), e.kind());
    }
}

} // namespace mcregion
