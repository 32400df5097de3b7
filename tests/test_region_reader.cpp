#include "mcregion/nbt_easy.hpp"
#include "mcregion/region.hpp"

#include "test_util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using mcregion::ErrorKind;
using mcregion::RegionFile;
using testutil::Bytes;
using testutil::ChunkSpec;

static ChunkSpec zlib_chunk(int x, int z, std::int32_t ts = 0) {
    ChunkSpec c;
    c.x = x;
    c.z = z;
    c.compression = 2;
    c.payload = testutil::zlib_compress(testutil::chunk_document(x, z));
    c.timestamp = ts;
    return c;
}

static RegionFile open_bytes(const Bytes& b) {
    return RegionFile::open(testutil::owned_memory(b));
}

static std::int64_t level_int(const mcregion::Document& d, const char* key) {
    const mcregion::Tag* t = mcregion::easy::find_path(d.root, std::string("Level.") + key);
    if (!t) throw std::runtime_error(std::string("missing Level.") + key);
    return std::get<std::int32_t>(t->v);
}

static void test_empty_region() {
    RegionFile r = open_bytes(Bytes(mcregion::kRegionHeaderBytes, 0));
    CHECK(r.list_chunks().empty());
    for (int x = 0; x < 32; ++x) {
        for (int z = 0; z < 32; ++z) {
            CHECK(!r.chunk_exists(x, z));
            CHECK(!r.load_chunk(x, z).has_value());
        }
    }
    // Empty slots never need the body.
    CHECK(!r.body_loaded());
}

static void test_single_chunk() {
    Bytes file = testutil::build_region({zlib_chunk(3, 5, 1234)});
    RegionFile r = open_bytes(file);

    auto listed = r.list_chunks();
    CHECK(listed.size() == 1);
    CHECK((listed[0] == mcregion::ChunkPos{3, 5}));
    CHECK(r.chunk_exists(3, 5));
    CHECK(r.chunk_timestamp(3, 5) == 1234);
    CHECK(r.chunk_location(3, 5).sector_offset == 2);
    CHECK(r.chunk_location(3, 5).sector_count == 1);
    CHECK(!r.body_loaded());

    std::optional<mcregion::Document> d = r.load_chunk(3, 5);
    CHECK(d.has_value());
    CHECK(r.body_loaded());
    CHECK(level_int(*d, "xPos") == 3);
    CHECK(level_int(*d, "zPos") == 5);

    Bytes raw = testutil::chunk_document(3, 5);
    CHECK(*d == mcregion::read_nbt_bytes(raw.data(), raw.size(), mcregion::Compression::None));
}

static void test_coordinate_wrap() {
    Bytes file = testutil::build_region({zlib_chunk(3, 5)});
    RegionFile r = open_bytes(file);

    // Global coordinates of a chunk in region (-1, 2).
    CHECK(r.chunk_exists(3 - 32, 5 + 64));
    CHECK(r.chunk_exists(35, 37));
    CHECK(r.chunk_timestamp(-29, -27) == r.chunk_timestamp(3, 5));
    auto a = r.load_chunk(3, 5);
    auto b = r.load_chunk(-29, 69);
    CHECK(a.has_value() && b.has_value());
    CHECK(*a == *b);

    CHECK(mcregion::region_slot(-1, -1) == 31 + 31 * 32);
    CHECK(mcregion::region_slot(32, 0) == 0);
    CHECK(mcregion::region_slot(1, 2) == 1 + 2 * 32);
}

static void test_list_order_and_timestamps() {
    std::vector<ChunkSpec> chunks = {
        zlib_chunk(0, 31, 7), zlib_chunk(31, 0, 8), zlib_chunk(0, 0, 9), zlib_chunk(4, 2, -1),
    };
    RegionFile r = open_bytes(testutil::build_region(chunks));

    auto listed = r.list_chunks();
    CHECK(listed.size() == 4);
    // x-major, then z.
    CHECK((listed[0] == mcregion::ChunkPos{0, 0}));
    CHECK((listed[1] == mcregion::ChunkPos{0, 31}));
    CHECK((listed[2] == mcregion::ChunkPos{4, 2}));
    CHECK((listed[3] == mcregion::ChunkPos{31, 0}));

    CHECK(r.chunk_timestamp(0, 31) == 7);
    CHECK(r.chunk_timestamp(4, 2) == -1);

    for (const auto& p : listed) {
        auto d = r.load_chunk(p.x, p.z);
        CHECK(d.has_value());
        CHECK(level_int(*d, "xPos") == p.x);
        CHECK(level_int(*d, "zPos") == p.z);
    }
}

static void test_minimal_chunk_at_sector_two() {
    ChunkSpec c;
    c.payload = testutil::zlib_compress(testutil::minimal_document());
    Bytes file = testutil::build_region({c});
    // Slot (0, 0): sector offset 2, count 1.
    CHECK(file[0] == 0 && file[1] == 0 && file[2] == 2 && file[3] == 1);

    RegionFile r = open_bytes(file);
    auto d = r.load_chunk(0, 0);
    CHECK(d.has_value());
    CHECK(d->name.empty());
    CHECK(d->root.empty());

    c.compression = 5;
    RegionFile bad = open_bytes(testutil::build_region({c}));
    bool threw = false;
    try {
        (void)bad.load_chunk(0, 0);
    } catch (const mcregion::NbtError& e) {
        threw = true;
        CHECK(e.kind() == ErrorKind::CorruptRegion);
        CHECK(std::string(e.what()).find("compression type: 5") != std::string::npos);
    }
    CHECK(threw);
}

static void test_unsupported_compression() {
    ChunkSpec c = zlib_chunk(0, 0);
    c.compression = 3;
    RegionFile r = open_bytes(testutil::build_region({c, zlib_chunk(1, 0)}));
    CHECK_THROWS_KIND(r.load_chunk(0, 0), ErrorKind::CorruptRegion);
    CHECK(r.chunk_exists(0, 0));
    CHECK(r.load_chunk(1, 0).has_value());
}

static void test_length_past_end() {
    ChunkSpec c = zlib_chunk(0, 0);
    c.override_length = true;
    c.length = 10000;
    RegionFile r = open_bytes(testutil::build_region({c}));
    CHECK_THROWS_KIND(r.load_chunk(0, 0), ErrorKind::CorruptRegion);

    ChunkSpec zero = zlib_chunk(0, 0);
    zero.override_length = true;
    zero.length = 0;
    RegionFile r2 = open_bytes(testutil::build_region({zero}));
    CHECK_THROWS_KIND(r2.load_chunk(0, 0), ErrorKind::CorruptRegion);
}

static void test_gzip_chunk_matches_zlib() {
    ChunkSpec g;
    g.x = 7;
    g.z = 9;
    g.compression = 1;
    g.payload = testutil::gzip_compress(testutil::chunk_document(7, 9));

    RegionFile rg = open_bytes(testutil::build_region({g}));
    RegionFile rz = open_bytes(testutil::build_region({zlib_chunk(7, 9)}));
    auto a = rg.load_chunk(7, 9);
    auto b = rz.load_chunk(7, 9);
    CHECK(a.has_value() && b.has_value());
    CHECK(*a == *b);
}

static void test_corrupt_chunk_is_isolated() {
    ChunkSpec bad;
    bad.x = 2;
    bad.z = 2;
    bad.compression = 2;
    bad.payload = Bytes(64, 0xAB);
    bad.timestamp = 55;

    RegionFile r = open_bytes(testutil::build_region({zlib_chunk(1, 1), bad, zlib_chunk(3, 3)}));
    bool threw = false;
    try {
        (void)r.load_chunk(2, 2);
    } catch (const mcregion::NbtError& e) {
        threw = true;
        CHECK(e.kind() == ErrorKind::CorruptChunk);
        CHECK(e.cause() == ErrorKind::Zlib);
        CHECK(std::string(e.what()).find("(2, 2)") != std::string::npos);
    }
    CHECK(threw);

    CHECK(r.list_chunks().size() == 3);
    CHECK(r.chunk_exists(2, 2));
    CHECK(r.chunk_timestamp(2, 2) == 55);
    CHECK(r.load_chunk(1, 1).has_value());
    CHECK(r.load_chunk(3, 3).has_value());

    // Valid compression around invalid NBT.
    ChunkSpec nbt;
    nbt.x = 0;
    nbt.z = 0;
    nbt.payload = testutil::zlib_compress(Bytes{0x01, 0x00, 0x00, 0x05});
    RegionFile r2 = open_bytes(testutil::build_region({nbt}));
    threw = false;
    try {
        (void)r2.load_chunk(0, 0);
    } catch (const mcregion::NbtError& e) {
        threw = true;
        CHECK(e.kind() == ErrorKind::CorruptChunk);
        CHECK(e.cause() == ErrorKind::CorruptNbt);
    }
    CHECK(threw);
}

static void test_short_header() {
    for (std::size_t n : {std::size_t{0}, std::size_t{100}, std::size_t{4096}, mcregion::kRegionHeaderBytes - 1}) {
        bool threw = false;
        try {
            (void)open_bytes(Bytes(n, 0));
        } catch (const mcregion::NbtError& e) {
            threw = true;
            CHECK(e.kind() == ErrorKind::CorruptRegion);
            CHECK(e.cause() == ErrorKind::Io);
        }
        CHECK(threw);
    }
}

static void test_sector_offset_in_header() {
    Bytes file(mcregion::kRegionHeaderBytes + mcregion::kSectorBytes, 0);
    // Slot 0 -> sector 1, count 1.
    file[2] = 0x01;
    file[3] = 0x01;
    RegionFile r = open_bytes(file);
    CHECK(r.chunk_exists(0, 0));
    CHECK_THROWS_KIND(r.load_chunk(0, 0), ErrorKind::CorruptRegion);
}

static void test_sector_past_end() {
    Bytes file(mcregion::kRegionHeaderBytes, 0);
    // Slot 0 -> sector 40.
    file[2] = 40;
    file[3] = 0x01;
    RegionFile r = open_bytes(file);
    CHECK_THROWS_KIND(r.load_chunk(0, 0), ErrorKind::CorruptRegion);
    CHECK(r.body_loaded());
}

static void test_concurrent_loads() {
    std::vector<ChunkSpec> chunks;
    for (int i = 0; i < 16; ++i) chunks.push_back(zlib_chunk(i, 31 - i));
    RegionFile r = open_bytes(testutil::build_region(chunks));
    CHECK(!r.body_loaded());

    std::vector<std::optional<mcregion::Document>> results(8 * chunks.size());
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (std::size_t i = 0; i < chunks.size(); ++i) {
                results[static_cast<std::size_t>(t) * chunks.size() + i] =
                    r.load_chunk(chunks[i].x, chunks[i].z);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(r.body_loaded());
    for (std::size_t t = 1; t < 8; ++t) {
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            const auto& a = results[i];
            const auto& b = results[t * chunks.size() + i];
            CHECK(a.has_value() && b.has_value());
            CHECK(*a == *b);
        }
    }
}

static void test_open_file_on_disk() {
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "mcregion_test_r.0.0.mca";
    std::filesystem::remove(tmp);
    CHECK_THROWS_KIND(RegionFile::open(tmp), ErrorKind::Io);

    Bytes file = testutil::build_region({zlib_chunk(10, 20, 42)});
    {
        std::ofstream f(tmp, std::ios::binary);
        f.write(reinterpret_cast<const char*>(file.data()), static_cast<std::streamsize>(file.size()));
    }
    RegionFile r = RegionFile::open(tmp);
    CHECK(r.chunk_timestamp(10, 20) == 42);
    auto d = r.load_chunk(10, 20);
    CHECK(d.has_value());
    CHECK(level_int(*d, "xPos") == 10);

    // Moving keeps the loaded state.
    RegionFile moved = std::move(r);
    CHECK(moved.body_loaded());
    CHECK(moved.load_chunk(10, 20).has_value());

    // The moved-from reader still answers from its header copy but has no body.
    CHECK(r.chunk_exists(10, 20));
    CHECK(!r.body_loaded());
    CHECK_THROWS_KIND(r.load_chunk(10, 20), ErrorKind::Io);

    std::filesystem::remove(tmp);
}

// Serves the header, then hands out part of the body and fails.
class BrokenBodySource : public mcregion::ByteSource {
public:
    BrokenBodySource(Bytes bytes, int& body_reads)
        : bytes_(std::move(bytes)), view_(bytes_), body_reads_(body_reads) {}

    void read_exact(std::uint8_t* dst, std::size_t n) override { view_.read_exact(dst, n); }

    std::vector<std::uint8_t> read_to_end() override {
        ++body_reads_;
        std::uint8_t partial[16];
        view_.read_exact(partial, sizeof(partial));
        throw mcregion::NbtError(ErrorKind::Io, "device error");
    }

private:
    Bytes bytes_;
    mcregion::MemorySource view_;
    int& body_reads_;
};

static void test_failed_body_load_is_final() {
    int body_reads = 0;
    RegionFile r = RegionFile::open(
        std::make_unique<BrokenBodySource>(testutil::build_region({zlib_chunk(0, 0)}), body_reads));

    for (int attempt = 0; attempt < 3; ++attempt) {
        bool threw = false;
        try {
            (void)r.load_chunk(0, 0);
        } catch (const mcregion::NbtError& e) {
            threw = true;
            CHECK(e.kind() == ErrorKind::Io);
            CHECK(std::string(e.what()).find("device error") != std::string::npos);
        }
        CHECK(threw);
        CHECK(!r.body_loaded());
    }
    // One read of the source; later calls rethrow the stored error.
    CHECK(body_reads == 1);
    CHECK(r.chunk_exists(0, 0));
    CHECK(!r.load_chunk(5, 5).has_value());
}

static void test_huge_end_list_is_corrupt_chunk() {
    ChunkSpec c;
    // Root compound holding a list of 0x0FFFFFFF End tags: 13 bytes of input.
    c.payload = testutil::zlib_compress(Bytes{10, 0, 0, 9, 0, 1, 'l', 0, 0x0F, 0xFF, 0xFF, 0xFF, 0});
    RegionFile r = open_bytes(testutil::build_region({c}));
    bool threw = false;
    try {
        (void)r.load_chunk(0, 0);
    } catch (const mcregion::NbtError& e) {
        threw = true;
        CHECK(e.kind() == ErrorKind::CorruptChunk);
        CHECK(e.cause() == ErrorKind::CorruptNbt);
    }
    CHECK(threw);
}

static void test_decode_options_apply_to_chunks() {
    mcregion::RegionOptions opts;
    opts.decode.max_depth = 2;
    RegionFile r = RegionFile::open(testutil::owned_memory(testutil::build_region({zlib_chunk(0, 0)})), opts);
    bool threw = false;
    try {
        (void)r.load_chunk(0, 0);
    } catch (const mcregion::NbtError& e) {
        threw = true;
        CHECK(e.kind() == ErrorKind::CorruptChunk);
        CHECK(e.cause() == ErrorKind::CorruptNbt);
    }
    CHECK(threw);
}

int main() {
    try {
        test_empty_region();
        test_single_chunk();
        test_coordinate_wrap();
        test_list_order_and_timestamps();
        test_minimal_chunk_at_sector_two();
        test_unsupported_compression();
        test_length_past_end();
        test_gzip_chunk_matches_zlib();
        test_corrupt_chunk_is_isolated();
        test_short_header();
        test_sector_offset_in_header();
        test_sector_past_end();
        test_concurrent_loads();
        test_open_file_on_disk();
        test_decode_options_apply_to_chunks();
        test_failed_body_load_is_final();
        test_huge_end_list_is_corrupt_chunk();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}
