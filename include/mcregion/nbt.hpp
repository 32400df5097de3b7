#pragma once

#include "mcregion/byte_source.hpp"
#include "mcregion/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mcregion {

// ------------------------------
// Tag value model
// ------------------------------

// Wire ids. The Tag variant lists its alternatives in this order so that
// Tag::id() is the variant index.
enum class TagId : std::uint8_t {
    End = 0,
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11,
    LongArray = 12,
};

constexpr std::uint8_t kMaxTagId = 12;

std::string to_string(TagId id);
bool is_known_tag_id(std::uint8_t raw) noexcept;

struct Tag;

struct End {};

using ByteArray = std::vector<std::uint8_t>;
using IntArray = std::vector<std::int32_t>;
using LongArray = std::vector<std::int64_t>;

struct List {
    // Kept as read, even for an empty list.
    TagId element_type{TagId::End};
    std::vector<Tag> items{};
};

/// Insertion-ordered key/value mapping. Inserting an existing key drops the
/// earlier entry and appends the new one.
class Compound {
public:
    using Entry = std::pair<std::string, Tag>;

    Compound();
    Compound(const Compound&);
    Compound(Compound&&) noexcept;
    Compound& operator=(const Compound&);
    Compound& operator=(Compound&&) noexcept;
    ~Compound();

    void insert(std::string key, Tag value);

    const Tag* find(const std::string& key) const;
    Tag* find(const std::string& key);
    bool contains(const std::string& key) const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    // Entries in insertion order.
    const std::vector<Entry>& entries() const noexcept;

private:
    std::vector<Entry> entries_;
    std::map<std::string, std::size_t> index_;
};

struct Tag {
    using Value = std::variant<
        End,
        std::int8_t,
        std::int16_t,
        std::int32_t,
        std::int64_t,
        float,
        double,
        ByteArray,
        std::string,
        List,
        Compound,
        IntArray,
        LongArray
    >;

    Value v;

    TagId id() const noexcept { return static_cast<TagId>(v.index()); }

    template <typename T>
    bool is() const noexcept { return std::holds_alternative<T>(v); }

    const Compound& as_compound() const;
    const List& as_list() const;
    const std::string& as_string() const;
};

struct Document {
    std::string name{};
    Compound root{};
};

bool operator==(const List& a, const List& b);
bool operator!=(const List& a, const List& b);
bool operator==(const Compound& a, const Compound& b);
bool operator!=(const Compound& a, const Compound& b);
bool operator==(const Tag& a, const Tag& b);
bool operator!=(const Tag& a, const Tag& b);
bool operator==(const Document& a, const Document& b);
bool operator!=(const Document& a, const Document& b);
bool operator==(const End&, const End&) noexcept;

// ------------------------------
// Decoding
// ------------------------------

struct DecodeOptions {
    // Maximum List/Compound nesting, the root compound counting as 1.
    // 0 = unlimited.
    std::size_t max_depth{512};
    // Upper bound for any single length-prefixed block.
    std::size_t max_array_bytes{256u * 1024u * 1024u};
};

/// Big-endian primitive reader. The pointer returned by read() stays valid
/// until the next read on the same Decoder.
class Decoder {
public:
    explicit Decoder(ByteSource& src, const DecodeOptions& opts = DecodeOptions{});

    const std::uint8_t* read(std::size_t n);

    std::uint8_t read_u8();
    std::int8_t read_i8();
    std::uint16_t read_u16();
    std::int16_t read_i16();
    std::uint32_t read_u32();
    std::int32_t read_i32();
    std::uint64_t read_u64();
    std::int64_t read_i64();
    float read_f32();
    double read_f64();

    ByteArray read_byte_array();
    std::string read_string();
    IntArray read_int_array();
    LongArray read_long_array();

    // Byte size of `count` elements of `elem` bytes; throws CorruptNbt above
    // DecodeOptions::max_array_bytes.
    std::size_t block_size(std::uint32_t count, std::size_t elem, const char* what) const;

    const DecodeOptions& options() const noexcept { return opts_; }
    std::size_t scratch_capacity() const noexcept { return scratch_.size(); }

private:
    ByteSource& src_;
    DecodeOptions opts_;
    std::vector<std::uint8_t> scratch_;
};

/// Recursive-descent NBT reader.
class NbtParser {
public:
    explicit NbtParser(Decoder& dec);

    Document read_document();
    Compound read_compound();
    List read_list();

private:
    Tag read_payload(std::uint8_t raw_id);

    Decoder& dec_;
    std::size_t depth_{0};
};

/// Decode one document from `src`.
Document read_document(ByteSource& src, const DecodeOptions& opts = DecodeOptions{});

enum class Compression {
    None,
    Gzip,
    Zlib,
};

/// Decode a loose NBT file (level.dat, player files). These are gzip-framed
/// by default.
Document read_nbt_file(
    const std::filesystem::path& file,
    Compression compression = Compression::Gzip,
    const DecodeOptions& opts = DecodeOptions{}
);

Document read_nbt_bytes(
    const std::uint8_t* data,
    std::size_t size,
    Compression compression,
    const DecodeOptions& opts = DecodeOptions{}
);

/// Replaces each maximal invalid UTF-8 subsequence with U+FFFD.
std::string utf8_lossy(const std::uint8_t* data, std::size_t len);

// ------------------------------
// SNBT text
// ------------------------------

enum class SnbtStyle {
    Compact,
    Indented,
};

std::string to_snbt(const Tag& t, SnbtStyle style = SnbtStyle::Compact);
std::string to_snbt(const Compound& c, SnbtStyle style = SnbtStyle::Compact);
std::string to_snbt(const Document& d, SnbtStyle style = SnbtStyle::Compact);

} // namespace mcregion
