#include "mcregion/nbt.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <sstream>
#include <type_traits>

namespace mcregion {

NbtError::NbtError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k), cause_(k) {}

NbtError::NbtError(ErrorKind k, const std::string& msg, ErrorKind cause)
    : std::runtime_error(msg), kind_(k), cause_(cause) {}

ErrorKind NbtError::kind() const noexcept { return kind_; }

ErrorKind NbtError::cause() const noexcept { return cause_; }

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::Zlib: return "zlib";
        case ErrorKind::CorruptRegion: return "corrupt-region";
        case ErrorKind::CorruptChunk: return "corrupt-chunk";
        case ErrorKind::CorruptNbt: return "corrupt-nbt";
    }
    return "unknown";
}

// ------------------------------
// Tag ids
// ------------------------------

std::string to_string(TagId id) {
    switch (id) {
        case TagId::End: return "end";
        case TagId::Byte: return "byte";
        case TagId::Short: return "short";
        case TagId::Int: return "int";
        case TagId::Long: return "long";
        case TagId::Float: return "float";
        case TagId::Double: return "double";
        case TagId::ByteArray: return "byte_array";
        case TagId::String: return "string";
        case TagId::List: return "list";
        case TagId::Compound: return "compound";
        case TagId::IntArray: return "int_array";
        case TagId::LongArray: return "long_array";
    }
    return "unknown";
}

bool is_known_tag_id(std::uint8_t raw) noexcept {
    return raw <= kMaxTagId;
}

static_assert(std::variant_size_v<Tag::Value> == kMaxTagId + 1, "Tag alternatives must cover every id");
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(TagId::Compound), Tag::Value>, Compound>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(TagId::LongArray), Tag::Value>, LongArray>);

// ------------------------------
// Compound
// ------------------------------

Compound::Compound() = default;
Compound::Compound(const Compound&) = default;
Compound::Compound(Compound&&) noexcept = default;
Compound& Compound::operator=(const Compound&) = default;
Compound& Compound::operator=(Compound&&) noexcept = default;
Compound::~Compound() = default;

void Compound::insert(std::string key, Tag value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        const std::size_t old = it->second;
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(old));
        index_.erase(it);
        for (auto& kv : index_) {
            if (kv.second > old) --kv.second;
        }
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
}

const Tag* Compound::find(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

Tag* Compound::find(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

bool Compound::contains(const std::string& key) const {
    return index_.find(key) != index_.end();
}

std::size_t Compound::size() const noexcept { return entries_.size(); }

bool Compound::empty() const noexcept { return entries_.empty(); }

const std::vector<Compound::Entry>& Compound::entries() const noexcept { return entries_; }

// ------------------------------
// Tag helpers
// ------------------------------

const Compound& Tag::as_compound() const {
    if (!std::holds_alternative<Compound>(v)) {
        throw NbtError(ErrorKind::CorruptNbt, "expected compound, found " + to_string(id()));
    }
    return std::get<Compound>(v);
}

const List& Tag::as_list() const {
    if (!std::holds_alternative<List>(v)) {
        throw NbtError(ErrorKind::CorruptNbt, "expected list, found " + to_string(id()));
    }
    return std::get<List>(v);
}

const std::string& Tag::as_string() const {
    if (!std::holds_alternative<std::string>(v)) {
        throw NbtError(ErrorKind::CorruptNbt, "expected string, found " + to_string(id()));
    }
    return std::get<std::string>(v);
}

bool operator==(const End&, const End&) noexcept { return true; }

bool operator==(const List& a, const List& b) {
    return a.element_type == b.element_type && a.items == b.items;
}
bool operator!=(const List& a, const List& b) { return !(a == b); }

bool operator==(const Compound& a, const Compound& b) {
    return a.entries() == b.entries();
}
bool operator!=(const Compound& a, const Compound& b) { return !(a == b); }

bool operator==(const Tag& a, const Tag& b) { return a.v == b.v; }
bool operator!=(const Tag& a, const Tag& b) { return !(a == b); }

bool operator==(const Document& a, const Document& b) {
    return a.name == b.name && a.root == b.root;
}
bool operator!=(const Document& a, const Document& b) { return !(a == b); }

// ------------------------------
// UTF-8
// ------------------------------

static void append_replacement(std::string& out) {
    out += "\xEF\xBF\xBD";
}

std::string utf8_lossy(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(len);

    std::size_t i = 0;
    while (i < len) {
        const std::uint8_t b = data[i];
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
            ++i;
            continue;
        }

        // Sequence width and the valid range of the second byte (RFC 3629).
        std::size_t width = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        if (b >= 0xC2 && b <= 0xDF) {
            width = 2;
        } else if (b == 0xE0) {
            width = 3; lo = 0xA0;
        } else if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) {
            width = 3;
        } else if (b == 0xED) {
            width = 3; hi = 0x9F;
        } else if (b == 0xF0) {
            width = 4; lo = 0x90;
        } else if (b >= 0xF1 && b <= 0xF3) {
            width = 4;
        } else if (b == 0xF4) {
            width = 4; hi = 0x8F;
        } else {
            append_replacement(out);
            ++i;
            continue;
        }

        std::size_t j = i + 1;
        if (j >= len || data[j] < lo || data[j] > hi) {
            append_replacement(out);
            i = j;
            continue;
        }
        ++j;

        bool ok = true;
        while (j < i + width) {
            if (j >= len || data[j] < 0x80 || data[j] > 0xBF) {
                ok = false;
                break;
            }
            ++j;
        }
        if (!ok) {
            append_replacement(out);
            i = j;
            continue;
        }

        out.append(reinterpret_cast<const char*>(data + i), width);
        i = j;
    }
    return out;
}

// ------------------------------
// Decoder
// ------------------------------

static std::uint16_t read_u16_be_from(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) | p[1]);
}

static std::uint32_t read_u32_be_from(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) <<  8) |
           (static_cast<std::uint32_t>(p[3])      );
}

static std::uint64_t read_u64_be_from(const std::uint8_t* p) {
    std::uint64_t u = 0;
    for (int i = 0; i < 8; ++i) u = (u << 8) | p[i];
    return u;
}

Decoder::Decoder(ByteSource& src, const DecodeOptions& opts)
    : src_(src), opts_(opts) {}

const std::uint8_t* Decoder::read(std::size_t n) {
    if (scratch_.size() < n) {
        scratch_.resize(n);
    }
    src_.read_exact(scratch_.data(), n);
    return scratch_.data();
}

std::uint8_t Decoder::read_u8() { return read(1)[0]; }

std::int8_t Decoder::read_i8() { return static_cast<std::int8_t>(read_u8()); }

std::uint16_t Decoder::read_u16() { return read_u16_be_from(read(2)); }

std::int16_t Decoder::read_i16() { return static_cast<std::int16_t>(read_u16()); }

std::uint32_t Decoder::read_u32() { return read_u32_be_from(read(4)); }

std::int32_t Decoder::read_i32() { return static_cast<std::int32_t>(read_u32()); }

std::uint64_t Decoder::read_u64() { return read_u64_be_from(read(8)); }

std::int64_t Decoder::read_i64() { return static_cast<std::int64_t>(read_u64()); }

float Decoder::read_f32() {
    std::uint32_t bits = read_u32();
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

double Decoder::read_f64() {
    std::uint64_t bits = read_u64();
    double d;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

std::size_t Decoder::block_size(std::uint32_t count, std::size_t elem, const char* what) const {
    const std::uint64_t total = static_cast<std::uint64_t>(count) * static_cast<std::uint64_t>(elem);
    if (total > static_cast<std::uint64_t>(opts_.max_array_bytes)) {
        std::ostringstream oss;
        oss << what << " of " << count << " elements exceeds the "
            << opts_.max_array_bytes << " byte limit";
        throw NbtError(ErrorKind::CorruptNbt, oss.str());
    }
    return static_cast<std::size_t>(total);
}

ByteArray Decoder::read_byte_array() {
    const std::size_t n = block_size(read_u32(), 1, "byte array");
    const std::uint8_t* p = read(n);
    return ByteArray(p, p + n);
}

std::string Decoder::read_string() {
    const std::size_t n = read_u16();
    const std::uint8_t* p = read(n);
    return utf8_lossy(p, n);
}

IntArray Decoder::read_int_array() {
    const std::uint32_t count = read_u32();
    const std::uint8_t* p = read(block_size(count, 4, "int array"));
    IntArray out(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        out[i] = static_cast<std::int32_t>(read_u32_be_from(p + 4u * i));
    }
    return out;
}

LongArray Decoder::read_long_array() {
    const std::uint32_t count = read_u32();
    const std::uint8_t* p = read(block_size(count, 8, "long array"));
    LongArray out(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        out[i] = static_cast<std::int64_t>(read_u64_be_from(p + 8u * static_cast<std::size_t>(i)));
    }
    return out;
}

// ------------------------------
// Parser
// ------------------------------

namespace {

class DepthGuard {
public:
    DepthGuard(std::size_t& depth, std::size_t max_depth) : depth_(depth) {
        ++depth_;
        if (max_depth != 0 && depth_ > max_depth) {
            --depth_;
            throw NbtError(ErrorKind::CorruptNbt,
                "nesting deeper than " + std::to_string(max_depth) + " levels");
        }
    }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& depth_;
};

template <typename T>
Tag make_tag(T&& value) {
    return Tag{Tag::Value{std::in_place_type<std::decay_t<T>>, std::forward<T>(value)}};
}

} // namespace

NbtParser::NbtParser(Decoder& dec) : dec_(dec) {}

Document NbtParser::read_document() {
    const std::uint8_t raw = dec_.read_u8();
    if (raw != static_cast<std::uint8_t>(TagId::Compound)) {
        throw NbtError(ErrorKind::CorruptNbt,
            "expected compound root tag, found tag id " + std::to_string(raw));
    }
    Document doc;
    doc.name = dec_.read_string();
    doc.root = read_compound();
    return doc;
}

Compound NbtParser::read_compound() {
    DepthGuard guard(depth_, dec_.options().max_depth);

    Compound out;
    while (true) {
        const std::uint8_t raw = dec_.read_u8();
        if (raw == static_cast<std::uint8_t>(TagId::End)) break;

        std::string name = dec_.read_string();
        if (!is_known_tag_id(raw)) {
            throw NbtError(ErrorKind::CorruptNbt,
                "invalid tag id " + std::to_string(raw) + " for compound entry '" + name + "'");
        }
        out.insert(std::move(name), read_payload(raw));
    }
    return out;
}

List NbtParser::read_list() {
    DepthGuard guard(depth_, dec_.options().max_depth);

    const std::uint8_t raw = dec_.read_u8();
    const std::uint32_t count = dec_.read_u32();
    if (!is_known_tag_id(raw)) {
        throw NbtError(ErrorKind::CorruptNbt, "invalid list element tag id " + std::to_string(raw));
    }

    List out;
    out.element_type = static_cast<TagId>(raw);
    if (out.element_type == TagId::End) {
        // End elements consume no input; bound the decoded size instead.
        (void)dec_.block_size(count, sizeof(Tag), "end list");
    }
    out.items.reserve(std::min<std::size_t>(count, 4096));
    for (std::uint32_t i = 0; i < count; ++i) {
        out.items.push_back(read_payload(raw));
    }
    return out;
}

Tag NbtParser::read_payload(std::uint8_t raw_id) {
    switch (static_cast<TagId>(raw_id)) {
        case TagId::End: return make_tag(End{});
        case TagId::Byte: return make_tag(dec_.read_i8());
        case TagId::Short: return make_tag(dec_.read_i16());
        case TagId::Int: return make_tag(dec_.read_i32());
        case TagId::Long: return make_tag(dec_.read_i64());
        case TagId::Float: return make_tag(dec_.read_f32());
        case TagId::Double: return make_tag(dec_.read_f64());
        case TagId::ByteArray: return make_tag(dec_.read_byte_array());
        case TagId::String: return make_tag(dec_.read_string());
        case TagId::List: return make_tag(read_list());
        case TagId::Compound: return make_tag(read_compound());
        case TagId::IntArray: return make_tag(dec_.read_int_array());
        case TagId::LongArray: return make_tag(dec_.read_long_array());
    }
    throw NbtError(ErrorKind::CorruptNbt, "invalid tag id " + std::to_string(raw_id));
}

// ------------------------------
// API implementations
// ------------------------------

Document read_document(ByteSource& src, const DecodeOptions& opts) {
    Decoder dec(src, opts);
    NbtParser parser(dec);
    return parser.read_document();
}

Document read_nbt_bytes(
    const std::uint8_t* data,
    std::size_t size,
    Compression compression,
    const DecodeOptions& opts
) {
    switch (compression) {
        case Compression::None: {
            MemorySource src(data, size);
            return read_document(src, opts);
        }
        case Compression::Gzip: {
            InflateSource src(data, size, Framing::Gzip);
            return read_document(src, opts);
        }
        case Compression::Zlib: {
            InflateSource src(data, size, Framing::Zlib);
            return read_document(src, opts);
        }
    }
    throw NbtError(ErrorKind::CorruptNbt, "unknown compression mode");
}

Document read_nbt_file(
    const std::filesystem::path& file,
    Compression compression,
    const DecodeOptions& opts
) {
    StreamSource src(file);
    std::vector<std::uint8_t> bytes = src.read_to_end();
    return read_nbt_bytes(bytes.data(), bytes.size(), compression, opts);
}

} // namespace mcregion
