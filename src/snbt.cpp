#include "mcregion/nbt.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace mcregion {

namespace {

class SnbtWriter {
public:
    explicit SnbtWriter(SnbtStyle style) : indented_(style == SnbtStyle::Indented) {
        os_.imbue(std::locale::classic());
    }

    std::string str() const { return os_.str(); }

    void write_tag(const Tag& t) {
        std::visit([this](const auto& value) { write_value(value); }, t.v);
    }

    void write_compound(const Compound& c) {
        if (c.empty()) {
            os_ << "{}";
            return;
        }
        os_ << '{';
        ++depth_;
        bool first = true;
        for (const auto& kv : c.entries()) {
            if (!first) os_ << ',';
            if (indented_) newline();
            else if (!first) os_ << ' ';
            first = false;
            write_key(kv.first);
            os_ << ": ";
            write_tag(kv.second);
        }
        --depth_;
        if (indented_) newline();
        os_ << '}';
    }

    void write_key(const std::string& key) {
        if (is_bare_key(key)) {
            os_ << key;
        } else {
            write_quoted(key);
        }
    }

    void write_named_root(const Document& d) {
        if (!d.name.empty()) {
            write_key(d.name);
            os_ << ": ";
        }
        write_compound(d.root);
    }

private:
    std::ostringstream os_;
    bool indented_{false};
    int depth_{0};

    void newline() {
        os_ << '\n' << std::string(static_cast<std::size_t>(depth_) * 2, ' ');
    }

    static bool is_bare_key(const std::string& s) {
        if (s.empty()) return false;
        for (unsigned char c : s) {
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                            (c >= '0' && c <= '9') || c == '_' || c == '-' ||
                            c == '.' || c == '+';
            if (!ok) return false;
        }
        return true;
    }

    void write_quoted(const std::string& s) {
        os_ << '"';
        for (unsigned char c : s) {
            switch (c) {
                case '"': os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b"; break;
                case '\f': os_ << "\\f"; break;
                case '\n': os_ << "\\n"; break;
                case '\r': os_ << "\\r"; break;
                case '\t': os_ << "\\t"; break;
                default:
                    if (c < 0x20) {
                        os_ << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec << std::setw(0);
                    } else {
                        os_ << static_cast<char>(c);
                    }
            }
        }
        os_ << '"';
    }

    // Shortest decimal form that parses back to the same value.
    template <typename F>
    void write_float(F v, char suffix) {
        if (!std::isfinite(v)) {
            os_ << (std::isnan(v) ? "NaN" : (v > 0 ? "Infinity" : "-Infinity")) << suffix;
            return;
        }
        std::string text;
        for (int prec = 6; prec <= std::numeric_limits<F>::max_digits10; ++prec) {
            std::ostringstream tmp;
            tmp.imbue(std::locale::classic());
            tmp << std::setprecision(prec) << v;
            text = tmp.str();
            const double back = std::strtod(text.c_str(), nullptr);
            if (static_cast<F>(back) == v) break;
        }
        if (text.find_first_of(".eE") == std::string::npos) text += ".0";
        os_ << text << suffix;
    }

    template <typename T>
    void write_array(const char* prefix, const std::vector<T>& a, const char* suffix) {
        os_ << '[' << prefix << ';';
        for (std::size_t i = 0; i < a.size(); ++i) {
            os_ << (i ? ", " : " ");
            os_ << static_cast<std::int64_t>(a[i]) << suffix;
        }
        os_ << ']';
    }

    static bool is_container(TagId id) {
        return id == TagId::List || id == TagId::Compound;
    }

    void write_value(const End&) { os_ << "<end>"; }
    void write_value(std::int8_t v) { os_ << static_cast<int>(v) << 'b'; }
    void write_value(std::int16_t v) { os_ << v << 's'; }
    void write_value(std::int32_t v) { os_ << v; }
    void write_value(std::int64_t v) { os_ << v << 'L'; }
    void write_value(float v) { write_float(v, 'f'); }
    void write_value(double v) { write_float(v, 'd'); }
    void write_value(const ByteArray& a) {
        os_ << "[B;";
        for (std::size_t i = 0; i < a.size(); ++i) {
            os_ << (i ? ", " : " ") << static_cast<int>(static_cast<std::int8_t>(a[i])) << 'b';
        }
        os_ << ']';
    }
    void write_value(const std::string& s) { write_quoted(s); }
    void write_value(const Compound& c) { write_compound(c); }
    void write_value(const IntArray& a) { write_array("I", a, ""); }
    void write_value(const LongArray& a) { write_array("L", a, "L"); }

    void write_value(const List& l) {
        if (l.items.empty()) {
            os_ << "[]";
            return;
        }
        const bool break_lines = indented_ && is_container(l.element_type);
        os_ << '[';
        ++depth_;
        for (std::size_t i = 0; i < l.items.size(); ++i) {
            if (i) os_ << ',';
            if (break_lines) newline();
            else if (i) os_ << ' ';
            write_tag(l.items[i]);
        }
        --depth_;
        if (break_lines) newline();
        os_ << ']';
    }
};

} // namespace

std::string to_snbt(const Tag& t, SnbtStyle style) {
    SnbtWriter w(style);
    w.write_tag(t);
    return w.str();
}

std::string to_snbt(const Compound& c, SnbtStyle style) {
    SnbtWriter w(style);
    w.write_compound(c);
    return w.str();
}

std::string to_snbt(const Document& d, SnbtStyle style) {
    SnbtWriter w(style);
    w.write_named_root(d);
    return w.str();
}

} // namespace mcregion
