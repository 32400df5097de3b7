#include "mcregion/nbt_easy.hpp"
#include "mcregion/region.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string fmt_pos(int x, int z) {
    std::ostringstream oss;
    oss << '(' << x << ", " << z << ')';
    return oss.str();
}

static void usage() {
    std::cerr <<
        "mcregion - NBT / region file inspector\n"
        "\n"
        "Usage:\n"
        "  mcregion header <REGION> [--no-color]\n"
        "  mcregion list   <REGION> [--details] [--no-color]\n"
        "  mcregion dump   <FILE> [--chunk X Z] [--gzip|--zlib|--raw] [--pretty] [--max-depth N]\n"
        "  mcregion tree   <FILE> [--chunk X Z] [--gzip|--zlib|--raw] [--max-depth N] [--no-color]\n"
        "  mcregion show   <REGION> [--max-depth N]\n"
        "\n"
        "Without --chunk, FILE is a loose NBT file (gzip unless --zlib or --raw).\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::optional<mcregion::ChunkPos> chunk;
    mcregion::Compression compression{mcregion::Compression::Gzip};
    bool details{false};
    bool pretty{false};
    bool no_color{false};
    std::size_t max_depth{mcregion::DecodeOptions{}.max_depth};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--details") a.details = true;
        else if (opt == "--pretty") a.pretty = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--gzip") a.compression = mcregion::Compression::Gzip;
        else if (opt == "--zlib") a.compression = mcregion::Compression::Zlib;
        else if (opt == "--raw") a.compression = mcregion::Compression::None;
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--chunk" && i + 1 < argc) {
            int x = std::stoi(argv[i++]);
            int z = std::stoi(argv[i++]);
            a.chunk = mcregion::ChunkPos{x, z};
        }
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "header" && a.cmd != "list" && a.cmd != "dump" &&
        a.cmd != "tree" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

static mcregion::RegionOptions region_options(const Args& a) {
    mcregion::RegionOptions ro;
    ro.decode.max_depth = a.max_depth;
    return ro;
}

// Loose file, or one chunk of a region when --chunk is given. nullopt for an
// empty slot.
static std::optional<mcregion::Document> load_document(const Args& a) {
    if (a.chunk) {
        auto region = mcregion::RegionFile::open(a.file, region_options(a));
        return region.load_chunk(a.chunk->x, a.chunk->z);
    }
    mcregion::DecodeOptions opts;
    opts.max_depth = a.max_depth;
    return mcregion::read_nbt_file(a.file, a.compression, opts);
}

// ----------------- Tag tree printer -----------------

static std::string tag_summary(const mcregion::Tag& t) {
    using mcregion::TagId;
    std::ostringstream oss;
    switch (t.id()) {
        case TagId::List: {
            const auto& l = std::get<mcregion::List>(t.v);
            oss << '[' << l.items.size() << " x " << mcregion::to_string(l.element_type) << ']';
            break;
        }
        case TagId::Compound:
            oss << '{' << mcregion::easy::child_count(t) << " entries}";
            break;
        case TagId::ByteArray:
        case TagId::IntArray:
        case TagId::LongArray:
            oss << '[' << mcregion::easy::child_count(t) << ']';
            break;
        default:
            oss << mcregion::to_snbt(t);
            break;
    }
    return oss.str();
}

static void print_tag_tree(
    std::ostream& os,
    const std::string& name,
    const mcregion::Tag& t,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_depth
) {
    std::string pad(indent, ' ');
    os << pad
       << ansi.cyan() << (name.empty() ? "<root>" : name) << ansi.reset()
       << " " << ansi.yellow() << mcregion::to_string(t.id()) << ansi.reset()
       << " " << ansi.gray() << tag_summary(t) << ansi.reset()
       << "\n";

    if (max_depth != 0 && depth + 1 >= max_depth) return;

    if (const auto* c = std::get_if<mcregion::Compound>(&t.v)) {
        for (const auto& kv : c->entries()) {
            print_tag_tree(os, kv.first, kv.second, ansi, indent + 2, depth + 1, max_depth);
        }
    } else if (const auto* l = std::get_if<mcregion::List>(&t.v)) {
        if (l->element_type == mcregion::TagId::Compound || l->element_type == mcregion::TagId::List) {
            for (std::size_t i = 0; i < l->items.size(); ++i) {
                print_tag_tree(os, "[" + std::to_string(i) + "]", l->items[i], ansi,
                               indent + 2, depth + 1, max_depth);
            }
        }
    }
}

static std::string tag_tree_to_string(const mcregion::Document& d) {
    std::ostringstream oss;
    Ansi plain;
    plain.enabled = false;
    print_tag_tree(oss, d.name, mcregion::Tag{d.root}, plain, 0, 0, 0);
    return oss.str();
}

// ----------------- Interactive UI (FTXUI) -----------------

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    cur.reserve(128);
    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

// Lines look like "<indent><name> <Type> <summary>".
static ftxui::Element render_tree_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());

    for (const auto& line : lines) {
        const std::size_t lead = line.find_first_not_of(' ');
        if (lead == std::string::npos) {
            els.push_back(text(""));
            continue;
        }
        const std::size_t name_end = line.find(' ', lead);
        if (name_end == std::string::npos) {
            els.push_back(text(line) | color(Color::White));
            continue;
        }
        const std::size_t type_end = line.find(' ', name_end + 1);
        std::string name = line.substr(0, name_end);
        std::string type = line.substr(name_end, type_end == std::string::npos ? std::string::npos : type_end - name_end);
        std::string rest = type_end == std::string::npos ? std::string() : line.substr(type_end);

        Color rest_color = Color::GrayLight;
        if (!rest.empty() && rest.find('"') != std::string::npos) rest_color = Color::Green;

        els.push_back(hbox({
            text(name) | color(Color::Cyan),
            text(type) | color(Color::Yellow),
            text(rest) | color(rest_color) | flex,
        }));
    }

    return vbox(std::move(els));
}

static int run_show(const Args& a, const Ansi& ansi) {
    auto region = mcregion::RegionFile::open(a.file, region_options(a));
    const std::vector<mcregion::ChunkPos> chunks = region.list_chunks();
    if (chunks.empty()) {
        std::cerr << ansi.yellow() << "Note" << ansi.reset() << ": region has no chunks\n";
        return 0;
    }

    using namespace ftxui;

    int selected = 0;
    int left_scroll = 0;

    struct StatusKV {
        std::string k;
        std::string v;
    };
    std::vector<StatusKV> status_kv;

    std::string preview;
    std::string selected_label;

    auto load_preview_for_selected = [&]() {
        if (selected < 0 || static_cast<std::size_t>(selected) >= chunks.size()) return;
        const mcregion::ChunkPos p = chunks[static_cast<std::size_t>(selected)];
        selected_label = "chunk " + fmt_pos(p.x, p.z);

        const mcregion::ChunkLocation loc = region.chunk_location(p.x, p.z);
        status_kv.clear();
        status_kv.push_back({"sector", std::to_string(loc.sector_offset)});
        status_kv.push_back({"sectors", std::to_string(loc.sector_count)});
        status_kv.push_back({"timestamp", std::to_string(region.chunk_timestamp(p.x, p.z))});

        try {
            std::optional<mcregion::Document> d = region.load_chunk(p.x, p.z);
            if (!d) {
                preview.clear();
                status_kv.push_back({"state", "empty"});
                return;
            }
            status_kv.push_back({"entries", std::to_string(d->root.size())});
            preview = tag_tree_to_string(*d);
        } catch (const mcregion::NbtError& e) {
            preview.clear();
            status_kv.push_back({"error", e.what()});
        }
    };

    load_preview_for_selected();

    auto left_pane = Renderer([&] {
        // The list scrolls inside its own viewport so the DOM never outgrows the terminal.
        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);
        int visible_rows = std::max(3, term_h - 6);

        int total = static_cast<int>(chunks.size());
        left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
        if (selected < left_scroll) left_scroll = selected;
        if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        items.reserve(static_cast<std::size_t>(std::max(0, end - begin)) + 2);

        if (begin > 0) {
            items.push_back(text("↑ more") | color(Color::GrayDark));
        }

        for (int i = begin; i < end; ++i) {
            const mcregion::ChunkPos& p = chunks[static_cast<std::size_t>(i)];
            Element left_txt = text("• " + fmt_pos(p.x, p.z)) | color(Color::Cyan) | flex;
            Element right_txt = text(std::to_string(region.chunk_timestamp(p.x, p.z))) | color(Color::Yellow);
            Element line = hbox({left_txt, right_txt});
            if (i == selected) {
                line = line | inverted;
            }
            items.push_back(line);
        }

        if (end < total) {
            items.push_back(text("↓ more") | color(Color::GrayDark));
        }

        auto header = hbox({
            text("Region") | bold | color(Color::White),
            text("  "),
            text(std::to_string(total) + " chunks") | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" load") | color(Color::GrayDark),
        });

        return vbox({
                   header,
                   separator(),
                   vbox(std::move(items)) | flex,
               }) |
               flex |
               border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        meta_lines.reserve(status_kv.size() + 1);
        for (const auto& kv : status_kv) {
            meta_lines.push_back(
                hbox({
                    text(kv.k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(kv.v) | color(Color::GrayLight) | flex,
                })
            );
        }

        Element top = vbox({
            text(selected_label) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | size(HEIGHT, LESS_THAN, 10);

        Element body = vbox({
            text("tags") | bold | color(Color::Magenta),
            separator(),
            render_tree_colored(preview) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) |
               flex |
               border;
    });

    auto layout = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        return hbox({
                   left_pane->Render() | size(WIDTH, EQUAL, 36),
                   right_pane->Render() | flex,
               })
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    const int last = static_cast<int>(chunks.size()) - 1;
    auto app = CatchEvent(layout, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected < last) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min(last, selected + 25);
            return true;
        }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min(last, selected + 3);
                return true;
            }
        }
        if (e == Event::Return) {
            load_preview_for_selected();
            return true;
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    try {
        if (!parse_args(argc, argv, a)) {
            usage();
            return 2;
        }
    } catch (const std::exception& e) {
        // std::stoi / std::stoull on a malformed number.
        std::cerr << "Invalid number: " << e.what() << "\n";
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "header") {
            auto region = mcregion::RegionFile::open(a.file, region_options(a));
            const auto chunks = region.list_chunks();

            std::size_t sectors = 0;
            std::uint32_t end_sector = 2;
            std::int32_t ts_min = std::numeric_limits<std::int32_t>::max();
            std::int32_t ts_max = std::numeric_limits<std::int32_t>::min();
            for (const auto& p : chunks) {
                const auto loc = region.chunk_location(p.x, p.z);
                sectors += loc.sector_count;
                end_sector = std::max<std::uint32_t>(end_sector, loc.sector_offset + loc.sector_count);
                ts_min = std::min(ts_min, region.chunk_timestamp(p.x, p.z));
                ts_max = std::max(ts_max, region.chunk_timestamp(p.x, p.z));
            }

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Chunks" << ansi.reset() << ": " << chunks.size()
                      << " / " << mcregion::kRegionSlots << "\n";
            std::cout << ansi.bold() << "Sectors used" << ansi.reset() << ": " << sectors << "\n";
            std::cout << ansi.bold() << "Expected size" << ansi.reset() << ": "
                      << static_cast<std::uint64_t>(end_sector) * mcregion::kSectorBytes << " bytes\n";
            if (!chunks.empty()) {
                std::cout << ansi.bold() << "Timestamps" << ansi.reset() << ": "
                          << ts_min << " .. " << ts_max << "\n";
            }
            std::cout << ansi.bold() << "Body" << ansi.reset() << ": "
                      << (region.body_loaded() ? "loaded" : "not loaded") << "\n";
            return 0;
        }

        if (a.cmd == "list") {
            auto region = mcregion::RegionFile::open(a.file, region_options(a));
            for (const auto& p : region.list_chunks()) {
                std::cout << ansi.cyan() << fmt_pos(p.x, p.z) << ansi.reset()
                          << " " << ansi.yellow() << region.chunk_timestamp(p.x, p.z) << ansi.reset();
                if (a.details) {
                    const auto loc = region.chunk_location(p.x, p.z);
                    std::cout << " " << ansi.dim()
                              << "sector=" << loc.sector_offset
                              << " count=" << static_cast<unsigned>(loc.sector_count)
                              << ansi.reset();
                }
                std::cout << "\n";
            }
            return 0;
        }

        if (a.cmd == "dump" || a.cmd == "tree") {
            std::optional<mcregion::Document> d = load_document(a);
            if (!d) {
                std::cerr << ansi.yellow() << "Note" << ansi.reset() << ": chunk "
                          << fmt_pos(a.chunk->x, a.chunk->z) << " is empty\n";
                return 1;
            }
            if (a.cmd == "dump") {
                std::cout << mcregion::to_snbt(*d, a.pretty ? mcregion::SnbtStyle::Indented
                                                            : mcregion::SnbtStyle::Compact) << "\n";
            } else {
                print_tag_tree(std::cout, d->name, mcregion::Tag{d->root}, ansi, 0, 0, a.max_depth);
            }
            return 0;
        }

        if (a.cmd == "show") {
            return run_show(a, ansi);
        }

    } catch (const mcregion::NbtError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset()
                  << " [" << mcregion::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
