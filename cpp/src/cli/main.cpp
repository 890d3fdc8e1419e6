// =============================================================================
// remap CLI - Range remapping over almanac documents
// =============================================================================
//
// Usage:
//   remap [global options] <command> [command options]
//
// Commands:
//   lowest      Smallest value reached from the seeds (run when no command is named)
//   map         Trace one number through every category
//   range       Show the pieces one interval splits into
//   dump        Print every map and its interval index
//   version     Show version information
//
// Examples:
//   remap lowest input.txt
//   remap input.txt --ranges
//   remap lowest --ranges input.txt
//   remap --to humidity map input.txt 79
//   remap range input.txt 79 14
//
// =============================================================================

#include <cstdint>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "remap/almanac.hpp"
#include "remap/config.hpp"
#include "remap/error.hpp"
#include "remap/interval.hpp"
#include "remap/logging.hpp"
#include "remap/pipeline.hpp"

namespace remap::cli {
    int cmd_lowest(int argc, char* argv[]);
    int cmd_map(int argc, char* argv[]);
    int cmd_range(int argc, char* argv[]);
    int cmd_dump(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define REMAP_VERSION_MAJOR 1
#define REMAP_VERSION_MINOR 0
#define REMAP_VERSION_PATCH 0
#define REMAP_VERSION_STRING "1.0.0"

// Exit codes
static constexpr int EXIT_OK = 0;
static constexpr int EXIT_FAILED = 1;
static constexpr int EXIT_USAGE = 2;

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"lowest",  "Smallest value reached from the seeds", remap::cli::cmd_lowest},
    {"map",     "Trace one number through every category", remap::cli::cmd_map},
    {"range",   "Show the pieces one interval splits into", remap::cli::cmd_range},
    {"dump",    "Print every map and its interval index", remap::cli::cmd_dump},
    {"version", "Show version information", remap::cli::cmd_version},
    {"help",    "Show this help message", remap::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string from;
    std::string to;
    std::string config_file = "remap.conf";
    bool ranges = false;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

static bool parse_number(const char* text, uint64_t& out) {
    if (!text || !*text) return false;
    try {
        size_t used = 0;
        std::string s(text);
        if (s[0] == '-') return false;
        out = std::stoull(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

namespace remap::cli {

// Load the document and build its pipeline; nullopt after reporting an error
static std::optional<std::pair<almanac::Almanac, Pipeline>> open_input(const char* path) {
    try {
        almanac::Almanac doc = almanac::load_almanac(path);
        Pipeline pipeline = almanac::build_pipeline(doc);
        return std::make_pair(std::move(doc), std::move(pipeline));
    } catch (const RemapException& e) {
        std::cerr << e.what() << "\n";
        return std::nullopt;
    }
}

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "remap - Multi-stage range remapping\n";
    std::cout << "Version " << REMAP_VERSION_STRING << "\n\n";
    std::cout << "Usage: remap [global options] <command> [options]\n";
    std::cout << "       remap [global options] <input> [--ranges]   (runs 'lowest')\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -f, --from <category>   Starting category (default: seed)\n";
    std::cout << "  -t, --to <category>     Target category (default: location)\n";
    std::cout << "  -c, --config <file>     Config file (default: remap.conf)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  REMAP_LOG_LEVEL         debug, info, warn, error or off\n";
    std::cout << "  REMAP_LOG_FILE          Append log lines to this file\n";
    std::cout << "  REMAP_FROM, REMAP_TO    Default walk endpoints\n";
    std::cout << "  REMAP_MODE              'values' or 'ranges' for the lowest command\n";
    std::cout << "\nPrecedence: command-line flags, then the config file, then the\n";
    std::cout << "environment. Keys walk.from, walk.to and walk.mode in the config\n";
    std::cout << "file override REMAP_FROM, REMAP_TO and REMAP_MODE.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  remap lowest input.txt\n";
    std::cout << "  remap lowest --ranges input.txt\n";
    std::cout << "  remap --to soil map input.txt 79\n";
    std::cout << "  remap range input.txt 79 14\n";

    return EXIT_OK;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "remap " << REMAP_VERSION_STRING << "\n";
    return EXIT_OK;
}

// =============================================================================
// Lowest Command
// =============================================================================

int cmd_lowest(int argc, char* argv[]) {
    const char* input = nullptr;
    bool ranges = g_options.ranges;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-r" || arg == "--ranges") {
            ranges = true;
        } else if (arg == "--values") {
            ranges = false;
        } else if (arg[0] != '-' && !input) {
            input = argv[i];
        }
    }

    if (!input) {
        std::cerr << "Usage: remap lowest [--ranges] <input>\n";
        return EXIT_USAGE;
    }

    auto opened = open_input(input);
    if (!opened) return EXIT_FAILED;
    const auto& [doc, pipeline] = *opened;

    std::optional<uint64_t> lowest;
    try {
        if (ranges) {
            lowest = pipeline.lowest_in_ranges(doc.seed_ranges(), g_options.from, g_options.to);
        } else {
            lowest = pipeline.lowest(doc.seeds, g_options.from, g_options.to);
        }
    } catch (const RemapException& e) {
        std::cerr << e.what() << "\n";
        return EXIT_FAILED;
    }

    if (!lowest) {
        std::cerr << "Could not map any seeds from '" << g_options.from
                  << "' to '" << g_options.to << "'\n";
        return EXIT_FAILED;
    }

    std::cout << "smallest " << g_options.to << ": " << *lowest << "\n";
    return EXIT_OK;
}

// =============================================================================
// Map Command
// =============================================================================

int cmd_map(int argc, char* argv[]) {
    uint64_t number = 0;
    if (argc < 2 || !parse_number(argv[1], number)) {
        std::cerr << "Usage: remap map <input> <number>\n";
        return EXIT_USAGE;
    }

    auto opened = open_input(argv[0]);
    if (!opened) return EXIT_FAILED;
    const Pipeline& pipeline = opened->second;

    auto path = pipeline.chain(g_options.from, g_options.to);
    if (!path) {
        std::cerr << "No chain from '" << g_options.from << "' to '" << g_options.to << "'\n";
        return EXIT_FAILED;
    }

    Value value{g_options.from, number};
    std::cout << value;
    for (size_t hop = 0; hop + 1 < path->size(); ++hop) {
        auto next = pipeline.map(value, (*path)[hop + 1]);
        if (!next) return EXIT_FAILED;
        value = *next;
        std::cout << " -> " << value;
    }
    std::cout << "\n";
    return EXIT_OK;
}

// =============================================================================
// Range Command
// =============================================================================

int cmd_range(int argc, char* argv[]) {
    uint64_t start = 0;
    uint64_t length = 0;
    if (argc < 3 || !parse_number(argv[1], start) || !parse_number(argv[2], length) ||
        start > UINT64_MAX - length) {
        std::cerr << "Usage: remap range <input> <start> <length>\n";
        return EXIT_USAGE;
    }

    auto opened = open_input(argv[0]);
    if (!opened) return EXIT_FAILED;
    const Pipeline& pipeline = opened->second;

    Interval query(start, start + length);
    auto pieces = pipeline.map_range(query, g_options.from, g_options.to);
    if (!pieces) {
        std::cerr << "No chain from '" << g_options.from << "' to '" << g_options.to << "'\n";
        return EXIT_FAILED;
    }

    for (const auto& piece : *pieces) {
        std::cout << piece << " (" << piece.length() << ")\n";
    }
    if (!g_options.quiet) {
        std::cout << pieces->size() << " pieces, " << total_length(*pieces) << " values";
        if (auto low = min_start(*pieces)) {
            std::cout << ", lowest " << *low;
        }
        std::cout << "\n";
    }
    return EXIT_OK;
}

// =============================================================================
// Dump Command
// =============================================================================

int cmd_dump(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: remap dump <input>\n";
        return EXIT_USAGE;
    }

    auto opened = open_input(argv[0]);
    if (!opened) return EXIT_FAILED;
    const auto& [doc, pipeline] = *opened;

    std::cout << "seeds:";
    for (uint64_t seed : doc.seeds) std::cout << " " << seed;
    std::cout << "\n";

    for (const auto& block : doc.blocks) {
        const CategoryMap* map = pipeline.find(block.source);
        const IntervalIndex& index = map->index();
        std::cout << "\n" << map->source() << " -> " << map->target()
                  << " (" << index.size() << " rules, height " << index.height() << ")\n";
        index.for_each_in_order([](const RangeRule& rule, uint64_t max_end, size_t depth) {
            std::cout << std::string(2 + depth * 2, ' ') << rule << "  max=" << max_end << "\n";
        });
    }
    return EXIT_OK;
}

}  // namespace remap::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static bool parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-f" || arg == "--from") && i + 1 < argc) {
            g_options.from = argv[++i];
        } else if ((arg == "-t" || arg == "--to") && i + 1 < argc) {
            g_options.to = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else if (arg[0] != '-') {
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return true;
}

// Config supplies defaults; flags given on the command line win
static bool apply_config() {
    if (!remap::init_config(g_options.config_file)) {
        return false;
    }

    const remap::Config& config = remap::Config::getInstance();
    if (g_options.from.empty()) g_options.from = config.get<std::string>("walk.from");
    if (g_options.to.empty()) g_options.to = config.get<std::string>("walk.to");
    g_options.ranges = config.get<std::string>("walk.mode") == "ranges";

    if (g_options.verbose) {
        remap::set_log_level(remap::LogLevel::DEBUG);
        config.print();
    } else if (g_options.quiet) {
        remap::set_log_level(remap::LogLevel::ERROR);
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (!parse_global_options(argc, argv)) {
        return EXIT_USAGE;
    }
    if (!apply_config()) {
        return EXIT_USAGE;
    }

    if (argc < 1) {
        remap::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[0];
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc - 1, argv + 1);
        }
    }

    // No command named: "remap <input> [--ranges]" means lowest
    return remap::cli::cmd_lowest(argc, argv);
}
