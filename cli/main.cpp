#include "repricer.h"

#include <charconv>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

using namespace repricer_cpp;

static void usage(char const* prog) {
    std::cerr << "Usage: " << prog << " --adjust <value> [--file <path>] [--limit <n>] [--fragment] [--verbose]\n"
              << "Reads HTML from stdin or --file and writes HTML with adjusted prices to stdout.\n"
              << "Options:\n"
              << "  --adjust <value>    Amount to add (e.g. -2.46) or percentage (e.g. -14%)\n"
              << "  --file <path>       Read HTML from file instead of stdin\n"
              << "  --limit <n>         Rewrite at most n price-containing elements\n"
              << "  --fragment          Write only the body's inner markup\n"
              << "  --verbose           Print a summary and diagnostics to stderr\n"
              << "  --help              Show this help\n";
}

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::optional<std::size_t> parse_count(std::string const& text) {
    std::size_t value = 0;
    char const* first = text.data();
    char const* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

int main(int argc, char** argv) {
    std::string filePath;
    std::optional<Adjustment> adjustment;
    bool verbose = false;
    AdjustOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--file" && i + 1 < argc) {
            filePath = argv[++i];
        } else if (arg == "--adjust" && i + 1 < argc) {
            std::string value = argv[++i];
            adjustment = Adjustment::parse(value);
            if (!adjustment) {
                std::cerr << "Invalid adjustment: " << value << "\n";
                return 1;
            }
        } else if (arg == "--limit" && i + 1 < argc) {
            std::string value = argv[++i];
            opts.limit = parse_count(value);
            if (!opts.limit) {
                std::cerr << "Invalid limit: " << value << "\n";
                return 1;
            }
        } else if (arg == "--fragment") {
            opts.fragment = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    if (!adjustment) {
        usage(argv[0]);
        return 1;
    }

    std::string html;
    if (!filePath.empty()) {
        std::ifstream f(filePath);
        if (!f) {
            std::cerr << "Failed to open " << filePath << "\n";
            return 1;
        }
        html = read_all(f);
    } else {
        html = read_all(std::cin);
    }

    if (verbose) {
        opts.diagnosticHandler = [](dom::NodeView node, std::string const& message) {
            std::cerr << "<" << node.tag_name() << ">: " << message << "\n";
        };
    }

    AdjustReport report;
    std::cout << adjustHtml(html, *adjustment, opts, &report);

    if (verbose) {
        std::cerr << report.candidates << " element(s) matched, "
                  << report.nodesRewritten << " rewritten, "
                  << report.amountsAdjusted << " amount(s) adjusted, "
                  << report.nodesAborted << " left unchanged\n";
    }
    return 0;
}
