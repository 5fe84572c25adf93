/**
 * Directory Search Example
 *
 * Usage: search_directory <root> <pattern> [limit] [threads]
 *
 * Walks <root> in parallel, counting every entry whose name contains
 * <pattern> (case-insensitive), and prints the matches with scan statistics.
 */

#include <parex/search.hpp>
#include <parex/sources/directory_source.hpp>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace parex;

namespace {

// Plain decimal digits only; stoull would accept "-1" and wrap it
bool parse_count(const char* text, std::size_t& out) {
    if (!std::isdigit(static_cast<unsigned char>(text[0]))) return false;
    try {
        std::size_t consumed = 0;
        const unsigned long long value = std::stoull(text, &consumed);
        if (text[consumed] != '\0') return false;
        out = static_cast<std::size_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 5) {
        std::cerr << "Usage: " << argv[0] << " <root> <pattern> [limit] [threads]\n";
        return 2;
    }

    auto builder = search()
        .source(DirectorySource(argv[1]))
        .matching(argv[2])
        .collect_paths(true)
        .collect_errors(true);

    std::size_t value = 0;
    if (argc >= 4) {
        if (!parse_count(argv[3], value)) {
            std::cerr << "Invalid limit: " << argv[3] << "\n";
            return 2;
        }
        builder.limit(value);
    }
    if (argc >= 5) {
        if (!parse_count(argv[4], value)) {
            std::cerr << "Invalid thread count: " << argv[4] << "\n";
            return 2;
        }
        builder.threads(value);
    }

    std::cout << "=== parex directory search ===\n";
    std::cout << "  Root: " << argv[1] << "\n";
    std::cout << "  Pattern: " << argv[2] << "\n";
    std::cout << "  Threads: " << builder.options().config.threads << "\n\n";

    try {
        const Results results = builder.run();

        for (const auto& path : results.paths) {
            std::cout << path.string() << "\n";
        }
        for (const auto& error : results.errors) {
            std::cerr << "skipped: " << error.describe() << "\n";
        }

        std::cout << "\nResults:\n";
        std::cout << "  Matches: " << results.matches << "\n";
        std::cout << "  Files scanned: " << results.stats.files << "\n";
        std::cout << "  Directories scanned: " << results.stats.dirs << "\n";
        std::cout << "  Duration: " << results.stats.duration_seconds() << " s\n";
        std::cout << "  Throughput: " << results.stats.entries_per_sec << " entries/s\n";
    } catch (const ParexError& e) {
        std::cerr << "Search failed [" << to_string(e.kind()) << "]: " << e.describe() << "\n";
        return 1;
    }

    return 0;
}
