#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

struct Options {
    static constexpr std::size_t MAX_TRACE_DEPTH = std::size_t(1) << 20;

    std::vector<std::string> images;
    std::string trace_path;
    std::size_t trace_depth = 4096;
    bool verbose = false;
};

void usage(std::ostream& os);

// Digits only, 1..MAX_TRACE_DEPTH. Returns false otherwise.
bool parse_trace_depth(const std::string& s, std::size_t& out);

// Returns -1 to continue, otherwise the exit status to leave with
// (0 for --help, 2 for bad usage). Messages go to `out` / `err`.
int parse_args(int argc, const char* const* argv, Options& o,
               std::ostream& out, std::ostream& err);
