#pragma once
#include "../util/Result.h"

#include <iosfwd>
#include <string>
#include <vector>

#ifndef NOTOX_VERSION
#define NOTOX_VERSION "0.0.0"
#endif
#ifndef NOTOX_AUTHORS
#define NOTOX_AUTHORS "the notox contributors"
#endif

namespace notox {

enum class OutputMode { Default, Quiet, Json };

// A path argument and whether output was verbose when it was read, which
// decides if a missing path is reported.
struct Operand {
    std::string path;
    bool verbose_at_parse = true;

    friend bool operator==(const Operand& a, const Operand& b) {
        return a.path == b.path && a.verbose_at_parse == b.verbose_at_parse;
    }
};

struct Options {
    bool dry_run = true;           // -d turns renaming on
    OutputMode output = OutputMode::Default;
    bool json_only_errors = false;
    bool json_pretty = false;
    unsigned jobs = 0;             // 0: one per hardware thread
    bool show_help = false;
    bool show_version = false;
    std::vector<Operand> operands;  // command line order

    bool verbose() const noexcept { return output == OutputMode::Default; }
};

// Parses argv with getopt_long in argument order. Help and version stop the
// scan early.
Result<Options> parse_options(int argc, char* argv[]);

void print_usage(std::ostream& os);
void print_version(std::ostream& os);

} // namespace notox
