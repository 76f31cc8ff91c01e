#pragma once
#include "Options.h"
#include "../fs/Outcome.h"

#include <ostream>
#include <vector>

namespace notox {

class NotoxApp {
public:
    NotoxApp(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    // Returns the process exit status.
    int run(int argc, char* argv[]);

    // Runs an already parsed command line and prints the report.
    int run(const Options& opt);

private:
    std::vector<fs::path> resolve_operands(const Options& opt) const;

    std::ostream& out_;
    std::ostream& err_;
};

} // namespace notox
