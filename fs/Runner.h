#pragma once
#include "ForkJoin.h"
#include "Outcome.h"
#include "RenameEngine.h"

#include <ostream>
#include <vector>

namespace notox {

struct RunSettings {
    bool dry_run{true};
    unsigned jobs{1};                // 1: sequential and deterministic
    std::ostream* progress{nullptr}; // "Checking: <path>" lines when set
};

// Top-level driver: sanitizes every root, walking the ones that are directories.
// Roots must not overlap when jobs > 1.
class Runner {
public:
    explicit Runner(RunSettings settings);

    std::vector<Outcome> run(const std::vector<fs::path>& roots) const;

private:
    std::vector<Outcome> run_one(const fs::path& root) const;

    RunSettings settings_;
    RenameEngine engine_;
    ForkJoin pool_;
};

// Drops repeated paths, keeping the first occurrence.
[[nodiscard]] std::vector<fs::path> unique_paths(const std::vector<fs::path>& paths);

} // namespace notox
