#include "Runner.h"
#include "TreeWalker.h"

#include <set>
#include <system_error>

namespace notox {

Runner::Runner(RunSettings settings)
    : settings_(settings), engine_(settings.dry_run), pool_(settings.jobs) {}

std::vector<Outcome> Runner::run(const std::vector<fs::path>& roots) const {
    const std::vector<fs::path> todo = unique_paths(roots);
    if (settings_.progress) {
        for (const auto& p : todo) *settings_.progress << "Checking: " << p.string() << '\n';
    }
    return pool_.map_concat(todo, [this](const fs::path& p) { return run_one(p); });
}

std::vector<Outcome> Runner::run_one(const fs::path& root) const {
    std::error_code ec;
    // Roots follow symlinks, entries found while walking do not.
    if (fs::is_directory(root, ec)) {
        TreeWalker walker(engine_, pool_);
        return walker.walk(root);
    }
    return {engine_.apply(root)};
}

std::vector<fs::path> unique_paths(const std::vector<fs::path>& paths) {
    std::set<fs::path> seen;
    std::vector<fs::path> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        if (seen.insert(p).second) out.push_back(p);
    }
    return out;
}

} // namespace notox
