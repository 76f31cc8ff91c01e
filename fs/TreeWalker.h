#pragma once
#include "DirectoryLister.h"
#include "ForkJoin.h"
#include "Outcome.h"
#include "RenameEngine.h"

#include <vector>

namespace notox {

// Depth-first sanitizing walk: a directory is renamed before its children and
// the children are listed under the new name. With jobs > 1 sibling entries
// may be handled concurrently and the result order between them is unspecified.
class TreeWalker {
public:
    TreeWalker(const RenameEngine& engine, const ForkJoin& pool)
        : engine_(engine), pool_(pool) {}

    std::vector<Outcome> walk(const fs::path& root) const;

private:
    std::vector<Outcome> visit(const EntryInfo& entry) const;

    const RenameEngine& engine_;
    const ForkJoin& pool_;
    DirectoryLister lister_;
};

} // namespace notox
