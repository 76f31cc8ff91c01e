#pragma once
#include "Outcome.h"
#include "../text/NameSanitizer.h"

namespace notox {

// Applies the sanitizer verdict to one path. With dry_run set, planned renames
// are reported as previews and the filesystem is left alone.
class RenameEngine {
public:
    explicit RenameEngine(bool dry_run) : dry_run_(dry_run) {}

    Outcome apply(const fs::path& p) const;

    bool dry_run() const noexcept { return dry_run_; }

private:
    NameSanitizer sanitizer_;
    bool dry_run_;
};

// "dir/" names the same entry as "dir".
[[nodiscard]] fs::path without_trailing_separator(const fs::path& p);

} // namespace notox
