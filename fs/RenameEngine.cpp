#include "RenameEngine.h"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <mutex>
#include <system_error>

namespace notox {

namespace {

// Moves `from` to `to` unless `to` already exists, as one step.
std::error_code rename_no_replace(const fs::path& from, const fs::path& to) {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0)
        return {};
    const int err = errno;
    if (err != EINVAL && err != ENOSYS) return std::error_code(err, std::generic_category());

    // Filesystem without RENAME_NOREPLACE: check and rename under one lock.
    static std::mutex fallback;
    std::lock_guard<std::mutex> lock(fallback);
    std::error_code ec;
    if (fs::exists(fs::symlink_status(to, ec))) return std::make_error_code(std::errc::file_exists);
    fs::rename(from, to, ec);
    return ec;
}

} // namespace

fs::path without_trailing_separator(const fs::path& p) {
    if (p.has_filename() || !p.has_relative_path()) return p;
    return p.parent_path();
}

Outcome RenameEngine::apply(const fs::path& p) const {
    const fs::path base = without_trailing_separator(p);
    const fs::path name = base.filename();
    if (name.empty() || name == "." || name == "..") return Outcome::unchanged(p);

    SanitizedName s = sanitizer_.sanitize(name.native());
    if (!s.changed) return Outcome::unchanged(p);

    fs::path target = base;
    target.replace_filename(s.name);

    if (dry_run_) return Outcome::dry_run(p, std::move(target));

    if (std::error_code ec = rename_no_replace(base, target))
        return Outcome::rename_failed(p, std::move(target), ec.message());
    return Outcome::changed(p, std::move(target));
}

} // namespace notox
