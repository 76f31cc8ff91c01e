#include "DirectoryLister.h"
#include "DirHandle.h"

#include <cstring>
#include <utility>
#include <sys/stat.h>

namespace notox {

namespace {

bool entry_is_dir(const fs::path& full, const ::dirent* e) {
#ifdef _DIRENT_HAVE_D_TYPE
    if (e->d_type != DT_UNKNOWN) return e->d_type == DT_DIR;
#else
    (void)e;
#endif
    // lstat: a symlink to a directory is not descended into.
    struct ::stat st{};
    if (::lstat(full.c_str(), &st) != 0) return false;
    return S_ISDIR(st.st_mode);
}

} // namespace

Result<DirListing> DirectoryLister::list(const fs::path& dir) const {
    DirHandle handle(dir.c_str());
    if (!handle) return Result<DirListing>::fail(kReadDirError);

    DirListing out;
    std::error_code ec;
    for (;;) {
        ::dirent* e = handle.read(ec);
        if (ec) {
            out.entry_errors.push_back("Error reading dir entry of directory " + ec.message());
            break;
        }
        if (!e) break;
        if (std::strcmp(e->d_name, ".") == 0 || std::strcmp(e->d_name, "..") == 0) continue;

        fs::path full = dir / e->d_name;
        const bool is_dir = entry_is_dir(full, e);
        out.entries.emplace_back(std::move(full), is_dir);
    }
    return Result<DirListing>::ok(std::move(out));
}

} // namespace notox
