#pragma once
#include <filesystem>
#include <utility>

namespace notox {

namespace fs = std::filesystem;

// One directory entry as seen by the walker. Symlinks are never directories.
struct EntryInfo {
    fs::path path;
    bool is_dir{false};

    EntryInfo(fs::path p, bool dir) : path(std::move(p)), is_dir(dir) {}
};

} // namespace notox
