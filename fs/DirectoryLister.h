#pragma once
#include "EntryInfo.h"
#include "../util/Result.h"

#include <string>
#include <vector>

namespace notox {

struct DirListing {
    std::vector<EntryInfo> entries;       // native readdir order, no "." / ".."
    std::vector<std::string> entry_errors; // failures after the stream was opened
};

inline constexpr const char* kReadDirError = "Error while reading directory";

class DirectoryLister {
public:
    // Fails only when the directory cannot be opened at all.
    Result<DirListing> list(const fs::path& dir) const;
};

} // namespace notox
