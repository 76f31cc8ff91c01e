#pragma once
#include <cerrno>
#include <dirent.h>
#include <system_error>

namespace notox {

// Owns an open directory stream.
class DirHandle {
public:
    explicit DirHandle(const char* path) : dir_(::opendir(path)) {
        if (!dir_) open_error_ = std::error_code(errno, std::generic_category());
    }
    ~DirHandle() { if (dir_) ::closedir(dir_); }
    DirHandle(const DirHandle&) = delete;
    DirHandle& operator=(const DirHandle&) = delete;
    DirHandle(DirHandle&& other) noexcept
        : dir_(other.dir_), open_error_(other.open_error_) { other.dir_ = nullptr; }

    explicit operator bool() const { return dir_ != nullptr; }
    const std::error_code& open_error() const { return open_error_; }

    // Next raw entry, or nullptr at the end of the stream or on failure
    // (ec is set only for the latter).
    ::dirent* read(std::error_code& ec) {
        ec.clear();
        errno = 0;
        ::dirent* e = ::readdir(dir_);
        if (!e && errno != 0) ec = std::error_code(errno, std::generic_category());
        return e;
    }

private:
    DIR* dir_{};
    std::error_code open_error_;
};

} // namespace notox
