#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace notox {

namespace fs = std::filesystem;

// Reason carried by rename previews; not an actual failure.
inline constexpr std::string_view kDryRunReason = "dry-run";

// Result of sanitizing one path. Immutable once built.
class Outcome {
public:
    enum class Kind { Unchanged, Changed, ErrorRename, Error };

    static Outcome unchanged(fs::path p);
    static Outcome changed(fs::path p, fs::path modified);
    static Outcome dry_run(fs::path p, fs::path modified);
    static Outcome rename_failed(fs::path p, fs::path modified, std::string error);
    static Outcome error(fs::path p, std::string error);

    // Rebuilds an outcome from its external (path, modified, error) layout.
    static Outcome from_fields(fs::path p,
                               std::optional<fs::path> modified,
                               std::optional<std::string> error);

    Kind kind() const noexcept { return kind_; }
    const fs::path& path() const noexcept { return path_; }
    const std::optional<fs::path>& modified() const noexcept { return modified_; }
    const std::optional<std::string>& error() const noexcept { return error_; }

    bool is_dry_run() const noexcept { return dry_run_; }
    bool is_failure() const noexcept {
        return kind_ == Kind::Error || kind_ == Kind::ErrorRename;
    }

    friend bool operator==(const Outcome& a, const Outcome& b) {
        return a.kind_ == b.kind_ && a.path_ == b.path_
            && a.modified_ == b.modified_ && a.error_ == b.error_;
    }
    friend bool operator!=(const Outcome& a, const Outcome& b) { return !(a == b); }

private:
    Outcome(Kind k, fs::path p) : kind_(k), path_(std::move(p)) {}

    Kind kind_;
    fs::path path_;
    std::optional<fs::path> modified_;
    std::optional<std::string> error_;
    bool dry_run_{false};
};

[[nodiscard]] const char* kind_name(Outcome::Kind k) noexcept;

} // namespace notox
