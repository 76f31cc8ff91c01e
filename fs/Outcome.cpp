#include "Outcome.h"

#include <utility>

namespace notox {

Outcome Outcome::unchanged(fs::path p) {
    return Outcome(Kind::Unchanged, std::move(p));
}

Outcome Outcome::changed(fs::path p, fs::path modified) {
    Outcome o(Kind::Changed, std::move(p));
    o.modified_ = std::move(modified);
    return o;
}

Outcome Outcome::dry_run(fs::path p, fs::path modified) {
    Outcome o(Kind::ErrorRename, std::move(p));
    o.modified_ = std::move(modified);
    o.error_ = std::string(kDryRunReason);
    o.dry_run_ = true;
    return o;
}

Outcome Outcome::rename_failed(fs::path p, fs::path modified, std::string error) {
    Outcome o(Kind::ErrorRename, std::move(p));
    o.modified_ = std::move(modified);
    o.error_ = std::move(error);
    return o;
}

Outcome Outcome::error(fs::path p, std::string error) {
    Outcome o(Kind::Error, std::move(p));
    o.error_ = std::move(error);
    return o;
}

Outcome Outcome::from_fields(fs::path p,
                             std::optional<fs::path> modified,
                             std::optional<std::string> error) {
    if (!modified && !error) return unchanged(std::move(p));
    if (modified && !error) return changed(std::move(p), std::move(*modified));
    if (!modified) return Outcome::error(std::move(p), std::move(*error));
    if (*error == kDryRunReason) return dry_run(std::move(p), std::move(*modified));
    return rename_failed(std::move(p), std::move(*modified), std::move(*error));
}

const char* kind_name(Outcome::Kind k) noexcept {
    switch (k) {
        case Outcome::Kind::Unchanged:   return "unchanged";
        case Outcome::Kind::Changed:     return "changed";
        case Outcome::Kind::ErrorRename: return "error-rename";
        case Outcome::Kind::Error:       return "error";
    }
    return "?";
}

} // namespace notox
