#include "Report.h"
#include "JsonEscape.h"

#include <sstream>

namespace notox {

namespace {

bool write_string(std::ostringstream& oss, const std::string& s) {
    std::string quoted;
    if (!append_json_string(quoted, s)) return false;
    oss << quoted;
    return true;
}

template <typename T, typename Str>
bool write_optional(std::ostringstream& oss, const std::optional<T>& v, Str to_string) {
    if (!v) { oss << "null"; return true; }
    return write_string(oss, to_string(*v));
}

} // namespace

Result<std::string> JsonReport::render(const std::vector<Outcome>& outcomes) const {
    // field separators for the compact and two-space indented layouts
    const char* open   = pretty_ ? "\n    " : "";
    const char* sep    = pretty_ ? ",\n    " : ",";
    const char* colon  = pretty_ ? ": " : ":";
    const char* close  = pretty_ ? "\n  }" : "}";
    const char* item   = pretty_ ? "\n  {" : "{";
    const char* between = ",";

    std::ostringstream oss;
    oss << '[';
    bool first = true;
    for (const auto& o : outcomes) {
        if (only_errors_ && !o.is_failure()) continue;
        if (!first) oss << between;
        first = false;

        oss << item << open << "\"path\"" << colon;
        if (!write_string(oss, o.path().string())) return Result<std::string>::fail(kJsonFailure);
        oss << sep << "\"modified\"" << colon;
        if (!write_optional(oss, o.modified(), [](const fs::path& p) { return p.string(); }))
            return Result<std::string>::fail(kJsonFailure);
        oss << sep << "\"error\"" << colon;
        if (!write_optional(oss, o.error(), [](const std::string& s) { return s; }))
            return Result<std::string>::fail(kJsonFailure);
        oss << close;
    }
    if (pretty_ && !first) oss << '\n';
    oss << "]\n";
    return Result<std::string>::ok(oss.str());
}

} // namespace notox
