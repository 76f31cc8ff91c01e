#include "Report.h"

#include <sstream>

namespace notox {

Result<std::string> TextReport::render(const std::vector<Outcome>& outcomes) const {
    std::ostringstream oss;
    for (const auto& o : outcomes) {
        switch (o.kind()) {
            case Outcome::Kind::Unchanged:
                break;
            case Outcome::Kind::Changed:
                oss << o.path().string() << " -> " << o.modified()->string() << '\n';
                break;
            case Outcome::Kind::Error:
                oss << o.path().string() << " : " << *o.error() << '\n';
                break;
            case Outcome::Kind::ErrorRename:
                oss << o.path().string() << " -> " << o.modified()->string()
                    << " : " << *o.error() << '\n';
                break;
        }
    }
    const auto n = outcomes.size();
    oss << n << (n == 1 ? " file checked" : " files checked") << '\n';
    return Result<std::string>::ok(oss.str());
}

} // namespace notox
