#include "TreeWalker.h"

#include <iterator>
#include <utility>

namespace notox {

std::vector<Outcome> TreeWalker::walk(const fs::path& root) const {
    std::vector<Outcome> out;
    Outcome self = engine_.apply(root);
    const fs::path dir = self.kind() == Outcome::Kind::Changed ? *self.modified() : root;
    out.push_back(std::move(self));

    auto listing = lister_.list(dir);
    if (!listing.has_value()) {
        out.push_back(Outcome::error(dir, listing.error()));
        return out;
    }
    for (auto& msg : listing.value().entry_errors)
        out.push_back(Outcome::error(dir, std::move(msg)));

    auto children = pool_.map_concat(listing.value().entries,
                                     [this](const EntryInfo& e) { return visit(e); });
    out.insert(out.end(), std::make_move_iterator(children.begin()),
               std::make_move_iterator(children.end()));
    return out;
}

std::vector<Outcome> TreeWalker::visit(const EntryInfo& entry) const {
    if (entry.is_dir) return walk(entry.path);
    return {engine_.apply(entry.path)};
}

} // namespace notox
