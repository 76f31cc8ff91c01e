#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace notox {

struct SanitizedName {
    std::string name;
    bool changed{false};
};

// Accumulates the ASCII output of one sanitizing pass. Never holds two
// consecutive collapse placeholders.
class NameBuilder {
public:
    void literal(char c) { out_.push_back(c); last_was_collapse_ = false; }
    void literal(std::string_view s) { out_.append(s); last_was_collapse_ = false; }
    void collapse() {
        if (!last_was_collapse_) out_.push_back('_');
        last_was_collapse_ = true;
    }

    bool last_was_collapse() const noexcept { return last_was_collapse_; }
    std::string take() { return std::move(out_); }

private:
    std::string out_;
    bool last_was_collapse_{false};
};

class NameSanitizer {
public:
    // Pure function of `component`: the raw bytes of one path segment.
    [[nodiscard]] SanitizedName sanitize(std::string_view component) const;
};

} // namespace notox
