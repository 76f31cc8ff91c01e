#pragma once
#include "../fs/Outcome.h"
#include "../util/Result.h"

#include <string>
#include <vector>

namespace notox {

// Renders the outcome list of one run.
class IReport {
public:
    virtual ~IReport() = default;
    virtual Result<std::string> render(const std::vector<Outcome>& outcomes) const = 0;
};

// "<path> -> <modified> : <error>" lines plus a checked-count footer.
class TextReport final : public IReport {
public:
    Result<std::string> render(const std::vector<Outcome>& outcomes) const override;
};

class JsonReport final : public IReport {
public:
    JsonReport(bool only_errors, bool pretty) : only_errors_(only_errors), pretty_(pretty) {}

    // Fails when a path is not valid UTF-8.
    Result<std::string> render(const std::vector<Outcome>& outcomes) const override;

private:
    bool only_errors_;
    bool pretty_;
};

class QuietReport final : public IReport {
public:
    Result<std::string> render(const std::vector<Outcome>&) const override {
        return Result<std::string>::ok({});
    }
};

inline constexpr const char* kJsonFailure = R"({"error": "Cannot serialize result"})";

} // namespace notox
