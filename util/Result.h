#pragma once
#include <optional>
#include <string>
#include <utility>

namespace notox {

// Value-or-message holder for calls that fail without throwing.
template <typename T>
class Result {
public:
    static Result ok(T v) {
        Result r; r.value_ = std::move(v); return r;
    }
    static Result fail(std::string err) {
        Result r; r.error_ = std::move(err); return r;
    }
    bool has_value() const noexcept { return value_.has_value(); }
    T&       value()       { return *value_; }
    const T& value() const { return *value_; }
    const std::string& error() const { return error_; }
private:
    std::optional<T> value_;
    std::string error_;
};

} // namespace notox
