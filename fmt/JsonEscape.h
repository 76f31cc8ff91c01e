#pragma once
#include <string>
#include <string_view>

namespace notox {

// Appends s to out as a quoted JSON string. JSON strings must carry
// well-formed UTF-8: on a malformed sequence out is left as it was and
// false is returned.
[[nodiscard]] bool append_json_string(std::string& out, std::string_view s);

} // namespace notox
