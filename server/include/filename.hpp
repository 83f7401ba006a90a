#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace filedrop::server {

// Reduces a client supplied name to a single safe path component.
//
// Both '/' and '\' count as separators (browsers on Windows have been known to
// send full paths). Trailing separators are ignored and the last component is
// kept. The name is rejected when any component is "..", when the result is
// empty, "." or "..", or when it contains a control character.
std::optional<std::string> sanitize_filename(std::string_view raw);

// True when `name` is already a single safe component.
bool is_safe_filename(std::string_view name);

}  // namespace filedrop::server
