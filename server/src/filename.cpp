#include "filename.hpp"

#include <algorithm>

namespace filedrop::server {

namespace {

bool is_separator(char ch) {
    return ch == '/' || ch == '\\';
}

bool has_control_char(std::string_view value) {
    return std::any_of(value.begin(), value.end(),
                       [](char ch) { return static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f; });
}

}  // namespace

std::optional<std::string> sanitize_filename(std::string_view raw) {
    while (!raw.empty() && is_separator(raw.back())) {
        raw.remove_suffix(1);
    }

    std::string_view last;
    std::size_t start = 0;
    while (start <= raw.size()) {
        auto end = start;
        while (end < raw.size() && !is_separator(raw[end])) {
            ++end;
        }
        const auto component = raw.substr(start, end - start);
        if (component == "..") {
            return std::nullopt;
        }
        last = component;
        start = end + 1;
    }

    if (!is_safe_filename(last)) {
        return std::nullopt;
    }
    return std::string(last);
}

bool is_safe_filename(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (std::any_of(name.begin(), name.end(), is_separator)) {
        return false;
    }
    return !has_control_char(name);
}

}  // namespace filedrop::server
