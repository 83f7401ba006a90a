#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace filedrop::util {

inline std::string escape_json(std::string_view raw) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string escaped;
    escaped.reserve(raw.size() + 2);
    for (char ch : raw) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            case '\b':
                escaped.append("\\b");
                break;
            case '\f':
                escaped.append("\\f");
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    escaped.append("\\u00");
                    escaped.push_back(kHex[(ch >> 4) & 0x0F]);
                    escaped.push_back(kHex[ch & 0x0F]);
                } else {
                    escaped.push_back(ch);
                }
        }
    }
    return escaped;
}

// Streaming writer for the small documents the handlers return. Commas are
// inserted automatically; callers are responsible for balanced begin/end.
class JsonWriter {
public:
    JsonWriter& begin_object() {
        separate();
        out_ << '{';
        first_.push_back(true);
        return *this;
    }

    JsonWriter& end_object() {
        first_.pop_back();
        out_ << '}';
        return *this;
    }

    JsonWriter& begin_array() {
        separate();
        out_ << '[';
        first_.push_back(true);
        return *this;
    }

    JsonWriter& end_array() {
        first_.pop_back();
        out_ << ']';
        return *this;
    }

    JsonWriter& key(std::string_view name) {
        separate();
        out_ << '"' << escape_json(name) << "\":";
        after_key_ = true;
        return *this;
    }

    JsonWriter& value(std::string_view text) {
        separate();
        out_ << '"' << escape_json(text) << '"';
        return *this;
    }

    JsonWriter& value(const char* text) { return value(std::string_view(text)); }

    JsonWriter& value(std::uint64_t number) {
        separate();
        out_ << number;
        return *this;
    }

    JsonWriter& value(bool flag) {
        separate();
        out_ << (flag ? "true" : "false");
        return *this;
    }

    std::string str() const { return out_.str(); }

private:
    void separate() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (first_.empty()) {
            return;
        }
        if (!first_.back()) {
            out_ << ',';
        }
        first_.back() = false;
    }

    std::ostringstream out_;
    std::vector<bool> first_;
    bool after_key_ = false;
};

}  // namespace filedrop::util
