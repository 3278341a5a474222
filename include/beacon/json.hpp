// include/beacon/json.hpp
// Minimal JSON writers for ping payloads. Writes text directly, no DOM.

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

namespace beacon {
namespace json {

inline bool needs_escape(char c) {
    return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
}

// Append s with JSON string escaping. Runs of safe characters are bulk-copied.
inline void append_escaped(std::string& out, const char* s, size_t len) {
    size_t i = 0;
    while (i < len) {
        size_t run_start = i;
        while (i < len && !needs_escape(s[i])) ++i;
        if (i > run_start) {
            out.append(s + run_start, i - run_start);
        }
        if (i < len) {
            char c = s[i];
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default: {
                    char hex[7];
                    std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                    out.append(hex, 6);
                    break;
                }
            }
            ++i;
        }
    }
}

inline void append_string(std::string& out, const std::string& s) {
    out.push_back('"');
    append_escaped(out, s.data(), s.size());
    out.push_back('"');
}

inline std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    append_string(out, s);
    return out;
}

inline void append_int(std::string& out, int64_t value) {
    char tmp[24];
    int n = std::snprintf(tmp, sizeof(tmp), "%lld", static_cast<long long>(value));
    if (n > 0) out.append(tmp, static_cast<size_t>(n));
}

} // namespace json

// JSON object writer.
//
// Example:
//   auto doc = JsonObject().add("v", 7).add("os", "Linux").str();
class JsonObject {
public:
    JsonObject() { buf_.reserve(128); }

    JsonObject& add(const std::string& key, const std::string& value) {
        begin_field(key);
        json::append_string(buf_, value);
        return *this;
    }

    JsonObject& add(const std::string& key, const char* value) {
        begin_field(key);
        buf_.push_back('"');
        json::append_escaped(buf_, value, std::strlen(value));
        buf_.push_back('"');
        return *this;
    }

    JsonObject& add(const std::string& key, int64_t value) {
        begin_field(key);
        json::append_int(buf_, value);
        return *this;
    }

    JsonObject& add(const std::string& key, int value) {
        return add(key, static_cast<int64_t>(value));
    }

    JsonObject& add(const std::string& key, double value) {
        begin_field(key);
        char tmp[64];
        int n = std::snprintf(tmp, sizeof(tmp), "%g", value);
        if (n > 0) buf_.append(tmp, static_cast<size_t>(n));
        return *this;
    }

    JsonObject& add(const std::string& key, bool value) {
        begin_field(key);
        buf_ += value ? "true" : "false";
        return *this;
    }

    // Insert an already-serialized JSON value verbatim.
    JsonObject& add_raw(const std::string& key, const std::string& raw_json) {
        begin_field(key);
        buf_ += raw_json;
        return *this;
    }

    JsonObject& add_null(const std::string& key) {
        begin_field(key);
        buf_ += "null";
        return *this;
    }

    std::string str() const { return "{" + buf_ + "}"; }

    bool empty() const noexcept { return count_ == 0; }
    size_t size() const noexcept { return count_; }

private:
    std::string buf_;
    size_t count_ = 0;

    void begin_field(const std::string& key) {
        if (count_ > 0) buf_.push_back(',');
        json::append_string(buf_, key);
        buf_.push_back(':');
        count_++;
    }
};

// JSON array writer.
class JsonArray {
public:
    JsonArray& push(const std::string& value) {
        begin_element();
        json::append_string(buf_, value);
        return *this;
    }

    JsonArray& push(int64_t value) {
        begin_element();
        json::append_int(buf_, value);
        return *this;
    }

    JsonArray& push_raw(const std::string& raw_json) {
        begin_element();
        buf_ += raw_json;
        return *this;
    }

    JsonArray& push_null() {
        begin_element();
        buf_ += "null";
        return *this;
    }

    std::string str() const { return "[" + buf_ + "]"; }

    bool empty() const noexcept { return count_ == 0; }
    size_t size() const noexcept { return count_; }

private:
    std::string buf_;
    size_t count_ = 0;

    void begin_element() {
        if (count_ > 0) buf_.push_back(',');
        count_++;
    }
};

} // namespace beacon
