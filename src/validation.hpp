// src/validation.hpp
// Internal event field validation.

#pragma once

#include <cstddef>
#include <string>

namespace beacon {
namespace validation {

constexpr size_t MAX_LENGTH_CATEGORY = 30;
constexpr size_t MAX_LENGTH_METHOD = 20;
constexpr size_t MAX_LENGTH_OBJECT = 20;
constexpr size_t MAX_LENGTH_VALUE = 80;
constexpr size_t MAX_EXTRA_KEYS = 10;
constexpr size_t MAX_LENGTH_EXTRA_KEY = 15;
constexpr size_t MAX_LENGTH_EXTRA_VALUE = 80;

inline bool check_category(const std::string& category) {
    return !category.empty() && category.size() <= MAX_LENGTH_CATEGORY;
}

inline bool check_method(const std::string& method) {
    return !method.empty() && method.size() <= MAX_LENGTH_METHOD;
}

inline bool check_object(const std::string& object) {
    return !object.empty() && object.size() <= MAX_LENGTH_OBJECT;
}

inline bool check_extra_key(const std::string& key) {
    return !key.empty() && key.size() <= MAX_LENGTH_EXTRA_KEY;
}

// Values longer than max are cut, not rejected.
inline std::string truncate(const std::string& value, size_t max) {
    return value.size() <= max ? value : value.substr(0, max);
}

} // namespace validation
} // namespace beacon
