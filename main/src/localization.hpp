#pragma once

#include <cstdio>
#include <string>
#include <vector>

void init_localization();
const std::string& get_string(const std::string& key);

// Variadic template for printf-style string formatting of a localized key
template<typename... Args>
std::string string_format(const std::string& format_key, Args... args) {
    const std::string& format = get_string(format_key);
    int size = std::snprintf(nullptr, 0, format.c_str(), args...) + 1; // Extra space for '\0'
    if (size <= 1) { return format; }
    std::vector<char> buf(static_cast<size_t>(size));
    std::snprintf(buf.data(), buf.size(), format.c_str(), args...);
    return std::string(buf.data(), buf.data() + size - 1); // We don't want the '\0' inside
}
