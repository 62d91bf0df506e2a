#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace abstruse::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

// Splits on `delimiter`, dropping empty items.
inline std::vector<std::string> Split(const std::string& value, char delimiter) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, delimiter)) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

inline bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

inline bool Contains(const std::string& value, const std::string& needle) {
    return value.find(needle) != std::string::npos;
}

inline std::string EraseAll(std::string value, const std::string& needle) {
    if (needle.empty()) {
        return value;
    }
    std::size_t pos = 0;
    while ((pos = value.find(needle, pos)) != std::string::npos) {
        value.erase(pos, needle.size());
    }
    return value;
}

inline std::string ReplaceAll(std::string value, const std::string& needle, const std::string& replacement) {
    if (needle.empty()) {
        return value;
    }
    std::size_t pos = 0;
    while ((pos = value.find(needle, pos)) != std::string::npos) {
        value.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
    return value;
}

}  // namespace abstruse::utils
