#include "kraken/util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace kraken {

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string to_upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string normalize_column_name(const std::string& name) {
    auto key = to_lower_copy(trim(name));
    // Spreadsheet exports sometimes prefix the first header with a UTF-8 BOM.
    if (starts_with(key, "\xEF\xBB\xBF")) {
        key.erase(0, 3);
    }
    return key;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            oss << separator;
        }
        oss << parts[i];
    }
    return oss.str();
}

} // namespace kraken
