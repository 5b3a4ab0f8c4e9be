#pragma once

#include <string>
#include <vector>

namespace kraken {

std::string trim(std::string value);

std::string to_upper_copy(std::string value);

std::string to_lower_copy(std::string value);

// Header lookup key: trimmed and lower-cased.
std::string normalize_column_name(const std::string& name);

bool starts_with(const std::string& value, const std::string& prefix);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace kraken
