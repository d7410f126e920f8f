#pragma once

#include <string>

/// True for an empty string or one made only of whitespace
bool is_blank(const std::string& value);

/// True if path names an existing regular file (symlinks followed)
bool config_file_exists(const std::string& path);
