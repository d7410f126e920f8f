#include "core/validation.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

bool config_file_exists(const std::string& path) {
    if (is_blank(path)) return false;
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}
