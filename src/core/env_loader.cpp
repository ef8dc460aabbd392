// src/core/env_loader.cpp
#include "trade_guard/core/env_loader.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace trade_guard {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

Result<void> EnvLoader::load(const std::string& filepath, bool overwrite) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Failed to open .env file: " + filepath,
                                "EnvLoader");
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, delimiter_pos));
        std::string value = unquote(trim(line.substr(delimiter_pos + 1)));
        if (key.empty()) {
            continue;
        }

        if (setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0) != 0) {
            return make_error<void>(ErrorCode::INVALID_DATA, "Failed to set variable " + key,
                                    "EnvLoader");
        }
    }
    return Result<void>();
}

std::optional<std::string> EnvLoader::get(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

Result<std::optional<double>> EnvLoader::get_double(const std::string& key) {
    auto raw = get(key);
    if (!raw) {
        return Result<std::optional<double>>(std::optional<double>());
    }
    try {
        size_t consumed = 0;
        double value = std::stod(*raw, &consumed);
        if (consumed != raw->size()) {
            throw std::invalid_argument("trailing characters");
        }
        return Result<std::optional<double>>(std::optional<double>(value));
    } catch (const std::exception&) {
        return make_error<std::optional<double>>(
            ErrorCode::INVALID_ARGUMENT, key + " is not a number: " + *raw, "EnvLoader");
    }
}

Result<std::optional<long>> EnvLoader::get_long(const std::string& key) {
    auto raw = get(key);
    if (!raw) {
        return Result<std::optional<long>>(std::optional<long>());
    }
    try {
        size_t consumed = 0;
        long value = std::stol(*raw, &consumed);
        if (consumed != raw->size()) {
            throw std::invalid_argument("trailing characters");
        }
        return Result<std::optional<long>>(std::optional<long>(value));
    } catch (const std::exception&) {
        return make_error<std::optional<long>>(
            ErrorCode::INVALID_ARGUMENT, key + " is not an integer: " + *raw, "EnvLoader");
    }
}

std::vector<std::string> EnvLoader::get_list(const std::string& key) {
    std::vector<std::string> items;
    auto raw = get(key);
    if (!raw) {
        return items;
    }
    std::stringstream ss(*raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace trade_guard
