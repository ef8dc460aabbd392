// src/core/config_base.cpp

#include "trade_guard/core/config_base.hpp"
#include <iomanip>

namespace trade_guard {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath, "ConfigBase");
        }
        file << std::setw(4) << j << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving config: ") + e.what(), "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    }

    auto problems = validate();
    if (!problems.empty()) {
        std::string message = "Invalid configuration in " + filepath + ":";
        for (const auto& p : problems) {
            message += " " + p + ";";
        }
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "ConfigBase");
    }
    return Result<void>();
}

}  // namespace trade_guard
