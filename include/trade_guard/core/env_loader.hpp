// include/trade_guard/core/env_loader.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "trade_guard/core/error.hpp"

namespace trade_guard {

/**
 * @brief Loads KEY=VALUE lines from a .env file into the process environment
 */
class EnvLoader {
public:
    /**
     * @brief Load a .env file
     * @param filepath Path to the file
     * @param overwrite Replace variables already present in the environment
     */
    static Result<void> load(const std::string& filepath, bool overwrite = false);

    static std::optional<std::string> get(const std::string& key);

    /**
     * @brief Numeric lookup
     * @return nullopt when unset, error when set but not a number
     */
    static Result<std::optional<double>> get_double(const std::string& key);

    static Result<std::optional<long>> get_long(const std::string& key);

    /**
     * @brief Comma-separated list lookup, trimmed and without empty entries
     */
    static std::vector<std::string> get_list(const std::string& key);
};

}  // namespace trade_guard
