#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "../logger/Mylogger.hpp"

using json = nlohmann::json;

namespace ConfigReader
{
    // Throws std::runtime_error if the file cannot be opened. A parse error is
    // logged and yields an empty object.
    json load(const std::string &filepath);
    bool save(const std::string &filepath, const json &j);

    // Getters log and return the fallback when the key is missing or has the
    // wrong type.
    long long get_config_int(const std::string &key, const json &j, long long fallback = 0);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback = "");
    bool get_config_bool(const std::string &key, const json &j, bool fallback = false);
}
