#include "load_config.hpp"
#include <fstream>
#include <stdexcept>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
        }
        return json::object();
    }

    bool save(const std::string &filepath, const json &j)
    {
        std::ofstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file for writing: " + filepath);
            throw std::runtime_error("Could not open config file for writing: " + filepath);
        }

        config_file << j.dump(4);
        if (!config_file)
        {
            MyLogger::error("Error saving JSON to file " + filepath);
            return false;
        }
        MyLogger::info("Configuration file saved successfully: " + filepath);
        return true;
    }

    long long get_config_int(const std::string &key, const json &j, long long fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            return fallback;
        }
        return j[key].get<long long>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            return fallback;
        }
        return j[key].get<std::string>();
    }

    bool get_config_bool(const std::string &key, const json &j, bool fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_boolean())
        {
            MyLogger::error("Key is not a boolean: " + key);
            return fallback;
        }
        return j[key].get<bool>();
    }
}
