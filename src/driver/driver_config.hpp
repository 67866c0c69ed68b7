#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace teldrive
{
    struct DriverConfig
    {
        std::string apiHost;
        std::string uploadHost;
        std::string accessToken;
        int64_t channelId = 0;
        int64_t chunkSizeMb = 500;
        bool randomChunkName = true;
        bool encryptFiles = false;
        int uploadConcurrency = 4;
        std::string logLevel = "info";

        // Throws ConfigError on a missing required key or an invalid value.
        static DriverConfig fromJson(const nlohmann::json &j);
        // Loads the JSON file through ConfigReader, then fromJson().
        static DriverConfig fromFile(const std::string &path);

        int64_t chunkSizeBytes() const;
    };
}
