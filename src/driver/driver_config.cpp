#include "driver_config.hpp"
#include "../errors/errors.hpp"
#include "../load_config/load_config.hpp"
#include "../upload/chunk_plan.hpp"
#include <limits>

namespace teldrive
{
    namespace
    {
        std::string requireString(const std::string &key, const json &j)
        {
            std::string value = ConfigReader::get_config_string(key, j);
            if (value.empty())
            {
                throw ConfigError("missing required config key: " + key);
            }
            return value;
        }

        // channel_id is accepted as a number or a decimal string.
        int64_t readChannelId(const json &j)
        {
            if (j.contains("channel_id") && j["channel_id"].is_number_integer())
            {
                return j["channel_id"].get<int64_t>();
            }
            std::string text = requireString("channel_id", j);
            try
            {
                size_t used = 0;
                long long value = std::stoll(text, &used);
                if (used != text.size())
                    throw std::invalid_argument(text);
                return value;
            }
            catch (const std::exception &)
            {
                throw ConfigError("channel_id is not an integer: " + text);
            }
        }
    }

    DriverConfig DriverConfig::fromJson(const json &j)
    {
        if (!j.is_object())
        {
            throw ConfigError("configuration must be a JSON object");
        }

        DriverConfig config;
        config.apiHost = requireString("api_host", j);
        config.accessToken = requireString("access_token", j);
        config.channelId = readChannelId(j);
        config.uploadHost = ConfigReader::get_config_string("upload_host", j, "");
        config.chunkSizeMb = ConfigReader::get_config_int("chunk_size", j, config.chunkSizeMb);
        config.randomChunkName = ConfigReader::get_config_bool("random_chunk_name", j, config.randomChunkName);
        config.encryptFiles = ConfigReader::get_config_bool("encrypt_files", j, config.encryptFiles);
        long long concurrency = ConfigReader::get_config_int("upload_concurrency", j, config.uploadConcurrency);
        config.logLevel = ConfigReader::get_config_string("log_level", j, config.logLevel);

        if (config.chunkSizeMb <= 0 ||
            config.chunkSizeMb > std::numeric_limits<int64_t>::max() / BYTES_PER_MB)
        {
            throw ConfigError("chunk_size must be a positive number of megabytes, got " +
                              std::to_string(config.chunkSizeMb));
        }
        if (concurrency <= 0 || concurrency > 64)
        {
            throw ConfigError("upload_concurrency must be between 1 and 64, got " + std::to_string(concurrency));
        }
        config.uploadConcurrency = static_cast<int>(concurrency);
        return config;
    }

    DriverConfig DriverConfig::fromFile(const std::string &path)
    {
        return fromJson(ConfigReader::load(path));
    }

    int64_t DriverConfig::chunkSizeBytes() const
    {
        return chunkSizeMb * BYTES_PER_MB;
    }
}
