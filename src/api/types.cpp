#include "types.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace teldrive
{
    namespace
    {
        // Numeric fields sometimes arrive as strings (channel ids).
        int64_t asInt64(const json &v)
        {
            if (v.is_number_integer())
                return v.get<int64_t>();
            if (v.is_string())
                return std::stoll(v.get<std::string>());
            return 0;
        }

        std::string stringOr(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return "";
            return it->get<std::string>();
        }

        TimePoint timeOr(const json &j, const char *key)
        {
            std::string text = stringOr(j, key);
            if (text.empty())
                return TimePoint();
            return parseTime(text);
        }
    }

    std::string formatTime(TimePoint tp)
    {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        std::time_t secs = static_cast<std::time_t>(ms / 1000);
        int millis = static_cast<int>(ms % 1000);
        if (millis < 0)
        {
            millis += 1000;
            secs -= 1;
        }
        std::tm utc{};
        gmtime_r(&secs, &utc);
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                      utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
        return buf;
    }

    TimePoint parseTime(const std::string &text)
    {
        std::tm tm{};
        int consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6)
        {
            throw std::invalid_argument("bad timestamp: " + text);
        }
        tm.tm_year -= 1900;
        tm.tm_mon -= 1;

        size_t pos = static_cast<size_t>(consumed);
        long long nanos = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            long long scale = 100000000;
            for (++pos; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos)
            {
                nanos += (text[pos] - '0') * scale;
                scale /= 10;
            }
        }

        long offsetSeconds = 0;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
        {
            int hh = 0, mm = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hh, &mm) != 2)
            {
                throw std::invalid_argument("bad timestamp offset: " + text);
            }
            offsetSeconds = (hh * 3600L + mm * 60L) * (text[pos] == '-' ? -1 : 1);
        }
        else if (pos >= text.size() || (text[pos] != 'Z' && text[pos] != 'z'))
        {
            throw std::invalid_argument("missing timezone in timestamp: " + text);
        }

        std::time_t secs = timegm(&tm) - offsetSeconds;
        return std::chrono::system_clock::from_time_t(secs) +
               std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
    }

    void from_json(const json &j, RemotePart &p)
    {
        p.name = stringOr(j, "name");
        p.partId = j.contains("partId") ? asInt64(j["partId"]) : 0;
        p.partNo = j.contains("partNo") ? static_cast<int>(asInt64(j["partNo"])) : 0;
        p.totalParts = j.contains("totalParts") ? static_cast<int>(asInt64(j["totalParts"])) : 0;
        p.size = j.contains("size") ? asInt64(j["size"]) : 0;
        p.channelId = j.contains("channelId") ? asInt64(j["channelId"]) : 0;
        p.encrypted = j.value("encrypted", false);
        p.salt = stringOr(j, "salt");
    }

    void to_json(json &j, const FilePart &p)
    {
        j = json{{"id", p.id}};
        if (!p.salt.empty())
        {
            j["salt"] = p.salt;
        }
    }

    void to_json(json &j, const CreateFileRequest &r)
    {
        j = json{{"name", r.name},
                 {"type", r.type},
                 {"path", r.path},
                 {"size", r.size},
                 {"channelId", r.channelId},
                 {"encrypted", r.encrypted},
                 {"parts", r.parts},
                 {"updatedAt", formatTime(r.modTime)}};
    }

    void from_json(const json &j, FileInfo &f)
    {
        f.id = stringOr(j, "id");
        f.name = stringOr(j, "name");
        f.mimeType = stringOr(j, "mimeType");
        f.size = j.contains("size") ? asInt64(j["size"]) : 0;
        f.parentId = stringOr(j, "parentId");
        f.type = stringOr(j, "type");
        f.modTime = timeOr(j, "updatedAt");
    }

    void from_json(const json &j, Session &s)
    {
        s.userName = stringOr(j, "userName");
        s.userId = j.contains("userId") ? asInt64(j["userId"]) : 0;
        s.hash = stringOr(j, "hash");
    }
}
