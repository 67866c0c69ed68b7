#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace teldrive
{
    using json = nlohmann::json;
    using TimePoint = std::chrono::system_clock::time_point;

    // RFC 3339 in UTC with millisecond precision, e.g. 2024-05-01T10:20:30.123Z.
    std::string formatTime(TimePoint tp);
    // Accepts fractional seconds and "Z" or "+hh:mm" offsets. Throws
    // std::invalid_argument on malformed input.
    TimePoint parseTime(const std::string &text);

    // Remote record of one transferred chunk.
    struct RemotePart
    {
        std::string name;
        int64_t partId = 0;
        int partNo = 0;
        int totalParts = 0;
        int64_t size = 0;
        int64_t channelId = 0;
        bool encrypted = false;
        std::string salt;
    };

    // Manifest entry.
    struct FilePart
    {
        int64_t id = 0;
        std::string salt;
    };

    struct CreateFileRequest
    {
        std::string name;
        std::string type = "file";
        std::string path;
        int64_t size = 0;
        int64_t channelId = 0;
        bool encrypted = false;
        std::vector<FilePart> parts;
        TimePoint modTime;
    };

    struct FileInfo
    {
        std::string id;
        std::string name;
        std::string mimeType;
        int64_t size = 0;
        std::string parentId;
        std::string type;
        TimePoint modTime;
    };

    struct Session
    {
        std::string userName;
        int64_t userId = 0;
        std::string hash;
    };

    // A file or folder on the remote drive.
    struct StorageObject
    {
        std::string id;
        std::string name;
        int64_t size = 0;
        TimePoint modTime;
        bool isFolder = false;
        std::string path;
        std::string parentId;
    };

    void from_json(const json &j, RemotePart &p);
    void to_json(json &j, const FilePart &p);
    void to_json(json &j, const CreateFileRequest &r);
    void from_json(const json &j, FileInfo &f);
    void from_json(const json &j, Session &s);
}
