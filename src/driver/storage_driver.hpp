#pragma once

#include <map>
#include <string>
#include <vector>
#include "../api/types.hpp"
#include "../upload/chunked_uploader.hpp"

namespace teldrive
{
    class CancellationToken;

    struct Link
    {
        std::string url;
        std::map<std::string, std::string> headers;
    };

    // Capability set every storage backend provides.
    class StorageDriver
    {
    public:
        virtual ~StorageDriver() = default;

        virtual StorageObject root() const = 0;
        virtual std::vector<StorageObject> list(const StorageObject &dir) = 0;
        virtual StorageObject makeDir(const StorageObject &parent, const std::string &name) = 0;
        virtual StorageObject put(const StorageObject &dir, FileStream &file,
                                  const ProgressCallback &progress,
                                  const CancellationToken *cancel) = 0;
        virtual void remove(const StorageObject &obj) = 0;
        virtual StorageObject rename(const StorageObject &obj, const std::string &newName) = 0;
        virtual StorageObject move(const StorageObject &obj, const StorageObject &dstDir) = 0;
        virtual Link link(const StorageObject &file) = 0;
    };
}
