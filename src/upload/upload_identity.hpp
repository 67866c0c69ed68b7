#pragma once

#include <cstdint>
#include <string>

namespace teldrive
{
    // Root ("/") becomes "", trailing slashes are dropped.
    std::string normalizeDirPath(const std::string &path);

    // Joins a normalized directory and a name with exactly one '/', the way
    // the server expects full paths ("/a/b", "/name" at root).
    std::string joinPath(const std::string &dir, const std::string &name);

    // Stable session id for (directory, name, size, owner). The same inputs
    // always give the same 32-char hex id, which is what lets an interrupted
    // upload find its parts again. Throws UnsupportedSizeError for size < 0.
    std::string deriveUploadId(const std::string &dirPath, const std::string &fileName,
                               int64_t fileSize, int64_t ownerId);
}
