#include "upload_identity.hpp"
#include "../errors/errors.hpp"
#include "../hash/hash.hpp"

namespace teldrive
{
    std::string normalizeDirPath(const std::string &path)
    {
        std::string out = path;
        while (!out.empty() && out.back() == '/')
        {
            out.pop_back();
        }
        if (!out.empty() && out.front() != '/')
            out.insert(out.begin(), '/');
        return out;
    }

    std::string joinPath(const std::string &dir, const std::string &name)
    {
        std::string base = normalizeDirPath(dir);
        std::string leaf = name;
        while (!leaf.empty() && leaf.front() == '/')
        {
            leaf.erase(0, 1);
        }
        if (leaf.empty())
            return base.empty() ? "/" : base;
        if (!base.empty() && base.front() != '/')
            base = "/" + base;
        return base + "/" + leaf;
    }

    std::string deriveUploadId(const std::string &dirPath, const std::string &fileName,
                               int64_t fileSize, int64_t ownerId)
    {
        if (fileSize < 0)
        {
            throw UnsupportedSizeError(fileSize);
        }
        std::string key = normalizeDirPath(dirPath) + ":" + fileName + ":" +
                          std::to_string(fileSize) + ":" + std::to_string(ownerId);
        return hashing::md5Hex(key);
    }
}
