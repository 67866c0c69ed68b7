#include "chunk_plan.hpp"
#include "../hash/hash.hpp"
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace teldrive
{
    int64_t ChunkPlan::lengthOf(int partNo) const
    {
        if (partNo < 1 || partNo > totalChunks)
        {
            throw std::out_of_range("chunk " + std::to_string(partNo) + " outside plan of " +
                                    std::to_string(totalChunks));
        }
        if (partNo < totalChunks)
            return chunkSize;
        return totalSize - chunkSize * (totalChunks - 1);
    }

    ChunkPlan planChunks(int64_t totalSize, int64_t chunkSize)
    {
        if (chunkSize <= 0)
        {
            throw std::invalid_argument("chunk size must be positive, got " + std::to_string(chunkSize));
        }
        if (totalSize < 0)
        {
            throw std::invalid_argument("total size must not be negative, got " + std::to_string(totalSize));
        }
        const int64_t count = totalSize / chunkSize + (totalSize % chunkSize != 0 ? 1 : 0);
        if (count > std::numeric_limits<int>::max())
        {
            throw std::invalid_argument("file of " + std::to_string(totalSize) + " bytes needs " +
                                        std::to_string(count) + " chunks of " + std::to_string(chunkSize) +
                                        " bytes, more than a part number can hold");
        }
        ChunkPlan plan;
        plan.totalSize = totalSize;
        plan.chunkSize = chunkSize;
        plan.totalChunks = static_cast<int>(count);
        return plan;
    }

    std::string chunkName(const std::string &fileName, int partNo, int totalChunks, bool randomize)
    {
        if (randomize)
        {
            return hashing::md5Hex(hashing::newUuid());
        }
        if (totalChunks > 1)
        {
            char suffix[16];
            std::snprintf(suffix, sizeof(suffix), ".part.%03d", partNo);
            return fileName + suffix;
        }
        return fileName;
    }
}
