#pragma once

#include <cstdint>
#include <string>

namespace teldrive
{
    constexpr int64_t BYTES_PER_MB = 1024 * 1024;

    struct ChunkPlan
    {
        int64_t totalSize = 0;
        int64_t chunkSize = 0;
        int totalChunks = 0;

        // Length of chunk `partNo` (1-based). Every chunk is chunkSize long
        // except the last, which takes the remainder.
        int64_t lengthOf(int partNo) const;
    };

    // ceil(totalSize / chunkSize) chunks; a zero-byte file gives zero chunks.
    // Throws std::invalid_argument for chunkSize <= 0, totalSize < 0, or a
    // chunk count beyond the range of an int part number.
    ChunkPlan planChunks(int64_t totalSize, int64_t chunkSize);

    // Name the chunk is stored under: a random digest when randomize is set,
    // "<file>.part.NNN" for multi-chunk files, otherwise the file name.
    std::string chunkName(const std::string &fileName, int partNo, int totalChunks, bool randomize);
}
