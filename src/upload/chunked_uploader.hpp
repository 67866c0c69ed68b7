#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include "../api/types.hpp"
#include "upload_api.hpp"

namespace teldrive
{
    class CancellationToken;

    // Percentage in [0, 100].
    using ProgressCallback = std::function<void(double)>;

    // A sequential byte source of known length.
    struct FileStream
    {
        std::string name;
        int64_t size = -1;
        TimePoint modTime;
        std::istream *in = nullptr;
    };

    struct UploadOptions
    {
        int64_t chunkSize = 500 * 1024 * 1024;
        bool randomChunkName = true;
        bool encryptFiles = false;
        int64_t channelId = 0;
        // Advisory; chunks are sent one after another.
        int concurrency = 4;
    };

    // Resumable chunked upload: plans chunks, skips those the server already
    // has, sends the rest in order and commits the ordered manifest.
    class ChunkedUploader
    {
    public:
        ChunkedUploader(UploadApi &api, UploadOptions options);

        // Uploads `file` into `dirPath` on behalf of `ownerId`. Throws an
        // UploadError subclass on the first fatal failure; nothing is
        // committed in that case.
        StorageObject upload(const std::string &dirPath, FileStream &file, int64_t ownerId,
                             const ProgressCallback &progress = ProgressCallback(),
                             const CancellationToken *cancel = nullptr);

        const UploadOptions &options() const { return options_; }

    private:
        UploadApi &api_;
        UploadOptions options_;
    };
}
