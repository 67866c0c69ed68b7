#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "../api/types.hpp"

namespace teldrive
{
    class BoundedReader;
    class CancellationToken;

    struct PartUpload
    {
        std::string uploadId;
        std::string partName;
        std::string fileName;
        int partNo = 0;
        int64_t channelId = 0;
        bool encrypted = false;
    };

    // Remote calls the chunked uploader needs. TelDriveApi implements it over
    // HTTP; tests substitute an in-memory fake.
    class UploadApi
    {
    public:
        virtual ~UploadApi() = default;

        // Parts already stored for the session, keyed by part number. Lookup
        // failures yield an empty map; only cancellation throws.
        virtual std::map<int, RemotePart> listExistingParts(const std::string &uploadId,
                                                            const CancellationToken *cancel) = 0;

        // Sends exactly body.size() bytes. Throws ChunkTransferError on a
        // failed or incomplete transfer, UploadCancelled when cancelled.
        virtual RemotePart uploadPart(const PartUpload &part, BoundedReader &body,
                                      const CancellationToken *cancel) = 0;

        // Throws CommitError on failure, UploadCancelled when cancelled.
        virtual FileInfo createFile(const CreateFileRequest &request,
                                    const CancellationToken *cancel) = 0;
    };
}
