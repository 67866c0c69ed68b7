#include "chunked_uploader.hpp"
#include "chunk_plan.hpp"
#include "upload_identity.hpp"
#include "../errors/errors.hpp"
#include "../http/http_transport.hpp"
#include "../logger/Mylogger.hpp"
#include "../stream/source_stream.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace teldrive
{
    namespace
    {
        void checkCancelled(const CancellationToken *cancel)
        {
            if (cancel && cancel->cancelled())
            {
                throw UploadCancelled();
            }
        }

        void reportProgress(const ProgressCallback &progress, int64_t processed, int64_t total)
        {
            if (!progress)
                return;
            progress(total == 0 ? 100.0 : static_cast<double>(processed) / static_cast<double>(total) * 100.0);
        }
    }

    ChunkedUploader::ChunkedUploader(UploadApi &api, UploadOptions options)
        : api_(api), options_(options)
    {
        if (options_.chunkSize <= 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
    }

    StorageObject ChunkedUploader::upload(const std::string &dirPath, FileStream &file, int64_t ownerId,
                                          const ProgressCallback &progress,
                                          const CancellationToken *cancel)
    {
        if (file.size < 0)
        {
            throw UnsupportedSizeError(file.size);
        }
        if (!file.in)
        {
            throw std::invalid_argument("file stream has no source: " + file.name);
        }

        const std::string dir = normalizeDirPath(dirPath);
        const std::string uploadId = deriveUploadId(dir, file.name, file.size, ownerId);
        const ChunkPlan plan = planChunks(file.size, options_.chunkSize);

        MyLogger::info("Uploading " + joinPath(dir, file.name) + " (" + std::to_string(file.size) +
                       " bytes) in " + std::to_string(plan.totalChunks) + " chunk(s), session " + uploadId);
        if (options_.concurrency > 1)
        {
            MyLogger::debug("Upload concurrency " + std::to_string(options_.concurrency) +
                            " requested; chunks are sent sequentially");
        }

        checkCancelled(cancel);
        std::map<int, RemotePart> existing = api_.listExistingParts(uploadId, cancel);
        if (!existing.empty())
        {
            MyLogger::info("Found " + std::to_string(existing.size()) + " part(s) from an earlier attempt");
        }

        SourceStream source(*file.in);
        std::vector<RemotePart> parts;
        parts.reserve(static_cast<size_t>(plan.totalChunks));
        int64_t processed = 0;

        for (int partNo = 1; partNo <= plan.totalChunks; partNo++)
        {
            checkCancelled(cancel);
            const int64_t length = plan.lengthOf(partNo);

            auto found = existing.find(partNo);
            if (found != existing.end())
            {
                const RemotePart &prior = found->second;
                if (prior.partId != 0 && prior.size == length)
                {
                    try
                    {
                        source.discardExactly(static_cast<uint64_t>(length));
                    }
                    catch (const StreamError &e)
                    {
                        throw ChunkTransferError(partNo, e.what());
                    }
                    parts.push_back(prior);
                    processed += length;
                    MyLogger::info("Chunk " + std::to_string(partNo) + "/" + std::to_string(plan.totalChunks) +
                                   " already uploaded, skipped");
                    reportProgress(progress, processed, file.size);
                    continue;
                }
                MyLogger::warning("Ignoring stored part " + std::to_string(partNo) + " (id " +
                                  std::to_string(prior.partId) + ", " + std::to_string(prior.size) +
                                  " bytes); expected " + std::to_string(length) + " bytes");
            }

            PartUpload request;
            request.uploadId = uploadId;
            request.partName = chunkName(file.name, partNo, plan.totalChunks, options_.randomChunkName);
            request.fileName = file.name;
            request.partNo = partNo;
            request.channelId = options_.channelId;
            request.encrypted = options_.encryptFiles;

            BoundedReader body(source, static_cast<uint64_t>(length));
            RemotePart uploaded;
            try
            {
                uploaded = api_.uploadPart(request, body, cancel);
            }
            catch (const StreamError &e)
            {
                throw ChunkTransferError(partNo, e.what());
            }
            if (body.remaining() != 0)
            {
                throw ChunkTransferError(partNo, "transfer ended with " + std::to_string(body.remaining()) +
                                                     " bytes unsent");
            }
            if (uploaded.partId == 0)
            {
                throw ChunkTransferError(partNo, "no part id in response");
            }
            uploaded.partNo = partNo;
            if (uploaded.size == 0)
                uploaded.size = length;

            parts.push_back(uploaded);
            processed += length;
            MyLogger::info("Chunk " + std::to_string(partNo) + "/" + std::to_string(plan.totalChunks) +
                           " uploaded as part " + std::to_string(uploaded.partId));
            reportProgress(progress, processed, file.size);
        }

        if (plan.totalChunks == 0)
        {
            reportProgress(progress, 0, 0);
        }

        std::sort(parts.begin(), parts.end(),
                  [](const RemotePart &a, const RemotePart &b) { return a.partNo < b.partNo; });

        CreateFileRequest commit;
        commit.name = file.name;
        commit.type = "file";
        commit.path = joinPath(dir, file.name);
        commit.size = file.size;
        commit.channelId = options_.channelId;
        commit.encrypted = options_.encryptFiles;
        commit.modTime = file.modTime;
        for (const auto &part : parts)
        {
            FilePart entry;
            entry.id = part.partId;
            entry.salt = part.salt;
            commit.parts.push_back(entry);
        }

        checkCancelled(cancel);
        FileInfo info = api_.createFile(commit, cancel);
        MyLogger::info("Created " + commit.path + " as " + info.id + " from " +
                       std::to_string(commit.parts.size()) + " part(s)");

        StorageObject result;
        result.id = info.id;
        result.name = file.name;
        result.size = file.size;
        result.modTime = (info.modTime == TimePoint()) ? file.modTime : info.modTime;
        result.isFolder = false;
        result.path = commit.path;
        result.parentId = info.parentId;
        return result;
    }
}
