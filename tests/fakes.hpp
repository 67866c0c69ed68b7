#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>
#include "api/types.hpp"
#include "errors/errors.hpp"
#include "http/http_transport.hpp"
#include "stream/source_stream.hpp"
#include "upload/upload_api.hpp"

namespace teldrive
{
    namespace test
    {
        inline std::string drain(BoundedReader &reader)
        {
            std::string out;
            char buf[4096];
            size_t n;
            while ((n = reader.read(buf, sizeof(buf))) > 0)
            {
                out.append(buf, n);
            }
            return out;
        }

        // In-memory server: keeps parts per session id across uploads, so a
        // second run against the same instance sees what the first stored.
        class FakeUploadApi : public UploadApi
        {
        public:
            struct SentPart
            {
                PartUpload request;
                std::string bytes;
            };

            std::map<std::string, std::map<int, RemotePart>> registry;
            std::vector<std::string> lookups;
            std::vector<SentPart> sent;
            std::vector<CreateFileRequest> commits;

            int failPartNo = 0;     // respond with an error for this part
            int zeroIdPartNo = 0;   // respond with part id 0 for this part
            bool failCommit = false;
            int64_t nextPartId = 1000;

            std::map<int, RemotePart> listExistingParts(const std::string &uploadId,
                                                        const CancellationToken *cancel) override
            {
                if (cancel && cancel->cancelled())
                    throw UploadCancelled();
                lookups.push_back(uploadId);
                auto it = registry.find(uploadId);
                return it == registry.end() ? std::map<int, RemotePart>() : it->second;
            }

            RemotePart uploadPart(const PartUpload &part, BoundedReader &body,
                                  const CancellationToken *cancel) override
            {
                if (cancel && cancel->cancelled())
                    throw UploadCancelled();
                SentPart record;
                record.request = part;
                record.bytes = drain(body);
                sent.push_back(record);

                if (part.partNo == failPartNo)
                    throw ChunkTransferError(part.partNo, "HTTP 500: internal error");

                RemotePart stored;
                stored.name = part.partName;
                stored.partId = (part.partNo == zeroIdPartNo) ? 0 : nextPartId++;
                stored.partNo = part.partNo;
                stored.size = static_cast<int64_t>(record.bytes.size());
                stored.channelId = part.channelId;
                stored.encrypted = part.encrypted;
                if (part.encrypted)
                    stored.salt = "salt-" + std::to_string(part.partNo);
                if (stored.partId != 0)
                    registry[part.uploadId][part.partNo] = stored;
                return stored;
            }

            FileInfo createFile(const CreateFileRequest &request, const CancellationToken *cancel) override
            {
                if (cancel && cancel->cancelled())
                    throw UploadCancelled();
                commits.push_back(request);
                if (failCommit)
                    throw CommitError("HTTP 500: commit rejected");
                FileInfo info;
                info.id = "file-" + std::to_string(commits.size());
                info.name = request.name;
                info.size = request.size;
                info.parentId = "parent-1";
                info.type = "file";
                info.modTime = request.modTime;
                return info;
            }
        };

        // Scripted transport: answers requests from a queue and records them.
        class FakeTransport : public HttpTransport
        {
        public:
            struct Recorded
            {
                HttpRequest request;
                std::string body; // streamed body when a reader was attached
            };

            std::deque<HttpResponse> responses;
            std::vector<Recorded> requests;

            void reply(int status, const std::string &body,
                       std::map<std::string, std::string> headers = {})
            {
                HttpResponse r;
                r.responseCode = status;
                r.content = body;
                r.metadata = nlohmann::json::parse(body, nullptr, false);
                if (r.metadata.is_discarded())
                    r.metadata = nullptr;
                r.headers = std::move(headers);
                responses.push_back(r);
            }

            void fail(const std::string &message, bool cancelled = false)
            {
                HttpResponse r;
                r.transportFailed = true;
                r.cancelled = cancelled;
                r.errorMessage = message;
                responses.push_back(r);
            }

            HttpResponse perform(const HttpRequest &request) override
            {
                Recorded rec;
                rec.request = request;
                if (request.bodyReader)
                    rec.body = drain(*request.bodyReader);
                rec.request.bodyReader = nullptr;
                requests.push_back(rec);

                if (responses.empty())
                {
                    HttpResponse r;
                    r.responseCode = 500;
                    r.content = "no scripted response";
                    return r;
                }
                HttpResponse r = responses.front();
                responses.pop_front();
                return r;
            }

            const HttpRequest &last() const { return requests.back().request; }
        };

        inline bool hasHeader(const HttpRequest &request, const std::string &header)
        {
            for (const auto &h : request.headers)
            {
                if (h == header)
                    return true;
            }
            return false;
        }

        inline std::string queryValue(const HttpRequest &request, const std::string &key)
        {
            for (const auto &kv : request.query)
            {
                if (kv.first == key)
                    return kv.second;
            }
            return "";
        }
    }
}
