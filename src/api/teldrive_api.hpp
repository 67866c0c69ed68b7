#pragma once

#include <memory>
#include <string>
#include <vector>
#include "types.hpp"
#include "../http/http_transport.hpp"
#include "../upload/upload_api.hpp"

namespace teldrive
{
    extern const char *const DEFAULT_USER_AGENT;

    struct ApiSettings
    {
        std::string apiHost;
        // Overrides apiHost for chunk uploads only; empty means apiHost.
        std::string uploadHost;
        std::string accessToken;
        std::string userAgent = DEFAULT_USER_AGENT;
    };

    // Client for the TelDrive HTTP API. Every request carries the configured
    // user agent and the access_token cookie.
    class TelDriveApi : public UploadApi
    {
    public:
        TelDriveApi(ApiSettings settings, std::shared_ptr<HttpTransport> transport);

        // Fetches the session and remembers the user id. Throws ApiError.
        Session initialize();
        int64_t userId() const { return userId_; }
        const ApiSettings &settings() const { return settings_; }

        std::map<int, RemotePart> listExistingParts(const std::string &uploadId,
                                                    const CancellationToken *cancel) override;
        RemotePart uploadPart(const PartUpload &part, BoundedReader &body,
                              const CancellationToken *cancel) override;
        FileInfo createFile(const CreateFileRequest &request,
                            const CancellationToken *cancel) override;

        // One-shot calls; all throw ApiError on a non-success status.
        std::vector<FileInfo> listFiles(const std::string &path);
        FileInfo createFolder(const std::string &path);
        void deleteFiles(const std::vector<std::string> &ids);
        void renameFile(const std::string &id, const std::string &newName);
        void moveFiles(const std::vector<std::string> &ids, const std::string &destinationParent);
        // Location of the download redirect for a file id.
        std::string downloadUrl(const std::string &id);

    private:
        ApiSettings settings_;
        std::shared_ptr<HttpTransport> transport_;
        int64_t userId_;

        HttpRequest newRequest(const std::string &method, const std::string &url) const;
        HttpResponse sendJson(const std::string &method, const std::string &path, const json &body);
    };
}
