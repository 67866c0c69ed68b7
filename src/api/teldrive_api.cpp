#include "teldrive_api.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include "../stream/source_stream.hpp"

namespace teldrive
{
    const char *const DEFAULT_USER_AGENT =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/116.0.0.0 Safari/537.36";

    namespace
    {
        std::string trimHost(std::string host)
        {
            while (!host.empty() && host.back() == '/')
            {
                host.pop_back();
            }
            return host;
        }

        void requireOk(const HttpResponse &response, const std::string &what)
        {
            if (!response.ok())
            {
                MyLogger::error(what + " failed: " + response.describe());
                throw ApiError(what + " failed: " + response.describe(), response.responseCode);
            }
        }
    }

    TelDriveApi::TelDriveApi(ApiSettings settings, std::shared_ptr<HttpTransport> transport)
        : settings_(std::move(settings)), transport_(std::move(transport)), userId_(0)
    {
        if (!transport_)
        {
            throw std::invalid_argument("TelDriveApi needs a transport");
        }
        settings_.apiHost = trimHost(settings_.apiHost);
        settings_.uploadHost = trimHost(settings_.uploadHost);
    }

    HttpRequest TelDriveApi::newRequest(const std::string &method, const std::string &url) const
    {
        HttpRequest request;
        request.method = method;
        request.url = url;
        request.headers.push_back("User-Agent: " + settings_.userAgent);
        request.headers.push_back("Cookie: access_token=" + settings_.accessToken);
        return request;
    }

    HttpResponse TelDriveApi::sendJson(const std::string &method, const std::string &path, const json &body)
    {
        HttpRequest request = newRequest(method, settings_.apiHost + path);
        request.headers.push_back("Content-Type: application/json");
        request.body = body.dump();
        return transport_->perform(request);
    }

    Session TelDriveApi::initialize()
    {
        MyLogger::info("Fetching TelDrive session from " + settings_.apiHost);
        HttpResponse response = transport_->perform(newRequest("GET", settings_.apiHost + "/api/auth/session"));
        requireOk(response, "Session lookup");

        Session session;
        try
        {
            session = response.metadata.get<Session>();
        }
        catch (const std::exception &e)
        {
            throw ApiError(std::string("Session lookup returned an unreadable body: ") + e.what(),
                           response.responseCode);
        }
        userId_ = session.userId;
        MyLogger::info("Logged in as " + session.userName + " (user " + std::to_string(userId_) + ")");
        return session;
    }

    std::map<int, RemotePart> TelDriveApi::listExistingParts(const std::string &uploadId,
                                                             const CancellationToken *cancel)
    {
        std::map<int, RemotePart> parts;
        HttpRequest request = newRequest("GET", settings_.apiHost + "/api/uploads/" + uploadId);
        request.cancel = cancel;
        HttpResponse response = transport_->perform(request);

        if (response.cancelled)
        {
            throw UploadCancelled();
        }
        if (response.transportFailed)
        {
            MyLogger::warning("Could not query existing parts, uploading all chunks: " + response.describe());
            return parts;
        }
        if (response.responseCode != 200)
        {
            MyLogger::debug("No existing parts for session " + uploadId + " (HTTP " +
                            std::to_string(response.responseCode) + ")");
            return parts;
        }
        if (!response.metadata.is_array())
        {
            MyLogger::warning("Unexpected existing-parts response, uploading all chunks");
            return parts;
        }

        try
        {
            for (const auto &entry : response.metadata)
            {
                RemotePart part = entry.get<RemotePart>();
                parts[part.partNo] = part;
            }
        }
        catch (const std::exception &e)
        {
            MyLogger::warning(std::string("Unreadable existing-parts entry, uploading all chunks: ") + e.what());
            parts.clear();
        }
        return parts;
    }

    RemotePart TelDriveApi::uploadPart(const PartUpload &part, BoundedReader &body,
                                       const CancellationToken *cancel)
    {
        const std::string &host = settings_.uploadHost.empty() ? settings_.apiHost : settings_.uploadHost;
        HttpRequest request = newRequest("POST", host + "/api/uploads/" + part.uploadId);
        request.query = {{"partName", part.partName},
                         {"fileName", part.fileName},
                         {"partNo", std::to_string(part.partNo)},
                         {"channelId", std::to_string(part.channelId)},
                         {"encrypted", part.encrypted ? "true" : "false"}};
        request.headers.push_back("Content-Type: application/octet-stream");
        request.bodyReader = &body;
        request.cancel = cancel;

        MyLogger::debug("Sending chunk " + std::to_string(part.partNo) + " as " + part.partName +
                        " (" + std::to_string(body.size()) + " bytes)");
        HttpResponse response = transport_->perform(request);
        if (response.cancelled)
        {
            throw UploadCancelled();
        }
        if (!response.ok())
        {
            throw ChunkTransferError(part.partNo, response.describe());
        }

        try
        {
            body.finish();
        }
        catch (const StreamError &e)
        {
            throw ChunkTransferError(part.partNo, e.what());
        }

        if (!response.metadata.is_object())
        {
            throw ChunkTransferError(part.partNo, "unreadable response: " + response.content);
        }
        try
        {
            return response.metadata.get<RemotePart>();
        }
        catch (const std::exception &e)
        {
            throw ChunkTransferError(part.partNo, std::string("unreadable response: ") + e.what());
        }
    }

    FileInfo TelDriveApi::createFile(const CreateFileRequest &createRequest, const CancellationToken *cancel)
    {
        HttpRequest request = newRequest("POST", settings_.apiHost + "/api/files");
        request.headers.push_back("Content-Type: application/json");
        request.body = json(createRequest).dump();
        request.cancel = cancel;

        HttpResponse response = transport_->perform(request);
        if (response.cancelled)
        {
            throw UploadCancelled();
        }
        if (!response.ok())
        {
            throw CommitError(response.describe());
        }
        if (!response.metadata.is_object())
        {
            throw CommitError("unreadable response: " + response.content);
        }
        try
        {
            return response.metadata.get<FileInfo>();
        }
        catch (const std::exception &e)
        {
            throw CommitError(std::string("unreadable response: ") + e.what());
        }
    }

    std::vector<FileInfo> TelDriveApi::listFiles(const std::string &path)
    {
        HttpRequest request = newRequest("GET", settings_.apiHost + "/api/files");
        request.query = {{"path", path}, {"page", "1"}, {"limit", "1000"}};
        HttpResponse response = transport_->perform(request);
        requireOk(response, "Listing " + path);

        std::vector<FileInfo> files;
        if (!response.metadata.is_object() || !response.metadata.contains("items"))
        {
            return files;
        }
        try
        {
            for (const auto &item : response.metadata["items"])
            {
                files.push_back(item.get<FileInfo>());
            }
        }
        catch (const std::exception &e)
        {
            throw ApiError("Listing " + path + " returned an unreadable body: " + e.what(), response.responseCode);
        }
        return files;
    }

    FileInfo TelDriveApi::createFolder(const std::string &path)
    {
        HttpResponse response = sendJson("POST", "/api/files/folder", json{{"path", path}});
        requireOk(response, "Creating folder " + path);
        try
        {
            return response.metadata.get<FileInfo>();
        }
        catch (const std::exception &e)
        {
            throw ApiError("Creating folder " + path + " returned an unreadable body: " + e.what(),
                           response.responseCode);
        }
    }

    void TelDriveApi::deleteFiles(const std::vector<std::string> &ids)
    {
        HttpResponse response = sendJson("DELETE", "/api/files", json{{"ids", ids}});
        requireOk(response, "Deleting " + std::to_string(ids.size()) + " file(s)");
    }

    void TelDriveApi::renameFile(const std::string &id, const std::string &newName)
    {
        HttpResponse response = sendJson("PATCH", "/api/files/" + id, json{{"name", newName}});
        requireOk(response, "Renaming " + id);
    }

    void TelDriveApi::moveFiles(const std::vector<std::string> &ids, const std::string &destinationParent)
    {
        HttpResponse response = sendJson("POST", "/api/files/move",
                                         json{{"destinationParent", destinationParent}, {"ids", ids}});
        requireOk(response, "Moving " + std::to_string(ids.size()) + " file(s)");
    }

    std::string TelDriveApi::downloadUrl(const std::string &id)
    {
        HttpRequest request = newRequest("GET", settings_.apiHost + "/api/files/download");
        request.query = {{"id", id}};
        request.followRedirects = false;
        HttpResponse response = transport_->perform(request);

        bool redirect = response.responseCode >= 300 && response.responseCode < 400;
        if (response.transportFailed || (response.responseCode != 200 && !redirect))
        {
            throw ApiError("Download link for " + id + " failed: " + response.describe(), response.responseCode);
        }
        std::string location = response.header("Location");
        if (location.empty())
        {
            throw ApiError("Download link for " + id + " failed: no redirect location", response.responseCode);
        }
        return location;
    }
}
