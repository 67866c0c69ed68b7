#pragma once

#include <stdexcept>
#include <string>

namespace teldrive
{
    // Invalid or missing configuration value.
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // The source stream ended before the requested number of bytes.
    class StreamError : public std::runtime_error
    {
    public:
        explicit StreamError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // A one-shot API call returned a non-success status or failed in transport.
    class ApiError : public std::runtime_error
    {
    public:
        ApiError(const std::string &msg, int status = 0)
            : std::runtime_error(msg), status_(status) {}

        int status() const { return status_; }

    private:
        int status_;
    };

    class NotAFileError : public std::runtime_error
    {
    public:
        explicit NotAFileError(const std::string &path)
            : std::runtime_error("not a file: " + path) {}
    };

    // Base of everything that aborts an upload.
    class UploadError : public std::runtime_error
    {
    public:
        explicit UploadError(const std::string &msg) : std::runtime_error(msg) {}
    };

    class UnsupportedSizeError : public UploadError
    {
    public:
        explicit UnsupportedSizeError(long long size)
            : UploadError("unsupported file size: " + std::to_string(size)) {}
    };

    class ChunkTransferError : public UploadError
    {
    public:
        ChunkTransferError(int partNo, const std::string &reason)
            : UploadError("chunk " + std::to_string(partNo) + " upload failed: " + reason),
              partNo_(partNo) {}

        int partNo() const { return partNo_; }

    private:
        int partNo_;
    };

    class CommitError : public UploadError
    {
    public:
        explicit CommitError(const std::string &reason)
            : UploadError("create file failed: " + reason) {}
    };

    class UploadCancelled : public UploadError
    {
    public:
        UploadCancelled() : UploadError("upload cancelled") {}
    };
} // namespace teldrive
