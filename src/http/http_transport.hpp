#pragma once

#include <atomic>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace teldrive
{
    class BoundedReader;

    // Shared flag a caller trips to abort in-flight and pending requests.
    class CancellationToken
    {
    public:
        CancellationToken() : cancelled_(false) {}

        void cancel() { cancelled_.store(true); }
        bool cancelled() const { return cancelled_.load(); }

    private:
        std::atomic<bool> cancelled_;
    };

    struct HttpRequest
    {
        std::string method = "GET";
        std::string url;
        std::vector<std::pair<std::string, std::string>> query;
        std::vector<std::string> headers; // "Name: value"
        std::string body;
        // When set, the body is streamed from this reader instead of `body`.
        BoundedReader *bodyReader = nullptr;
        bool followRedirects = false;
        const CancellationToken *cancel = nullptr;
    };

    struct HttpResponse
    {
        int responseCode = 0;          // HTTP status, 0 when the transport failed.
        bool transportFailed = false;  // Connection, TLS or body stream failure.
        bool cancelled = false;
        std::string errorMessage;      // Transport error text, if any.
        std::string content;           // Raw response body.
        nlohmann::json metadata;       // Parsed body, null if it is not JSON.
        std::map<std::string, std::string> headers; // Lowercased names.

        bool ok() const { return !transportFailed && responseCode == 200; }
        std::string header(const std::string &name) const;
        // Short description for log and error messages.
        std::string describe() const;
    };

    // Builds "url?k=v&..." with each key and value percent-encoded.
    std::string buildUrl(const std::string &url,
                         const std::vector<std::pair<std::string, std::string>> &query);
    std::string urlEncode(const std::string &value);

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;
        virtual HttpResponse perform(const HttpRequest &request) = 0;
    };

    // libcurl implementation. Holds one easy handle, so a single instance must
    // not be used from two threads at once.
    class CurlTransport : public HttpTransport
    {
    public:
        CurlTransport();
        ~CurlTransport() override;

        CurlTransport(const CurlTransport &) = delete;
        CurlTransport &operator=(const CurlTransport &) = delete;

        HttpResponse perform(const HttpRequest &request) override;

    private:
        CURL *curlHandle;
    };
}
