#include "http_transport.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include "../stream/source_stream.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace teldrive
{
    namespace
    {
        // State shared with the C callbacks for one request.
        struct TransferContext
        {
            std::string body;
            std::map<std::string, std::string> headers;
            BoundedReader *reader = nullptr;
            std::string readError;
            const CancellationToken *cancel = nullptr;
        };

        size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            auto *ctx = static_cast<TransferContext *>(userdata);
            size_t totalSize = size * nmemb;
            ctx->body.append(ptr, totalSize);
            return totalSize;
        }

        size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
        {
            auto *ctx = static_cast<TransferContext *>(userdata);
            size_t totalSize = size * nitems;
            std::string line(buffer, totalSize);
            auto colon = line.find(':');
            if (colon != std::string::npos)
            {
                std::string name = line.substr(0, colon);
                std::transform(name.begin(), name.end(), name.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                std::string value = line.substr(colon + 1);
                auto first = value.find_first_not_of(" \t");
                auto last = value.find_last_not_of(" \t\r\n");
                value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);
                ctx->headers[name] = value;
            }
            return totalSize;
        }

        size_t readCallback(char *buffer, size_t size, size_t nitems, void *userdata)
        {
            auto *ctx = static_cast<TransferContext *>(userdata);
            try
            {
                return ctx->reader->read(buffer, size * nitems);
            }
            catch (const StreamError &e)
            {
                ctx->readError = e.what();
                return CURL_READFUNC_ABORT;
            }
        }

        int progressCallback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            auto *ctx = static_cast<TransferContext *>(userdata);
            return (ctx->cancel && ctx->cancel->cancelled()) ? 1 : 0;
        }
    }

    std::string HttpResponse::header(const std::string &name) const
    {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = headers.find(key);
        return it == headers.end() ? "" : it->second;
    }

    std::string HttpResponse::describe() const
    {
        if (cancelled)
            return "cancelled";
        if (transportFailed)
            return "transport error: " + errorMessage;
        return "HTTP " + std::to_string(responseCode) + ": " + content;
    }

    std::string urlEncode(const std::string &value)
    {
        std::ostringstream escaped;
        escaped.fill('0');
        escaped << std::hex << std::uppercase;
        for (unsigned char c : value)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                escaped << c;
            }
            else
            {
                escaped << '%' << std::setw(2) << static_cast<int>(c);
            }
        }
        return escaped.str();
    }

    std::string buildUrl(const std::string &url,
                         const std::vector<std::pair<std::string, std::string>> &query)
    {
        if (query.empty())
            return url;
        std::string out = url;
        out += (url.find('?') == std::string::npos) ? '?' : '&';
        for (size_t i = 0; i < query.size(); i++)
        {
            if (i > 0)
                out += '&';
            out += urlEncode(query[i].first) + "=" + urlEncode(query[i].second);
        }
        return out;
    }

    // Constructor: initialize CURL.
    CurlTransport::CurlTransport() : curlHandle(nullptr)
    {
        curl_global_init(CURL_GLOBAL_ALL);
        curlHandle = curl_easy_init();
        if (!curlHandle)
        {
            MyLogger::error("Failed to initialize CURL in CurlTransport.");
            curl_global_cleanup();
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    // Destructor: cleanup CURL.
    CurlTransport::~CurlTransport()
    {
        if (curlHandle)
        {
            curl_easy_cleanup(curlHandle);
        }
        curl_global_cleanup();
    }

    HttpResponse CurlTransport::perform(const HttpRequest &request)
    {
        HttpResponse response;
        if (request.cancel && request.cancel->cancelled())
        {
            response.transportFailed = true;
            response.cancelled = true;
            response.errorMessage = "cancelled before start";
            return response;
        }

        std::string url = buildUrl(request.url, request.query);
        MyLogger::debug("Performing " + request.method + " request to URL: " + url);

        TransferContext ctx;
        ctx.reader = request.bodyReader;
        ctx.cancel = request.cancel;

        curl_easy_reset(curlHandle);
        curl_easy_setopt(curlHandle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);

        struct curl_slist *headers = NULL;
        for (const auto &h : request.headers)
        {
            headers = curl_slist_append(headers, h.c_str());
        }

        if (request.bodyReader)
        {
            // Streamed upload; suppress "Expect: 100-continue" round trip.
            headers = curl_slist_append(headers, "Expect:");
            curl_easy_setopt(curlHandle, CURLOPT_POST, 1L);
            curl_easy_setopt(curlHandle, CURLOPT_READFUNCTION, readCallback);
            curl_easy_setopt(curlHandle, CURLOPT_READDATA, &ctx);
            curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.bodyReader->size()));
        }
        else if (request.method == "POST")
        {
            curl_easy_setopt(curlHandle, CURLOPT_POST, 1L);
            curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }
        else if (request.method != "GET")
        {
            curl_easy_setopt(curlHandle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            if (!request.body.empty())
            {
                curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
        }
        if (request.bodyReader && request.method != "POST")
        {
            curl_easy_setopt(curlHandle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }

        curl_easy_setopt(curlHandle, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curlHandle, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curlHandle, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curlHandle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curlHandle, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curlHandle, CURLOPT_XFERINFODATA, &ctx);

        CURLcode res = curl_easy_perform(curlHandle);
        curl_slist_free_all(headers);

        if (res != CURLE_OK)
        {
            response.transportFailed = true;
            response.cancelled = request.cancel && request.cancel->cancelled();
            response.errorMessage = ctx.readError.empty() ? curl_easy_strerror(res) : ctx.readError;
            MyLogger::error("CURL perform failed: " + response.errorMessage);
            return response;
        }

        long httpCode = 0;
        curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &httpCode);
        response.responseCode = static_cast<int>(httpCode);
        response.content = std::move(ctx.body);
        response.headers = std::move(ctx.headers);
        MyLogger::debug("Received response with HTTP code: " + std::to_string(response.responseCode));

        response.metadata = nlohmann::json::parse(response.content, nullptr, false);
        if (response.metadata.is_discarded())
        {
            response.metadata = nullptr;
        }
        return response;
    }
}
