#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>

#include "util/http.hpp"

namespace http
{
    namespace
    {
        std::string trim(const std::string &text)
        {
            size_t begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return std::string();
            size_t end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        // Header bytes may be >= 0x80, so each char goes through unsigned char first
        bool isDigits(const std::string &text)
        {
            return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                                { return std::isdigit(c) != 0; });
        }

        std::optional<std::uint64_t> parseLength(const std::string &value)
        {
            if (!isDigits(value))
                return std::nullopt;
            try
            {
                return static_cast<std::uint64_t>(std::stoull(value));
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }

        // Records Content-Length of the final response for probeUrl
        size_t probeHeaderCallback(char *buffer, size_t size, size_t nitems, void *userData)
        {
            size_t length = size * nitems;
            auto *result = static_cast<ProbeResult *>(userData);
            std::string line(buffer, length);

            if (parseStatusLine(line))
            {
                result->contentLength.reset(); // New response after a redirect
            }
            else if (auto header = parseHeaderLine(line))
            {
                if (header->first == "content-length")
                    result->contentLength = parseLength(header->second);
            }
            return length;
        }

        size_t stringWriteCallback(void *ptr, size_t size, size_t nmemb, void *userData)
        {
            auto *body = static_cast<std::string *>(userData);
            body->append(static_cast<const char *>(ptr), size * nmemb);
            return size * nmemb;
        }

        Error curlError(CURLcode code, const char *errorBuffer)
        {
            std::string message = (errorBuffer && errorBuffer[0]) ? errorBuffer : curl_easy_strerror(code);
            ErrorKind kind = code == CURLE_OPERATION_TIMEDOUT ? ErrorKind::TIMEOUT : ErrorKind::NETWORK;
            return Error{kind, message};
        }
    }

    std::optional<StatusLine> parseStatusLine(const std::string &line)
    {
        std::string text = trim(line);
        if (text.rfind("HTTP/", 0) != 0)
            return std::nullopt;

        // HTTP/<version> <code> [reason]
        size_t codeStart = text.find(' ');
        if (codeStart == std::string::npos)
            return std::nullopt;
        codeStart = text.find_first_not_of(' ', codeStart);
        if (codeStart == std::string::npos)
            return std::nullopt;

        size_t codeEnd = text.find(' ', codeStart);
        std::string code = text.substr(codeStart, codeEnd == std::string::npos ? std::string::npos : codeEnd - codeStart);
        if (code.size() != 3 || !isDigits(code))
            return std::nullopt;

        StatusLine status;
        status.code = std::stol(code);
        status.text = "HTTP " + code;
        if (codeEnd != std::string::npos)
        {
            std::string reason = trim(text.substr(codeEnd));
            if (!reason.empty())
                status.text += " " + reason;
        }
        return status;
    }

    std::optional<std::pair<std::string, std::string>> parseHeaderLine(const std::string &line)
    {
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0)
            return std::nullopt;

        std::string name = trim(line.substr(0, colon));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return std::make_pair(name, trim(line.substr(colon + 1)));
    }

    // Derives the local archive filename from the last path segment of the URL
    // The query string and fragment are ignored, ".zip" is appended when missing
    std::string deriveArchiveName(const std::string &url)
    {
        std::string path = url;
        size_t cut = path.find_first_of("?#");
        if (cut != std::string::npos)
            path = path.substr(0, cut);

        size_t scheme = path.find("://");
        if (scheme != std::string::npos)
        {
            size_t pathStart = path.find('/', scheme + 3);
            path = pathStart == std::string::npos ? std::string() : path.substr(pathStart);
        }

        auto pos = path.find_last_of('/');
        std::string name = pos == std::string::npos ? path : path.substr(pos + 1);

        for (char &c : name)
        {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != '_')
                c = '_';
        }

        if (name.empty() || name == "." || name == "..")
            return DEFAULT_ARCHIVE_NAME;

        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (lower.size() < 4 || lower.compare(lower.size() - 4, 4, ".zip") != 0)
            name += ".zip";

        return name;
    }

    std::string appendQuery(const std::string &url,
                            const std::vector<std::pair<std::string, std::string>> &parameters)
    {
        if (parameters.empty())
            return url;

        CURL *curl = curl_easy_init();
        std::string query;
        for (const auto &parameter : parameters)
        {
            char *key = curl_easy_escape(curl, parameter.first.c_str(), static_cast<int>(parameter.first.size()));
            char *value = curl_easy_escape(curl, parameter.second.c_str(), static_cast<int>(parameter.second.size()));
            if (key && value)
            {
                query += query.empty() ? "" : "&";
                query += std::string(key) + "=" + value;
            }
            curl_free(key);
            curl_free(value);
        }
        if (curl)
            curl_easy_cleanup(curl);

        // A fragment stays at the end, after the query
        std::string base = url;
        std::string fragment;
        size_t hash = base.find('#');
        if (hash != std::string::npos)
        {
            fragment = base.substr(hash);
            base = base.substr(0, hash);
        }

        char separator = base.find('?') == std::string::npos ? '?' : '&';
        return base + separator + query + fragment;
    }

    Result<ProbeResult> probeUrl(const std::string &url, long timeoutSec)
    {
        CURL *curl = curl_easy_init();
        if (!curl)
            return Error{ErrorKind::NETWORK, "cannot initialise libcurl"};

        ProbeResult result;
        char errorBuffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);         // HEAD request
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L); // Follow HTTP redirects
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSec);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, SSM_USER_AGENT);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, probeHeaderCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &result);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK)
        {
            Error error = curlError(res, errorBuffer);
            curl_easy_cleanup(curl);
            spdlog::debug("Probe of {} failed: {}", url, error.message);
            return error;
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.statusCode);
        curl_easy_cleanup(curl);

        result.available = result.statusCode >= 200 && result.statusCode < 300;
        if (!result.available)
            result.contentLength.reset();
        return result;
    }

    Result<std::string> fetchText(const std::string &url, long timeoutSec)
    {
        CURL *curl = curl_easy_init();
        if (!curl)
            return Error{ErrorKind::NETWORK, "cannot initialise libcurl"};

        std::string body;
        char errorBuffer[CURL_ERROR_SIZE] = {0};
        struct curl_slist *headers = curl_slist_append(nullptr, "Accept: application/json");

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSec);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, SSM_USER_AGENT);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stringWriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

        CURLcode res = curl_easy_perform(curl);
        long statusCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
        curl_easy_cleanup(curl);
        curl_slist_free_all(headers);

        if (res != CURLE_OK)
            return curlError(res, errorBuffer);

        if (statusCode != 200)
            return Error{ErrorKind::PROTOCOL, "HTTP " + std::to_string(statusCode) + " from " + url};

        return body;
    }
}
