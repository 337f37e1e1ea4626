#ifndef HTTP_HPP
#define HTTP_HPP

#include <string>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "core/Error.hpp"

static constexpr char DEFAULT_ARCHIVE_NAME[] = "package.zip";
static constexpr char SSM_USER_AGENT[] = "ssm/1.0";

namespace http
{
    struct StatusLine
    {
        long code{0};
        std::string text; // "HTTP 404 Not Found"
    };

    struct ProbeResult
    {
        bool available{false};
        long statusCode{0};
        std::optional<std::uint64_t> contentLength;
    };

    // Parses "HTTP/1.1 206 Partial Content", nothing if the line is not a status line
    std::optional<StatusLine> parseStatusLine(const std::string &line);

    // Splits "Name: value" and lowercases the name, nothing if there is no colon
    std::optional<std::pair<std::string, std::string>> parseHeaderLine(const std::string &line);

    std::string deriveArchiveName(const std::string &url);

    // Adds percent-encoded key=value pairs to the query string of url
    std::string appendQuery(const std::string &url,
                            const std::vector<std::pair<std::string, std::string>> &parameters);

    // HEAD request for pre-flight availability and size checks
    Result<ProbeResult> probeUrl(const std::string &url, long timeoutSec);

    // Small GET into memory, used for repository catalogs
    Result<std::string> fetchText(const std::string &url, long timeoutSec);
}

#endif
