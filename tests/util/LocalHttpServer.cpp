#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <algorithm>

#include "util/LocalHttpServer.hpp"

namespace
{
    const char *reasonPhrase(int status)
    {
        switch (status)
        {
        case 200:
            return "OK";
        case 206:
            return "Partial Content";
        case 404:
            return "Not Found";
        case 416:
            return "Range Not Satisfiable";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
        }
    }

    std::string lowercase(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string trim(const std::string &text)
    {
        size_t begin = text.find_first_not_of(" \t");
        if (begin == std::string::npos)
            return "";
        size_t end = text.find_last_not_of(" \t\r");
        return text.substr(begin, end - begin + 1);
    }

    // "bytes=500-" -> 500
    std::optional<size_t> parseRangeStart(const std::string &value)
    {
        const std::string prefix = "bytes=";
        if (value.rfind(prefix, 0) != 0)
            return std::nullopt;
        size_t dash = value.find('-', prefix.size());
        if (dash == std::string::npos || dash == prefix.size())
            return std::nullopt;
        return static_cast<size_t>(std::stoull(value.substr(prefix.size(), dash - prefix.size())));
    }
}

LocalHttpServer::LocalHttpServer()
{
    _listenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (_listenFd < 0)
        throw std::runtime_error("socket() failed");

    int reuse = 1;
    setsockopt(_listenFd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;

    if (bind(_listenFd, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0 ||
        listen(_listenFd, 16) != 0)
    {
        close(_listenFd);
        throw std::runtime_error("cannot listen on 127.0.0.1");
    }

    socklen_t length = sizeof(address);
    getsockname(_listenFd, reinterpret_cast<sockaddr *>(&address), &length);
    _port = ntohs(address.sin_port);

    _acceptThread = std::thread(&LocalHttpServer::acceptLoop, this);
}

LocalHttpServer::~LocalHttpServer()
{
    _stopping = true;
    releaseStalls();

    if (_acceptThread.joinable())
        _acceptThread.join();
    close(_listenFd);

    std::vector<std::thread> connections;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        connections.swap(_connections);
    }
    for (auto &connection : connections)
    {
        if (connection.joinable())
            connection.join();
    }
}

void LocalHttpServer::setRoute(const std::string &path, const Route &route)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _routes[path] = route;
}

void LocalHttpServer::releaseStalls()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stallsReleased = true;
    }
    _stallCondition.notify_all();
}

std::string LocalHttpServer::url(const std::string &path) const
{
    return "http://127.0.0.1:" + std::to_string(_port) + path;
}

std::vector<LocalHttpServer::Request> LocalHttpServer::requests() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _requests;
}

size_t LocalHttpServer::requestCount(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return std::count_if(_requests.begin(), _requests.end(), [&path](const Request &request)
                         { return request.path == path; });
}

void LocalHttpServer::acceptLoop()
{
    while (!_stopping)
    {
        pollfd pfd{_listenFd, POLLIN, 0};
        if (poll(&pfd, 1, 50) <= 0)
            continue;

        int fd = accept(_listenFd, nullptr, nullptr);
        if (fd < 0)
            continue;

        timeval timeout{5, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        std::lock_guard<std::mutex> lock(_mutex);
        _connections.emplace_back(&LocalHttpServer::serve, this, fd);
    }
}

bool LocalHttpServer::sendAll(int fd, const char *data, size_t size)
{
    while (size > 0)
    {
        ssize_t sent = send(fd, data, size, MSG_NOSIGNAL);
        if (sent <= 0)
            return false;
        data += sent;
        size -= static_cast<size_t>(sent);
    }
    return true;
}

bool LocalHttpServer::waitForRelease()
{
    std::unique_lock<std::mutex> lock(_mutex);
    _stallCondition.wait(lock, [this]
                         { return _stallsReleased || _stopping.load(); });
    return !_stopping;
}

void LocalHttpServer::serve(int fd)
{
    std::string raw;
    char buffer[4096];
    while (raw.find("\r\n\r\n") == std::string::npos)
    {
        ssize_t received = recv(fd, buffer, sizeof(buffer), 0);
        if (received <= 0)
        {
            close(fd);
            return;
        }
        raw.append(buffer, static_cast<size_t>(received));
    }

    Request request;
    size_t lineEnd = raw.find("\r\n");
    std::string requestLine = raw.substr(0, lineEnd);
    size_t firstSpace = requestLine.find(' ');
    size_t secondSpace = requestLine.find(' ', firstSpace + 1);
    request.method = requestLine.substr(0, firstSpace);
    request.path = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);

    size_t position = lineEnd + 2;
    size_t headersEnd = raw.find("\r\n\r\n");
    while (position < headersEnd)
    {
        size_t end = raw.find("\r\n", position);
        std::string line = raw.substr(position, end - position);
        size_t colon = line.find(':');
        if (colon != std::string::npos)
            request.headers[lowercase(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        position = end + 2;
    }

    Route route;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _requests.push_back(request);
        auto it = _routes.find(request.path.substr(0, request.path.find('?')));
        if (it != _routes.end())
        {
            route = it->second;
            found = true;
        }
    }

    if (!found)
    {
        route.status = 404;
        route.body = "not found";
        route.supportsRange = false;
    }

    int status = route.status;
    std::string body = route.body;
    std::string extraHeaders;

    auto range = request.headers.find("range");
    if (status == 200 && route.supportsRange && range != request.headers.end())
    {
        auto start = parseRangeStart(range->second);
        if (start && *start >= route.body.size())
        {
            status = 416;
            body.clear();
            extraHeaders += "Content-Range: bytes */" + std::to_string(route.body.size()) + "\r\n";
        }
        else if (start)
        {
            status = 206;
            body = route.body.substr(*start);
            extraHeaders += "Content-Range: bytes " + std::to_string(*start) + "-" +
                            std::to_string(route.body.size() - 1) + "/" + std::to_string(route.body.size()) + "\r\n";
        }
    }

    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + reasonPhrase(status) + "\r\n";
    head += "Content-Type: application/octet-stream\r\n";
    head += "Connection: close\r\n";
    if (route.sendContentLength)
        head += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    head += extraHeaders;
    head += "\r\n";

    if (!sendAll(fd, head.data(), head.size()) || request.method == "HEAD")
    {
        close(fd);
        return;
    }

    size_t chunk = route.chunkSize == 0 ? body.size() : route.chunkSize;
    size_t sent = 0;
    bool stalled = false;
    while (sent < body.size() && !_stopping)
    {
        size_t limit = body.size();
        if (route.stallAfter && !stalled)
            limit = std::min(limit, *route.stallAfter);

        if (sent >= limit)
        {
            stalled = true;
            if (!waitForRelease())
                break;
            continue;
        }

        size_t piece = std::min(chunk, limit - sent);
        if (!sendAll(fd, body.data() + sent, piece))
            break;
        sent += piece;

        if (route.chunkDelay.count() > 0 && sent < body.size())
            std::this_thread::sleep_for(route.chunkDelay);
    }

    shutdown(fd, SHUT_WR);
    close(fd);
}
