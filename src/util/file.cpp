#include <sys/stat.h>
#include <cctype>
#include <string>
#include <vector>
#include <sstream>
#include <filesystem>
#include <system_error>

#include "util/file.hpp"

namespace fs = std::filesystem;

// Checks if anything exists at the given path
bool fileExists(const std::string &path)
{
    struct stat buf;
    return (stat(path.c_str(), &buf) == 0);
}

bool directoryExists(const std::string &path)
{
    struct stat buf;
    return (stat(path.c_str(), &buf) == 0) && S_ISDIR(buf.st_mode);
}

std::uint64_t fileSize(const std::string &path)
{
    struct stat buf;
    if (stat(path.c_str(), &buf) != 0 || !S_ISREG(buf.st_mode))
        return 0;

    return static_cast<std::uint64_t>(buf.st_size);
}

std::uint64_t directorySize(const std::string &path)
{
    std::error_code ec;
    if (!fs::is_directory(path, ec))
        return 0;

    std::uint64_t total = 0;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    while (!ec && it != end)
    {
        std::error_code entryError;
        if (it->is_regular_file(entryError))
        {
            auto size = it->file_size(entryError);
            if (!entryError)
                total += size;
        }
        it.increment(ec);
    }
    return total;
}

// Creates the directory and any missing parents
bool ensureDirectory(const std::string &path, std::string &error)
{
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec || !fs::is_directory(path))
    {
        error = "cannot create directory " + path + (ec ? ": " + ec.message() : "");
        return false;
    }
    return true;
}

// Deletes a file or directory tree; a missing path counts as removed
bool removeTree(const std::string &path, std::string &error)
{
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
    {
        error = "cannot remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}

std::string joinPath(const std::string &base, const std::string &relative)
{
    return (fs::path(base) / fs::path(relative)).lexically_normal().string();
}

std::optional<std::string> confinedRelativePath(const std::string &path)
{
    if (path.empty())
        return std::nullopt;

    // Archives written on Windows may use backslashes
    std::string unified = path;
    for (char &c : unified)
    {
        if (c == '\\')
            c = '/';
    }

    if (unified.front() == '/')
        return std::nullopt;
    if (unified.size() >= 2 && std::isalpha(static_cast<unsigned char>(unified[0])) && unified[1] == ':')
        return std::nullopt;

    std::vector<std::string> parts;
    std::istringstream iss(unified);
    std::string segment;
    while (std::getline(iss, segment, '/'))
    {
        if (segment.empty() || segment == ".")
            continue;
        if (segment == "..")
            return std::nullopt;
        parts.push_back(segment);
    }

    if (parts.empty())
        return std::nullopt;

    std::string normalised = parts[0];
    for (size_t i = 1; i < parts.size(); ++i)
    {
        normalised += "/" + parts[i];
    }
    return normalised;
}
