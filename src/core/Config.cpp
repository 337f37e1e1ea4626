#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>

#include "core/Config.hpp"
#include "util/file.hpp"

using nlohmann::json;

namespace
{
    void readString(const json &root, const char *key, std::string &target)
    {
        auto it = root.find(key);
        if (it == root.end())
            return;
        if (it->is_string() && !it->get<std::string>().empty())
            target = it->get<std::string>();
        else
            spdlog::warn("Ignoring config key '{}': expected a non-empty string", key);
    }

    template <typename T>
    void readPositive(const json &root, const char *key, T &target)
    {
        auto it = root.find(key);
        if (it == root.end())
            return;
        if (it->is_number_integer() && it->get<long long>() > 0)
            target = static_cast<T>(it->get<long long>());
        else
            spdlog::warn("Ignoring config key '{}': expected a positive integer", key);
    }
}

std::string getStateDirectory()
{
    const char *home = std::getenv("HOME");
    if (home == nullptr || *home == '\0')
        return ".ssm";
    return joinPath(home, ".ssm");
}

std::string getDefaultConfigPath()
{
    return joinPath(getStateDirectory(), "config.json");
}

ServiceConfig defaultConfig()
{
    std::string state = getStateDirectory();

    ServiceConfig config;
    config.installRoot = joinPath(state, "packages");
    config.downloadDirectory = joinPath(state, "downloads");
    config.logFile = joinPath(state, "ssm.log");
    return config;
}

Status loadConfigFile(const std::string &path, ServiceConfig &config)
{
    if (!fileExists(path))
        return Status();

    std::ifstream in(path);
    if (!in.is_open())
        return Error{ErrorKind::IO, "cannot read config file " + path};

    json root = json::parse(in, nullptr, false);
    if (root.is_discarded() || !root.is_object())
        return Error{ErrorKind::IO, "config file " + path + " is not a JSON object"};

    readString(root, "installRoot", config.installRoot);
    readString(root, "downloadDirectory", config.downloadDirectory);
    readString(root, "logFile", config.logFile);
    readString(root, "logLevel", config.logLevel);
    readPositive(root, "maxConcurrent", config.maxConcurrent);
    readPositive(root, "connectTimeoutSec", config.connectTimeoutSec);
    readPositive(root, "readTimeoutSec", config.readTimeoutSec);

    long long intervalMs = config.progressInterval.count();
    readPositive(root, "progressIntervalMs", intervalMs);
    config.progressInterval = std::chrono::milliseconds(intervalMs);

    return Status();
}

TransferSettings toTransferSettings(const ServiceConfig &config)
{
    TransferSettings settings;
    settings.connectTimeoutSec = config.connectTimeoutSec;
    settings.readTimeoutSec = config.readTimeoutSec;
    settings.progressInterval = config.progressInterval;
    return settings;
}
