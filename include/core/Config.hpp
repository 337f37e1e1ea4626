#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <chrono>

#include "core/Error.hpp"
#include "core/TransferEngine.hpp"

struct ServiceConfig
{
    std::string installRoot;
    std::string downloadDirectory;
    std::string logFile;
    std::string logLevel{"info"};
    size_t maxConcurrent{3};
    long connectTimeoutSec{30};
    long readTimeoutSec{60};
    std::chrono::milliseconds progressInterval{500};
};

// Returns $HOME/.ssm, or .ssm in the working directory when HOME is unset
std::string getStateDirectory();

std::string getDefaultConfigPath();

// Defaults rooted in the state directory
ServiceConfig defaultConfig();

// Overlays the values found in a JSON file onto config. A missing file
// leaves config untouched; unreadable JSON is an error; wrong-typed keys
// are ignored.
Status loadConfigFile(const std::string &path, ServiceConfig &config);

TransferSettings toTransferSettings(const ServiceConfig &config);

#endif
