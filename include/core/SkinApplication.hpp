#ifndef SKINAPPLICATION_HPP
#define SKINAPPLICATION_HPP

#include <string>
#include <vector>

#include "core/Config.hpp"

class PackageService;

class SkinApplication
{
public:
    explicit SkinApplication(const ServiceConfig &config);
    ~SkinApplication();

    // Interactive terminal interface
    int run();

    // Installs each URL in turn, printing progress to stdout
    int runInstall(const std::vector<std::string> &urls);

private:
    ServiceConfig _config;

    bool prepare(PackageService &service);
};

#endif
