#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/SkinApplication.hpp"

int main(int argc, char **argv)
{
    CLI::App app{"SSM - Simple Skin Manager"};

    std::string configPath = getDefaultConfigPath();
    std::string installRoot;
    std::string downloadDirectory;
    std::string logLevel;
    size_t maxConcurrent = 0;
    std::vector<std::string> installUrls;

    app.add_option("--config", configPath, "JSON configuration file");
    app.add_option("--root", installRoot, "Directory packages are installed into");
    app.add_option("--downloads", downloadDirectory, "Directory archives are downloaded into");
    app.add_option("--max", maxConcurrent, "Maximum concurrent downloads")->check(CLI::PositiveNumber);
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error or off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app.add_option("--install", installUrls, "Install the given URLs without the interface");

    CLI11_PARSE(app, argc, argv);

    // Flags override the file, which overrides the defaults
    ServiceConfig config = defaultConfig();
    Status loaded = loadConfigFile(configPath, config);
    if (!loaded)
    {
        std::cerr << "ssm: " << loaded.error().message << std::endl;
        return 1;
    }

    if (!installRoot.empty())
        config.installRoot = installRoot;
    if (!downloadDirectory.empty())
        config.downloadDirectory = downloadDirectory;
    if (!logLevel.empty())
        config.logLevel = logLevel;
    if (maxConcurrent > 0)
        config.maxConcurrent = maxConcurrent;

    SkinApplication application(config);
    if (!installUrls.empty())
        return application.runInstall(installUrls);
    return application.run();
}
