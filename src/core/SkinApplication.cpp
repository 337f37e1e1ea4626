#include <spdlog/spdlog.h>
#include <iostream>

#include "core/SkinApplication.hpp"
#include "core/PackageService.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/log.hpp"

SkinApplication::SkinApplication(const ServiceConfig &config) : _config(config) {}
SkinApplication::~SkinApplication() {}

// Routes logging to the log file and brings the service up
bool SkinApplication::prepare(PackageService &service)
{
    auto level = parseLogLevel(_config.logLevel).value_or(spdlog::level::info);

    std::string error;
    if (!initFileLogging(_config.logFile, level, error))
        std::cerr << "ssm: logging disabled: " << error << std::endl;

    Status status = service.initialize();
    if (!status)
    {
        std::cerr << "ssm: " << status.error().message << std::endl;
        return false;
    }
    return true;
}

int SkinApplication::run()
{
    PackageService service(_config);
    if (!prepare(service))
        return 1;

    UI ui(service);
    ui.run();

    service.dispose();
    return 0;
}

int SkinApplication::runInstall(const std::vector<std::string> &urls)
{
    PackageService service(_config);
    if (!prepare(service))
        return 1;

    int failures = 0;
    for (const auto &url : urls)
    {
        auto handle = service.install(url);
        if (!handle)
        {
            std::cerr << url << ": " << handle.error().message << std::endl;
            failures++;
            continue;
        }

        ProgressSnapshot snapshot;
        ProgressSnapshot last;
        while (handle->next(snapshot))
        {
            if (snapshot.status != last.status || snapshot.bytesReceived != last.bytesReceived)
            {
                std::cout << "[" << statusName(snapshot.status) << "] "
                          << formatBytes(static_cast<double>(snapshot.bytesReceived));
                if (snapshot.bytesTotal > 0)
                    std::cout << " / " << formatBytes(static_cast<double>(snapshot.bytesTotal));
                std::cout << " ETA " << formatDuration(snapshot.estimatedSecondsRemaining) << std::endl;
            }
            last = snapshot;
        }

        if (last.status != TransferStatus::COMPLETED)
        {
            std::cerr << url << ": " << last.errorMessage.value_or(statusName(last.status)) << std::endl;
            failures++;
        }
    }

    service.dispose();
    return failures == 0 ? 0 : 1;
}
