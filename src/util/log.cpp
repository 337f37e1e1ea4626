#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

#include "util/log.hpp"
#include "util/file.hpp"

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string &name)
{
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "off")
        return spdlog::level::off;
    return std::nullopt;
}

bool initFileLogging(const std::string &path, spdlog::level::level_enum level, std::string &error)
{
    std::string parent = std::filesystem::path(path).parent_path().string();
    if (!parent.empty() && !ensureDirectory(parent, error))
        return false;

    try
    {
        auto logger = spdlog::basic_logger_mt("ssm", path);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        spdlog::set_level(level);
    }
    catch (const spdlog::spdlog_ex &e)
    {
        error = e.what();
        return false;
    }
    return true;
}
