#include <sstream>
#include <stdio.h>
#include <time.h>
#include <iomanip>
#include <cmath>

#include "util/format.hpp"

std::string formatBytes(double bytes)
{
    const double KB = 1024.0;
    const double MB = KB * 1024.0;
    const double GB = MB * 1024.0;

    std::ostringstream oss;
    oss << std::fixed;

    if (bytes < KB)
        oss << std::setprecision(0) << bytes << " B";
    else if (bytes < MB)
        oss << std::setprecision(0) << (bytes / KB) << " KB";
    else if (bytes < GB)
        oss << std::setprecision(1) << (bytes / MB) << " MB";
    else
        oss << std::setprecision(2) << (bytes / GB) << " GB";

    return oss.str();
}

std::string formatTime(time_t time)
{
    char buffer[20];
    struct tm timeinfo;
    localtime_r(&time, &timeinfo);
    strftime(buffer, sizeof(buffer), "%H:%M:%S %d/%m/%y", &timeinfo);

    return std::string(buffer);
}

std::string formatDuration(const std::optional<double> &seconds)
{
    if (!seconds || *seconds < 0.0 || !std::isfinite(*seconds))
        return "--";

    long total = static_cast<long>(std::lround(*seconds));
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    char buffer[32];
    if (hours > 0)
        snprintf(buffer, sizeof(buffer), "%ldh %02ldm", hours, minutes);
    else if (minutes > 0)
        snprintf(buffer, sizeof(buffer), "%ldm %02lds", minutes, secs);
    else
        snprintf(buffer, sizeof(buffer), "%lds", secs);

    return std::string(buffer);
}

std::string truncateMiddle(const std::string &text, int width)
{
    if (width <= 0)
        return "";
    if (static_cast<int>(text.size()) <= width)
        return text;
    if (width <= 3)
        return text.substr(0, width);

    size_t keep = static_cast<size_t>(width - 3);
    size_t head = (keep + 1) / 2;
    size_t tail = keep - head;
    return text.substr(0, head) + "..." + text.substr(text.size() - tail);
}
