#ifndef FORMAT_HPP
#define FORMAT_HPP

#include <string>
#include <ctime>
#include <optional>

std::string formatBytes(double bytes);
std::string formatTime(time_t time);

// "1h 02m", "3m 07s", "12s"; "--" when the duration is unknown
std::string formatDuration(const std::optional<double> &seconds);

// Shortens text to at most width characters by replacing its middle with "..."
std::string truncateMiddle(const std::string &text, int width);

#endif
