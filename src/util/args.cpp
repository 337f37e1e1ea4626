#include <cctype>
#include <string>
#include <vector>

#include "util/args.hpp"

std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs)
{
    std::vector<std::string> parts;
    std::string currentArg;
    bool isQuoted = false;
    bool hasArg = false; // "" is a valid, empty argument

    // Skip the command word itself (e.g. "install", "remove")
    size_t pos = 0;
    while (pos < command.size() && std::isspace(static_cast<unsigned char>(command[pos])))
        pos++;
    while (pos < command.size() && !std::isspace(static_cast<unsigned char>(command[pos])))
        pos++;

    for (; pos < command.size() && parts.size() < maxArgs; ++pos)
    {
        char c = command[pos];

        if (c == '\\' && pos + 1 < command.size())
        {
            currentArg += command[++pos];
            hasArg = true;
        }
        else if (c == '"')
        {
            isQuoted = !isQuoted;
            hasArg = true;
        }
        else if (std::isspace(static_cast<unsigned char>(c)) && !isQuoted)
        {
            if (hasArg)
            {
                parts.push_back(currentArg);
                currentArg.clear();
                hasArg = false;
            }
        }
        else
        {
            currentArg += c;
            hasArg = true;
        }
    }

    if (hasArg && parts.size() < maxArgs)
        parts.push_back(currentArg);

    return parts;
}

std::optional<size_t> parseIndexArgument(const std::string &argument)
{
    if (argument.empty() || argument.size() > 9)
        return std::nullopt;

    size_t value = 0;
    for (char c : argument)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        value = value * 10 + static_cast<size_t>(c - '0');
    }

    if (value == 0)
        return std::nullopt;
    return value - 1;
}
