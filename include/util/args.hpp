#ifndef ARGS_HPP
#define ARGS_HPP

#include <string>
#include <vector>
#include <optional>

// Splits the arguments following the command word. Double quotes group
// words containing spaces; a backslash escapes the next character.
std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs);

// Parses a 1-based list index into a 0-based one
std::optional<size_t> parseIndexArgument(const std::string &argument);

#endif
