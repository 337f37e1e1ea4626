#ifndef FILE_HPP
#define FILE_HPP

#include <string>
#include <cstdint>
#include <optional>

bool fileExists(const std::string &path);
bool directoryExists(const std::string &path);

// Size of a regular file, 0 if it does not exist
std::uint64_t fileSize(const std::string &path);

// Sum of all regular file sizes below a directory, unreadable entries are skipped
std::uint64_t directorySize(const std::string &path);

bool ensureDirectory(const std::string &path, std::string &error);
bool removeTree(const std::string &path, std::string &error);

std::string joinPath(const std::string &base, const std::string &relative);

// Normalises a relative path taken from untrusted input (archive entries,
// manifest resources). Returns nothing if the path is absolute, carries a
// drive prefix, or climbs out of its base with "..".
std::optional<std::string> confinedRelativePath(const std::string &path);

#endif
