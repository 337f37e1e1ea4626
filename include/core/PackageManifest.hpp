#ifndef PACKAGEMANIFEST_HPP
#define PACKAGEMANIFEST_HPP

#include <map>
#include <set>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "core/Error.hpp"

static constexpr const char SSM_MANIFEST_FILENAME[] = "package.json";
static constexpr const char SSM_LEGACY_MANIFEST_FILENAME[] = "skin.json";
static constexpr const char SSM_DEFAULT_VERSION[] = "1.0.0";

struct PackageManifest
{
    std::string id;
    std::string name;
    std::string version{SSM_DEFAULT_VERSION};
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<std::string> createdAt;
    std::optional<std::string> sourceUrl;
    std::optional<std::uint64_t> sizeBytes;
    std::set<std::string> tags;
    std::string type{"theme"};

    // Resource key ("images.background") -> path relative to the package root
    std::map<std::string, std::string> resources;

    // Fields this program does not interpret, kept for forward compatibility.
    // Non-string values hold their compact JSON text.
    std::map<std::string, std::string> extensions;
};

// Parses manifest JSON. Wrong-typed or missing fields fall back to defaults;
// only text that is not a JSON object is an error. fallbackId stands in for
// a missing id (normally the package directory name).
Result<PackageManifest> parseManifest(const std::string &text, const std::string &fallbackId);

// Finds and parses the manifest file at the root of a package directory
Result<PackageManifest> loadManifest(const std::string &packageDirectory);

std::optional<std::string> findManifestFile(const std::string &packageDirectory);

std::string serializeManifest(const PackageManifest &manifest);

// Parses a repository listing or search response: {"packages": [...]},
// {"results": [...]} or a bare array of manifests. Entries without an id
// are dropped.
Result<std::vector<PackageManifest>> parseCatalog(const std::string &text);

#endif
