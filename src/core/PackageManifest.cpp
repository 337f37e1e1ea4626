#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/PackageManifest.hpp"
#include "util/file.hpp"

using nlohmann::json;
namespace fs = std::filesystem;

namespace
{
    const std::set<std::string> KNOWN_FIELDS = {
        "id", "name", "version", "description", "author", "createdAt", "sourceUrl",
        "downloadUrl", "size", "sizeBytes", "tags", "type", "resources", "metadata"};

    std::optional<std::string> optionalString(const json &object, const char *key)
    {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string())
            return std::nullopt;
        return it->get<std::string>();
    }

    std::string stringOr(const json &object, const char *key, const std::string &fallback)
    {
        auto value = optionalString(object, key);
        return (value && !value->empty()) ? *value : fallback;
    }

    std::string extensionValue(const json &value)
    {
        return value.is_string() ? value.get<std::string>() : value.dump();
    }

    // Accepts {"logo": "img/logo.png"} and one nested level such as
    // {"images": {"logo": "img/logo.png"}}; other shapes are ignored
    void collectResources(const json &node, const std::string &prefix, int depth,
                          std::map<std::string, std::string> &out)
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
            if (it->is_string())
                out[key] = it->get<std::string>();
            else if (it->is_object() && depth == 0)
                collectResources(*it, key, depth + 1, out);
        }
    }
}

Result<PackageManifest> parseManifest(const std::string &text, const std::string &fallbackId)
{
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded())
        return Error{ErrorKind::MANIFEST, "manifest is not valid JSON"};
    if (!root.is_object())
        return Error{ErrorKind::MANIFEST, "manifest root is not an object"};

    PackageManifest manifest;
    manifest.id = stringOr(root, "id", fallbackId);
    if (manifest.id.empty())
        return Error{ErrorKind::MANIFEST, "manifest has no id"};

    manifest.name = stringOr(root, "name", manifest.id);
    manifest.version = stringOr(root, "version", SSM_DEFAULT_VERSION);
    manifest.description = optionalString(root, "description");
    manifest.author = optionalString(root, "author");
    manifest.createdAt = optionalString(root, "createdAt");
    manifest.type = stringOr(root, "type", manifest.type);

    manifest.sourceUrl = optionalString(root, "sourceUrl");
    if (!manifest.sourceUrl)
        manifest.sourceUrl = optionalString(root, "downloadUrl");

    for (const char *key : {"sizeBytes", "size"})
    {
        auto it = root.find(key);
        if (it != root.end() && it->is_number_unsigned())
        {
            manifest.sizeBytes = it->get<std::uint64_t>();
            break;
        }
    }

    auto tags = root.find("tags");
    if (tags != root.end() && tags->is_array())
    {
        for (const auto &tag : *tags)
        {
            if (tag.is_string())
                manifest.tags.insert(tag.get<std::string>());
        }
    }

    auto resources = root.find("resources");
    if (resources != root.end() && resources->is_object())
        collectResources(*resources, "", 0, manifest.resources);

    auto metadata = root.find("metadata");
    if (metadata != root.end() && metadata->is_object())
    {
        for (auto it = metadata->begin(); it != metadata->end(); ++it)
        {
            manifest.extensions[it.key()] = extensionValue(*it);
        }
    }

    for (auto it = root.begin(); it != root.end(); ++it)
    {
        if (KNOWN_FIELDS.count(it.key()) == 0)
            manifest.extensions[it.key()] = extensionValue(*it);
    }

    return manifest;
}

std::optional<std::string> findManifestFile(const std::string &packageDirectory)
{
    for (const char *name : {SSM_MANIFEST_FILENAME, SSM_LEGACY_MANIFEST_FILENAME})
    {
        std::string candidate = joinPath(packageDirectory, name);
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec))
            return candidate;
    }
    return std::nullopt;
}

Result<PackageManifest> loadManifest(const std::string &packageDirectory)
{
    auto manifestPath = findManifestFile(packageDirectory);
    if (!manifestPath)
        return Error{ErrorKind::MANIFEST, "no " + std::string(SSM_MANIFEST_FILENAME) + " in " + packageDirectory};

    std::ifstream in(*manifestPath, std::ios::binary);
    if (!in.is_open())
        return Error{ErrorKind::MANIFEST, "cannot read " + *manifestPath};

    std::ostringstream content;
    content << in.rdbuf();

    std::string directoryName = fs::path(packageDirectory).lexically_normal().filename().string();
    if (directoryName.empty())
        directoryName = fs::path(packageDirectory).lexically_normal().parent_path().filename().string();

    auto manifest = parseManifest(content.str(), directoryName);
    if (!manifest)
        return Error{ErrorKind::MANIFEST, manifest.error().message + " (" + *manifestPath + ")"};
    return manifest;
}

std::string serializeManifest(const PackageManifest &manifest)
{
    json root = json::object();
    root["id"] = manifest.id;
    root["name"] = manifest.name;
    root["version"] = manifest.version;
    if (manifest.description)
        root["description"] = *manifest.description;
    if (manifest.author)
        root["author"] = *manifest.author;
    if (manifest.createdAt)
        root["createdAt"] = *manifest.createdAt;
    if (manifest.sourceUrl)
        root["sourceUrl"] = *manifest.sourceUrl;
    if (manifest.sizeBytes)
        root["sizeBytes"] = *manifest.sizeBytes;
    root["tags"] = manifest.tags;
    root["type"] = manifest.type;
    if (!manifest.resources.empty())
        root["resources"] = manifest.resources;
    if (!manifest.extensions.empty())
        root["metadata"] = manifest.extensions;
    return root.dump(2);
}

Result<std::vector<PackageManifest>> parseCatalog(const std::string &text)
{
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded())
        return Error{ErrorKind::MANIFEST, "catalog is not valid JSON"};

    // Listings use "packages", search responses use "results"
    const json *entries = nullptr;
    if (root.is_array())
    {
        entries = &root;
    }
    else if (root.is_object())
    {
        for (const char *key : {"packages", "results"})
        {
            auto it = root.find(key);
            if (it != root.end() && it->is_array())
            {
                entries = &*it;
                break;
            }
        }
    }
    if (!entries)
        return Error{ErrorKind::MANIFEST, "catalog has no package list"};

    std::vector<PackageManifest> packages;
    for (const auto &entry : *entries)
    {
        if (!entry.is_object())
            continue;
        auto manifest = parseManifest(entry.dump(), "");
        if (manifest)
            packages.push_back(std::move(manifest.value()));
    }
    return packages;
}
