#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

#include "core/PackageRegistry.hpp"
#include "util/file.hpp"

namespace fs = std::filesystem;

Result<InstalledPackage> PackageRegistry::load(const std::string &directory)
{
    auto manifest = loadManifest(directory);
    if (!manifest)
        return manifest.error();

    InstalledPackage package;
    package.manifest = std::move(manifest.value());
    package.installRootPath = directory;
    package.installedAt = std::time(nullptr);
    return package;
}

// Directory present, manifest readable, every listed resource inside the package
bool PackageRegistry::isIntact(const InstalledPackage &package)
{
    if (!directoryExists(package.installRootPath))
        return false;
    if (!loadManifest(package.installRootPath))
        return false;

    for (const auto &resource : package.manifest.resources)
    {
        auto relative = confinedRelativePath(resource.second);
        if (!relative || !fileExists(joinPath(package.installRootPath, *relative)))
        {
            spdlog::debug("Package {} is missing resource {} ({})", package.manifest.id, resource.first, resource.second);
            return false;
        }
    }
    return true;
}

size_t PackageRegistry::scan(const std::string &root)
{
    std::vector<std::string> directories;
    std::vector<Error> errors;

    std::error_code ec;
    fs::directory_iterator it(root, ec), end;
    if (ec)
        errors.push_back(Error{ErrorKind::IO, "cannot read install root " + root + ": " + ec.message()});

    for (; !ec && it != end; it.increment(ec))
    {
        std::error_code typeError;
        if (it->is_directory(typeError))
            directories.push_back(it->path().string());
    }
    std::sort(directories.begin(), directories.end());

    std::vector<InstalledPackage> packages;
    for (const auto &directory : directories)
    {
        auto package = load(directory);
        if (!package)
        {
            spdlog::warn("Skipping {}: {}", directory, package.error().message);
            errors.push_back(package.error());
            continue;
        }

        const std::string &id = package->manifest.id;
        bool duplicate = std::any_of(packages.begin(), packages.end(), [&id](const InstalledPackage &existing)
                                     { return existing.manifest.id == id; });
        if (duplicate)
        {
            spdlog::warn("Skipping {}: id '{}' is already installed", directory, id);
            continue;
        }
        packages.push_back(std::move(package.value()));
    }

    size_t indexed = packages.size();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _root = root;
        _packages = std::move(packages);
        _scanErrors = std::move(errors);
    }

    spdlog::info("Indexed {} package(s) under {}", indexed, root);
    notify();
    return indexed;
}

size_t PackageRegistry::refresh()
{
    return scan(getRoot());
}

Result<InstalledPackage> PackageRegistry::adopt(const std::string &directory)
{
    auto package = load(directory);
    if (!package)
        return package.error();

    // A directory holds one package, so anything indexed at the same path is stale
    std::string location = fs::path(directory).lexically_normal().string();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _packages.erase(std::remove_if(_packages.begin(), _packages.end(), [&](const InstalledPackage &entry)
                                       { return entry.manifest.id == package->manifest.id ||
                                                fs::path(entry.installRootPath).lexically_normal().string() == location; }),
                        _packages.end());
        _packages.push_back(package.value());
    }

    spdlog::info("Adopted package {} ({}) from {}", package->manifest.id, package->manifest.version, directory);
    notify();
    return package;
}

Status PackageRegistry::remove(const std::string &id)
{
    std::string directory;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = std::find_if(_packages.begin(), _packages.end(), [&id](const InstalledPackage &entry)
                               { return entry.manifest.id == id; });
        if (it == _packages.end())
            return Error{ErrorKind::NOT_FOUND, "no installed package with id " + id};
        directory = it->installRootPath;
    }

    std::string error;
    if (!removeTree(directory, error))
        return Error{ErrorKind::IO, "cannot delete " + directory + ": " + error};

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _packages.erase(std::remove_if(_packages.begin(), _packages.end(), [&id](const InstalledPackage &entry)
                                       { return entry.manifest.id == id; }),
                        _packages.end());
    }

    spdlog::info("Removed package {}", id);
    notify();
    return Status();
}

bool PackageRegistry::validate(const std::string &id) const
{
    auto package = findById(id);
    return package && isIntact(*package);
}

std::vector<std::string> PackageRegistry::cleanupCorrupted()
{
    std::vector<std::string> removed;
    for (const auto &package : list())
    {
        if (isIntact(package))
            continue;

        Status status = remove(package.manifest.id);
        if (status)
            removed.push_back(package.manifest.id);
        else
            spdlog::warn("Cleanup of {} failed: {}", package.manifest.id, status.error().message);
    }
    return removed;
}

std::optional<InstalledPackage> PackageRegistry::findById(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &package : _packages)
    {
        if (package.manifest.id == id)
            return package;
    }
    return std::nullopt;
}

std::optional<InstalledPackage> PackageRegistry::findByName(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &package : _packages)
    {
        if (package.manifest.name == name)
            return package;
    }
    return std::nullopt;
}

std::vector<InstalledPackage> PackageRegistry::list() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _packages;
}

size_t PackageRegistry::count() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _packages.size();
}

std::uint64_t PackageRegistry::totalInstalledSize() const
{
    std::uint64_t total = 0;
    for (const auto &package : list())
    {
        total += directorySize(package.installRootPath);
    }
    return total;
}

std::vector<Error> PackageRegistry::lastScanErrors() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _scanErrors;
}

std::string PackageRegistry::getRoot() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _root;
}

void PackageRegistry::setChangeListener(ChangeListener listener)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _listener = std::move(listener);
}

void PackageRegistry::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _packages.clear();
    _scanErrors.clear();
}

// Listener runs outside the lock so it may query the registry
void PackageRegistry::notify()
{
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        listener = _listener;
    }
    if (listener)
        listener();
}
