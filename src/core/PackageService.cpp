#include <spdlog/spdlog.h>
#include <filesystem>
#include <algorithm>
#include <cctype>

#include "core/PackageService.hpp"
#include "core/TransferTask.hpp"
#include "util/file.hpp"

namespace fs = std::filesystem;

PackageService::PackageService(const ServiceConfig &config)
    : _config(config),
      _supervisor(std::make_unique<TaskSupervisor>(config.maxConcurrent, toTransferSettings(config)))
{
}

PackageService::~PackageService()
{
    dispose();
}

Status PackageService::initialize()
{
    if (!_supervisor)
        _supervisor = std::make_unique<TaskSupervisor>(_config.maxConcurrent, toTransferSettings(_config));

    std::string error;
    if (!ensureDirectory(_config.installRoot, error))
        return Error{ErrorKind::IO, error};
    if (!ensureDirectory(_config.downloadDirectory, error))
        return Error{ErrorKind::IO, error};

    _registry.scan(_config.installRoot);
    _initialized = true;
    spdlog::info("Package service ready: {} installed, downloads in {}", _registry.count(), _config.downloadDirectory);
    return Status();
}

void PackageService::dispose()
{
    if (_supervisor)
    {
        _supervisor->shutdown();
        _supervisor.reset();
    }
    _registry.clear();
    _initialized = false;
}

Result<TransferHandle> PackageService::install(const std::string &url)
{
    if (!_supervisor)
        return Error{ErrorKind::NOT_READY, "package service is not initialized"};

    std::string baseName = localBaseName(http::deriveArchiveName(url), url);

    TransferOptions options;
    options.destinationPath = joinPath(_config.downloadDirectory, baseName + ".zip");
    options.extract = true;
    options.extractTo = joinPath(_config.installRoot, baseName);
    options.onExtracted = [this](const std::string &directory)
    { return adoptExtracted(directory); };

    return _supervisor->start(url, options);
}

Result<InstalledPackage> PackageService::installFromFile(const std::string &archivePath)
{
    if (!fileExists(archivePath))
        return Error{ErrorKind::NOT_FOUND, "archive " + archivePath + " does not exist"};

    std::error_code ec;
    fs::path absolute = fs::absolute(archivePath, ec);
    std::string source = ec ? archivePath : absolute.lexically_normal().string();
    std::string target = joinPath(_config.installRoot, localBaseName(fs::path(archivePath).filename().string(), source));
    Status extracted = _extractor.extractFile(archivePath, target);
    if (!extracted)
        return extracted.error();

    auto package = _registry.adopt(target);
    if (!package)
        spdlog::warn("Extracted {} but it is not a valid package: {}", archivePath, package.error().message);
    return package;
}

Result<http::ProbeResult> PackageService::probe(const std::string &url) const
{
    return http::probeUrl(url, _config.connectTimeoutSec);
}

Result<std::vector<PackageManifest>> PackageService::fetchCatalog(const std::string &repositoryUrl) const
{
    auto body = http::fetchText(repositoryUrl, _config.connectTimeoutSec);
    if (!body)
        return body.error();
    return parseCatalog(body.value());
}

Result<std::vector<PackageManifest>> PackageService::searchCatalog(const std::string &repositoryUrl,
                                                                   const CatalogQuery &query) const
{
    std::vector<std::pair<std::string, std::string>> parameters;
    if (query.text)
        parameters.emplace_back("q", *query.text);
    if (!query.tags.empty())
    {
        std::string joined;
        for (const auto &tag : query.tags)
            joined += (joined.empty() ? "" : ",") + tag;
        parameters.emplace_back("tags", joined);
    }
    if (query.author)
        parameters.emplace_back("author", *query.author);
    if (query.type)
        parameters.emplace_back("type", *query.type);

    auto body = http::fetchText(http::appendQuery(repositoryUrl, parameters), _config.connectTimeoutSec);
    if (!body)
        return body.error();
    return parseCatalog(body.value());
}

bool PackageService::cancel(const std::string &url)
{
    return _supervisor && _supervisor->cancel(url);
}

void PackageService::cancelAll()
{
    if (_supervisor)
        _supervisor->cancelAll();
}

std::vector<InstalledPackage> PackageService::installedPackages() const
{
    return _registry.list();
}

std::optional<InstalledPackage> PackageService::findById(const std::string &id) const
{
    return _registry.findById(id);
}

std::optional<InstalledPackage> PackageService::findByName(const std::string &name) const
{
    return _registry.findByName(name);
}

Status PackageService::removePackage(const std::string &id)
{
    return _registry.remove(id);
}

bool PackageService::validatePackage(const std::string &id) const
{
    return _registry.validate(id);
}

std::vector<std::string> PackageService::cleanupCorrupted()
{
    return _registry.cleanupCorrupted();
}

std::uint64_t PackageService::totalInstalledSize() const
{
    return _registry.totalInstalledSize();
}

size_t PackageService::refresh()
{
    return _registry.scan(_config.installRoot);
}

std::vector<std::string> PackageService::activeTransferUrls() const
{
    if (!_supervisor)
        return {};
    return _supervisor->activeUrls();
}

std::optional<ProgressSnapshot> PackageService::latestSnapshot(const std::string &url) const
{
    if (!_supervisor)
        return std::nullopt;
    return _supervisor->latestSnapshot(url);
}

size_t PackageService::cleanupDownloads(bool onlyArchives)
{
    std::vector<std::string> active = activeTransferUrls();
    size_t removed = 0;

    std::error_code ec;
    fs::directory_iterator it(_config.downloadDirectory, ec), end;
    for (; !ec && it != end; it.increment(ec))
    {
        std::error_code entryError;
        if (!it->is_regular_file(entryError))
            continue;
        if (onlyArchives && it->path().extension() != ".zip")
            continue;

        // Never pull a file out from under a running transfer
        bool inUse = false;
        for (const auto &url : active)
        {
            if (it->path().filename() == localBaseName(http::deriveArchiveName(url), url) + ".zip")
                inUse = true;
        }
        if (inUse)
            continue;

        if (fs::remove(it->path(), entryError))
            removed++;
        else if (entryError)
            spdlog::warn("Cannot delete {}: {}", it->path().string(), entryError.message());
    }

    spdlog::info("Removed {} file(s) from {}", removed, _config.downloadDirectory);
    return removed;
}

std::uint64_t PackageService::downloadCacheSize() const
{
    return directorySize(_config.downloadDirectory);
}

std::string PackageService::localBaseName(const std::string &archiveName, const std::string &source)
{
    std::string stem = archiveName;
    if (stem.size() > 4)
    {
        std::string extension = stem.substr(stem.size() - 4);
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (extension == ".zip")
            stem.resize(stem.size() - 4);
    }
    if (stem.empty() || stem == "." || stem == "..")
        stem = "package";
    return stem + "-" + makeTaskId(source).substr(0, 8);
}

Status PackageService::adoptExtracted(const std::string &directory)
{
    auto package = _registry.adopt(directory);
    if (!package)
        return package.error();
    return Status();
}
