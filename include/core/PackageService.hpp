#ifndef PACKAGESERVICE_HPP
#define PACKAGESERVICE_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <optional>

#include "core/Error.hpp"
#include "core/Config.hpp"
#include "core/TaskSupervisor.hpp"
#include "core/PackageRegistry.hpp"
#include "core/ArchiveExtractor.hpp"
#include "util/http.hpp"

// Filters for a repository search; unset fields are left out of the query
struct CatalogQuery
{
    std::optional<std::string> text;
    std::vector<std::string> tags;
    std::optional<std::string> author;
    std::optional<std::string> type;
};

// Front door of the pipeline: download, extract and register packages,
// and list or maintain the ones already installed
class PackageService
{
public:
    explicit PackageService(const ServiceConfig &config);
    ~PackageService();

    PackageService(const PackageService &) = delete;
    PackageService &operator=(const PackageService &) = delete;

    // Creates the install and download directories and indexes the install root
    Status initialize();

    // Cancels and waits for every transfer, then empties the index
    void dispose();

    bool isInitialized() const { return _initialized; }

    Result<TransferHandle> install(const std::string &url);
    Result<InstalledPackage> installFromFile(const std::string &archivePath);

    Result<http::ProbeResult> probe(const std::string &url) const;
    Result<std::vector<PackageManifest>> fetchCatalog(const std::string &repositoryUrl) const;
    Result<std::vector<PackageManifest>> searchCatalog(const std::string &repositoryUrl,
                                                       const CatalogQuery &query) const;

    bool cancel(const std::string &url);
    void cancelAll();

    std::vector<InstalledPackage> installedPackages() const;
    std::optional<InstalledPackage> findById(const std::string &id) const;
    std::optional<InstalledPackage> findByName(const std::string &name) const;
    Status removePackage(const std::string &id);
    bool validatePackage(const std::string &id) const;
    std::vector<std::string> cleanupCorrupted();
    std::uint64_t totalInstalledSize() const;
    size_t refresh();

    std::vector<std::string> activeTransferUrls() const;
    std::optional<ProgressSnapshot> latestSnapshot(const std::string &url) const;

    // Deletes files in the download directory, only archives when asked, returns how many
    size_t cleanupDownloads(bool onlyArchives);
    std::uint64_t downloadCacheSize() const;

    const ServiceConfig &getConfig() const { return _config; }
    PackageRegistry &getRegistry() { return _registry; }

private:
    ServiceConfig _config;
    PackageRegistry _registry;
    ArchiveExtractor _extractor;
    std::unique_ptr<TaskSupervisor> _supervisor;
    bool _initialized{false};

    Status adoptExtracted(const std::string &directory);
    // Archive name without extension, suffixed with a hash of the source so
    // different sources never share a download file or install directory
    static std::string localBaseName(const std::string &archiveName, const std::string &source);
};

#endif
