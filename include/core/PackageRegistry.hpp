#ifndef PACKAGEREGISTRY_HPP
#define PACKAGEREGISTRY_HPP

#include <mutex>
#include <string>
#include <vector>
#include <ctime>
#include <cstdint>
#include <optional>
#include <functional>

#include "core/Error.hpp"
#include "core/PackageManifest.hpp"

struct InstalledPackage
{
    PackageManifest manifest;
    std::string installRootPath;
    std::time_t installedAt{0};
};

// In-memory index of the packages found under an install root.
// The filesystem is the source of truth; the index can always be rebuilt
// with scan().
class PackageRegistry
{
public:
    using ChangeListener = std::function<void()>;

    PackageRegistry() = default;
    PackageRegistry(const PackageRegistry &) = delete;
    PackageRegistry &operator=(const PackageRegistry &) = delete;

    // Replaces the index with the immediate subdirectories of root that
    // hold a valid manifest. Returns the number indexed.
    size_t scan(const std::string &root);
    size_t refresh();

    Result<InstalledPackage> adopt(const std::string &directory);
    Status remove(const std::string &id);
    bool validate(const std::string &id) const;

    // Removes every package that fails validation, returns their ids
    std::vector<std::string> cleanupCorrupted();

    std::optional<InstalledPackage> findById(const std::string &id) const;
    std::optional<InstalledPackage> findByName(const std::string &name) const;
    std::vector<InstalledPackage> list() const;
    size_t count() const;
    std::uint64_t totalInstalledSize() const;

    std::vector<Error> lastScanErrors() const;
    std::string getRoot() const;
    void setChangeListener(ChangeListener listener);
    void clear();

private:
    mutable std::mutex _mutex;
    std::string _root;
    std::vector<InstalledPackage> _packages;
    std::vector<Error> _scanErrors;
    ChangeListener _listener;

    static Result<InstalledPackage> load(const std::string &directory);
    static bool isIntact(const InstalledPackage &package);
    void notify();
};

#endif
