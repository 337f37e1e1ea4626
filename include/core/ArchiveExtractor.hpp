#ifndef ARCHIVEEXTRACTOR_HPP
#define ARCHIVEEXTRACTOR_HPP

#include <string>
#include <vector>
#include <atomic>
#include <utility>
#include <functional>

#include "core/Error.hpp"

struct archive;

// Unpacks ZIP archives into a directory. The whole entry index is read and
// validated before the first write, and a failure part way through removes
// whatever this call created and puts back any file it overwrote.
class ArchiveExtractor
{
public:
    ArchiveExtractor() = default;

    Status extractFile(const std::string &archivePath,
                       const std::string &destination,
                       const std::atomic<bool> *cancelFlag = nullptr) const;

    Status extractMemory(const void *data,
                         size_t size,
                         const std::string &destination,
                         const std::atomic<bool> *cancelFlag = nullptr) const;

private:
    struct Entry
    {
        std::string relativePath;
        bool isDirectory{false};
        bool isSkipped{false};
    };

    // What a single extraction changed on disk, in order
    struct Journal
    {
        std::vector<std::string> createdPaths;
        std::vector<std::pair<std::string, std::string>> backups; // original, moved-aside copy
    };

    using Opener = std::function<int(struct archive *)>;

    Status extract(const Opener &open,
                   const std::string &source,
                   const std::string &destination,
                   const std::atomic<bool> *cancelFlag) const;

    Result<std::vector<Entry>> readIndex(const Opener &open, const std::string &source) const;

    Status writeEntries(const Opener &open,
                        const std::vector<Entry> &entries,
                        const std::string &destination,
                        const std::atomic<bool> *cancelFlag,
                        Journal &journal) const;

    static Status moveAside(const std::string &target, Journal &journal);
    static void rollback(const Journal &journal);
    static void discardBackups(const Journal &journal);
};

#endif
