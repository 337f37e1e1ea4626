#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <algorithm>
#include <filesystem>
#include <system_error>

#include "core/ArchiveExtractor.hpp"
#include "aux/FileWriter.hpp"
#include "util/file.hpp"

namespace fs = std::filesystem;

namespace
{
    constexpr size_t ARCHIVE_BLOCK_SIZE = 10240;
    constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;
    constexpr const char *BACKUP_SUFFIX = ".ssm-backup";

    struct ArchiveReadDeleter
    {
        void operator()(struct archive *a) const
        {
            if (a)
                archive_read_free(a);
        }
    };

    using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;

    Error archiveError(const std::string &message)
    {
        return Error{ErrorKind::ARCHIVE, message};
    }

    std::string describeFailure(struct archive *a, const std::string &source)
    {
        const char *text = archive_error_string(a);
        return "cannot read archive " + source + ": " + (text ? text : "unknown error");
    }

    // Opens a reader that accepts ZIP containers only
    ArchiveReader openReader(const std::function<int(struct archive *)> &open,
                             const std::string &source,
                             Error &error)
    {
        ArchiveReader reader(archive_read_new());
        if (!reader)
        {
            error = archiveError("cannot allocate archive reader");
            return nullptr;
        }

        archive_read_support_format_zip(reader.get());
        if (open(reader.get()) != ARCHIVE_OK)
        {
            error = archiveError(describeFailure(reader.get(), source));
            return nullptr;
        }
        return reader;
    }

    std::string entryPathname(struct archive_entry *entry)
    {
        const char *name = archive_entry_pathname_utf8(entry);
        if (!name)
            name = archive_entry_pathname(entry);
        return name ? std::string(name) : std::string();
    }

    // Creates the directory and records every level that did not exist before
    bool createDirectories(const fs::path &dir, std::vector<std::string> &createdPaths, std::string &error)
    {
        std::vector<fs::path> missing;
        std::error_code ec;
        for (fs::path p = dir; !p.empty() && !fs::exists(p, ec); p = p.parent_path())
        {
            missing.push_back(p);
            if (p == p.parent_path())
                break;
        }

        if (!ensureDirectory(dir.string(), error))
            return false;

        for (auto it = missing.rbegin(); it != missing.rend(); ++it)
        {
            createdPaths.push_back(it->string());
        }
        return true;
    }
}

Status ArchiveExtractor::extractFile(const std::string &archivePath,
                                     const std::string &destination,
                                     const std::atomic<bool> *cancelFlag) const
{
    if (!fileExists(archivePath))
        return Error{ErrorKind::IO, "archive not found: " + archivePath};

    if (fileSize(archivePath) == 0)
        return archiveError("archive is empty: " + archivePath);

    auto open = [&archivePath](struct archive *a)
    {
        return archive_read_open_filename(a, archivePath.c_str(), ARCHIVE_BLOCK_SIZE);
    };
    return extract(open, archivePath, destination, cancelFlag);
}

Status ArchiveExtractor::extractMemory(const void *data,
                                       size_t size,
                                       const std::string &destination,
                                       const std::atomic<bool> *cancelFlag) const
{
    if (!data || size == 0)
        return archiveError("archive is empty: <memory>");

    auto open = [data, size](struct archive *a)
    {
        return archive_read_open_memory(a, data, size);
    };
    return extract(open, "<memory>", destination, cancelFlag);
}

Status ArchiveExtractor::extract(const Opener &open,
                                 const std::string &source,
                                 const std::string &destination,
                                 const std::atomic<bool> *cancelFlag) const
{
    auto index = readIndex(open, source);
    if (!index)
    {
        spdlog::warn("Extraction of {} rejected: {}", source, index.error().message);
        return index.error();
    }

    Journal journal;
    bool createdDestination = !fileExists(destination);

    Status status;
    try
    {
        std::string error;
        if (!createDirectories(fs::path(destination), journal.createdPaths, error))
            status = Error{ErrorKind::IO, error};
        else
            status = writeEntries(open, index.value(), destination, cancelFlag, journal);
    }
    catch (const std::exception &e)
    {
        status = Error{ErrorKind::IO, std::string("extraction failed: ") + e.what()};
    }

    if (!status)
    {
        spdlog::warn("Extraction of {} into {} failed: {}", source, destination, status.error().message);
        rollback(journal);
        if (createdDestination)
        {
            std::string error;
            if (!removeTree(destination, error))
                spdlog::warn("Rollback incomplete: {}", error);
        }
        return status;
    }

    discardBackups(journal);
    spdlog::info("Extracted {} entries from {} into {}", index->size(), source, destination);
    return status;
}

// First pass: walk every header without writing, so a corrupt or hostile
// archive is refused before the destination is touched
Result<std::vector<ArchiveExtractor::Entry>> ArchiveExtractor::readIndex(const Opener &open,
                                                                        const std::string &source) const
{
    Error error;
    ArchiveReader reader = openReader(open, source, error);
    if (!reader)
        return error;

    std::vector<Entry> entries;
    struct archive_entry *entry = nullptr;
    int r;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN)
    {
        std::string pathname = entryPathname(entry);
        auto relative = confinedRelativePath(pathname);
        if (!relative)
        {
            return archiveError("entry '" + pathname + "' escapes the destination directory");
        }

        Entry e;
        e.relativePath = *relative;

        auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR || (!pathname.empty() && pathname.back() == '/'))
        {
            e.isDirectory = true;
        }
        else if (type != AE_IFREG)
        {
            spdlog::warn("Skipping special entry '{}' in {}", pathname, source);
            e.isSkipped = true;
        }

        entries.push_back(e);

        if (archive_read_data_skip(reader.get()) != ARCHIVE_OK)
        {
            return archiveError(describeFailure(reader.get(), source));
        }
    }

    if (r != ARCHIVE_EOF)
        return archiveError(describeFailure(reader.get(), source));

    return entries;
}

// Second pass: materialise directories and files in archive order
Status ArchiveExtractor::writeEntries(const Opener &open,
                                     const std::vector<Entry> &entries,
                                     const std::string &destination,
                                     const std::atomic<bool> *cancelFlag,
                                     Journal &journal) const
{
    Error error;
    ArchiveReader reader = openReader(open, "<index>", error);
    if (!reader)
        return error;

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    struct archive_entry *entry = nullptr;

    for (const auto &e : entries)
    {
        if (cancelFlag && cancelFlag->load())
            return archiveError("extraction cancelled");

        int r = archive_read_next_header(reader.get(), &entry);
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
            return archiveError(describeFailure(reader.get(), "entry " + e.relativePath));

        fs::path target = fs::path(destination) / e.relativePath;
        std::string ioError;

        if (e.isSkipped)
        {
            archive_read_data_skip(reader.get());
            continue;
        }

        if (e.isDirectory)
        {
            if (!createDirectories(target, journal.createdPaths, ioError))
                return Error{ErrorKind::IO, ioError};
            continue;
        }

        // Parents are created on demand, archives need not list them
        if (!createDirectories(target.parent_path(), journal.createdPaths, ioError))
            return Error{ErrorKind::IO, ioError};

        const std::string path = target.string();
        bool createdHere = std::find(journal.createdPaths.begin(), journal.createdPaths.end(), path) !=
                           journal.createdPaths.end();
        if (fileExists(path) && !createdHere)
        {
            Status moved = moveAside(path, journal);
            if (!moved)
                return moved;
        }

        FileWriter writer(path, false);
        if (!writer.isOpen())
            return Error{ErrorKind::IO, writer.getLastError()};
        if (!createdHere)
            journal.createdPaths.push_back(path);

        la_ssize_t n;
        while ((n = archive_read_data(reader.get(), buffer.data(), buffer.size())) > 0)
        {
            if (!writer.write(buffer.data(), static_cast<size_t>(n)))
                return Error{ErrorKind::IO, writer.getLastError()};
        }
        if (n < 0)
            return archiveError(describeFailure(reader.get(), "entry " + e.relativePath));

        if (!writer.close())
            return Error{ErrorKind::IO, writer.getLastError()};
    }

    return Status();
}

// Keeps the previous content of a file about to be overwritten so a failed
// extraction can put it back
Status ArchiveExtractor::moveAside(const std::string &target, Journal &journal)
{
    std::string backup = target + BACKUP_SUFFIX;
    std::error_code ec;
    for (int n = 1; fs::exists(backup, ec); ++n)
        backup = target + BACKUP_SUFFIX + "." + std::to_string(n);

    fs::rename(target, backup, ec);
    if (ec)
        return Error{ErrorKind::IO, "cannot move " + target + " aside: " + ec.message()};

    journal.backups.emplace_back(target, backup);
    return Status();
}

// Removes what an aborted extraction created, newest first, then restores
// the files it replaced
void ArchiveExtractor::rollback(const Journal &journal)
{
    for (auto it = journal.createdPaths.rbegin(); it != journal.createdPaths.rend(); ++it)
    {
        std::error_code ec;
        fs::remove(*it, ec); // Non-empty directories held files that existed before
    }

    for (auto it = journal.backups.rbegin(); it != journal.backups.rend(); ++it)
    {
        std::error_code ec;
        fs::rename(it->second, it->first, ec);
        if (ec)
            spdlog::warn("Cannot restore {} from {}: {}", it->first, it->second, ec.message());
    }
}

void ArchiveExtractor::discardBackups(const Journal &journal)
{
    for (const auto &backup : journal.backups)
    {
        std::error_code ec;
        if (!fs::remove(backup.second, ec) && ec)
            spdlog::warn("Cannot delete backup {}: {}", backup.second, ec.message());
    }
}
