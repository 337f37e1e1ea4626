#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <stdexcept>

#include "util/ZipBuilder.hpp"

ZipBuilder &ZipBuilder::addFile(const std::string &path, const std::string &content)
{
    _items.push_back(Item{Kind::FILE, path, content});
    return *this;
}

ZipBuilder &ZipBuilder::addDirectory(const std::string &path)
{
    _items.push_back(Item{Kind::DIRECTORY, path, ""});
    return *this;
}

ZipBuilder &ZipBuilder::addSymlink(const std::string &path, const std::string &target)
{
    _items.push_back(Item{Kind::SYMLINK, path, target});
    return *this;
}

std::string ZipBuilder::build() const
{
    size_t capacity = 4096;
    for (const auto &item : _items)
    {
        capacity += item.content.size() + 2 * item.path.size() + 512;
    }
    std::string output(capacity, '\0');
    size_t used = 0;

    struct archive *a = archive_write_new();
    archive_write_set_format_zip(a);
    archive_write_set_options(a, "zip:compression=store");
    archive_write_set_bytes_per_block(a, 0);
    if (archive_write_open_memory(a, &output[0], output.size(), &used) != ARCHIVE_OK)
    {
        archive_write_free(a);
        throw std::runtime_error("cannot open zip writer");
    }

    for (const auto &item : _items)
    {
        struct archive_entry *entry = archive_entry_new();
        archive_entry_set_pathname(entry, item.path.c_str());
        archive_entry_set_mtime(entry, 1700000000, 0);

        switch (item.kind)
        {
        case Kind::FILE:
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            archive_entry_set_size(entry, static_cast<la_int64_t>(item.content.size()));
            break;
        case Kind::DIRECTORY:
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
            archive_entry_set_size(entry, 0);
            break;
        case Kind::SYMLINK:
            archive_entry_set_filetype(entry, AE_IFLNK);
            archive_entry_set_perm(entry, 0777);
            archive_entry_set_symlink(entry, item.content.c_str());
            archive_entry_set_size(entry, 0);
            break;
        }

        archive_write_header(a, entry);
        if (item.kind == Kind::FILE && !item.content.empty())
            archive_write_data(a, item.content.data(), item.content.size());
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);

    output.resize(used);
    return output;
}

void ZipBuilder::writeTo(const std::string &file) const
{
    std::string bytes = build();
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}
