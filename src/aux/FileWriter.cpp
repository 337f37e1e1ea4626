#include <cerrno>
#include <cstring>

#include "aux/FileWriter.hpp"

FileWriter::FileWriter(const std::string &filePath, bool isAppendMode) : _path(filePath)
{
    std::ios::openmode mode = std::ios::binary | std::ios::out;
    if (isAppendMode)
    {
        mode |= std::ios::app; // Keep bytes from an earlier attempt
    }
    else
    {
        mode |= std::ios::trunc;
    }

    errno = 0;
    _out.open(filePath, mode);
    if (!_out.is_open())
    {
        recordError("open");
    }
}

FileWriter::~FileWriter()
{
    if (_out.is_open())
    {
        _out.close();
    }
}

bool FileWriter::isOpen() const
{
    return _out.is_open();
}

// Writes a chunk and reports whether the stream is still healthy (disk full, etc.)
bool FileWriter::write(const char *data, size_t size)
{
    if (!_out.is_open())
        return false;

    errno = 0;
    _out.write(data, static_cast<std::streamsize>(size));
    if (!_out)
    {
        recordError("write");
        return false;
    }
    return true;
}

bool FileWriter::truncate()
{
    if (_out.is_open())
    {
        _out.close();
    }

    errno = 0;
    _out.clear();
    _out.open(_path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!_out.is_open())
    {
        recordError("truncate");
        return false;
    }
    return true;
}

// Flushes and closes, a failed flush is reported as a write error
bool FileWriter::close()
{
    if (!_out.is_open())
        return _lastError.empty();

    errno = 0;
    _out.flush();
    bool flushed = static_cast<bool>(_out);
    _out.close();
    if (!flushed)
    {
        recordError("flush");
        return false;
    }
    return true;
}

void FileWriter::recordError(const char *operation)
{
    _lastError = std::string("cannot ") + operation + " " + _path;
    if (errno != 0)
    {
        _lastError += ": ";
        _lastError += std::strerror(errno);
    }
}
