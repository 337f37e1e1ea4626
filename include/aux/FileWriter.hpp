#ifndef FILEWRITER_HPP
#define FILEWRITER_HPP

#include <string>
#include <fstream>

// Binary output file used for downloads (append on resume) and for
// extracted archive entries (always truncated)
class FileWriter
{
public:
    FileWriter(const std::string &filePath, bool isAppendMode);
    ~FileWriter();

    FileWriter(const FileWriter &) = delete;
    FileWriter &operator=(const FileWriter &) = delete;

    bool isOpen() const;
    bool write(const char *data, size_t size);

    // Discards everything in the file and continues writing from offset 0
    bool truncate();
    bool close();

    std::string getLastError() const { return _lastError; }

private:
    std::string _path;
    std::ofstream _out;
    std::string _lastError;

    void recordError(const char *operation);
};

#endif
