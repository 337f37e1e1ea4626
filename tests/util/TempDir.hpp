#ifndef TEMP_DIR_HPP
#define TEMP_DIR_HPP

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <filesystem>
#include <stdexcept>

// Scratch directory removed with everything in it when the test ends
class TempDir
{
public:
    TempDir()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "ssm-test-XXXXXX").string();
        if (!mkdtemp(&pattern[0]))
            throw std::runtime_error("mkdtemp failed");
        _path = pattern;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::string &path() const { return _path; }
    std::string operator/(const std::string &relative) const { return _path + "/" + relative; }

private:
    std::string _path;
};

inline void writeTextFile(const std::string &path, const std::string &content)
{
    std::filesystem::path p(path);
    if (p.has_parent_path())
        std::filesystem::create_directories(p.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readTextFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

#endif
