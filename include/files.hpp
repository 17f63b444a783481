#ifndef FILES_HPP
#define FILES_HPP
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

// Served directory, only regular files directly inside it are visible.
class Directory {
public:
    explicit Directory(const std::string &path);

    // sorted file names
    std::vector<std::string> list() const;
    // size of a listed file
    std::optional<uint64_t> lookup(const std::string &name) const;
    std::string path_of(const std::string &name) const;

private:
    std::string path;
};

// Random-access reads from one open file.
class FileReader {
public:
    FileReader();
    ~FileReader();
    FileReader(const FileReader &) = delete;
    FileReader &operator=(const FileReader &) = delete;

    int open(const std::string &path);
    // read up to length bytes at offset into out, return bytes read or -1
    int read(uint64_t offset, size_t length, std::vector<uint8_t> &out);
    void close();

private:
    FILE *fp = nullptr;
};

// Sequential writer, truncates on open.
class FileWriter {
public:
    FileWriter();
    ~FileWriter();
    FileWriter(const FileWriter &) = delete;
    FileWriter &operator=(const FileWriter &) = delete;

    int open(const std::string &path);
    int write(const uint8_t *data, size_t len);
    int close();

    uint64_t bytes_written() const {
        return written;
    }

private:
    FILE *fp = nullptr;
    uint64_t written = 0;
};

#endif
