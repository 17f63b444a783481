#include "files.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

Directory::Directory(const std::string &path) : path(path) {
}

std::vector<std::string> Directory::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return names;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<uint64_t> Directory::lookup(const std::string &name) const {
    // only plain names, nothing outside the directory
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::path full = fs::path(path) / name;
    if (!fs::is_regular_file(full, ec)) {
        return std::nullopt;
    }
    uintmax_t size = fs::file_size(full, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

std::string Directory::path_of(const std::string &name) const {
    return (fs::path(path) / name).string();
}

FileReader::FileReader() {
}

FileReader::~FileReader() {
    close();
}

int FileReader::open(const std::string &path) {
    close();
    fp = fopen(path.c_str(), "rb");
    return fp == nullptr ? -1 : 0;
}

int FileReader::read(uint64_t offset, size_t length, std::vector<uint8_t> &out) {
    out.clear();
    if (fp == nullptr) {
        return -1;
    }
    if (fseeko(fp, static_cast<off_t>(offset), SEEK_SET) != 0) {
        return -1;
    }
    out.resize(length);
    size_t n = fread(out.data(), 1, length, fp);
    if (n < length && ferror(fp)) {
        out.clear();
        clearerr(fp);
        return -1;
    }
    out.resize(n);
    return static_cast<int>(n);
}

void FileReader::close() {
    if (fp != nullptr) {
        fclose(fp);
        fp = nullptr;
    }
}

FileWriter::FileWriter() {
}

FileWriter::~FileWriter() {
    if (fp != nullptr) {
        fclose(fp);
    }
}

int FileWriter::open(const std::string &path) {
    if (fp != nullptr) {
        fclose(fp);
    }
    written = 0;
    fp = fopen(path.c_str(), "wb");
    return fp == nullptr ? -1 : 0;
}

int FileWriter::write(const uint8_t *data, size_t len) {
    if (fp == nullptr) {
        return -1;
    }
    if (len > 0 && fwrite(data, 1, len, fp) != len) {
        return -1;
    }
    written += len;
    return static_cast<int>(len);
}

int FileWriter::close() {
    if (fp == nullptr) {
        return 0;
    }
    int ret = fclose(fp);
    fp = nullptr;
    return ret == 0 ? 0 : -1;
}
