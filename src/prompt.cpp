#include "prompt.hpp"
#include "udp.hpp"
#include <cerrno>
#include <cstdlib>

Prompt::Prompt(std::istream &in, std::ostream &out) : in(in), out(out) {
}

std::optional<std::string> Prompt::read_line(const char *question) {
    out << question << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << std::endl;
        return std::nullopt;
    }
    // trim surrounding blanks
    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = line.find_last_not_of(" \t\r");
    return line.substr(first, last - first + 1);
}

std::optional<int> Prompt::ask_port(const char *question, int min_port) {
    for (int i = 0; i < MAX_ATTEMPTS; i++) {
        std::optional<std::string> line = read_line(question);
        if (!line) {
            return std::nullopt;
        }
        char *end = nullptr;
        errno = 0;
        long port = strtol(line->c_str(), &end, 10);
        if (!line->empty() && errno == 0 && *end == '\0' && port >= min_port && port <= 65535) {
            return static_cast<int>(port);
        }
        out << "Invalid port number" << std::endl;
    }
    return std::nullopt;
}

std::optional<std::string> Prompt::ask_address(const char *question) {
    for (int i = 0; i < MAX_ATTEMPTS; i++) {
        std::optional<std::string> line = read_line(question);
        if (!line) {
            return std::nullopt;
        }
        struct sockaddr_in addr;
        if (!line->empty() && resolve_address(line->c_str(), 0, &addr) == 0) {
            return line;
        }
        out << "Invalid IP address" << std::endl;
    }
    return std::nullopt;
}

std::optional<std::string> Prompt::ask_file(const std::vector<std::string> &files, const std::string &server) {
    out << "--------------------" << std::endl;
    out << "Available files on " << server << ":" << std::endl;
    for (const auto &file : files) {
        out << "\t" << file << std::endl;
    }
    for (int i = 0; i < MAX_ATTEMPTS; i++) {
        std::optional<std::string> line = read_line("\nSelect a file: ");
        if (!line) {
            return std::nullopt;
        }
        if (!line->empty()) {
            return line;
        }
    }
    return std::nullopt;
}
