#ifndef FTP_HPP
#define FTP_HPP
#include "config.hpp"
#include "files.hpp"
#include "handshake.hpp"
#include "prompt.hpp"
#include "rdt.hpp"

enum SessionResult {
    SESSION_OK,
    SESSION_NOT_FOUND,
    SESSION_FAILED,
    // the socket itself failed before any client was seen
    SESSION_SOCKET_ERROR
};

class FTPServer {
public:
    FTPServer(const Config &config, Channel &channel);
    ~FTPServer();

    // one connection from SYN to the end of the transfer
    SessionResult serve_one();
    // serve connections one after another, exits through err() once the
    // socket fails MAX_SOCKET_ERRORS times in a row
    void serve_forever();

    static const unsigned int MAX_SOCKET_ERRORS = 5;

    // connections that got past the SYN
    unsigned int sessions = 0;

private:
    Config config;
    Channel &channel;
    Directory directory;
};

class FTPClient {
public:
    FTPClient(const Config &config, Channel &channel, Prompt &prompt);
    ~FTPClient();

    SessionResult run();

    std::vector<std::string> files;
    std::string output_path;

private:
    Config config;
    Channel &channel;
    Prompt &prompt;
};

#endif
