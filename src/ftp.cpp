#include "ftp.hpp"
#include <chrono>
#include <cstdio>

FTPServer::FTPServer(const Config &config, Channel &channel)
    : config(config), channel(channel), directory(config.directory) {
        log(("FTPServer: Serving " + config.directory).c_str());
}

FTPServer::~FTPServer() {
    log("FTPServer: Terminated");
}

SessionResult FTPServer::serve_one() {
    Session session;
    HandshakeServer handshake(channel, directory, config.send_timeout);
    if (handshake.wait_syn(session) != HS_OK) {
        return SESSION_SOCKET_ERROR;
    }
    sessions++;
    log(("FTPServer: Session " + std::to_string(sessions) + " with " + addr_str(session.peer)).c_str());
    HandshakeResult result = handshake.wait_req(session, config.request_wait);
    if (result == HS_NOT_FOUND) {
        return SESSION_NOT_FOUND;
    }
    if (result != HS_OK) {
        return SESSION_FAILED;
    }

    FileReader reader;
    if (reader.open(directory.path_of(session.file_name)) < 0) {
        warn(("FTPServer: Error opening " + session.file_name).c_str());
        return SESSION_FAILED;
    }
    log(("Starting file transfer, " + std::to_string(session.num_packets) + " packets").c_str());
    RDTSender sender(channel, config.window, config.send_timeout, config.send_retries);
    auto start = std::chrono::steady_clock::now();
    int ret = sender.send_file(session, reader);
    auto end = std::chrono::steady_clock::now();
    if (ret < 0) {
        warn(("FTPServer: Transfer of " + session.file_name + " failed").c_str());
        return SESSION_FAILED;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    log(("FTPServer: Time elapsed: " + std::to_string((float)elapsed.count() / 1000.0) + " s").c_str());
    log(("FTPServer: Timed out rounds: " + std::to_string(sender.misses)
        + " of " + std::to_string(sender.rounds)).c_str());
    return SESSION_OK;
}

void FTPServer::serve_forever() {
    unsigned int errors = 0;
    while (true) {
        SessionResult result = serve_one();
        if (result != SESSION_SOCKET_ERROR) {
            errors = 0;
            debug(("FTPServer: Session " + std::to_string(sessions) + " finished with "
                + std::to_string(result)).c_str());
            continue;
        }
        if (++errors >= MAX_SOCKET_ERRORS) {
            err("FTPServer: Socket keeps failing, shutting down");
        }
        warn(("FTPServer: Socket error " + std::to_string(errors) + " of "
            + std::to_string(MAX_SOCKET_ERRORS)).c_str());
    }
}

FTPClient::FTPClient(const Config &config, Channel &channel, Prompt &prompt)
    : config(config), channel(channel), prompt(prompt) {
}

FTPClient::~FTPClient() {
}

SessionResult FTPClient::run() {
    Session session;
    if (resolve_address(config.server_ip.c_str(), config.server_port, &session.peer) < 0) {
        warn(("FTPClient: Cannot resolve " + config.server_ip).c_str());
        return SESSION_FAILED;
    }

    HandshakeClient handshake(channel, config.recv_timeout, config.handshake_attempts);
    if (handshake.connect(session, files) != HS_OK) {
        return SESSION_FAILED;
    }
    if (files.empty()) {
        warn("Server has no files to send");
        return SESSION_FAILED;
    }

    std::string name = config.file;
    if (name.empty()) {
        std::optional<std::string> chosen = prompt.ask_file(files, addr_str(session.peer));
        if (!chosen) {
            warn("FTPClient: No file selected");
            return SESSION_FAILED;
        }
        name = *chosen;
    }

    HandshakeResult result = handshake.request(session, name);
    if (result == HS_NOT_FOUND) {
        return SESSION_NOT_FOUND;
    }
    if (result != HS_OK) {
        return SESSION_FAILED;
    }

    // never write outside the output directory
    std::string base = name.substr(name.find_last_of('/') + 1);
    output_path = config.output_dir + "/" + base;
    FileWriter writer;
    if (writer.open(output_path) < 0) {
        warn(("FTPClient: Error opening " + output_path).c_str());
        return SESSION_FAILED;
    }

    RDTReceiver receiver(channel, config.window, config.recv_timeout, config.stall_rounds);
    auto start = std::chrono::steady_clock::now();
    int ret = receiver.recv_file(session, writer);
    auto end = std::chrono::steady_clock::now();
    if (writer.close() < 0 && ret == 0) {
        warn(("FTPClient: Error closing " + output_path).c_str());
        ret = E_IO;
    }
    if (ret < 0) {
        if (std::remove(output_path.c_str()) != 0) {
            warn(("FTPClient: Could not remove partial file " + output_path).c_str());
        }
        return SESSION_FAILED;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    log(("FTPClient: File size: " + std::to_string(session.file_size) + " Bytes").c_str());
    log(("FTPClient: Time elapsed: " + std::to_string((float)elapsed.count() / 1000.0) + " s").c_str());
    if (receiver.discarded > 0 || receiver.corrupted > 0) {
        log(("FTPClient: Discarded " + std::to_string(receiver.discarded) + " packets, "
            + std::to_string(receiver.corrupted) + " corrupted").c_str());
    }
    return SESSION_OK;
}
