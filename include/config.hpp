#ifndef CONFIG_HPP
#define CONFIG_HPP
#include <string>

struct Config {
    // local socket
    std::string ip = "0.0.0.0";
    int port = -1;

    // client only
    std::string server_ip;
    int server_port = -1;
    std::string output_dir = ".";
    std::string file;

    // server only
    std::string directory = "files/";
    unsigned int request_wait = 30;    // idle timeouts before WaitReq gives up

    unsigned int window = 5;
    unsigned int send_timeout = 2000;  // ms
    unsigned int send_retries = 100;
    unsigned int recv_timeout = 5000;  // ms
    unsigned int stall_rounds = 3;
    unsigned int handshake_attempts = 3;
    bool debug = false;
};

// parse command line, 0 on success, 1 on bad usage, 2 when --help was given
int parse_server_args(int argc, char *argv[], Config *config);
int parse_client_args(int argc, char *argv[], Config *config);

void print_server_usage(const char *prog);
void print_client_usage(const char *prog);

#endif
