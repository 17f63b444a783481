#include "config.hpp"
#include <getopt.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>

enum {
    OPT_RECV_TIMEOUT = 256,
    OPT_STALL,
    OPT_ATTEMPTS,
    OPT_REQ_WAIT
};

static bool parse_uint(const char *arg, long min, long max, long *out) {
    if (arg == nullptr || *arg == '\0') {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    long v = strtol(arg, &end, 10);
    if (errno != 0 || *end != '\0' || v < min || v > max) {
        return false;
    }
    *out = v;
    return true;
}

void print_server_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--port <port>] [--bind <ip>] [--dir <directory>]"
        << " [--window <n>] [--timeout <ms>] [--retries <n>] [--request-wait <n>] [--debug]" << std::endl;
}

void print_client_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--port <port>] [--server <ip>] [--server-port <port>]"
        << " [--file <name>] [--output <directory>] [--window <n>] [--recv-timeout <ms>]"
        << " [--stall <n>] [--attempts <n>] [--debug]" << std::endl;
}

// options shared by both ends, returns false on a bad value
static bool common_option(int opt, Config *config) {
    long v = 0;
    switch (opt) {
        case 'p':
            if (!parse_uint(optarg, 0, 65535, &v)) return false;
            config->port = static_cast<int>(v);
            return true;
        case 'b':
            config->ip = optarg;
            return true;
        case 'w':
            if (!parse_uint(optarg, 1, 1024, &v)) return false;
            config->window = static_cast<unsigned int>(v);
            return true;
        case 't':
            if (!parse_uint(optarg, 1, INT_MAX, &v)) return false;
            config->send_timeout = static_cast<unsigned int>(v);
            return true;
        case 'r':
            if (!parse_uint(optarg, 0, INT_MAX, &v)) return false;
            config->send_retries = static_cast<unsigned int>(v);
            return true;
        case OPT_RECV_TIMEOUT:
            if (!parse_uint(optarg, 1, INT_MAX, &v)) return false;
            config->recv_timeout = static_cast<unsigned int>(v);
            return true;
        case OPT_STALL:
            if (!parse_uint(optarg, 1, INT_MAX, &v)) return false;
            config->stall_rounds = static_cast<unsigned int>(v);
            return true;
        case OPT_ATTEMPTS:
            if (!parse_uint(optarg, 1, INT_MAX, &v)) return false;
            config->handshake_attempts = static_cast<unsigned int>(v);
            return true;
        case 'v':
            config->debug = true;
            return true;
        default:
            return false;
    }
}

int parse_server_args(int argc, char *argv[], Config *config) {
    struct option long_options[] = {
        {"port", required_argument, 0, 'p'},
        {"bind", required_argument, 0, 'b'},
        {"dir", required_argument, 0, 'd'},
        {"window", required_argument, 0, 'w'},
        {"timeout", required_argument, 0, 't'},
        {"retries", required_argument, 0, 'r'},
        {"request-wait", required_argument, 0, OPT_REQ_WAIT},
        {"debug", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    // restart scanning, parse may run more than once per process
    optind = 0;
    int opt;
    int option_index = 0;
    long v = 0;
    while ((opt = getopt_long(argc, argv, "p:b:d:w:t:r:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'd':
                config->directory = optarg;
                break;
            case OPT_REQ_WAIT:
                if (!parse_uint(optarg, 0, INT_MAX, &v)) {
                    std::cerr << "Error: Invalid argument --request-wait." << std::endl;
                    return 1;
                }
                config->request_wait = static_cast<unsigned int>(v);
                break;
            case 'h':
                print_server_usage(argv[0]);
                return 2;
            case '?':
                // getopt_long already printed an error message.
                print_server_usage(argv[0]);
                return 1;
            default:
                if (!common_option(opt, config)) {
                    std::cerr << "Error: Invalid value \"" << (optarg ? optarg : "") << "\"." << std::endl;
                    return 1;
                }
                break;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: Unexpected argument " << argv[optind] << "." << std::endl;
        print_server_usage(argv[0]);
        return 1;
    }
    return 0;
}

int parse_client_args(int argc, char *argv[], Config *config) {
    struct option long_options[] = {
        {"port", required_argument, 0, 'p'},
        {"bind", required_argument, 0, 'b'},
        {"server", required_argument, 0, 's'},
        {"server-port", required_argument, 0, 'P'},
        {"file", required_argument, 0, 'f'},
        {"output", required_argument, 0, 'o'},
        {"window", required_argument, 0, 'w'},
        {"recv-timeout", required_argument, 0, OPT_RECV_TIMEOUT},
        {"stall", required_argument, 0, OPT_STALL},
        {"attempts", required_argument, 0, OPT_ATTEMPTS},
        {"debug", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    optind = 0;
    int opt;
    int option_index = 0;
    long v = 0;
    while ((opt = getopt_long(argc, argv, "p:b:s:P:f:o:w:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 's':
                config->server_ip = optarg;
                break;
            case 'P':
                if (!parse_uint(optarg, 1, 65535, &v)) {
                    std::cerr << "Error: Invalid argument --server-port." << std::endl;
                    return 1;
                }
                config->server_port = static_cast<int>(v);
                break;
            case 'f':
                config->file = optarg;
                break;
            case 'o':
                config->output_dir = optarg;
                break;
            case 'h':
                print_client_usage(argv[0]);
                return 2;
            case '?':
                print_client_usage(argv[0]);
                return 1;
            default:
                if (!common_option(opt, config)) {
                    std::cerr << "Error: Invalid value \"" << (optarg ? optarg : "") << "\"." << std::endl;
                    return 1;
                }
                break;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: Unexpected argument " << argv[optind] << "." << std::endl;
        print_client_usage(argv[0]);
        return 1;
    }
    return 0;
}
