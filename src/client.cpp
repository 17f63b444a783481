#include "utils.hpp"
#include "udp.hpp"
#include "ftp.hpp"
#include "prompt.hpp"

int main(int argc, char *argv[]) {
    Config config;
    int ret = parse_client_args(argc, argv, &config);
    if (ret != 0) {
        return ret == 2 ? 0 : 1;
    }
    set_debug(config.debug);

    log("Welcome to LiteFTP!");

    // ask for whatever the command line left out
    Prompt prompt(std::cin, std::cout);
    if (config.port < 0) {
        std::optional<int> port = prompt.ask_port("Please specify a client port number (0 for any): ", 0);
        if (!port) {
            err("No valid client port number given");
        }
        config.port = *port;
    }
    if (config.server_port < 0) {
        std::optional<int> port = prompt.ask_port("Enter server port number: ");
        if (!port) {
            err("No valid server port number given");
        }
        config.server_port = *port;
    }
    if (config.server_ip.empty()) {
        std::optional<std::string> address = prompt.ask_address("Enter server IP address: ");
        if (!address) {
            err("No valid server address given");
        }
        config.server_ip = *address;
    }

    UDP udp;
    if (udp.bind(config.ip.c_str(), config.port) < 0) {
        err(("Problem starting client on port " + std::to_string(config.port)
            + ". Is the port already in use by another instance of this client?").c_str());
    }

    FTPClient client(config, udp, prompt);
    SessionResult result = client.run();
    return result == SESSION_OK ? 0 : 1;
}
