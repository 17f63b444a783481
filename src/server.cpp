#include "utils.hpp"
#include "udp.hpp"
#include "ftp.hpp"
#include "prompt.hpp"

int main(int argc, char *argv[]) {
    Config config;
    int ret = parse_server_args(argc, argv, &config);
    if (ret != 0) {
        return ret == 2 ? 0 : 1;
    }
    set_debug(config.debug);

    log("Welcome to LiteFTP!");

    // choose port
    if (config.port < 0) {
        Prompt prompt(std::cin, std::cout);
        std::optional<int> port = prompt.ask_port("Please specify a port number: ");
        if (!port) {
            err("No valid port number given");
        }
        config.port = *port;
    }

    UDP udp;
    if (udp.bind(config.ip.c_str(), config.port) < 0) {
        err(("Error occurred hosting server on port " + std::to_string(config.port)
            + ". Is the port already in use by another instance of this server?").c_str());
    }
    log(("Server started on port " + std::to_string(udp.local_port())).c_str());

    FTPServer server(config, udp);
    server.serve_forever();
    return 0;
}
