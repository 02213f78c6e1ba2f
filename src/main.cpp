#include "fsgate/fsgate.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string program = argc > 0 ? argv[0] : "fsgate-server";

    fsgate::ServerConfig cfg;
    try {
        cfg = fsgate::ServerConfig::from_args(argc, argv);
    } catch (const fsgate::ConfigError& e) {
        std::cerr << e.what() << "\n\n" << fsgate::usage(program);
        return 2;
    }
    if (cfg.show_help) {
        std::cout << fsgate::usage(program);
        return 0;
    }

    try {
        cfg.apply_logging();
    } catch (const fsgate::IoError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    fsgate::Sandbox sandbox;
    try {
        sandbox.replace_roots(cfg.roots);
    } catch (const fsgate::FsGateError& e) {
        fsgate::logger().error(std::string("invalid allowed directory: ") + e.what());
        return 1;
    }

    fsgate::McpServer::Options options;
    options.name = cfg.server_name;
    fsgate::McpServer server(sandbox, options);
    server.run(std::cin, std::cout);
    return 0;
}
