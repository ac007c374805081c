#include <iostream>
#include <stdexcept>
#include <csignal>
#include <cstdlib>
#include "tcp_server.hpp"

// Global server for the signal handler
static TCPServer* g_server = nullptr;

void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_server != nullptr) {
        // Only touches an atomic flag and the selector's eventfd (async-signal-safe)
        g_server->stop();
    }
}

int main(int argc, char** argv) {
    try {
        int port = 8080;
        if (argc > 1) port = std::atoi(argv[1]);

        TCPServer server(port);

        g_server = &server;

        // Install signal handlers after the server exists
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "Starting TCP server on port " << server.getPort() << "..." << std::endl;
        server.start();
        g_server = nullptr;
        std::cout << "\nShutdown signal received. Stopping server..." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
