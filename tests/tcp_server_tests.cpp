#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <sys/socket.h>
#include <sys/time.h>
#include <catch2/catch_test_macros.hpp>
#include "tcp_server.hpp"
#include "test_support.hpp"

namespace {

// Runs a TCPServer on its own thread, since the loop belongs to the thread
// that constructs it.
class ServerThread {
    std::promise<std::pair<TCPServer*, int>> m_ready;
    std::thread m_thread;
    TCPServer* m_server = nullptr;
    int m_port = 0;

public:
    ServerThread() {
        auto started = m_ready.get_future();
        m_thread = std::thread([this] {
            std::unique_ptr<TCPServer> server;
            try {
                server = std::make_unique<TCPServer>(0);
            } catch (const std::exception&) {
                m_ready.set_exception(std::current_exception());
                return;
            }
            m_ready.set_value({server.get(), server->getPort()});
            server->start();
        });
        try {
            auto info = started.get();
            m_server = info.first;
            m_port = info.second;
        } catch (const std::exception&) {
            m_thread.join();
            throw;
        }
    }

    ~ServerThread() {
        m_server->stop();
        m_thread.join();
    }

    int port() const { return m_port; }
};

Socket connectClient(int port) {
    Socket client;
    client.connect("127.0.0.1", port);
    timeval timeout{};
    timeout.tv_sec = 10;
    setsockopt(client.getFd(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    setsockopt(client.getFd(), SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
    return client;
}

std::string readExactly(Socket& socket, std::size_t length) {
    std::string received;
    char buffer[4096];
    while (received.size() < length) {
        ssize_t bytes_read = socket.readSome(buffer, sizeof(buffer));
        if (bytes_read <= 0) {
            break; // End of stream or receive timeout
        }
        received.append(buffer, static_cast<std::size_t>(bytes_read));
    }
    return received;
}

void writeAll(Socket& socket, const std::string& data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t bytes_written = socket.writeSome(data.data() + offset, data.size() - offset);
        if (bytes_written <= 0) {
            return;
        }
        offset += static_cast<std::size_t>(bytes_written);
    }
}

}

TEST_CASE("TCPServer echoes data uppercased", "[tcp_server]") {
    ServerThread server;

    SECTION("Single message round trip") {
        Socket client = connectClient(server.port());
        writeAll(client, "hello world");

        REQUIRE(readExactly(client, 11) == "HELLO WORLD");
    }

    SECTION("Several clients are served independently") {
        Socket first = connectClient(server.port());
        Socket second = connectClient(server.port());

        writeAll(first, "first");
        writeAll(second, "second");

        REQUIRE(readExactly(second, 6) == "SECOND");
        REQUIRE(readExactly(first, 5) == "FIRST");
    }
}

TEST_CASE("TCPServer applies backpressure to a slow reader", "[tcp_server]") {
    ServerThread server;
    Socket client = connectClient(server.port());

    // Far larger than the socket buffers and the channel's high water mark, so
    // the server must stop reading until the client drains the echoed bytes.
    const std::string payload(1024 * 1024, 'a');
    std::thread writer([&] { writeAll(client, payload); });

    std::string echoed = readExactly(client, payload.size());
    writer.join();

    REQUIRE(echoed.size() == payload.size());
    REQUIRE(echoed == std::string(payload.size(), 'A'));
}
