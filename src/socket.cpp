#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <system_error>
#include <cerrno>
#include <cstring>
#include "socket.hpp"

namespace {

std::system_error socketError(const char* what) {
    return std::system_error(errno, std::generic_category(), std::string(what) + ": " + std::strerror(errno));
}

}

Socket::Socket() : m_fd(-1) {
    m_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_fd == -1) {
        throw std::runtime_error("Failed to create socket");
    }
}

Socket::Socket(int fd) : m_fd(fd) {
}

Socket::Socket(Socket&& other) noexcept : m_fd(other.m_fd) {
    other.m_fd = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        if (m_fd != -1) {
            ::close(m_fd);
        }
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

Socket::~Socket() {
    close();
}

void Socket::setNonBlocking() {
    int flags = fcntl(m_fd, F_GETFL, 0);
    if (flags == -1) {
        throw std::runtime_error("Failed to get socket flags");
    }
    if (fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throw std::runtime_error("Failed to set socket flags");
    }
}

void Socket::setReuseAddr() {
    int opt = 1;
    if (setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1) {
        throw std::runtime_error("Failed to set SO_REUSEADDR");
    }
}

void Socket::bind(int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    if (::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        throw std::runtime_error("Failed to bind socket");
    }
}

void Socket::listen() {
    if (::listen(m_fd, SOMAXCONN) == -1) {
        throw std::runtime_error("Failed to listen on socket");
    }
}

void Socket::connect(const char* ipv4Address, int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ipv4Address, &addr.sin_addr) != 1) {
        throw std::invalid_argument(std::string("Invalid IPv4 address: ") + ipv4Address);
    }
    if (::connect(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        throw socketError("connect failed");
    }
}

Socket Socket::accept() {
    int client_fd = accept4(m_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd == -1) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return Socket(-1);
        }
        throw socketError("accept failed");
    }
    return Socket(client_fd);
}

ssize_t Socket::readSome(char* buffer, std::size_t length) {
    while (true) {
        ssize_t bytes_read = ::read(m_fd, buffer, length);
        if (bytes_read >= 0) {
            return bytes_read;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return -1;
        }
        throw socketError("read failed");
    }
}

ssize_t Socket::writeSome(const char* buffer, std::size_t length) {
    while (true) {
        ssize_t bytes_written = ::send(m_fd, buffer, length, MSG_NOSIGNAL);
        if (bytes_written >= 0) {
            return bytes_written;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return -1;
        }
        throw socketError("write failed");
    }
}

void Socket::close() {
    if (m_fd != -1) {
        ::close(m_fd);
        m_fd = -1;
    }
}

int Socket::getPort() const {
    if (m_fd == -1) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
        throw std::system_error(errno, std::generic_category(), std::string("getsockname failed: ") + std::strerror(errno));
    }
    return ntohs(addr.sin_port);
}
