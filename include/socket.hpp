#pragma once
#include <cstddef>
#include <sys/types.h>

class Socket {
    int m_fd;
public:
    Socket();

    explicit Socket(int fd);

    Socket(const Socket&) = delete;

    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;

    Socket& operator=(Socket&& other) noexcept;

    ~Socket();

    void setNonBlocking();

    void setReuseAddr();

    void bind(int port);

    void listen();

    // Blocking connect to an IPv4 address, used by clients before going non-blocking.
    void connect(const char* ipv4Address, int port);

    // Returns an invalid Socket when no connection is pending.
    Socket accept();

    // Number of bytes transferred, 0 at end of stream (reads only), or -1 when
    // the call would block. Any other failure throws std::system_error.
    ssize_t readSome(char* buffer, std::size_t length);
    ssize_t writeSome(const char* buffer, std::size_t length);

    void close();

    int getPort() const;

    int getFd() const { return m_fd; }

    bool isValid() const { return m_fd != -1; }
};
