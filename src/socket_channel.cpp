#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "socket_channel.hpp"

namespace {

class FlagScope {
    bool& m_flag;
public:
    explicit FlagScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~FlagScope() { m_flag = false; }
};

}

SocketChannel::SocketChannel(EventLoop& loop, Socket socket, SocketChannelConfig config)
    : m_loop(loop),
      m_socket(std::move(socket)),
      m_fd(m_socket.getFd()),
      m_config(config),
      m_pipeline(this),
      m_interest(Interest::None),
      m_registeredInterest(Interest::None),
      m_pendingBytes(0),
      m_writable(true),
      m_notifyingWritability(false) {
    if (!m_socket.isValid()) {
        throw std::invalid_argument("SocketChannel requires a valid socket");
    }
    if (m_config.lowWaterMark > m_config.highWaterMark) {
        throw std::invalid_argument("SocketChannelConfig::lowWaterMark must not exceed highWaterMark");
    }
    if (m_config.readChunkSize == 0 || m_config.maxReadsPerEvent == 0) {
        throw std::invalid_argument("SocketChannelConfig read limits must be positive");
    }
    m_socket.setNonBlocking();
}

void SocketChannel::registerAndActivate() {
    m_loop.registerChannel(shared_from_this());
    m_registeredInterest = m_interest;

    m_pipeline.fireChannelRegistered();
    if (!isOpen()) {
        return;
    }
    m_pipeline.fireChannelActive();
    if (isOpen() && m_config.autoRead) {
        m_pipeline.read();
    }
}

void SocketChannel::readFromEventLoop() {
    // Each read request covers one readiness event.
    m_interest = withoutInterest(m_interest, Interest::Read);

    bool readSomething = false;
    for (std::size_t i = 0; i < m_config.maxReadsPerEvent && isOpen(); ++i) {
        Bytes chunk(m_config.readChunkSize);
        ssize_t bytes_read;
        try {
            bytes_read = m_socket.readSome(chunk.data(), chunk.size());
        } catch (const std::system_error&) {
            failWith(std::current_exception());
            return;
        }

        if (bytes_read == 0) {
            // Clean peer disconnect
            if (readSomething) {
                m_pipeline.fireChannelReadComplete();
            }
            close0();
            return;
        }
        if (bytes_read < 0) {
            break;
        }

        chunk.resize(static_cast<std::size_t>(bytes_read));
        readSomething = true;
        m_pipeline.fireChannelRead(std::move(chunk));
    }

    if (!isOpen()) {
        return;
    }
    if (readSomething) {
        m_pipeline.fireChannelReadComplete();
    }
    if (isOpen() && m_config.autoRead) {
        // Goes through the pipeline so a BackPressureHandler can hold it back.
        m_pipeline.read();
    }
    if (isOpen()) {
        updateInterest();
    }
}

void SocketChannel::flushFromEventLoop() {
    flushNow();
}

void SocketChannel::write0(Bytes data) {
    if (!isOpen() || data.empty()) {
        return;
    }
    m_pendingBytes += data.size();
    m_unflushed.insert(m_unflushed.end(), data.begin(), data.end());
    updateWritability();
}

void SocketChannel::flush0() {
    if (!isOpen()) {
        return;
    }
    m_flushBuffer.insert(m_flushBuffer.end(), m_unflushed.begin(), m_unflushed.end());
    m_unflushed.clear();
    flushNow();
}

void SocketChannel::flushNow() {
    while (isOpen() && !m_flushBuffer.empty()) {
        ssize_t bytes_written;
        try {
            bytes_written = m_socket.writeSome(m_flushBuffer.data(), m_flushBuffer.size());
        } catch (const std::system_error&) {
            failWith(std::current_exception());
            return;
        }
        if (bytes_written < 0) {
            break; // Socket buffer full, wait for writability
        }
        m_flushBuffer.erase(m_flushBuffer.begin(), m_flushBuffer.begin() + bytes_written);
        m_pendingBytes -= static_cast<std::size_t>(bytes_written);
    }
    if (!isOpen()) {
        return;
    }

    if (m_flushBuffer.empty()) {
        m_interest = withoutInterest(m_interest, Interest::Write);
    } else {
        m_interest = m_interest | Interest::Write;
    }
    updateWritability();
    if (isOpen()) {
        updateInterest();
    }
}

void SocketChannel::read0() {
    if (!isOpen() || hasInterest(m_interest, Interest::Read)) {
        return;
    }
    m_interest = m_interest | Interest::Read;
    updateInterest();
}

void SocketChannel::close0() {
    if (!isOpen()) {
        return;
    }
    // Deregistration drops the event loop's reference.
    auto self = weak_from_this().lock();

    if (m_loop.isRegistered(*this)) {
        try {
            m_loop.deregisterChannel(*this);
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to deregister fd " << m_fd << ": " << e.what() << std::endl;
        }
    }
    m_socket.close();
    m_unflushed.clear();
    m_flushBuffer.clear();
    m_pendingBytes = 0;

    m_pipeline.fireChannelInactive();
    m_pipeline.removeAll();
}

// Fires writability changes with hysteresis between the water marks. A change
// caused while handlers are being notified is re-checked once they return, so
// handlers always observe alternating notifications.
void SocketChannel::updateWritability() {
    if (m_notifyingWritability) {
        return;
    }
    while (isOpen()) {
        bool shouldBeWritable = m_writable ? m_pendingBytes <= m_config.highWaterMark
                                           : m_pendingBytes < m_config.lowWaterMark;
        if (shouldBeWritable == m_writable) {
            return;
        }
        m_writable = shouldBeWritable;
        FlagScope notifying(m_notifyingWritability);
        m_pipeline.fireChannelWritabilityChanged(m_writable);
    }
}

void SocketChannel::updateInterest() {
    if (m_interest == m_registeredInterest || !m_loop.isRegistered(*this)) {
        return;
    }
    m_loop.reregisterChannel(*this);
    m_registeredInterest = m_interest;
}

void SocketChannel::failWith(std::exception_ptr error) {
    m_pipeline.fireErrorCaught(std::move(error));
    close0();
}

ServerSocketChannel::ServerSocketChannel(EventLoop& loop, int port, ChannelInitializer::InitChannel childInit,
                                         SocketChannelConfig childConfig)
    : m_loop(loop),
      m_fd(-1),
      m_pipeline(this),
      m_childInit(std::move(childInit)),
      m_childConfig(childConfig) {
    if (!m_childInit) {
        throw std::invalid_argument("ServerSocketChannel requires a child initializer");
    }
    m_socket.setReuseAddr();
    m_socket.setNonBlocking();
    m_socket.bind(port);
    m_socket.listen();
    m_fd = m_socket.getFd();
}

void ServerSocketChannel::registerAndActivate() {
    m_loop.registerChannel(shared_from_this());
    m_pipeline.fireChannelRegistered();
    if (isOpen()) {
        m_pipeline.fireChannelActive();
    }
}

void ServerSocketChannel::readFromEventLoop() {
    while (isOpen()) {
        Socket client(-1);
        try {
            client = m_socket.accept();
        } catch (const std::system_error& e) {
            std::cerr << "Failed to accept new connection: " << e.what() << std::endl;
            m_pipeline.fireErrorCaught(std::current_exception());
            break;
        }
        if (!client.isValid()) {
            break; // No more incoming connections
        }

        auto child = std::make_shared<SocketChannel>(m_loop, std::move(client), m_childConfig);
        child->pipeline().addLast("initializer", std::make_shared<ChannelInitializer>(m_childInit));
        try {
            child->registerAndActivate();
        } catch (const std::exception& e) {
            std::cerr << "Error: Failed to initialize channel fd " << child->selectableFd()
                      << ": " << e.what() << std::endl;
            child->close0();
            continue;
        }

        std::cout << "Accepted new connection, fd: " << child->selectableFd() << std::endl;
    }
}

void ServerSocketChannel::write0(Bytes) {
    m_pipeline.fireErrorCaught(
        std::make_exception_ptr(std::logic_error("ServerSocketChannel does not support write")));
}

void ServerSocketChannel::close0() {
    if (!isOpen()) {
        return;
    }
    auto self = weak_from_this().lock();

    if (m_loop.isRegistered(*this)) {
        try {
            m_loop.deregisterChannel(*this);
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to deregister fd " << m_fd << ": " << e.what() << std::endl;
        }
    }
    m_socket.close();
    m_pipeline.fireChannelInactive();
    m_pipeline.removeAll();
}
