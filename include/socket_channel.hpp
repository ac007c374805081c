#pragma once
#include <cstddef>
#include <memory>
#include "channel_handlers.hpp"
#include "channel_pipeline.hpp"
#include "event_loop.hpp"
#include "socket.hpp"

struct SocketChannelConfig {
    std::size_t highWaterMark = 64 * 1024; // Unwritable above 64KB of pending output
    std::size_t lowWaterMark = 32 * 1024;  // Writable again below 32KB
    std::size_t readChunkSize = 4096;
    std::size_t maxReadsPerEvent = 16;
    bool autoRead = true;
};

// Connected TCP stream. Must be owned by a std::shared_ptr, since the event loop
// keeps a reference to every registered channel.
class SocketChannel : public Channel, public std::enable_shared_from_this<SocketChannel> {
    EventLoop& m_loop;
    Socket m_socket;
    int m_fd;
    SocketChannelConfig m_config;
    ChannelPipeline m_pipeline;
    Interest m_interest;
    Interest m_registeredInterest;
    Bytes m_unflushed;
    Bytes m_flushBuffer;
    std::size_t m_pendingBytes;
    bool m_writable;
    bool m_notifyingWritability;

public:
    SocketChannel(EventLoop& loop, Socket socket, SocketChannelConfig config = {});

    // Registers with the event loop, then fires channelRegistered and
    // channelActive and issues the first read when autoRead is set. Errors
    // thrown while the pipeline is initialized propagate to the caller.
    void registerAndActivate();

    EventLoop& eventLoop() { return m_loop; }
    std::size_t pendingBytes() const { return m_pendingBytes; }

    int selectableFd() const override { return m_fd; }
    Interest interestedEvent() const override { return m_interest; }
    bool isOpen() const override { return m_socket.isValid(); }
    bool isWritable() const override { return m_writable; }
    ChannelPipeline& pipeline() override { return m_pipeline; }

    void flushFromEventLoop() override;
    void readFromEventLoop() override;

    void write0(Bytes data) override;
    void flush0() override;
    void read0() override;
    void close0() override;

private:
    void flushNow();
    void updateWritability();
    void updateInterest();
    void failWith(std::exception_ptr error);
};

// Listening TCP socket. Every accepted connection becomes a SocketChannel whose
// pipeline is set up by a ChannelInitializer wrapping the child callback.
class ServerSocketChannel : public Channel, public std::enable_shared_from_this<ServerSocketChannel> {
    EventLoop& m_loop;
    Socket m_socket;
    int m_fd;
    ChannelPipeline m_pipeline;
    ChannelInitializer::InitChannel m_childInit;
    SocketChannelConfig m_childConfig;

public:
    ServerSocketChannel(EventLoop& loop, int port, ChannelInitializer::InitChannel childInit,
                        SocketChannelConfig childConfig = {});

    void registerAndActivate();

    int getPort() const { return m_socket.getPort(); }

    int selectableFd() const override { return m_fd; }
    Interest interestedEvent() const override { return Interest::Read; }
    bool isOpen() const override { return m_socket.isValid(); }
    bool isWritable() const override { return false; }
    ChannelPipeline& pipeline() override { return m_pipeline; }

    void flushFromEventLoop() override {}
    void readFromEventLoop() override;

    void write0(Bytes data) override;
    void flush0() override {}
    void read0() override {}
    void close0() override;
};
