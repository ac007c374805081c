#pragma once
#include <memory>
#include "channel_handlers.hpp"
#include "event_loop.hpp"
#include "socket_channel.hpp"

// Echoes every received byte back to the sender, uppercased.
class UpperCaseEchoHandler : public ChannelHandler {
public:
    void channelRead(ChannelHandlerContext& ctx, Bytes data) override;
    void channelReadComplete(ChannelHandlerContext& ctx) override;
    void channelInactive(ChannelHandlerContext& ctx) override;
    void errorCaught(ChannelHandlerContext& ctx, std::exception_ptr error) override;
};

// Must be constructed on the thread that calls start().
class TCPServer {
    EventLoop m_loop;
    std::shared_ptr<ServerSocketChannel> m_serverChannel;

public:
    explicit TCPServer(int port, SocketChannelConfig childConfig = {});

    // Blocks until stop() is called.
    void start();

    // Safe to call from any thread or a signal handler.
    void stop();

    int getPort() const;
    EventLoop& eventLoop() { return m_loop; }
};
