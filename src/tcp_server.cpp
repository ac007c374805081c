#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>
#include "tcp_server.hpp"

void UpperCaseEchoHandler::channelRead(ChannelHandlerContext& ctx, Bytes data) {
    std::cout << "Received " << data.size() << " bytes from fd " << ctx.channel()->selectableFd() << std::endl;
    std::transform(data.begin(), data.end(), data.begin(), [](char c) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
    ctx.write(std::move(data));
}

void UpperCaseEchoHandler::channelReadComplete(ChannelHandlerContext& ctx) {
    ctx.flush();
    ctx.fireChannelReadComplete();
}

void UpperCaseEchoHandler::channelInactive(ChannelHandlerContext& ctx) {
    std::cout << "Client disconnected, fd: " << ctx.channel()->selectableFd() << std::endl;
    ctx.fireChannelInactive();
}

void UpperCaseEchoHandler::errorCaught(ChannelHandlerContext& ctx, std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        std::cerr << "Error on fd " << ctx.channel()->selectableFd() << ": " << e.what() << std::endl;
    }
    ctx.close();
}

TCPServer::TCPServer(int port, SocketChannelConfig childConfig) : m_loop() {
    m_serverChannel = std::make_shared<ServerSocketChannel>(m_loop, port, [](Channel& channel) {
        channel.pipeline().addLast("backpressure", std::make_shared<BackPressureHandler>());
        channel.pipeline().addLast("echo", std::make_shared<UpperCaseEchoHandler>());
    }, childConfig);
}

void TCPServer::start() {
    m_serverChannel->registerAndActivate();
    m_loop.run();
    m_serverChannel->close0();
}

void TCPServer::stop() {
    m_loop.shutdown();
}

int TCPServer::getPort() const {
    return m_serverChannel->getPort();
}
