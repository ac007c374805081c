#pragma once
#include <exception>
#include "channel.hpp"

class ChannelHandlerContext;

// Every method forwards the event unchanged, so a handler only overrides the
// events it cares about.
class ChannelHandler {
public:
    virtual ~ChannelHandler() = default;

    virtual void handlerAdded(ChannelHandlerContext& ctx);
    virtual void handlerRemoved(ChannelHandlerContext& ctx);

    // Inbound, travelling from the head towards the tail.
    virtual void channelRegistered(ChannelHandlerContext& ctx);
    virtual void channelActive(ChannelHandlerContext& ctx);
    virtual void channelInactive(ChannelHandlerContext& ctx);
    virtual void channelRead(ChannelHandlerContext& ctx, Bytes data);
    virtual void channelReadComplete(ChannelHandlerContext& ctx);
    virtual void channelWritabilityChanged(ChannelHandlerContext& ctx, bool writable);
    virtual void errorCaught(ChannelHandlerContext& ctx, std::exception_ptr error);

    // Outbound, travelling from the tail towards the head and into the channel.
    virtual void write(ChannelHandlerContext& ctx, Bytes data);
    virtual void flush(ChannelHandlerContext& ctx);
    virtual void read(ChannelHandlerContext& ctx);
    virtual void close(ChannelHandlerContext& ctx);
};
