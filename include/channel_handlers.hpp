#pragma once
#include <functional>
#include "channel_pipeline.hpp"

// Stops reading from the peer while the channel cannot absorb more outbound
// data, and resumes once pending writes have drained.
class BackPressureHandler : public ChannelHandler {
    bool m_readPending = false;
    bool m_writable = true;

public:
    void read(ChannelHandlerContext& ctx) override;
    void channelWritabilityChanged(ChannelHandlerContext& ctx, bool writable) override;
    void handlerRemoved(ChannelHandlerContext& ctx) override;

    bool isReadPending() const { return m_readPending; }
    bool isWritable() const { return m_writable; }
};

// Configures a channel's pipeline on its first registration, then removes itself.
class ChannelInitializer : public ChannelHandler {
public:
    using InitChannel = std::function<void(Channel&)>;

    explicit ChannelInitializer(InitChannel initChannel);

    void channelRegistered(ChannelHandlerContext& ctx) override;

private:
    InitChannel m_initChannel;
};
