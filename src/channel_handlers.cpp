#include <stdexcept>
#include <utility>
#include "channel_handlers.hpp"

namespace {

// Removes the handler when the scope is left, whether normally or by an exception.
class RemoveOnExit {
    ChannelHandlerContext& m_ctx;
public:
    explicit RemoveOnExit(ChannelHandlerContext& ctx) : m_ctx(ctx) {}
    RemoveOnExit(const RemoveOnExit&) = delete;
    RemoveOnExit& operator=(const RemoveOnExit&) = delete;

    ~RemoveOnExit() {
        if (!m_ctx.isRemoved()) {
            m_ctx.pipeline().remove(m_ctx.handler());
        }
    }
};

}

void BackPressureHandler::read(ChannelHandlerContext& ctx) {
    if (m_writable) {
        ctx.read();
    } else {
        m_readPending = true;
    }
}

void BackPressureHandler::channelWritabilityChanged(ChannelHandlerContext& ctx, bool writable) {
    m_writable = writable;
    if (writable) {
        if (m_readPending) {
            m_readPending = false;
            ctx.read();
        }
    } else {
        ctx.flush();
    }

    // Later handlers may still want to react to the change.
    ctx.fireChannelWritabilityChanged(writable);
}

void BackPressureHandler::handlerRemoved(ChannelHandlerContext& ctx) {
    if (m_readPending) {
        m_readPending = false;
        ctx.read();
    }
}

ChannelInitializer::ChannelInitializer(InitChannel initChannel) : m_initChannel(std::move(initChannel)) {
    if (!m_initChannel) {
        throw std::invalid_argument("ChannelInitializer requires a callback");
    }
}

void ChannelInitializer::channelRegistered(ChannelHandlerContext& ctx) {
    {
        RemoveOnExit removeOnExit(ctx);
        if (Channel* channel = ctx.channel()) {
            m_initChannel(*channel);
        }
    }
    ctx.fireChannelRegistered();
}
