#include <iostream>
#include <stdexcept>
#include <utility>
#include "channel_pipeline.hpp"

namespace {

const char* const HEAD_NAME = "head";
const char* const TAIL_NAME = "tail";

// Outbound requests that reach the head are performed by the channel itself.
class HeadHandler : public ChannelHandler {
public:
    void write(ChannelHandlerContext& ctx, Bytes data) override {
        if (Channel* channel = ctx.channel()) {
            channel->write0(std::move(data));
        }
    }

    void flush(ChannelHandlerContext& ctx) override {
        if (Channel* channel = ctx.channel()) {
            channel->flush0();
        }
    }

    void read(ChannelHandlerContext& ctx) override {
        if (Channel* channel = ctx.channel()) {
            channel->read0();
        }
    }

    void close(ChannelHandlerContext& ctx) override {
        if (Channel* channel = ctx.channel()) {
            channel->close0();
        }
    }
};

class TailHandler : public ChannelHandler {
public:
    void channelRegistered(ChannelHandlerContext&) override {}
    void channelActive(ChannelHandlerContext&) override {}
    void channelInactive(ChannelHandlerContext&) override {}
    void channelRead(ChannelHandlerContext&, Bytes) override {}
    void channelReadComplete(ChannelHandlerContext&) override {}
    void channelWritabilityChanged(ChannelHandlerContext&, bool) override {}

    void errorCaught(ChannelHandlerContext&, std::exception_ptr error) override {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            std::cerr << "Warning: error reached the end of the pipeline: " << e.what() << std::endl;
        }
    }
};

}

void ChannelHandler::handlerAdded(ChannelHandlerContext&) {}
void ChannelHandler::handlerRemoved(ChannelHandlerContext&) {}

void ChannelHandler::channelRegistered(ChannelHandlerContext& ctx) { ctx.fireChannelRegistered(); }
void ChannelHandler::channelActive(ChannelHandlerContext& ctx) { ctx.fireChannelActive(); }
void ChannelHandler::channelInactive(ChannelHandlerContext& ctx) { ctx.fireChannelInactive(); }
void ChannelHandler::channelRead(ChannelHandlerContext& ctx, Bytes data) { ctx.fireChannelRead(std::move(data)); }
void ChannelHandler::channelReadComplete(ChannelHandlerContext& ctx) { ctx.fireChannelReadComplete(); }
void ChannelHandler::channelWritabilityChanged(ChannelHandlerContext& ctx, bool writable) {
    ctx.fireChannelWritabilityChanged(writable);
}
void ChannelHandler::errorCaught(ChannelHandlerContext& ctx, std::exception_ptr error) {
    ctx.fireErrorCaught(std::move(error));
}

void ChannelHandler::write(ChannelHandlerContext& ctx, Bytes data) { ctx.write(std::move(data)); }
void ChannelHandler::flush(ChannelHandlerContext& ctx) { ctx.flush(); }
void ChannelHandler::read(ChannelHandlerContext& ctx) { ctx.read(); }
void ChannelHandler::close(ChannelHandlerContext& ctx) { ctx.close(); }

ChannelHandlerContext::ChannelHandlerContext(ChannelPipeline& pipeline, std::string name,
                                             std::shared_ptr<ChannelHandler> handler)
    : m_pipeline(pipeline), m_name(std::move(name)), m_handler(std::move(handler)), m_removed(false) {
}

Channel* ChannelHandlerContext::channel() {
    return m_pipeline.channel();
}

std::shared_ptr<ChannelHandlerContext> ChannelHandlerContext::previous() {
    if (auto prev = m_prev.lock()) {
        return prev;
    }
    return m_pipeline.m_head;
}

void ChannelHandlerContext::fireChannelRegistered() { m_next->invokeChannelRegistered(); }
void ChannelHandlerContext::fireChannelActive() { m_next->invokeChannelActive(); }
void ChannelHandlerContext::fireChannelInactive() { m_next->invokeChannelInactive(); }
void ChannelHandlerContext::fireChannelRead(Bytes data) { m_next->invokeChannelRead(std::move(data)); }
void ChannelHandlerContext::fireChannelReadComplete() { m_next->invokeChannelReadComplete(); }
void ChannelHandlerContext::fireChannelWritabilityChanged(bool writable) {
    m_next->invokeChannelWritabilityChanged(writable);
}
void ChannelHandlerContext::fireErrorCaught(std::exception_ptr error) { m_next->invokeErrorCaught(std::move(error)); }

void ChannelHandlerContext::write(Bytes data) { previous()->invokeWrite(std::move(data)); }
void ChannelHandlerContext::flush() { previous()->invokeFlush(); }
void ChannelHandlerContext::read() { previous()->invokeRead(); }
void ChannelHandlerContext::close() { previous()->invokeClose(); }

// Each invoke keeps the context alive for the duration of the call, since the
// handler may remove itself from the pipeline while handling the event.
void ChannelHandlerContext::invokeChannelRegistered() {
    auto self = shared_from_this();
    m_handler->channelRegistered(*this);
}

void ChannelHandlerContext::invokeChannelActive() {
    auto self = shared_from_this();
    m_handler->channelActive(*this);
}

void ChannelHandlerContext::invokeChannelInactive() {
    auto self = shared_from_this();
    m_handler->channelInactive(*this);
}

void ChannelHandlerContext::invokeChannelRead(Bytes data) {
    auto self = shared_from_this();
    m_handler->channelRead(*this, std::move(data));
}

void ChannelHandlerContext::invokeChannelReadComplete() {
    auto self = shared_from_this();
    m_handler->channelReadComplete(*this);
}

void ChannelHandlerContext::invokeChannelWritabilityChanged(bool writable) {
    auto self = shared_from_this();
    m_handler->channelWritabilityChanged(*this, writable);
}

void ChannelHandlerContext::invokeErrorCaught(std::exception_ptr error) {
    auto self = shared_from_this();
    m_handler->errorCaught(*this, std::move(error));
}

void ChannelHandlerContext::invokeWrite(Bytes data) {
    auto self = shared_from_this();
    m_handler->write(*this, std::move(data));
}

void ChannelHandlerContext::invokeFlush() {
    auto self = shared_from_this();
    m_handler->flush(*this);
}

void ChannelHandlerContext::invokeRead() {
    auto self = shared_from_this();
    m_handler->read(*this);
}

void ChannelHandlerContext::invokeClose() {
    auto self = shared_from_this();
    m_handler->close(*this);
}

ChannelPipeline::ChannelPipeline(Channel* channel)
    : m_channel(channel),
      m_head(std::make_shared<ChannelHandlerContext>(*this, HEAD_NAME, std::make_shared<HeadHandler>())),
      m_tail(std::make_shared<ChannelHandlerContext>(*this, TAIL_NAME, std::make_shared<TailHandler>())) {
    m_head->m_next = m_tail;
    m_tail->m_prev = m_head;
}

ChannelPipeline::~ChannelPipeline() {
    // Unlink front to back so a long chain is not torn down recursively.
    std::shared_ptr<ChannelHandlerContext> ctx = std::move(m_head->m_next);
    while (ctx) {
        ctx = std::move(ctx->m_next);
    }
}

void ChannelPipeline::addFirst(std::string name, std::shared_ptr<ChannelHandler> handler) {
    insertAfter(*m_head, std::move(name), std::move(handler));
}

void ChannelPipeline::addLast(std::string name, std::shared_ptr<ChannelHandler> handler) {
    auto last = m_tail->m_prev.lock();
    insertAfter(*last, std::move(name), std::move(handler));
}

void ChannelPipeline::insertAfter(ChannelHandlerContext& prev, std::string name,
                                  std::shared_ptr<ChannelHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("Cannot add a null handler to the pipeline");
    }
    if (name == HEAD_NAME || name == TAIL_NAME || context(name)) {
        throw std::invalid_argument("Duplicate handler name: " + name);
    }

    auto ctx = std::make_shared<ChannelHandlerContext>(*this, std::move(name), std::move(handler));
    ctx->m_prev = prev.shared_from_this();
    ctx->m_next = prev.m_next;
    prev.m_next->m_prev = ctx;
    prev.m_next = ctx;

    ctx->m_handler->handlerAdded(*ctx);
}

void ChannelPipeline::unlink(const std::shared_ptr<ChannelHandlerContext>& ctx) {
    auto prev = ctx->m_prev.lock();
    prev->m_next = ctx->m_next;
    ctx->m_next->m_prev = prev;
    ctx->m_removed = true;

    ctx->m_handler->handlerRemoved(*ctx);
}

bool ChannelPipeline::remove(const ChannelHandler& handler) {
    auto ctx = context(handler);
    if (!ctx) {
        return false;
    }
    unlink(ctx);
    return true;
}

bool ChannelPipeline::remove(const std::string& name) {
    auto ctx = context(name);
    if (!ctx) {
        return false;
    }
    unlink(ctx);
    return true;
}

void ChannelPipeline::removeAll() {
    while (m_head->m_next != m_tail) {
        auto ctx = m_head->m_next;
        unlink(ctx);
    }
}

std::shared_ptr<ChannelHandlerContext> ChannelPipeline::context(const std::string& name) const {
    for (auto ctx = m_head->m_next; ctx != m_tail; ctx = ctx->m_next) {
        if (ctx->m_name == name) {
            return ctx;
        }
    }
    return nullptr;
}

std::shared_ptr<ChannelHandlerContext> ChannelPipeline::context(const ChannelHandler& handler) const {
    for (auto ctx = m_head->m_next; ctx != m_tail; ctx = ctx->m_next) {
        if (ctx->m_handler.get() == &handler) {
            return ctx;
        }
    }
    return nullptr;
}

std::vector<std::string> ChannelPipeline::names() const {
    std::vector<std::string> result;
    for (auto ctx = m_head->m_next; ctx != m_tail; ctx = ctx->m_next) {
        result.push_back(ctx->m_name);
    }
    return result;
}

void ChannelPipeline::fireChannelRegistered() { m_head->invokeChannelRegistered(); }
void ChannelPipeline::fireChannelActive() { m_head->invokeChannelActive(); }
void ChannelPipeline::fireChannelInactive() { m_head->invokeChannelInactive(); }
void ChannelPipeline::fireChannelRead(Bytes data) { m_head->invokeChannelRead(std::move(data)); }
void ChannelPipeline::fireChannelReadComplete() { m_head->invokeChannelReadComplete(); }
void ChannelPipeline::fireChannelWritabilityChanged(bool writable) {
    m_head->invokeChannelWritabilityChanged(writable);
}
void ChannelPipeline::fireErrorCaught(std::exception_ptr error) { m_head->invokeErrorCaught(std::move(error)); }

void ChannelPipeline::write(Bytes data) { m_tail->previous()->invokeWrite(std::move(data)); }
void ChannelPipeline::flush() { m_tail->previous()->invokeFlush(); }

void ChannelPipeline::writeAndFlush(Bytes data) {
    write(std::move(data));
    flush();
}

void ChannelPipeline::read() { m_tail->previous()->invokeRead(); }
void ChannelPipeline::close() { m_tail->previous()->invokeClose(); }
