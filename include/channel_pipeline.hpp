#pragma once
#include <exception>
#include <memory>
#include <string>
#include <vector>
#include "channel_handler.hpp"

class ChannelPipeline;

class ChannelHandlerContext : public std::enable_shared_from_this<ChannelHandlerContext> {
    friend class ChannelPipeline;

    ChannelPipeline& m_pipeline;
    std::string m_name;
    std::shared_ptr<ChannelHandler> m_handler;
    std::shared_ptr<ChannelHandlerContext> m_next;
    std::weak_ptr<ChannelHandlerContext> m_prev;
    bool m_removed;

public:
    ChannelHandlerContext(ChannelPipeline& pipeline, std::string name, std::shared_ptr<ChannelHandler> handler);

    const std::string& name() const { return m_name; }
    ChannelHandler& handler() { return *m_handler; }
    ChannelPipeline& pipeline() { return m_pipeline; }
    Channel* channel();
    bool isRemoved() const { return m_removed; }

    // Inbound events go to the next handler. A removed context keeps its links,
    // so the event it is handling can still be forwarded.
    void fireChannelRegistered();
    void fireChannelActive();
    void fireChannelInactive();
    void fireChannelRead(Bytes data);
    void fireChannelReadComplete();
    void fireChannelWritabilityChanged(bool writable);
    void fireErrorCaught(std::exception_ptr error);

    // Outbound requests go to the previous handler.
    void write(Bytes data);
    void flush();
    void read();
    void close();

private:
    std::shared_ptr<ChannelHandlerContext> previous();

    void invokeChannelRegistered();
    void invokeChannelActive();
    void invokeChannelInactive();
    void invokeChannelRead(Bytes data);
    void invokeChannelReadComplete();
    void invokeChannelWritabilityChanged(bool writable);
    void invokeErrorCaught(std::exception_ptr error);

    void invokeWrite(Bytes data);
    void invokeFlush();
    void invokeRead();
    void invokeClose();
};

// Ordered chain of handlers between a fixed head (which hands outbound requests
// to the channel) and a fixed tail (which absorbs inbound events).
class ChannelPipeline {
    friend class ChannelHandlerContext;

    Channel* m_channel;
    std::shared_ptr<ChannelHandlerContext> m_head;
    std::shared_ptr<ChannelHandlerContext> m_tail;

public:
    explicit ChannelPipeline(Channel* channel);
    ~ChannelPipeline();

    ChannelPipeline(const ChannelPipeline&) = delete;
    ChannelPipeline& operator=(const ChannelPipeline&) = delete;

    Channel* channel() const { return m_channel; }

    void addFirst(std::string name, std::shared_ptr<ChannelHandler> handler);
    void addLast(std::string name, std::shared_ptr<ChannelHandler> handler);

    // Returns false when the handler is not part of the pipeline.
    bool remove(const ChannelHandler& handler);
    bool remove(const std::string& name);
    void removeAll();

    std::shared_ptr<ChannelHandlerContext> context(const std::string& name) const;
    std::shared_ptr<ChannelHandlerContext> context(const ChannelHandler& handler) const;
    std::vector<std::string> names() const;

    void fireChannelRegistered();
    void fireChannelActive();
    void fireChannelInactive();
    void fireChannelRead(Bytes data);
    void fireChannelReadComplete();
    void fireChannelWritabilityChanged(bool writable);
    void fireErrorCaught(std::exception_ptr error);

    void write(Bytes data);
    void flush();
    void writeAndFlush(Bytes data);
    void read();
    void close();

private:
    void insertAfter(ChannelHandlerContext& prev, std::string name, std::shared_ptr<ChannelHandler> handler);
    void unlink(const std::shared_ptr<ChannelHandlerContext>& ctx);
};
