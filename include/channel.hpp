#pragma once
#include <vector>
#include "selector.hpp"

class ChannelPipeline;

using Bytes = std::vector<char>;

// One registered I/O endpoint. A channel belongs to exactly one EventLoop and
// all of its methods are called on that loop's thread.
class Channel {
public:
    virtual ~Channel() = default;

    virtual int selectableFd() const = 0;
    virtual Interest interestedEvent() const = 0;
    virtual bool isOpen() const = 0;
    virtual bool isWritable() const = 0;
    virtual ChannelPipeline& pipeline() = 0;

    // Invoked by EventLoop::run when the selector reports readiness. Both may
    // close the channel; errors travel through the pipeline, not as exceptions.
    virtual void flushFromEventLoop() = 0;
    virtual void readFromEventLoop() = 0;

    // Outbound operations that have travelled through the whole pipeline.
    virtual void write0(Bytes data) = 0;
    virtual void flush0() = 0;
    virtual void read0() = 0;
    virtual void close0() = 0;
};
