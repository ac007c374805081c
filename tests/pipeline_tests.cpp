#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include "channel_pipeline.hpp"
#include "test_support.hpp"

namespace {

// Prefixes every outbound write with its tag.
class TaggingHandler : public ChannelHandler {
    std::string m_tag;
public:
    explicit TaggingHandler(std::string tag) : m_tag(std::move(tag)) {}

    void write(ChannelHandlerContext& ctx, Bytes data) override {
        data.insert(data.begin(), m_tag.begin(), m_tag.end());
        ctx.write(std::move(data));
    }
};

class SelfRemovingHandler : public ChannelHandler {
public:
    void channelActive(ChannelHandlerContext& ctx) override {
        ctx.pipeline().remove(*this);
        ctx.fireChannelActive();
    }
};

}

TEST_CASE("Pipeline handler management", "[pipeline]") {
    RecordingChannel channel;
    ChannelPipeline& pipeline = channel.pipeline();

    SECTION("Handlers keep insertion order") {
        pipeline.addLast("b", std::make_shared<RecordingHandler>());
        pipeline.addLast("c", std::make_shared<RecordingHandler>());
        pipeline.addFirst("a", std::make_shared<RecordingHandler>());

        REQUIRE(pipeline.names() == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(pipeline.context("b") != nullptr);
        REQUIRE(pipeline.context("missing") == nullptr);
    }

    SECTION("Duplicate or reserved names are rejected") {
        pipeline.addLast("a", std::make_shared<RecordingHandler>());
        REQUIRE_THROWS_AS(pipeline.addLast("a", std::make_shared<RecordingHandler>()), std::invalid_argument);
        REQUIRE_THROWS_AS(pipeline.addLast("head", std::make_shared<RecordingHandler>()), std::invalid_argument);
        REQUIRE_THROWS_AS(pipeline.addLast("b", nullptr), std::invalid_argument);
    }

    SECTION("Added and removed handlers are notified") {
        auto handler = std::make_shared<RecordingHandler>();
        pipeline.addLast("recorder", handler);
        REQUIRE(handler->events == std::vector<std::string>{"handlerAdded"});

        REQUIRE(pipeline.remove("recorder"));
        REQUIRE(handler->events == std::vector<std::string>{"handlerAdded", "handlerRemoved"});
        REQUIRE(pipeline.names().empty());
        REQUIRE_FALSE(pipeline.remove(*handler));
    }

    SECTION("removeAll empties the pipeline") {
        auto first = std::make_shared<RecordingHandler>();
        auto second = std::make_shared<RecordingHandler>();
        pipeline.addLast("first", first);
        pipeline.addLast("second", second);

        pipeline.removeAll();

        REQUIRE(pipeline.names().empty());
        REQUIRE(first->events.back() == "handlerRemoved");
        REQUIRE(second->events.back() == "handlerRemoved");
    }
}

TEST_CASE("Pipeline event flow", "[pipeline]") {
    RecordingChannel channel;
    ChannelPipeline& pipeline = channel.pipeline();

    SECTION("Inbound events visit handlers head to tail") {
        auto first = std::make_shared<RecordingHandler>();
        auto second = std::make_shared<RecordingHandler>();
        pipeline.addLast("first", first);
        pipeline.addLast("second", second);

        pipeline.fireChannelRegistered();
        pipeline.fireChannelRead(toBytes("data"));

        REQUIRE(first->events == std::vector<std::string>{"handlerAdded", "channelRegistered", "channelRead"});
        REQUIRE(second->events == first->events);
        REQUIRE(toString(second->reads.at(0)) == "data");
    }

    SECTION("Outbound requests visit handlers tail to head and reach the channel") {
        pipeline.addLast("outer", std::make_shared<TaggingHandler>("1"));
        pipeline.addLast("inner", std::make_shared<TaggingHandler>("2"));

        pipeline.writeAndFlush(toBytes("x"));
        pipeline.read();
        pipeline.close();

        REQUIRE(channel.writes.size() == 1);
        REQUIRE(toString(channel.writes[0]) == "12x");
        REQUIRE(channel.flushes == 1);
        REQUIRE(channel.reads == 1);
        REQUIRE(channel.closes == 1);
    }

    SECTION("A handler removed while handling an event still forwards it") {
        auto after = std::make_shared<RecordingHandler>();
        pipeline.addLast("once", std::make_shared<SelfRemovingHandler>());
        pipeline.addLast("after", after);

        pipeline.fireChannelActive();
        pipeline.fireChannelActive();

        REQUIRE(pipeline.names() == std::vector<std::string>{"after"});
        REQUIRE(after->events == std::vector<std::string>{"handlerAdded", "channelActive", "channelActive"});
    }

    SECTION("Unhandled errors are absorbed by the tail") {
        pipeline.addLast("recorder", std::make_shared<RecordingHandler>());
        REQUIRE_NOTHROW(pipeline.fireErrorCaught(std::make_exception_ptr(std::runtime_error("ignored"))));
    }
}
