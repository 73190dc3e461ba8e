#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "SubscriptionRegistry.hpp"

using quietmqtt::Message;
using quietmqtt::SelfEchoFilter;
using quietmqtt::Subscription;
using quietmqtt::SubscriptionOptions;
using quietmqtt::SubscriptionRegistry;
using quietmqtt::TopicSink;

namespace
{
    struct SinkCall
    {
        bool subscribe;
        std::vector<std::string> topics;
        Message::QoS qos;
        bool noLocal;
    };

    class RecordingSink : public TopicSink
    {
    public:
        void subscribeTopics(const std::vector<std::string> &topics, Message::QoS qos, bool noLocal) override
        {
            calls.push_back(SinkCall{true, topics, qos, noLocal});
        }

        void unsubscribeTopics(const std::vector<std::string> &topics) override
        {
            calls.push_back(SinkCall{false, topics, Message::QoS::AT_MOST_ONCE, false});
        }

        std::vector<SinkCall> calls;
    };
}

class SubscriptionRegistryTest : public ::testing::Test
{
protected:
    SubscriptionRegistryTest()
        : now_(5000),
          registry_(std::make_shared<SubscriptionRegistry>()),
          filter_("self-registry", [this]
                  { return now_; })
    {
        registry_->setSink(&sink_);
    }

    ~SubscriptionRegistryTest() override
    {
        if (registry_)
        {
            registry_->setSink(nullptr);
        }
    }

    size_t deliver(const std::string &topic, const std::string &payload)
    {
        return registry_->dispatch(Message(topic, payload), filter_);
    }

    int64_t now_;
    RecordingSink sink_;
    std::shared_ptr<SubscriptionRegistry> registry_;
    SelfEchoFilter filter_;
};

TEST_F(SubscriptionRegistryTest, FirstSubscriberIssuesTransportSubscribe)
{
    SubscriptionOptions options;
    options.qos = Message::QoS::AT_LEAST_ONCE;
    auto sub = registry_->add({"a", "b", "a"}, options);

    ASSERT_EQ(1u, sink_.calls.size());
    EXPECT_TRUE(sink_.calls[0].subscribe);
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), sink_.calls[0].topics);
    EXPECT_EQ(Message::QoS::AT_LEAST_ONCE, sink_.calls[0].qos);
    EXPECT_FALSE(sink_.calls[0].noLocal);
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), sub->getTopics());
}

TEST_F(SubscriptionRegistryTest, SecondSubscriberWithSameOptionsIsSilent)
{
    auto first = registry_->add({"a"}, SubscriptionOptions());
    auto second = registry_->add({"a"}, SubscriptionOptions());

    EXPECT_EQ(1u, sink_.calls.size());
    EXPECT_EQ(2u, registry_->getTopicStates()["a"].refs);
}

TEST_F(SubscriptionRegistryTest, HigherQosResubscribes)
{
    auto first = registry_->add({"a"}, SubscriptionOptions());
    SubscriptionOptions options;
    options.qos = Message::QoS::EXACTLY_ONCE;
    auto second = registry_->add({"a"}, options);

    ASSERT_EQ(2u, sink_.calls.size());
    EXPECT_EQ(Message::QoS::EXACTLY_ONCE, sink_.calls[1].qos);

    // Dropping the QoS 2 subscriber lowers the topic back to QoS 0.
    second->close();
    ASSERT_EQ(3u, sink_.calls.size());
    EXPECT_TRUE(sink_.calls[2].subscribe);
    EXPECT_EQ(Message::QoS::AT_MOST_ONCE, sink_.calls[2].qos);
}

TEST_F(SubscriptionRegistryTest, NoLocalOnlyWhileEverySubscriberExcludesSelf)
{
    SubscriptionOptions quiet;
    quiet.excludeSelf = true;
    auto first = registry_->add({"a"}, quiet);
    ASSERT_EQ(1u, sink_.calls.size());
    EXPECT_TRUE(sink_.calls[0].noLocal);

    auto second = registry_->add({"a"}, SubscriptionOptions());
    ASSERT_EQ(2u, sink_.calls.size());
    EXPECT_FALSE(sink_.calls[1].noLocal);

    second.reset();
    ASSERT_EQ(3u, sink_.calls.size());
    EXPECT_TRUE(sink_.calls[2].noLocal);
}

TEST_F(SubscriptionRegistryTest, LastCloseUnsubscribes)
{
    auto first = registry_->add({"a", "b"}, SubscriptionOptions());
    auto second = registry_->add({"b"}, SubscriptionOptions());
    sink_.calls.clear();

    first->close();
    ASSERT_EQ(1u, sink_.calls.size());
    EXPECT_FALSE(sink_.calls[0].subscribe);
    EXPECT_EQ((std::vector<std::string>{"a"}), sink_.calls[0].topics);

    second->close();
    ASSERT_EQ(2u, sink_.calls.size());
    EXPECT_EQ((std::vector<std::string>{"b"}), sink_.calls[1].topics);
    EXPECT_TRUE(registry_->getTopicStates().empty());
    EXPECT_EQ(0u, registry_->size());
}

TEST_F(SubscriptionRegistryTest, CloseIsIdempotent)
{
    auto sub = registry_->add({"a"}, SubscriptionOptions());
    sub->close();
    sub->close();
    EXPECT_FALSE(sub->isActive());
    EXPECT_EQ(2u, sink_.calls.size());
}

TEST_F(SubscriptionRegistryTest, ResubscribeAllGroupsByOptions)
{
    SubscriptionOptions quiet;
    quiet.excludeSelf = true;
    auto first = registry_->add({"a", "b"}, SubscriptionOptions());
    auto second = registry_->add({"c"}, quiet);
    sink_.calls.clear();

    registry_->resubscribeAll();
    ASSERT_EQ(2u, sink_.calls.size());
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), sink_.calls[0].topics);
    EXPECT_FALSE(sink_.calls[0].noLocal);
    EXPECT_EQ((std::vector<std::string>{"c"}), sink_.calls[1].topics);
    EXPECT_TRUE(sink_.calls[1].noLocal);
}

TEST_F(SubscriptionRegistryTest, DispatchKeepsLatestValue)
{
    auto sub = registry_->add({"sensors/temp"}, SubscriptionOptions());
    EXPECT_FALSE(sub->hasValue());
    EXPECT_TRUE(sub->getValue().isNull());

    EXPECT_EQ(1u, deliver("sensors/temp", "21"));
    EXPECT_EQ(1u, deliver("sensors/temp", "{\"c\":22}"));
    EXPECT_EQ(0u, deliver("sensors/other", "0"));

    ASSERT_TRUE(sub->hasValue());
    EXPECT_EQ(22, sub->getValue()["c"].asInt());
    EXPECT_EQ(2u, sub->getDeliveredCount());
}

TEST_F(SubscriptionRegistryTest, DispatchMatchesWildcards)
{
    std::vector<std::string> seen;
    SubscriptionOptions options;
    options.onMessage = [&seen](const std::string &topic, const Json::Value &)
    { seen.push_back(topic); };
    auto sub = registry_->add({"sensors/+/temp"}, options);

    deliver("sensors/kitchen/temp", "1");
    deliver("sensors/kitchen/humidity", "2");
    deliver("sensors/hall/temp", "3");

    EXPECT_EQ((std::vector<std::string>{"sensors/kitchen/temp", "sensors/hall/temp"}), seen);
}

TEST_F(SubscriptionRegistryTest, ThrowingCallbackDoesNotStopOthers)
{
    int calls = 0;
    SubscriptionOptions failing;
    failing.onMessage = [](const std::string &, const Json::Value &)
    { throw std::runtime_error("boom"); };
    SubscriptionOptions counting;
    counting.onMessage = [&calls](const std::string &, const Json::Value &)
    { ++calls; };

    auto first = registry_->add({"a"}, failing);
    auto second = registry_->add({"a"}, counting);

    EXPECT_EQ(2u, deliver("a", "x"));
    EXPECT_EQ(1, calls);
    EXPECT_TRUE(first->hasValue());
}

TEST_F(SubscriptionRegistryTest, ThrowingParserSkipsOnlyThatSubscription)
{
    SubscriptionOptions failing;
    failing.parser = [](const uint8_t *, size_t) -> Json::Value
    { throw std::invalid_argument("bad payload"); };
    auto first = registry_->add({"a"}, failing);
    auto second = registry_->add({"a"}, SubscriptionOptions());

    EXPECT_EQ(1u, deliver("a", "x"));
    EXPECT_FALSE(first->hasValue());
    EXPECT_TRUE(second->hasValue());
}

TEST_F(SubscriptionRegistryTest, ExcludeSelfAppliesPerSubscription)
{
    SubscriptionOptions quiet;
    quiet.excludeSelf = true;
    auto excluding = registry_->add({"a"}, quiet);
    auto including = registry_->add({"a"}, SubscriptionOptions());

    std::string payload = "own";
    filter_.recordPublish("a", reinterpret_cast<const uint8_t *>(payload.data()), payload.size());

    EXPECT_EQ(1u, deliver("a", payload));
    EXPECT_FALSE(excluding->hasValue());
    EXPECT_TRUE(including->hasValue());
}

TEST_F(SubscriptionRegistryTest, ClosedSubscriptionReceivesNothing)
{
    auto sub = registry_->add({"a"}, SubscriptionOptions());
    sub->close();
    EXPECT_EQ(0u, deliver("a", "x"));
    EXPECT_FALSE(sub->hasValue());
}

TEST_F(SubscriptionRegistryTest, HandleOutlivesRegistry)
{
    auto sub = registry_->add({"a"}, SubscriptionOptions());
    deliver("a", "1");
    registry_->setSink(nullptr);
    registry_.reset();

    EXPECT_TRUE(sub->hasValue());
    sub->close();
    EXPECT_FALSE(sub->isActive());
}

TEST_F(SubscriptionRegistryTest, NonStandardExceptionsAreIsolated)
{
    int calls = 0;
    SubscriptionOptions failingCallback;
    failingCallback.onMessage = [](const std::string &, const Json::Value &)
    { throw 42; };
    SubscriptionOptions failingParser;
    failingParser.parser = [](const uint8_t *, size_t) -> Json::Value
    { throw "unparseable"; };
    SubscriptionOptions counting;
    counting.onMessage = [&calls](const std::string &, const Json::Value &)
    { ++calls; };

    auto first = registry_->add({"a"}, failingCallback);
    auto second = registry_->add({"a"}, failingParser);
    auto third = registry_->add({"a"}, counting);

    size_t delivered = 0;
    EXPECT_NO_THROW(delivered = deliver("a", "1"));
    EXPECT_EQ(2u, delivered);
    EXPECT_EQ(1, calls);
    EXPECT_FALSE(second->hasValue());

    EXPECT_NO_THROW(deliver("a", "2"));
    EXPECT_EQ(2, calls);
}

TEST_F(SubscriptionRegistryTest, SinkIsCalledWithoutRegistryLock)
{
    class ReentrantSink : public TopicSink
    {
    public:
        explicit ReentrantSink(SubscriptionRegistry &registry) : owner_(registry) {}

        void subscribeTopics(const std::vector<std::string> &, Message::QoS, bool) override
        {
            seenSize = owner_.size();
            seenTopics = owner_.getTopicStates().size();
        }

        void unsubscribeTopics(const std::vector<std::string> &) override
        {
            seenSize = owner_.size();
        }

        size_t seenSize{99};
        size_t seenTopics{99};

    private:
        SubscriptionRegistry &owner_;
    };

    ReentrantSink reentrant(*registry_);
    registry_->setSink(&reentrant);

    auto sub = registry_->add({"a", "b"}, SubscriptionOptions());
    EXPECT_EQ(1u, reentrant.seenSize);
    EXPECT_EQ(2u, reentrant.seenTopics);

    sub->close();
    EXPECT_EQ(0u, reentrant.seenSize);

    registry_->setSink(&sink_);
}
