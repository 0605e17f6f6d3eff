#include "spill/core/Event.hh"
#include "spill/core/TrajectoryCaster.hh"
#include "spill/utils/ErrorHandling.hh"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace spill;

class EventTest : public ::testing::Test {
  protected:
    void SetUp() override {
        impactEvent = std::make_unique<Event>(kCastImpact, "caster");
        advanceEvent = std::make_unique<Event>(kCastAdvancing, "caster");
        dispatcher = std::make_unique<EventDispatcher>();
    }

    std::unique_ptr<Event> impactEvent;
    std::unique_ptr<Event> advanceEvent;
    std::unique_ptr<EventDispatcher> dispatcher;
};

TEST_F(EventTest, ConstructorThrowsOnEmptyType) {
    EXPECT_THROW(Event("", "source"), SpillException);
}

TEST_F(EventTest, TypeAndSource) {
    EXPECT_EQ(impactEvent->getType(), "cast.impact");
    EXPECT_EQ(impactEvent->getSource(), "caster");
    EXPECT_EQ(advanceEvent->getType(), "cast.advancing");
}

TEST_F(EventTest, PayloadRoundTrip) {
    CastSegment segment;
    segment.cast = 7;
    segment.origin = Vec3f(1.0f, 2.0f, 3.0f);
    segment.length = 0.5f;
    advanceEvent->setPayload(segment);

    ASSERT_TRUE(advanceEvent->hasPayload());
    const auto& read = advanceEvent->getPayload<CastSegment>();
    EXPECT_EQ(read.cast, 7u);
    EXPECT_FLOAT_EQ(read.origin.y, 2.0f);
    EXPECT_FLOAT_EQ(read.length, 0.5f);
}

TEST_F(EventTest, GetPayloadThrowsWhenMissing) {
    EXPECT_FALSE(impactEvent->hasPayload());
    EXPECT_THROW(impactEvent->getPayload<CastImpact>(), SpillException);
}

TEST_F(EventTest, GetPayloadThrowsOnWrongType) {
    impactEvent->setPayload(CastImpact{});
    EXPECT_THROW(impactEvent->getPayload<CastSegment>(), SpillException);
}

TEST_F(EventTest, HandledFlag) {
    EXPECT_FALSE(impactEvent->isHandled());
    impactEvent->setHandled(true);
    EXPECT_TRUE(impactEvent->isHandled());
    impactEvent->setHandled(false);
    EXPECT_FALSE(impactEvent->isHandled());
}

TEST_F(EventTest, AddEventListenerThrowsOnEmptyType) {
    EXPECT_THROW(dispatcher->addEventListener("", [](Event&) {}), SpillException);
}

TEST_F(EventTest, AddEventListenerThrowsOnNullHandler) {
    EXPECT_THROW(dispatcher->addEventListener(kCastImpact, nullptr), SpillException);
}

TEST_F(EventTest, RemoveEventListener) {
    std::string handlerId = dispatcher->addEventListener(kCastImpact, [](Event&) {});
    EXPECT_FALSE(handlerId.empty());
    EXPECT_EQ(dispatcher->listenerCount(kCastImpact), 1u);

    EXPECT_TRUE(dispatcher->removeEventListener(kCastImpact, handlerId));
    EXPECT_FALSE(dispatcher->removeEventListener(kCastImpact, handlerId));
    EXPECT_FALSE(dispatcher->removeEventListener("nonexistent", "invalid"));
    EXPECT_EQ(dispatcher->listenerCount(kCastImpact), 0u);
}

TEST_F(EventTest, HandlerIdsAreUnique) {
    auto a = dispatcher->addEventListener(kCastImpact, [](Event&) {});
    auto b = dispatcher->addEventListener(kCastImpact, [](Event&) {});
    EXPECT_NE(a, b);
}

TEST_F(EventTest, DispatchOnlyReachesMatchingType) {
    int impacts = 0;
    dispatcher->addEventListener(kCastImpact, [&](Event&) { impacts++; });

    EXPECT_FALSE(dispatcher->dispatchEvent(*impactEvent));
    EXPECT_FALSE(dispatcher->dispatchEvent(*advanceEvent));
    EXPECT_EQ(impacts, 1);
}

TEST_F(EventTest, HandledStopsPropagation) {
    int laterCalls = 0;
    dispatcher->addEventListener(kCastImpact, [](Event& e) { e.setHandled(true); });
    dispatcher->addEventListener(kCastImpact, [&](Event&) { laterCalls++; });

    EXPECT_TRUE(dispatcher->dispatchEvent(*impactEvent));
    EXPECT_EQ(laterCalls, 0);
}

TEST_F(EventTest, CancellationStopsPropagation) {
    int calls = 0;
    dispatcher->addEventListener(kCastImpact, [](Event& e) { e.setCancelled(true); });
    dispatcher->addEventListener(kCastImpact, [&](Event&) { calls++; });

    EXPECT_TRUE(dispatcher->dispatchEvent(*impactEvent));
    EXPECT_TRUE(impactEvent->isCancelled());
    EXPECT_EQ(calls, 0);
}

TEST_F(EventTest, PriorityOrdering) {
    std::vector<int> order;

    dispatcher->addEventListener(kCastImpact, [&](Event&) { order.push_back(2); }, 10);
    dispatcher->addEventListener(kCastImpact, [&](Event&) { order.push_back(0); }, -5);
    dispatcher->addEventListener(kCastImpact, [&](Event&) { order.push_back(1); }, 0);

    dispatcher->dispatchEvent(*impactEvent);

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 0);
    EXPECT_EQ(order[1], 1);
    EXPECT_EQ(order[2], 2);
}

TEST_F(EventTest, SamePriorityPreservesInsertionOrder) {
    std::vector<int> order;

    dispatcher->addEventListener(kCastImpact, [&](Event&) { order.push_back(0); });
    dispatcher->addEventListener(kCastImpact, [&](Event&) { order.push_back(1); });
    dispatcher->addEventListener(kCastImpact, [&](Event&) { order.push_back(2); });

    dispatcher->dispatchEvent(*impactEvent);

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 0);
    EXPECT_EQ(order[1], 1);
    EXPECT_EQ(order[2], 2);
}

TEST_F(EventTest, HandlerMayRemoveItselfDuringDispatch) {
    int calls = 0;
    std::string selfId;
    selfId = dispatcher->addEventListener(kCastImpact, [&](Event&) {
        calls++;
        dispatcher->removeEventListener(kCastImpact, selfId);
    });

    dispatcher->dispatchEvent(*impactEvent);
    dispatcher->dispatchEvent(*impactEvent);
    EXPECT_EQ(calls, 1);
}

TEST_F(EventTest, ThrowingHandlerDoesNotStopOthers) {
    int calls = 0;
    dispatcher->addEventListener(kCastImpact, [](Event&) { throw std::runtime_error("boom"); });
    dispatcher->addEventListener(kCastImpact, [&](Event&) { calls++; });

    EXPECT_NO_THROW(dispatcher->dispatchEvent(*impactEvent));
    EXPECT_EQ(calls, 1);
}
