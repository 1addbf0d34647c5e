// ============================================================================
// EVENT DISPATCHER UNIT TESTS
// ============================================================================
// Tests for priority-ordered delivery, failure isolation, idempotent
// unsubscription, scope teardown and deferred delivery
// ============================================================================

#include <gtest/gtest.h>
#include <pooldispatch/core/events/event_dispatcher.hpp>
#include <pooldispatch/core/utils/task_scheduler.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace PoolDispatch;

namespace {

struct Damaged {
    int amount;
};

struct Healed {
    int amount;
};

class EventDispatcherTest : public ::testing::Test {
protected:
    TaskScheduler scheduler{0};
    EventDispatcher dispatcher{&scheduler};
    std::vector<std::string> calls;

    std::function<void(const Damaged&)> record(const std::string& name) {
        return [this, name](const Damaged&) { calls.push_back(name); };
    }
};

} // namespace

// ============================================================================
// ORDERING TESTS
// ============================================================================

TEST_F(EventDispatcherTest, CriticalRunsBeforeNormal) {
    dispatcher.subscribe<Damaged>(record("A"), Priority::Normal);
    dispatcher.subscribe<Damaged>(record("B"), Priority::Critical);

    dispatcher.publish(Damaged{10});

    EXPECT_EQ(calls, (std::vector<std::string>{"B", "A"}));
}

TEST_F(EventDispatcherTest, MixedPrioritiesRunInRankOrder) {
    dispatcher.subscribe<Damaged>(record("high"), Priority::High);
    dispatcher.subscribe<Damaged>(record("low"), Priority::Low);
    dispatcher.subscribe<Damaged>(record("normal"), Priority::Normal);
    dispatcher.subscribe<Damaged>(record("background"), Priority::Background);
    dispatcher.subscribe<Damaged>(record("critical"), Priority::Critical);

    EXPECT_EQ(dispatcher.publish(Damaged{1}), 5u);
    EXPECT_EQ(calls, (std::vector<std::string>{"critical", "high", "normal", "low", "background"}));
}

TEST_F(EventDispatcherTest, EqualPriorityKeepsSubscriptionOrder) {
    dispatcher.subscribe<Damaged>(record("first"), Priority::Normal);
    dispatcher.subscribe<Damaged>(record("urgent"), Priority::High);
    dispatcher.subscribe<Damaged>(record("second"), Priority::Normal);
    dispatcher.subscribe<Damaged>(record("third"), Priority::Normal);

    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls, (std::vector<std::string>{"urgent", "first", "second", "third"}));
}

TEST_F(EventDispatcherTest, EventTypesHaveIndependentLists) {
    int healed = 0;
    dispatcher.subscribe<Damaged>(record("damage"));
    dispatcher.subscribe<Healed>([&healed](const Healed& e) { healed += e.amount; });

    EXPECT_EQ(dispatcher.publish(Healed{7}), 1u);
    EXPECT_TRUE(calls.empty());
    EXPECT_EQ(healed, 7);
    EXPECT_EQ(dispatcher.subscriberCount<Damaged>(), 1u);
    EXPECT_EQ(dispatcher.subscriberCount<Healed>(), 1u);
}

TEST_F(EventDispatcherTest, PayloadIsDelivered) {
    int total = 0;
    dispatcher.subscribe<Damaged>([&total](const Damaged& e) { total += e.amount; });
    dispatcher.subscribe<Damaged>([&total](const Damaged& e) { total += e.amount; });

    dispatcher.publish(Damaged{10});
    EXPECT_EQ(total, 20);
}

TEST_F(EventDispatcherTest, PublishWithoutSubscribersIsHarmless) {
    EXPECT_EQ(dispatcher.publish(Damaged{1}), 0u);
}

// ============================================================================
// SUBSCRIBE / UNSUBSCRIBE TESTS
// ============================================================================

TEST_F(EventDispatcherTest, NullCallbackIsRejected) {
    try {
        dispatcher.subscribe<Damaged>(nullptr);
        FAIL() << "expected NullCallback";
    } catch (const CoreError& e) {
        EXPECT_EQ(e.code(), Errc::NullCallback);
    }
    EXPECT_EQ(dispatcher.totalSubscribers(), 0u);
}

TEST_F(EventDispatcherTest, DuplicateSubscriptionCreatesIndependentEntries) {
    auto callback = record("dup");
    SubscriptionId first = dispatcher.subscribe<Damaged>(callback);
    SubscriptionId second = dispatcher.subscribe<Damaged>(callback);
    EXPECT_NE(first, second);

    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls.size(), 2u);

    EXPECT_TRUE(dispatcher.unsubscribe(first));
    calls.clear();
    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls.size(), 1u);
}

TEST_F(EventDispatcherTest, UnsubscribeIsIdempotent) {
    SubscriptionId a = dispatcher.subscribe<Damaged>(record("A"));
    dispatcher.subscribe<Damaged>(record("B"));

    EXPECT_TRUE(dispatcher.unsubscribe(a));
    EXPECT_FALSE(dispatcher.unsubscribe(a));
    EXPECT_FALSE(dispatcher.unsubscribe(9999));
    EXPECT_FALSE(dispatcher.unsubscribe(kInvalidSubscription));

    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls, (std::vector<std::string>{"B"}));
}

// ============================================================================
// SCOPE TESTS
// ============================================================================

TEST_F(EventDispatcherTest, ScopeTeardownRemovesAllItsSubscriptions) {
    int owner = 0;
    ScopeId scope = &owner;
    int healed = 0;

    dispatcher.subscribe<Damaged>(record("s1"), Priority::High, scope);
    dispatcher.subscribe<Damaged>(record("s2"), Priority::Low, scope);
    dispatcher.subscribe<Healed>([&healed](const Healed&) { ++healed; }, Priority::Normal, scope);
    dispatcher.subscribe<Damaged>(record("unscoped"));
    EXPECT_EQ(dispatcher.scopeSize(scope), 3u);

    EXPECT_EQ(dispatcher.unsubscribeScope(scope), 3u);
    dispatcher.publish(Damaged{1});
    dispatcher.publish(Healed{1});

    EXPECT_EQ(calls, (std::vector<std::string>{"unscoped"}));
    EXPECT_EQ(healed, 0);
    EXPECT_EQ(dispatcher.scopeSize(scope), 0u);
}

TEST_F(EventDispatcherTest, ClearRemovesEverySubscription) {
    int owner = 0;
    int healed = 0;
    SubscriptionId id = dispatcher.subscribe<Damaged>(record("scoped"), Priority::High, &owner);
    dispatcher.subscribe<Healed>([&healed](const Healed&) { ++healed; });
    dispatcher.subscribe<Damaged>(record("deferred"), Priority::Low, kNoScope, DispatchMode::Deferred);
    dispatcher.publish(Damaged{1});  // queues one deferred delivery

    dispatcher.clear();

    EXPECT_EQ(dispatcher.totalSubscribers(), 0u);
    EXPECT_EQ(dispatcher.scopeSize(&owner), 0u);
    EXPECT_FALSE(dispatcher.isSubscribed(id));
    EXPECT_EQ(dispatcher.unsubscribeScope(&owner), 0u);

    scheduler.runDue(1);
    EXPECT_EQ(dispatcher.publish(Damaged{2}), 0u);
    dispatcher.publish(Healed{2});
    EXPECT_EQ(calls, (std::vector<std::string>{"scoped"}));
    EXPECT_EQ(healed, 0);
}

TEST_F(EventDispatcherTest, ScopeTeardownIsSafeAfterPartialRemoval) {
    int owner = 0;
    SubscriptionId a = dispatcher.subscribe<Damaged>(record("a"), Priority::Normal, &owner);
    dispatcher.subscribe<Damaged>(record("b"), Priority::Normal, &owner);

    EXPECT_TRUE(dispatcher.unsubscribe(a));
    EXPECT_EQ(dispatcher.scopeSize(&owner), 1u);

    EXPECT_EQ(dispatcher.unsubscribeScope(&owner), 1u);
    EXPECT_EQ(dispatcher.unsubscribeScope(&owner), 0u);
    EXPECT_EQ(dispatcher.unsubscribeScope(kNoScope), 0u);
    EXPECT_EQ(dispatcher.totalSubscribers(), 0u);
}

// ============================================================================
// FAILURE ISOLATION TESTS
// ============================================================================

TEST_F(EventDispatcherTest, ThrowingSubscriberDoesNotStopDelivery) {
    dispatcher.subscribe<Damaged>(record("first"), Priority::Critical);
    dispatcher.subscribe<Damaged>([](const Damaged&) {
        throw std::runtime_error("boom");
    }, Priority::High, kNoScope, DispatchMode::Sync, "exploder");
    dispatcher.subscribe<Damaged>(record("after"), Priority::Low);

    EXPECT_NO_THROW(dispatcher.publish(Damaged{5}));
    EXPECT_EQ(calls, (std::vector<std::string>{"first", "after"}));

    ASSERT_EQ(dispatcher.failures().totalFailures(), 1u);
    auto recent = dispatcher.failures().recent();
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].label, "exploder");
    EXPECT_EQ(recent[0].message, "boom");
    EXPECT_EQ(recent[0].code, Errc::CallbackFailure);
    EXPECT_FALSE(recent[0].deferred);
}

TEST_F(EventDispatcherTest, NonStandardExceptionIsRecorded) {
    dispatcher.subscribe<Damaged>([](const Damaged&) { throw 42; });
    dispatcher.subscribe<Damaged>(record("survivor"));

    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls, (std::vector<std::string>{"survivor"}));
    EXPECT_EQ(dispatcher.failures().totalFailures(), 1u);
}

// ============================================================================
// REENTRANCY TESTS
// ============================================================================

TEST_F(EventDispatcherTest, UnsubscribeDuringPublishDoesNotAffectCurrentDelivery) {
    SubscriptionId victim = 0;
    dispatcher.subscribe<Damaged>([this, &victim](const Damaged&) {
        calls.push_back("killer");
        dispatcher.unsubscribe(victim);
    }, Priority::High);
    victim = dispatcher.subscribe<Damaged>(record("victim"), Priority::Low);

    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls, (std::vector<std::string>{"killer", "victim"}));

    calls.clear();
    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls, (std::vector<std::string>{"killer"}));
}

TEST_F(EventDispatcherTest, SubscribeDuringPublishTakesEffectNextTime) {
    dispatcher.subscribe<Damaged>([this](const Damaged&) {
        calls.push_back("spawner");
        dispatcher.subscribe<Damaged>(record("late"), Priority::Critical);
    });

    dispatcher.publish(Damaged{1});
    EXPECT_EQ(calls, (std::vector<std::string>{"spawner"}));
    EXPECT_EQ(dispatcher.subscriberCount<Damaged>(), 2u);
}

// ============================================================================
// DEFERRED MODE TESTS
// ============================================================================

TEST_F(EventDispatcherTest, DeferredCallbacksRunOnNextTickInOrder) {
    dispatcher.subscribe<Damaged>(record("sync"), Priority::Low);
    dispatcher.subscribe<Damaged>(record("deferred-normal"), Priority::Normal,
                                  kNoScope, DispatchMode::Deferred);
    dispatcher.subscribe<Damaged>(record("deferred-high"), Priority::High,
                                  kNoScope, DispatchMode::Deferred);

    EXPECT_EQ(dispatcher.publish(Damaged{3}), 1u);
    EXPECT_EQ(calls, (std::vector<std::string>{"sync"}));
    EXPECT_EQ(scheduler.pendingPosted(), 2u);

    scheduler.runDue(1);
    EXPECT_EQ(calls, (std::vector<std::string>{"sync", "deferred-high", "deferred-normal"}));
}

TEST_F(EventDispatcherTest, DeferredCallbackReceivesCopyOfEvent) {
    int seen = 0;
    dispatcher.subscribe<Damaged>([&seen](const Damaged& e) { seen = e.amount; },
                                  Priority::Normal, kNoScope, DispatchMode::Deferred);
    {
        Damaged temporary{99};
        dispatcher.publish(temporary);
    }
    scheduler.runDue(1);
    EXPECT_EQ(seen, 99);
}

TEST_F(EventDispatcherTest, DeferredCallbackSkippedAfterUnsubscribe) {
    SubscriptionId id = dispatcher.subscribe<Damaged>(record("deferred"), Priority::Normal,
                                                      kNoScope, DispatchMode::Deferred);
    dispatcher.publish(Damaged{1});
    dispatcher.unsubscribe(id);

    scheduler.runDue(1);
    EXPECT_TRUE(calls.empty());
}

TEST_F(EventDispatcherTest, DeferredFailureIsRecordedAsDeferred) {
    dispatcher.subscribe<Damaged>([](const Damaged&) { throw std::runtime_error("late boom"); },
                                  Priority::Normal, kNoScope, DispatchMode::Deferred, "late");
    dispatcher.publish(Damaged{1});
    EXPECT_EQ(dispatcher.failures().totalFailures(), 0u);

    scheduler.runDue(1);
    auto recent = dispatcher.failures().recent();
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_TRUE(recent[0].deferred);
    EXPECT_EQ(recent[0].label, "late");
}

TEST(EventDispatcherNoScheduler, DeferredSubscriptionRequiresScheduler) {
    EventDispatcher dispatcher;
    try {
        dispatcher.subscribe<Damaged>([](const Damaged&) {}, Priority::Normal, kNoScope,
                                      DispatchMode::Deferred);
        FAIL() << "expected MissingExecutor";
    } catch (const CoreError& e) {
        EXPECT_EQ(e.code(), Errc::MissingExecutor);
    }
}

TEST(EventDispatcherLifetime, DeferredTaskOutlivingDispatcherIsNoOp) {
    TaskScheduler scheduler(0);
    bool called = false;
    {
        EventDispatcher dispatcher(&scheduler);
        dispatcher.subscribe<Damaged>([&called](const Damaged&) { called = true; },
                                      Priority::Normal, kNoScope, DispatchMode::Deferred);
        dispatcher.publish(Damaged{1});
    }
    EXPECT_EQ(scheduler.runDue(1), 1u);
    EXPECT_FALSE(called);
}
