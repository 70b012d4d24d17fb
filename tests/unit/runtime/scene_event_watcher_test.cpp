#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <scenelink/host/SimulatedHost.h>
#include <scenelink/runtime/SceneEventWatcher.h>

#include "support/mocks.hpp"

#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace scenelink;
using namespace scenelink::runtime;
using host::HostEvent;
using host::SimulatedHost;
using ::testing::_;
using ::testing::Invoke;

TEST(SceneEventWatcherTest, StartSubscribesDefaultEventsPlusExit) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);

    auto r = watcher.start(SceneEventWatcher::defaultEvents(), false, [] {});
    ASSERT_TRUE(r);
    EXPECT_TRUE(watcher.isWatching());
    EXPECT_EQ(watcher.activeSubscriptionCount(), 4u);
    EXPECT_EQ(host.subscriberCount(HostEvent::DocumentOpened), 1u);
    EXPECT_EQ(host.subscriberCount(HostEvent::DocumentSaved), 1u);
    EXPECT_EQ(host.subscriberCount(HostEvent::DocumentCreated), 1u);
    EXPECT_EQ(host.subscriberCount(HostEvent::HostExiting), 1u);
}

TEST(SceneEventWatcherTest, ExitHookIsSubscribedEvenWhenNotRequested) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);

    ASSERT_TRUE(watcher.start({HostEvent::DocumentOpened}, false, [] {}));
    EXPECT_EQ(host.subscriberCount(HostEvent::HostExiting), 1u);
    EXPECT_EQ(host.subscriberCount(), 2u);
}

TEST(SceneEventWatcherTest, RequestedExitEventIsNotSubscribedTwice) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);

    ASSERT_TRUE(watcher.start({HostEvent::DocumentSaved, HostEvent::HostExiting}, false, [] {}));
    EXPECT_EQ(host.subscriberCount(HostEvent::HostExiting), 1u);
}

TEST(SceneEventWatcherTest, StopTwiceLeavesNoSubscriptions) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, [] {}));

    watcher.stop();
    watcher.stop();

    EXPECT_FALSE(watcher.isWatching());
    EXPECT_EQ(watcher.activeSubscriptionCount(), 0u);
    EXPECT_EQ(host.subscriberCount(), 0u);
    EXPECT_EQ(host.unknownUnsubscribeCount(), 0u);
}

TEST(SceneEventWatcherTest, ConcurrentStopReleasesEachSubscriptionOnce) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, [] {}));

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&watcher] { watcher.stop(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(host.subscriberCount(), 0u);
    EXPECT_EQ(host.unknownUnsubscribeCount(), 0u);
    EXPECT_FALSE(watcher.isWatching());
}

TEST(SceneEventWatcherTest, StopWithoutStartIsNoop) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    watcher.stop();
    EXPECT_EQ(host.unknownUnsubscribeCount(), 0u);
}

TEST(SceneEventWatcherTest, PersistentWatcherFiresForEveryEvent) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    int calls = 0;
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, [&] { ++calls; }));

    host.openDocument("/proj/a.ext");
    host.saveDocument();
    host.newDocument();

    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(watcher.isWatching());
}

TEST(SceneEventWatcherTest, RunOnceStopsBeforeCallbackRuns) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    int calls = 0;
    bool watchingInside = true;
    std::size_t subscribersInside = 99;
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), true, [&] {
        ++calls;
        watchingInside = watcher.isWatching();
        subscribersInside = host.subscriberCount();
    }));

    host.openDocument("/proj/a.ext");
    host.saveDocument();

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(watchingInside);
    EXPECT_EQ(subscribersInside, 0u);
    EXPECT_EQ(host.subscriberCount(), 0u);
}

TEST(SceneEventWatcherTest, CallbackMayRestartTheWatcher) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    int calls = 0;
    std::function<void()> cb = [&] {
        ++calls;
        ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, cb));
    };
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), true, cb));

    host.openDocument("/proj/a.ext");
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(watcher.isWatching());
    EXPECT_FALSE(watcher.isRunOnce());
    EXPECT_EQ(host.subscriberCount(), 4u);

    host.saveDocument();
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(host.subscriberCount(), 4u);
}

TEST(SceneEventWatcherTest, RestartReplacesPreviousRegistrations) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, [] {}));
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), true, [] {}));

    EXPECT_EQ(host.subscriberCount(), 4u);
    EXPECT_TRUE(watcher.isRunOnce());
}

TEST(SceneEventWatcherTest, FailedSubscriptionIsSkipped) {
    SimulatedHost host;
    host.failSubscriptionsFor(HostEvent::DocumentSaved);
    SceneEventWatcher watcher(host);
    int calls = 0;

    auto r = watcher.start(SceneEventWatcher::defaultEvents(), false, [&] { ++calls; });
    EXPECT_TRUE(r);
    EXPECT_EQ(watcher.activeSubscriptionCount(), 3u);
    EXPECT_EQ(host.subscriberCount(HostEvent::DocumentSaved), 0u);

    host.openDocument("/proj/a.ext");
    host.saveDocument();
    EXPECT_EQ(calls, 1);
}

TEST(SceneEventWatcherTest, ExitSubscriptionFailureIsReported) {
    SimulatedHost host;
    host.failSubscriptionsFor(HostEvent::HostExiting);
    SceneEventWatcher watcher(host);

    auto r = watcher.start(SceneEventWatcher::defaultEvents(), false, [] {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SubscriptionFailed);
    // the document events still work
    EXPECT_TRUE(watcher.isWatching());
    EXPECT_EQ(host.subscriberCount(), 3u);
}

TEST(SceneEventWatcherTest, HostExitStopsThenRunsExitCallback) {
    SimulatedHost host;
    SceneEventWatcher watcher(host);
    int sceneCalls = 0;
    bool exitCalled = false;
    std::size_t subscribersAtExit = 99;
    ASSERT_TRUE(watcher.start(
        SceneEventWatcher::defaultEvents(), false, [&] { ++sceneCalls; },
        [&] {
            exitCalled = true;
            subscribersAtExit = host.subscriberCount();
        }));

    host.exitHost();

    EXPECT_TRUE(exitCalled);
    EXPECT_EQ(subscribersAtExit, 0u);
    EXPECT_EQ(sceneCalls, 0);
    EXPECT_FALSE(watcher.isWatching());
}

TEST(SceneEventWatcherTest, DestructorReleasesSubscriptions) {
    SimulatedHost host;
    {
        SceneEventWatcher watcher(host);
        ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, [] {}));
        ASSERT_EQ(host.subscriberCount(), 4u);
    }
    EXPECT_EQ(host.subscriberCount(), 0u);
}

TEST(SceneEventWatcherTest, LateDeliveryAfterStopIsIgnored) {
    test_support::MockHostDocumentApi host;
    std::vector<host::HostEventHandler> handlers;
    EXPECT_CALL(host, subscribe(_, _))
        .WillRepeatedly(Invoke([&](HostEvent, host::HostEventHandler h) -> Result<host::SubscriptionId> {
            handlers.push_back(std::move(h));
            return static_cast<host::SubscriptionId>(handlers.size());
        }));
    EXPECT_CALL(host, unsubscribe(_)).Times(4);

    SceneEventWatcher watcher(host);
    int calls = 0;
    ASSERT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, [&] { ++calls; }));
    ASSERT_EQ(handlers.size(), 4u);

    watcher.stop();
    // the host may still deliver an event that was already in flight
    handlers[0]();
    handlers[3]();
    EXPECT_EQ(calls, 0);
}

TEST(SceneEventWatcherTest, ThrowingSubscribeIsSkipped) {
    test_support::MockHostDocumentApi host;
    host::SubscriptionId next = 0;
    EXPECT_CALL(host, subscribe(HostEvent::DocumentOpened, _))
        .WillOnce(Invoke([](HostEvent, host::HostEventHandler) -> Result<host::SubscriptionId> {
            throw std::runtime_error("host api unavailable");
        }));
    EXPECT_CALL(host, subscribe(HostEvent::DocumentSaved, _))
        .WillOnce(Invoke([&](HostEvent, host::HostEventHandler) -> Result<host::SubscriptionId> {
            return ++next;
        }));
    EXPECT_CALL(host, subscribe(HostEvent::DocumentCreated, _))
        .WillOnce(Invoke([&](HostEvent, host::HostEventHandler) -> Result<host::SubscriptionId> {
            return ++next;
        }));
    EXPECT_CALL(host, subscribe(HostEvent::HostExiting, _))
        .WillOnce(Invoke([&](HostEvent, host::HostEventHandler) -> Result<host::SubscriptionId> {
            return ++next;
        }));
    EXPECT_CALL(host, unsubscribe(_)).Times(3);

    SceneEventWatcher watcher(host);
    EXPECT_TRUE(watcher.start(SceneEventWatcher::defaultEvents(), false, [] {}));
    EXPECT_EQ(watcher.activeSubscriptionCount(), 3u);
}
