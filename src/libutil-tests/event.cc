#include "awsctx/util/event.hh"
#include "awsctx/util/logging.hh"

#include <gtest/gtest.h>

namespace awsctx {

TEST(Event, emitWithoutListeners)
{
    Event<int> event;
    event.emit(1);
    ASSERT_EQ(event.size(), 0u);
}

TEST(Event, listenersRunInRegistrationOrder)
{
    Event<int> event;
    std::vector<std::string> calls;

    auto a = event.subscribe([&](const int & n) { calls.push_back("a" + std::to_string(n)); });
    auto b = event.subscribe([&](const int & n) { calls.push_back("b" + std::to_string(n)); });
    auto c = event.subscribe([&](const int & n) { calls.push_back("c" + std::to_string(n)); });

    event.emit(1);
    event.emit(2);

    ASSERT_EQ(calls, std::vector<std::string>({"a1", "b1", "c1", "a2", "b2", "c2"}));
}

TEST(Event, destroyingHandleUnsubscribes)
{
    Event<int> event;
    int calls = 0;

    auto sub = event.subscribe([&](const int &) { calls++; });
    ASSERT_EQ(event.size(), 1u);

    event.emit(0);
    sub.reset();
    event.emit(0);

    ASSERT_EQ(calls, 1);
    ASSERT_EQ(event.size(), 0u);
}

TEST(Event, handleMayOutliveEvent)
{
    std::unique_ptr<Subscription> sub;
    {
        Event<int> event;
        sub = event.subscribe([](const int &) {});
    }
    sub.reset();
}

TEST(Event, throwingListenerDoesNotStopOthers)
{
    Event<int> event;
    int calls = 0;

    auto a = event.subscribe([](const int &) { throw Error("listener failed"); });
    auto b = event.subscribe([&](const int &) { calls++; });

    Verbosity saved = verbosity;
    verbosity = lvlError;
    event.emit(0);
    verbosity = saved;

    ASSERT_EQ(calls, 1);
}

TEST(Event, listenerMayUnsubscribeItself)
{
    Event<int> event;
    int calls = 0;
    std::unique_ptr<Subscription> sub;

    sub = event.subscribe([&](const int &) {
        calls++;
        sub.reset();
    });
    auto other = event.subscribe([&](const int &) { calls += 10; });

    event.emit(0);
    event.emit(0);

    ASSERT_EQ(calls, 21);
}

TEST(Event, listenerAddedDuringEmitIsNotCalled)
{
    Event<int> event;
    int lateCalls = 0;
    std::unique_ptr<Subscription> late;

    auto sub = event.subscribe([&](const int &) {
        if (!late)
            late = event.subscribe([&](const int &) { lateCalls++; });
    });

    event.emit(0);
    ASSERT_EQ(lateCalls, 0);

    event.emit(0);
    ASSERT_EQ(lateCalls, 1);
}

} // namespace awsctx
