#pragma once
///@file

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

#include "awsctx/util/error.hh"
#include "awsctx/util/sync.hh"

namespace awsctx {

/**
 * Handle for a listener registered with `Event<T>::subscribe()`.
 * Destroying it removes the listener.
 */
struct Subscription
{
    virtual ~Subscription() {};
};

/**
 * An ordered set of listeners that are called synchronously with a
 * value of type T.
 *
 * Listeners are kept in a map keyed by a unique, increasing token, so
 * iterating the map visits them in registration order. `emit()` does
 * not hold the lock while running a listener; a listener may
 * subscribe or unsubscribe (itself or others) while being called.
 * Listeners added during an `emit()` are not called by it.
 */
template<typename T>
class Event
{
public:

    typedef std::function<void(const T &)> Listener;

private:

    typedef int64_t Token;

    struct Listeners
    {
        /* Unique tokens so that a double delete can't remove the
           wrong listener. */
        Token nextToken = 0;

        std::map<Token, Listener> listeners;
    };

    std::shared_ptr<Sync<Listeners>> state = std::make_shared<Sync<Listeners>>();

    struct SubscriptionImpl : Subscription
    {
        std::weak_ptr<Sync<Listeners>> state;
        Token token;

        ~SubscriptionImpl() override
        {
            if (auto state2 = state.lock())
                state2->lock()->listeners.erase(token);
        }
    };

public:

    Event() = default;

    Event(const Event &) = delete;
    Event & operator=(const Event &) = delete;

    std::unique_ptr<Subscription> subscribe(Listener listener)
    {
        auto state_(state->lock());
        auto token = state_->nextToken++;
        state_->listeners.emplace(token, std::move(listener));

        auto res = std::make_unique<SubscriptionImpl>();
        res->state = state;
        res->token = token;
        return res;
    }

    /**
     * Call every listener with `value`. An exception thrown by a
     * listener is logged as a warning and does not stop the others.
     */
    void emit(const T & value)
    {
        Token end, i = 0;
        end = state->lock()->nextToken;

        while (true) {
            Listener listener;
            {
                auto state_(state->lock());
                auto lb = state_->listeners.lower_bound(i);
                if (lb == state_->listeners.end() || lb->first >= end)
                    break;

                listener = lb->second;
                i = lb->first + 1;
            }

            try {
                listener(value);
            } catch (...) {
                ignoreException(lvlWarn);
            }
        }
    }

    size_t size()
    {
        return state->lock()->listeners.size();
    }
};

} // namespace awsctx
