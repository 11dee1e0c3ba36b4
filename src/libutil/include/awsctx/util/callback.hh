#pragma once
///@file

#include <atomic>
#include <cassert>
#include <functional>
#include <future>

namespace awsctx {

/**
 * The completion handler of an asynchronous operation. It is completed
 * exactly once, either with a value of type `T` or with an exception,
 * and hands the outcome to the wrapped function as a ready
 * `std::future<T>`.
 */
template<typename T>
class Callback
{
    std::function<void(std::future<T>)> fun;
    std::atomic_flag done = ATOMIC_FLAG_INIT;

    void deliver(std::promise<T> & promise) noexcept
    {
        [[maybe_unused]] bool completedBefore = done.test_and_set();
        assert(!completedBefore);
        fun(promise.get_future());
    }

public:

    Callback(std::function<void(std::future<T>)> fun)
        : fun(std::move(fun))
    {
    }

    Callback(Callback && other) noexcept
        : fun(std::move(other.fun))
    {
        if (other.done.test_and_set())
            done.test_and_set();
    }

    void operator()(T && t) noexcept
    {
        std::promise<T> promise;
        promise.set_value(std::move(t));
        deliver(promise);
    }

    void rethrow(const std::exception_ptr & exc = std::current_exception()) noexcept
    {
        std::promise<T> promise;
        promise.set_exception(exc);
        deliver(promise);
    }
};

} // namespace awsctx
