#pragma once
///@file

#include <mutex>

namespace awsctx {

/**
 * A value of type `T` that can only be reached through a lock:
 *
 *   Sync<std::map<std::string, nlohmann::json>> values;
 *
 *   {
 *       auto values_(values.lock());
 *       values_->insert_or_assign(key, value);
 *   }
 *
 * The mutex is released when `values_` goes out of scope.
 */
template<class T, class M = std::mutex>
class Sync
{
    M mutex;
    T data;

public:

    using element_type = T;

    Sync() {}

    Sync(T && data)
        : data(std::move(data))
    {
    }

    class Lock
    {
        friend Sync;

        Sync * s;
        std::unique_lock<M> lk;

        Lock(Sync * s)
            : s(s)
            , lk(s->mutex)
        {
        }

    public:

        Lock(Lock &&) = delete;
        Lock(const Lock &) = delete;

        T * operator->()
        {
            return &s->data;
        }

        T & operator*()
        {
            return s->data;
        }
    };

    Lock lock()
    {
        return Lock(this);
    }
};

} // namespace awsctx
