#pragma once
///@file

#include <memory>
#include <stdexcept>

namespace awsctx {

/**
 * A `std::shared_ptr` that is never null. Collaborators a component
 * cannot work without (stores, resolvers) are held as `ref`s, so the
 * null check happens once, where the component is wired up.
 */
template<typename T>
class ref
{
    std::shared_ptr<T> p;

public:

    using element_type = T;

    explicit ref(std::shared_ptr<T> p)
        : p(std::move(p))
    {
        if (!this->p)
            throw std::invalid_argument("null pointer cast to ref");
    }

    T * operator->() const
    {
        return p.get();
    }

    T & operator*() const
    {
        return *p;
    }

    operator std::shared_ptr<T>() const
    {
        return p;
    }

    template<typename T2>
    operator ref<T2>() const
    {
        return ref<T2>(std::shared_ptr<T2>(p));
    }

    bool operator==(const ref<T> & other) const
    {
        return p == other.p;
    }
};

template<typename T, typename... Args>
ref<T> make_ref(Args &&... args)
{
    return ref<T>(std::make_shared<T>(std::forward<Args>(args)...));
}

} // namespace awsctx
