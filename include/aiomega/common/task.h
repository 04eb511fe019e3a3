#pragma once

#include <cassert>
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

#include <aiomega/common/task_forward.h>

namespace aiomega
{
namespace common
{
namespace detail
{

// Transfers control to whoever is awaiting the task.
struct FinalAwaiter
{
    bool await_ready() const noexcept
    {
        return false;
    }

    template<typename P>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<P> handle) noexcept
    {
        if (auto continuation = handle.promise().mContinuation)
            return continuation;

        return std::noop_coroutine();
    }

    void await_resume() const noexcept
    {
    }
}; // FinalAwaiter

class PromiseBase
{
public:
    // Who should we resume when we're done?
    std::coroutine_handle<> mContinuation;

    // Whatever escaped the coroutine's body.
    std::exception_ptr mException;

    std::suspend_always initial_suspend() const noexcept
    {
        return {};
    }

    FinalAwaiter final_suspend() const noexcept
    {
        return {};
    }

    void unhandled_exception() noexcept
    {
        mException = std::current_exception();
    }

    void rethrow() const
    {
        if (mException)
            std::rethrow_exception(mException);
    }
}; // PromiseBase

template<typename T>
class Promise
  : public PromiseBase
{
    // The value produced by co_return.
    std::optional<T> mValue;

public:
    Task<T> get_return_object() noexcept;

    template<typename U>
    void return_value(U&& value)
    {
        mValue.emplace(std::forward<U>(value));
    }

    T result()
    {
        rethrow();

        assert(mValue);

        return std::move(*mValue);
    }
}; // Promise<T>

template<>
class Promise<void>
  : public PromiseBase
{
public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept
    {
    }

    void result()
    {
        rethrow();
    }
}; // Promise<void>

} // detail

// A lazily started coroutine producing a value of type T.
//
// The coroutine's body doesn't execute until the task is awaited. When the
// body completes, control returns directly to the awaiting coroutine.
template<typename T>
class Task
{
public:
    using promise_type = detail::Promise<T>;

private:
    using Handle = std::coroutine_handle<promise_type>;

    struct Awaiter
    {
        bool await_ready() const noexcept
        {
            return mHandle.done();
        }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept
        {
            mHandle.promise().mContinuation = caller;

            return mHandle;
        }

        T await_resume()
        {
            return mHandle.promise().result();
        }

        Handle mHandle;
    }; // Awaiter

    Handle mHandle;

public:
    Task() = default;

    explicit Task(Handle handle)
      : mHandle(handle)
    {
    }

    Task(const Task& other) = delete;

    Task(Task&& other) noexcept
      : mHandle(std::exchange(other.mHandle, nullptr))
    {
    }

    ~Task()
    {
        if (mHandle)
            mHandle.destroy();
    }

    Task& operator=(const Task& rhs) = delete;

    Task& operator=(Task&& rhs) noexcept
    {
        Task temp(std::move(rhs));

        std::swap(mHandle, temp.mHandle);

        return *this;
    }

    explicit operator bool() const
    {
        return static_cast<bool>(mHandle);
    }

    Awaiter operator co_await() & noexcept
    {
        assert(mHandle);

        return Awaiter{mHandle};
    }

    Awaiter operator co_await() && noexcept
    {
        assert(mHandle);

        return Awaiter{mHandle};
    }

    // Has the coroutine run to completion?
    bool done() const
    {
        return !mHandle || mHandle.done();
    }
}; // Task<T>

namespace detail
{

template<typename T>
Task<T> Promise<T>::get_return_object() noexcept
{
    return Task<T>(std::coroutine_handle<Promise<T>>::from_promise(*this));
}

inline Task<void> Promise<void>::get_return_object() noexcept
{
    return Task<void>(std::coroutine_handle<Promise<void>>::from_promise(*this));
}

// A coroutine that starts immediately and releases itself on completion.
//
// Its body is responsible for handling anything it might throw.
struct DetachedTask
{
    struct promise_type
    {
        DetachedTask get_return_object() const noexcept
        {
            return {};
        }

        std::suspend_never initial_suspend() const noexcept
        {
            return {};
        }

        std::suspend_never final_suspend() const noexcept
        {
            return {};
        }

        void return_void() const noexcept
        {
        }

        void unhandled_exception() const noexcept
        {
            std::terminate();
        }
    }; // promise_type
}; // DetachedTask

} // detail
} // common
} // aiomega

