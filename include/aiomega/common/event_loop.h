#pragma once

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

#include <aiomega/common/event_loop_forward.h>
#include <aiomega/common/logger_forward.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace common
{
namespace detail
{

// Where EventLoop::run(...) stores the outcome of the task it drives.
template<typename T>
struct Outcome
{
    T get()
    {
        if (mException)
            std::rethrow_exception(mException);

        return std::move(*mValue);
    }

    std::exception_ptr mException;
    std::optional<T> mValue;
    bool mDone = false;
}; // Outcome<T>

template<>
struct Outcome<void>
{
    void get()
    {
        if (mException)
            std::rethrow_exception(mException);
    }

    std::exception_ptr mException;
    bool mDone = false;
}; // Outcome<void>

// Run a task to completion, recording how it ended.
template<typename T>
DetachedTask drive(Task<T> task, Outcome<T>& outcome)
{
    try
    {
        if constexpr (std::is_void_v<T>)
            co_await std::move(task);
        else
            outcome.mValue.emplace(co_await std::move(task));
    }
    catch (...)
    {
        // Rethrown by Outcome<T>::get().
        outcome.mException = std::current_exception();
    }

    outcome.mDone = true;
}

} // detail

// A single-threaded cooperative scheduler.
//
// Coroutines only ever execute on the thread currently inside run(...).
// Other threads interact with the loop solely by posting functions.
class EventLoop
{
    // Marks the calling thread as the loop's thread for its lifetime.
    class ThreadBinding;

    // Runs a spawned task and reports how it ended.
    detail::DetachedTask detach(Task<void> task);

    // Execute queued functions until done is true.
    void runUntil(const bool& done);

    // Signalled when a function has been queued.
    std::condition_variable mCV;

    // How many spawned tasks are still running?
    std::size_t mDetached;

    // Serializes access to instance members.
    mutable std::mutex mLock;

    // What logger should we use?
    Logger& mLogger;

    // Functions waiting to be executed on the loop's thread.
    std::deque<std::function<void()>> mQueue;

    // Which thread is running the loop, if any?
    std::thread::id mThreadID;

public:
    explicit EventLoop(Logger& logger);

    EventLoop();

    EventLoop(const EventLoop& other) = delete;

    ~EventLoop();

    EventLoop& operator=(const EventLoop& rhs) = delete;

    // How many spawned tasks haven't completed yet?
    std::size_t detached() const;

    // Is the caller executing on the loop's thread?
    bool onLoopThread() const;

    // Execute whatever's been queued without waiting for more.
    //
    // Returns the number of functions executed.
    std::size_t poll();

    // Queue a function for execution on the loop's thread.
    //
    // Safe to call from any thread.
    void post(std::function<void()> function);

    // Drive the loop on the calling thread until task completes.
    //
    // Returns the task's value or rethrows whatever it threw.
    template<typename T>
    T run(Task<T> task);

    // Start a task without waiting for it to complete.
    //
    // Must be called on the loop's thread. Anything the task throws is
    // logged and otherwise ignored.
    void spawn(Task<void> task);

    // Suspend the caller and resume it on a later iteration of the loop.
    auto yield()
    {
        struct Awaiter
        {
            bool await_ready() const noexcept
            {
                return false;
            }

            void await_suspend(std::coroutine_handle<> handle)
            {
                mLoop.post([handle]() {
                    handle.resume();
                });
            }

            void await_resume() const noexcept
            {
            }

            EventLoop& mLoop;
        }; // Awaiter

        return Awaiter{*this};
    }
}; // EventLoop

class EventLoop::ThreadBinding
{
    EventLoop& mLoop;

public:
    explicit ThreadBinding(EventLoop& loop);

    ThreadBinding(const ThreadBinding& other) = delete;

    ~ThreadBinding();

    ThreadBinding& operator=(const ThreadBinding& rhs) = delete;
}; // ThreadBinding

template<typename T>
T EventLoop::run(Task<T> task)
{
    ThreadBinding binding(*this);

    detail::Outcome<T> outcome;

    // Kick off the task.
    detail::drive(std::move(task), outcome);

    // Process events until the task completes.
    runUntil(outcome.mDone);

    return outcome.get();
}

} // common
} // aiomega

