#pragma once

#include <atomic>
#include <coroutine>
#include <memory>
#include <vector>

#include <aiomega/common/event_loop_forward.h>

namespace aiomega
{
namespace common
{

// A one-shot flag that can be raised from any thread and awaited on an
// event loop.
//
// Raising the flag never touches loop state directly: the wake-up is posted
// to the loop and performed there.
class CrossThreadSignal
{
    // State shared with wake-ups that are still in flight.
    class Context;

    using ContextPtr = std::shared_ptr<Context>;

    class Awaiter
    {
        ContextPtr mContext;

        // Who's waiting for the signal?
        std::coroutine_handle<> mWaiter;

    public:
        explicit Awaiter(ContextPtr context);

        Awaiter(const Awaiter& other) = delete;

        // Forgets the waiter if it was destroyed before being resumed.
        ~Awaiter();

        Awaiter& operator=(const Awaiter& rhs) = delete;

        bool await_ready() const noexcept;

        void await_suspend(std::coroutine_handle<> waiter);

        void await_resume() const noexcept;
    }; // Awaiter

    ContextPtr mContext;

public:
    explicit CrossThreadSignal(EventLoop& loop);

    CrossThreadSignal(const CrossThreadSignal& other) = delete;

    ~CrossThreadSignal();

    CrossThreadSignal& operator=(const CrossThreadSignal& rhs) = delete;

    // Has set() been called?
    //
    // Safe to call from any thread.
    bool raised() const;

    // Raise the signal.
    //
    // Returns false if the signal had already been raised.
    bool set();

    // Has the loop observed the signal?
    //
    // Must be called on the loop's thread.
    bool signalled() const;

    // Suspend the caller until the signal has been raised.
    //
    // Must be called on the loop's thread.
    Awaiter wait() const;
}; // CrossThreadSignal

class CrossThreadSignal::Context
{
public:
    explicit Context(EventLoop& loop);

    // Mark the signal as observed and resume any waiters.
    void signal();

    // Where wake-ups are performed.
    EventLoop& mLoop;

    // True once set() has been called.
    std::atomic<bool> mRaised;

    // True once the loop has processed the wake-up.
    //
    // Only accessed on the loop's thread.
    bool mSignalled;

    // Who's waiting for the signal?
    //
    // Only accessed on the loop's thread.
    std::vector<std::coroutine_handle<>> mWaiters;
}; // Context

} // common
} // aiomega

