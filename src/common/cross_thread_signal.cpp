#include <algorithm>
#include <cassert>
#include <utility>

#include <aiomega/common/cross_thread_signal.h>
#include <aiomega/common/event_loop.h>

namespace aiomega
{
namespace common
{

CrossThreadSignal::Awaiter::Awaiter(ContextPtr context)
  : mContext(std::move(context))
  , mWaiter()
{
}

CrossThreadSignal::Awaiter::~Awaiter()
{
    // Never suspended.
    if (!mWaiter)
        return;

    auto& waiters = mContext->mWaiters;

    waiters.erase(std::remove(waiters.begin(), waiters.end(), mWaiter),
                  waiters.end());
}

bool CrossThreadSignal::Awaiter::await_ready() const noexcept
{
    return mContext->mSignalled;
}

void CrossThreadSignal::Awaiter::await_suspend(std::coroutine_handle<> waiter)
{
    mContext->mWaiters.emplace_back(waiter);

    mWaiter = waiter;
}

void CrossThreadSignal::Awaiter::await_resume() const noexcept
{
}

CrossThreadSignal::Context::Context(EventLoop& loop)
  : mLoop(loop)
  , mRaised(false)
  , mSignalled(false)
  , mWaiters()
{
}

void CrossThreadSignal::Context::signal()
{
    // Sanity.
    assert(mLoop.onLoopThread());
    assert(!mSignalled);

    mSignalled = true;

    // Resuming a waiter may destroy other waiters.
    while (!mWaiters.empty())
    {
        auto waiter = mWaiters.front();

        mWaiters.erase(mWaiters.begin());

        waiter.resume();
    }
}

CrossThreadSignal::CrossThreadSignal(EventLoop& loop)
  : mContext(std::make_shared<Context>(loop))
{
}

CrossThreadSignal::~CrossThreadSignal() = default;

bool CrossThreadSignal::raised() const
{
    return mContext->mRaised;
}

bool CrossThreadSignal::set()
{
    // Signal's already been raised.
    if (mContext->mRaised.exchange(true))
        return false;

    // Let the loop perform the wake-up.
    mContext->mLoop.post([context = mContext]() {
        context->signal();
    });

    return true;
}

bool CrossThreadSignal::signalled() const
{
    assert(mContext->mLoop.onLoopThread());

    return mContext->mSignalled;
}

CrossThreadSignal::Awaiter CrossThreadSignal::wait() const
{
    assert(mContext->mLoop.onLoopThread());

    return Awaiter(mContext);
}

} // common
} // aiomega

