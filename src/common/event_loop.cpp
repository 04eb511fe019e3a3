#include <cassert>
#include <exception>

#include <aiomega/common/event_loop.h>
#include <aiomega/common/logging.h>

namespace aiomega
{
namespace common
{

EventLoop::ThreadBinding::ThreadBinding(EventLoop& loop)
  : mLoop(loop)
{
    std::lock_guard<std::mutex> guard(mLoop.mLock);

    // The loop can only be driven by one thread at a time.
    if (mLoop.mThreadID != std::thread::id())
        throw LogError1(mLoop.mLogger, "Event loop is already running");

    mLoop.mThreadID = std::this_thread::get_id();
}

EventLoop::ThreadBinding::~ThreadBinding()
{
    std::lock_guard<std::mutex> guard(mLoop.mLock);

    mLoop.mThreadID = std::thread::id();
}

detail::DetachedTask EventLoop::detach(Task<void> task)
{
    ++mDetached;

    try
    {
        co_await std::move(task);
    }
    catch (std::exception& exception)
    {
        LogWarningF(mLogger,
                    "Detached task failed: %s",
                    exception.what());
    }
    catch (...)
    {
        LogWarning1(mLogger, "Detached task failed: unknown exception");
    }

    --mDetached;
}

void EventLoop::runUntil(const bool& done)
{
    std::unique_lock<std::mutex> lock(mLock);

    while (!done)
    {
        // Wait for something to do.
        mCV.wait(lock, [&]() {
            return !mQueue.empty();
        });

        // Pick the next function.
        auto function = std::move(mQueue.front());

        mQueue.pop_front();

        // Execute the function without holding the lock.
        lock.unlock();

        function();

        lock.lock();
    }
}

EventLoop::EventLoop(Logger& logger)
  : mCV()
  , mDetached(0u)
  , mLock()
  , mLogger(logger)
  , mQueue()
  , mThreadID()
{
    LogDebug1(mLogger, "Event loop constructed");
}

EventLoop::EventLoop()
  : EventLoop(logger())
{
}

EventLoop::~EventLoop()
{
    std::lock_guard<std::mutex> guard(mLock);

    if (!mQueue.empty())
        LogWarningF(mLogger,
                    "Event loop destroyed with %zu pending function(s)",
                    mQueue.size());

    if (mDetached)
        LogWarningF(mLogger,
                    "Event loop destroyed with %zu running task(s)",
                    mDetached);

    LogDebug1(mLogger, "Event loop destroyed");
}

std::size_t EventLoop::detached() const
{
    return mDetached;
}

bool EventLoop::onLoopThread() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mThreadID == std::this_thread::get_id();
}

std::size_t EventLoop::poll()
{
    ThreadBinding binding(*this);

    std::deque<std::function<void()>> functions;

    // Take ownership of whatever's been queued so far.
    {
        std::lock_guard<std::mutex> guard(mLock);
        std::swap(functions, mQueue);
    }

    auto count = functions.size();

    for (auto& function : functions)
        function();

    return count;
}

void EventLoop::post(std::function<void()> function)
{
    // Sanity.
    assert(function);

    {
        std::lock_guard<std::mutex> guard(mLock);
        mQueue.emplace_back(std::move(function));
    }

    // Let the loop know there's something to do.
    mCV.notify_one();
}

void EventLoop::spawn(Task<void> task)
{
    // Sanity.
    assert(task);
    assert(onLoopThread());

    detach(std::move(task));
}

} // common
} // aiomega

