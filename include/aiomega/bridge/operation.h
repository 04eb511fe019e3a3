#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <utility>

#include <aiomega/bridge/operation_forward.h>
#include <aiomega/common/cross_thread_signal.h>
#include <aiomega/common/error.h>
#include <aiomega/common/error_or.h>
#include <aiomega/common/event_loop.h>
#include <aiomega/common/logging.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace bridge
{

// Represents some long-running engine operation.
//
// The engine reports the operation's outcome from one of its own threads
// by calling complete(...). The outcome is recorded exactly once and only
// then is anyone awaiting result() woken up on the event loop.
template<typename Payload>
class Operation
  : public std::enable_shared_from_this<Operation<Payload>>
{
    // Raised when the operation's outcome has been recorded.
    common::CrossThreadSignal mCompleted;

    // How did the operation end?
    common::Error mError;

    // True once complete(...) has been called.
    std::atomic<bool> mFinished;

    // Where is the operation being awaited?
    common::EventLoop& mLoop;

    // What logger should we use?
    common::Logger& mLogger;

    // What did the operation produce?
    std::optional<Payload> mResult;

    // Keeps the operation alive until it has completed.
    std::shared_ptr<Operation> mSelf;

protected:
    Operation(common::EventLoop& loop, common::Logger& logger)
      : mCompleted(loop)
      , mError()
      , mFinished(false)
      , mLoop(loop)
      , mLogger(logger)
      , mResult()
      , mSelf()
    {
    }

    // Called just before the operation's outcome is recorded.
    virtual void finishing()
    {
    }

public:
    using PayloadType = Payload;

    Operation(const Operation& other) = delete;

    virtual ~Operation() = default;

    Operation& operator=(const Operation& rhs) = delete;

    // Record the operation's outcome.
    //
    // Safe to call from any thread. Returns false if the operation had
    // already completed in which case the outcome is discarded.
    bool complete(Payload payload, common::Error error)
    {
        // Operation's already been completed.
        if (mFinished.exchange(true))
        {
            LogWarningF(mLogger,
                        "Discarding duplicate completion: %s",
                        error.toString().c_str());

            return false;
        }

        finishing();

        // Record the outcome before anyone can observe it.
        mError = std::move(error);
        mResult.emplace(std::move(payload));

        auto self = std::move(mSelf);

        // Wake up anyone waiting for the outcome.
        mCompleted.set();

        // Release our self-reference on the loop's thread.
        if (self)
            mLoop.post([self = std::move(self)]() mutable {
                self.reset();
            });

        return true;
    }

    // Has the operation's outcome been recorded?
    bool completed() const
    {
        return mCompleted.raised();
    }

    common::Logger& logger() const
    {
        return mLogger;
    }

    common::EventLoop& loop() const
    {
        return mLoop;
    }

    // Wait for the operation's outcome.
    //
    // Must be called on the loop's thread. The payload is handed over to
    // the caller so the outcome can only be collected once.
    common::Task<common::ErrorOr<Payload>> result()
    {
        co_await mCompleted.wait();

        if (mError.failed())
            co_return common::unexpected(mError);

        co_return std::move(*mResult);
    }

    // Keep the operation alive until it has completed.
    //
    // Must be called before the operation is handed to the engine.
    void retain()
    {
        mSelf = this->shared_from_this();
    }

    // Called when the engine reports a transient failure.
    void temporaryError(const common::Error& error) const
    {
        LogInfoF(mLogger,
                 "Operation encountered a temporary error: %s",
                 error.toString().c_str());
    }
}; // Operation<Payload>

} // bridge
} // aiomega

