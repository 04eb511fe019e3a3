#pragma once

#include <string>
#include <utility>

#include <aiomega/bridge/operation.h>
#include <aiomega/bridge/progress_callback.h>
#include <aiomega/bridge/transfer_progress.h>

namespace aiomega
{
namespace bridge
{

// An operation that reports its progress as it executes.
template<typename Payload>
class TransferOperation
  : public Operation<Payload>
{
    // Who should we tell about our progress?
    ProgressCallback mProgress;

public:
    TransferOperation(common::EventLoop& loop,
                      common::Logger& logger,
                      ProgressCallback progress)
      : Operation<Payload>(loop, logger)
      , mProgress(std::move(progress))
    {
    }

    using Operation<Payload>::complete;

    // Record the transfer's outcome as reported by the engine.
    //
    // Any code other than ENGINE_OK is reported as a failed transfer.
    bool complete(Payload payload, int code, std::string message)
    {
        auto error = common::Error();

        if (code != common::ENGINE_OK)
            error = common::transferFailed(code, std::move(message));

        return complete(std::move(payload), std::move(error));
    }

    // Report the transfer's progress.
    //
    // Safe to call from any thread. Progress reported after the transfer
    // has completed is discarded, in which case false is returned.
    bool progress(const TransferProgress& progress)
    {
        auto& logger = this->logger();

        if (this->completed())
        {
            LogWarningF(logger,
                        "Discarding progress of completed transfer: %lld of %lld bytes",
                        static_cast<long long>(progress.mTransferred),
                        static_cast<long long>(progress.mTotal));

            return false;
        }

        LogInfoF(logger,
                 "Transfer progress: %lld KB of %lld KB, %lld KB/s",
                 static_cast<long long>(progress.mTransferred / 1024),
                 static_cast<long long>(progress.mTotal / 1024),
                 static_cast<long long>(progress.mSpeed / 1024));

        mProgress.dispatch(this->loop(), logger, progress);

        return true;
    }
}; // TransferOperation<Payload>

} // bridge
} // aiomega

