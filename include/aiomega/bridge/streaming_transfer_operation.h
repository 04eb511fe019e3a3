#pragma once

#include <cstddef>
#include <utility>

#include <aiomega/bridge/transfer_operation.h>
#include <aiomega/common/conduit.h>

namespace aiomega
{
namespace bridge
{

// A transfer whose data is delivered to the event loop through a conduit.
//
// The engine pushes data from its own thread with data(...), blocking
// while the conduit is full. The conduit's write end is closed just
// before the transfer's outcome is recorded.
template<typename Payload>
class StreamingTransferOperation
  : public TransferOperation<Payload>
{
    // Carries the transfer's data to the event loop.
    common::Conduit mConduit;

protected:
    void finishing() override
    {
        // No more data will be delivered.
        mConduit.closeWriter();
    }

public:
    StreamingTransferOperation(common::EventLoop& loop,
                               common::Logger& logger,
                               ProgressCallback progress,
                               std::size_t capacity)
      : TransferOperation<Payload>(loop, logger, std::move(progress))
      , mConduit(loop, capacity)
    {
    }

    common::Conduit& conduit()
    {
        return mConduit;
    }

    // Deliver some of the transfer's data.
    //
    // Returns false if nobody is interested in the data anymore, in which
    // case the engine should abort the transfer.
    bool data(const void* data, std::size_t length)
    {
        if (mConduit.write(data, length))
            return true;

        LogWarningF(this->logger(),
                    "Stream abandoned with %zu byte(s) undelivered",
                    length);

        return false;
    }
}; // StreamingTransferOperation<Payload>

} // bridge
} // aiomega

