#pragma once

#include <cassert>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <aiomega/bridge/logger.h>
#include <aiomega/bridge/streaming_transfer_operation.h>
#include <aiomega/common/error_or.h>
#include <aiomega/common/logging.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace bridge
{

// A single-pass sequence of chunks produced by a streaming transfer.
//
// Every chunk is exactly as large as the stream's chunk size except the
// last. Any error reported by the transfer is only surfaced after every
// chunk it delivered has been consumed.
template<typename Payload>
class TransferStream
{
public:
    using OperationPtr = std::shared_ptr<StreamingTransferOperation<Payload>>;

private:
    // How large is each chunk?
    std::size_t mChunkSize;

    // Set when we've reached the end of the stream.
    bool mFinished;

    // The transfer producing our data.
    OperationPtr mOperation;

public:
    TransferStream(OperationPtr operation, std::size_t chunkSize)
      : mChunkSize(chunkSize)
      , mFinished(false)
      , mOperation(std::move(operation))
    {
        assert(mChunkSize);
        assert(mOperation);
    }

    TransferStream(const TransferStream& other) = delete;

    TransferStream(TransferStream&& other)
      : mChunkSize(other.mChunkSize)
      , mFinished(other.mFinished)
      , mOperation(std::move(other.mOperation))
    {
    }

    ~TransferStream()
    {
        close();
    }

    TransferStream& operator=(const TransferStream& rhs) = delete;

    TransferStream& operator=(TransferStream&& rhs)
    {
        TransferStream temp(std::move(rhs));

        swap(temp);

        return *this;
    }

    std::size_t chunkSize() const
    {
        return mChunkSize;
    }

    // Stop consuming the stream.
    //
    // Any data still in flight is discarded and the transfer is aborted
    // the next time it tries to deliver more.
    void close()
    {
        if (!mOperation)
            return;

        if (!mFinished)
            LogDebug1(logger(), "Stream closed before reaching its end");

        mOperation->conduit().closeReader();
    }

    // Have we reached the end of the stream?
    bool finished() const
    {
        return mFinished;
    }

    // Retrieve the next chunk.
    //
    // An empty optional marks the end of the stream.
    common::Task<common::ErrorOr<std::optional<std::string>>> next()
    {
        using Result = common::ErrorOr<std::optional<std::string>>;

        // Stream's already been consumed.
        if (mFinished || !mOperation)
            co_return Result(std::optional<std::string>());

        auto operation = mOperation;
        auto chunk = co_await operation->conduit().read(mChunkSize);

        if (!chunk.empty())
            co_return Result(std::optional<std::string>(std::move(chunk)));

        mFinished = true;

        LogDebug1(logger(), "Stream reached its end");

        // We'll never read from the conduit again.
        operation->conduit().closeReader();

        // Surface the transfer's outcome.
        auto result = co_await operation->result();

        if (!result)
            co_return common::unexpected(std::move(result).error());

        co_return Result(std::optional<std::string>());
    }

    void swap(TransferStream& other)
    {
        using std::swap;

        swap(mChunkSize, other.mChunkSize);
        swap(mFinished, other.mFinished);
        swap(mOperation, other.mOperation);
    }
}; // TransferStream<Payload>

} // bridge
} // aiomega

