#pragma once

#include <cstddef>
#include <utility>

#include <megaapi.h>

#include <aiomega/bridge/streaming_transfer_operation.h>
#include <aiomega/bridge/transfer_operation.h>
#include <aiomega/client/logger.h>
#include <aiomega/client/types.h>

namespace aiomega
{
namespace client
{

// Receives the progress and outcome of a single transfer from the SDK.
template<typename Operation>
class BasicTransferListener
  : public mega::MegaTransferListener
  , public Operation
{
public:
    template<typename... Arguments>
    BasicTransferListener(common::EventLoop& loop,
                          bridge::ProgressCallback progress,
                          Arguments&&... arguments)
      : mega::MegaTransferListener()
      , Operation(loop,
                  client::logger(),
                  std::move(progress),
                  std::forward<Arguments>(arguments)...)
    {
    }

    void onTransferStart(mega::MegaApi*,
                         mega::MegaTransfer* transfer) override
    {
        LogInfoF(this->logger(),
                 "Transfer start (%s %s)",
                 transfer->getTransferString(),
                 transfer->getFileName());
    }

    void onTransferFinish(mega::MegaApi*,
                          mega::MegaTransfer* transfer,
                          mega::MegaError* error) override
    {
        LogInfoF(this->logger(),
                 "Transfer finished (%s %s); Result: %s",
                 transfer->getTransferString(),
                 transfer->getFileName(),
                 error->getErrorString());

        // The transfer and error are only valid for the duration of this call.
        this->complete(TransferPtr(transfer->copy()),
                       error->getErrorCode(),
                       error->getErrorString());
    }

    void onTransferUpdate(mega::MegaApi*,
                          mega::MegaTransfer* transfer) override
    {
        bridge::TransferProgress snapshot;

        snapshot.mSpeed = transfer->getSpeed();
        snapshot.mTotal = transfer->getTotalBytes();
        snapshot.mTransferred = transfer->getTransferredBytes();

        this->progress(snapshot);
    }

    void onTransferTemporaryError(mega::MegaApi*,
                                  mega::MegaTransfer* transfer,
                                  mega::MegaError* error) override
    {
        LogInfoF(this->logger(),
                 "Transfer temporary error (%s %s)",
                 transfer->getTransferString(),
                 transfer->getFileName());

        this->temporaryError(common::transferFailed(error->getErrorCode(),
                                                    error->getErrorString()));
    }
}; // BasicTransferListener<Operation>

using TransferListener =
  BasicTransferListener<bridge::TransferOperation<TransferPtr>>;

// Receives a transfer's data as well as its progress and outcome.
class StreamingTransferListener
  : public BasicTransferListener<bridge::StreamingTransferOperation<TransferPtr>>
{
public:
    StreamingTransferListener(common::EventLoop& loop,
                              bridge::ProgressCallback progress,
                              std::size_t capacity);

    bool onTransferData(mega::MegaApi* api,
                        mega::MegaTransfer* transfer,
                        char* buffer,
                        size_t size) override;
}; // StreamingTransferListener

} // client
} // aiomega

