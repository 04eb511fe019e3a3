#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include <megaapi.h>

#include <aiomega/bridge/execute.h>
#include <aiomega/bridge/progress_callback.h>
#include <aiomega/client/transfer_listener.h>
#include <aiomega/client/types.h>
#include <aiomega/common/event_loop_forward.h>

namespace aiomega
{
namespace client
{

// Streams a file's content from the cloud to a coroutine.
class StreamingTransferBridge
{
    // Who executes our transfers?
    mega::MegaApi& mApi;

    // How many bytes can each stream buffer?
    std::size_t mCapacity;

    // Where are our streams consumed?
    common::EventLoop& mLoop;

public:
    StreamingTransferBridge(mega::MegaApi& api,
                            common::EventLoop& loop,
                            std::size_t capacity);

    // Stream limit bytes of node's content, beginning at offset.
    //
    // The stream yields chunks of chunkSize bytes. The SDK is paused
    // while the stream's buffer is full and the transfer is aborted if
    // the stream is closed before it has been drained.
    TransferStream stream(mega::MegaNode& node,
                          std::int64_t offset,
                          std::int64_t limit,
                          std::size_t chunkSize,
                          bridge::ProgressCallback progress);

    // Start a streaming transfer by calling:
    //   method(api, arguments..., listener)
    template<typename Method, typename... Arguments>
    TransferStream submit(Method method,
                          std::size_t chunkSize,
                          bridge::ProgressCallback progress,
                          Arguments... arguments)
    {
        auto listener =
          std::make_shared<StreamingTransferListener>(mLoop,
                                                      std::move(progress),
                                                      mCapacity);

        return bridge::stream(std::move(listener),
                              chunkSize,
                              [&api = mApi,
                               method = std::move(method),
                               ...arguments = std::move(arguments)]
                              (StreamingTransferListener& listener) {
            std::invoke(method,
                        api,
                        arguments...,
                        static_cast<mega::MegaTransferListener*>(&listener));
        });
    }
}; // StreamingTransferBridge

} // client
} // aiomega

