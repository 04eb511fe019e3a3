#include <utility>

#include <aiomega/client/logger.h>
#include <aiomega/client/streaming_transfer_bridge.h>

namespace aiomega
{
namespace client
{

using namespace common;

StreamingTransferBridge::StreamingTransferBridge(mega::MegaApi& api,
                                                 EventLoop& loop,
                                                 std::size_t capacity)
  : mApi(api)
  , mCapacity(capacity)
  , mLoop(loop)
{
}

TransferStream StreamingTransferBridge::stream(mega::MegaNode& node,
                                               std::int64_t offset,
                                               std::int64_t limit,
                                               std::size_t chunkSize,
                                               bridge::ProgressCallback progress)
{
    LogDebugF(logger(),
              "Streaming %lld byte(s) from offset %lld in %zu byte chunks",
              static_cast<long long>(limit),
              static_cast<long long>(offset),
              chunkSize);

    return submit(&mega::MegaApi::startStreaming,
                  chunkSize,
                  std::move(progress),
                  &node,
                  offset,
                  limit);
}

} // client
} // aiomega

