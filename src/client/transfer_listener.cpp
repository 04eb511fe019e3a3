#include <aiomega/client/transfer_listener.h>

namespace aiomega
{
namespace client
{

using namespace common;

StreamingTransferListener::StreamingTransferListener(EventLoop& loop,
                                                     bridge::ProgressCallback progress,
                                                     std::size_t capacity)
  : BasicTransferListener(loop, std::move(progress), capacity)
{
}

bool StreamingTransferListener::onTransferData(mega::MegaApi*,
                                               mega::MegaTransfer*,
                                               char* buffer,
                                               size_t size)
{
    // Blocks while the consumer catches up.
    return data(buffer, size);
}

} // client
} // aiomega

