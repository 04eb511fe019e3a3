#pragma once

#include <string>
#include <utility>

#include <aiomega/bridge/operation.h>

namespace aiomega
{
namespace bridge
{

// An operation that reports nothing but its outcome.
template<typename Payload>
class RequestOperation
  : public Operation<Payload>
{
public:
    RequestOperation(common::EventLoop& loop, common::Logger& logger)
      : Operation<Payload>(loop, logger)
    {
    }

    using Operation<Payload>::complete;

    // Record the request's outcome as reported by the engine.
    //
    // Any code other than ENGINE_OK is reported as a failed request.
    bool complete(Payload payload, int code, std::string message)
    {
        auto error = common::Error();

        if (code != common::ENGINE_OK)
            error = common::requestFailed(code, std::move(message));

        return complete(std::move(payload), std::move(error));
    }
}; // RequestOperation<Payload>

} // bridge
} // aiomega

