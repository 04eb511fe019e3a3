#pragma once

#include <functional>
#include <memory>
#include <utility>

#include <megaapi.h>

#include <aiomega/bridge/execute.h>
#include <aiomega/client/request_listener.h>
#include <aiomega/client/types.h>
#include <aiomega/common/error_or.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace client
{

// Issues requests to the SDK and lets coroutines wait for their outcome.
class RequestBridge
{
    // Who executes our requests?
    mega::MegaApi& mApi;

    // Where are our requests awaited?
    common::EventLoop& mLoop;

public:
    RequestBridge(mega::MegaApi& api, common::EventLoop& loop)
      : mApi(api)
      , mLoop(loop)
    {
    }

    // Issue a request and wait for its outcome.
    //
    // The request is issued by calling:
    //   method(api, arguments..., listener)
    //
    // A request that fails yields an error of kind REQUEST_FAILED carrying
    // the SDK's error code and description.
    template<typename Method, typename... Arguments>
    common::Task<common::ErrorOr<RequestPtr>> submit(Method method,
                                                     Arguments... arguments)
    {
        auto listener = std::make_shared<RequestListener>(mLoop);

        return bridge::execute(std::move(listener),
                               [&api = mApi,
                                method = std::move(method),
                                ...arguments = std::move(arguments)]
                               (RequestListener& listener) {
            std::invoke(method,
                        api,
                        arguments...,
                        static_cast<mega::MegaRequestListener*>(&listener));
        });
    }
}; // RequestBridge

} // client
} // aiomega

