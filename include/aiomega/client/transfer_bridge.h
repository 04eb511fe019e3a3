#pragma once

#include <functional>
#include <memory>
#include <utility>

#include <megaapi.h>

#include <aiomega/bridge/execute.h>
#include <aiomega/bridge/progress_callback.h>
#include <aiomega/client/transfer_listener.h>
#include <aiomega/client/types.h>
#include <aiomega/common/error_or.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace client
{

// Starts transfers and lets coroutines wait for their outcome.
class TransferBridge
{
    // Who executes our transfers?
    mega::MegaApi& mApi;

    // Where are our transfers awaited?
    common::EventLoop& mLoop;

public:
    TransferBridge(mega::MegaApi& api, common::EventLoop& loop)
      : mApi(api)
      , mLoop(loop)
    {
    }

    // Start a transfer and wait for its outcome.
    //
    // The transfer is started by calling:
    //   method(api, arguments..., listener)
    //
    // Every progress update reported by the SDK is delivered to progress
    // before the transfer's outcome is. A transfer that fails yields an
    // error of kind TRANSFER_FAILED.
    template<typename Method, typename... Arguments>
    common::Task<common::ErrorOr<TransferPtr>> submit(Method method,
                                                      bridge::ProgressCallback progress,
                                                      Arguments... arguments)
    {
        auto listener =
          std::make_shared<TransferListener>(mLoop, std::move(progress));

        return bridge::execute(std::move(listener),
                               [&api = mApi,
                                method = std::move(method),
                                ...arguments = std::move(arguments)]
                               (TransferListener& listener) {
            std::invoke(method,
                        api,
                        arguments...,
                        static_cast<mega::MegaTransferListener*>(&listener));
        });
    }
}; // TransferBridge

} // client
} // aiomega

