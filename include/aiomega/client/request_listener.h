#pragma once

#include <megaapi.h>

#include <aiomega/bridge/request_operation.h>
#include <aiomega/client/types.h>

namespace aiomega
{
namespace client
{

// Receives the outcome of a single request from the SDK.
class RequestListener
  : public mega::MegaRequestListener
  , public bridge::RequestOperation<RequestPtr>
{
public:
    explicit RequestListener(common::EventLoop& loop);

    void onRequestStart(mega::MegaApi* api,
                        mega::MegaRequest* request) override;

    void onRequestFinish(mega::MegaApi* api,
                         mega::MegaRequest* request,
                         mega::MegaError* error) override;

    void onRequestTemporaryError(mega::MegaApi* api,
                                 mega::MegaRequest* request,
                                 mega::MegaError* error) override;
}; // RequestListener

} // client
} // aiomega

