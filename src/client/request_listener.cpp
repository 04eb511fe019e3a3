#include <aiomega/client/logger.h>
#include <aiomega/client/request_listener.h>

namespace aiomega
{
namespace client
{

using namespace common;

RequestListener::RequestListener(EventLoop& loop)
  : mega::MegaRequestListener()
  , bridge::RequestOperation<RequestPtr>(loop, client::logger())
{
}

void RequestListener::onRequestStart(mega::MegaApi*,
                                     mega::MegaRequest* request)
{
    LogInfoF(logger(),
             "Request start (%s)",
             request->getRequestString());
}

void RequestListener::onRequestFinish(mega::MegaApi*,
                                      mega::MegaRequest* request,
                                      mega::MegaError* error)
{
    LogInfoF(logger(),
             "Request finished (%s); Result: %s",
             request->getRequestString(),
             error->getErrorString());

    // The request and error are only valid for the duration of this call.
    complete(RequestPtr(request->copy()),
             error->getErrorCode(),
             error->getErrorString());
}

void RequestListener::onRequestTemporaryError(mega::MegaApi*,
                                              mega::MegaRequest* request,
                                              mega::MegaError* error)
{
    LogInfoF(logger(),
             "Request temporary error (%s)",
             request->getRequestString());

    temporaryError(requestFailed(error->getErrorCode(),
                                 error->getErrorString()));
}

} // client
} // aiomega

