#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include <aiomega/bridge/operation.h>
#include <aiomega/bridge/transfer_stream.h>
#include <aiomega/common/error_or.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace bridge
{

// Hand an operation to the engine and wait for its outcome.
//
// start is called with the operation and is expected to pass it to the
// engine. The operation keeps itself alive until the engine reports its
// outcome even if the caller stops waiting.
template<typename T, typename Start>
auto execute(std::shared_ptr<T> operation, Start start)
  -> common::Task<common::ErrorOr<typename T::PayloadType>>
{
    operation->retain();

    start(*operation);

    co_return co_await operation->result();
}

// Hand a streaming operation to the engine.
//
// Returns a stream that will yield the transfer's data in chunks of
// chunkSize bytes.
template<typename T, typename Start>
auto stream(std::shared_ptr<T> operation,
            std::size_t chunkSize,
            Start start)
  -> TransferStream<typename T::PayloadType>
{
    operation->retain();

    start(*operation);

    using Payload = typename T::PayloadType;

    return TransferStream<Payload>(std::move(operation), chunkSize);
}

} // bridge
} // aiomega

