#pragma once

namespace aiomega
{
namespace bridge
{

template<typename Payload>
class Operation;

template<typename Payload>
class RequestOperation;

template<typename Payload>
class StreamingTransferOperation;

template<typename Payload>
class TransferOperation;

template<typename Payload>
class TransferStream;

} // bridge
} // aiomega

