#pragma once

#include <memory>
#include <string>

#include <megaapi.h>

#include <aiomega/bridge/operation_forward.h>

namespace aiomega
{
namespace client
{

using AccountDetailsPtr = std::unique_ptr<mega::MegaAccountDetails>;

using NodePtr = std::shared_ptr<mega::MegaNode>;

using RequestPtr = std::unique_ptr<mega::MegaRequest>;

using TransferPtr = std::unique_ptr<mega::MegaTransfer>;

using TransferStream = bridge::TransferStream<TransferPtr>;

// Why has the account been blocked?
struct BlockedReason
{
    // The reason's code, zero if the account isn't blocked.
    long long mCode = 0;

    // A human readable description of the reason.
    std::string mText;
}; // BlockedReason

} // client
} // aiomega

