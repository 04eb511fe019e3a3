#pragma once

#include <cstdint>

#include <aiomega/bridge/transfer_progress_forward.h>

namespace aiomega
{
namespace bridge
{

// A snapshot of a transfer's progress.
struct TransferProgress
{
    // How many bytes have been transferred so far?
    std::int64_t mTransferred = 0;

    // How many bytes will be transferred in total?
    std::int64_t mTotal = 0;

    // How fast is the transfer progressing, in bytes per second?
    std::int64_t mSpeed = 0;
}; // TransferProgress

} // bridge
} // aiomega

