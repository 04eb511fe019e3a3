#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include <aiomega/bridge/progress_callback_forward.h>
#include <aiomega/bridge/transfer_progress.h>
#include <aiomega/common/event_loop_forward.h>
#include <aiomega/common/logger_forward.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace bridge
{

// Delivers a transfer's progress to user code on the event loop.
//
// A direct callback is invoked on the loop's thread. A suspending callback,
// one that returns Task<void>, is started there as an independent task so
// that it can never delay the transfer it is observing.
class ProgressCallback
{
public:
    using DirectFunction =
      std::function<void(const TransferProgress&)>;

    using SuspendingFunction =
      std::function<common::Task<void>(const TransferProgress&)>;

private:
    // Keeps function alive for as long as its task is running.
    static common::Task<void> invoke(SuspendingFunction function,
                                     TransferProgress progress);

    std::variant<std::monostate,
                 DirectFunction,
                 SuspendingFunction> mFunction;

public:
    ProgressCallback();

    ProgressCallback(std::nullptr_t);

    explicit ProgressCallback(DirectFunction function);

    explicit ProgressCallback(SuspendingFunction function);

    // Do we have a function to call?
    explicit operator bool() const;

    // Hand progress to our function on the specified loop.
    //
    // Safe to call from any thread. Anything the function throws is
    // logged and otherwise ignored.
    void dispatch(common::EventLoop& loop,
                  common::Logger& logger,
                  const TransferProgress& progress) const;

    // Does our function suspend?
    bool suspending() const;
}; // ProgressCallback

// Bind a user function and any extra arguments into a progress callback.
//
// The function is called as:
//   function(transferred, total, speed, arguments...)
//
// Suspending functions should take their parameters by value.
template<typename Function, typename... Arguments>
ProgressCallback makeProgressCallback(Function function,
                                      Arguments... arguments)
{
    using Result = std::invoke_result_t<const Function&,
                                        std::int64_t,
                                        std::int64_t,
                                        std::int64_t,
                                        const Arguments&...>;

    auto bound = [function = std::move(function),
                  ...arguments = std::move(arguments)]
                 (const TransferProgress& progress) {
        return std::invoke(function,
                           progress.mTransferred,
                           progress.mTotal,
                           progress.mSpeed,
                           arguments...);
    }; // bound

    using SuspendingFunction = ProgressCallback::SuspendingFunction;
    using DirectFunction = ProgressCallback::DirectFunction;

    if constexpr (std::is_same_v<Result, common::Task<void>>)
        return ProgressCallback(SuspendingFunction(std::move(bound)));
    else
        return ProgressCallback(DirectFunction(std::move(bound)));
}

} // bridge
} // aiomega

