#include <exception>

#include <aiomega/bridge/progress_callback.h>
#include <aiomega/common/event_loop.h>
#include <aiomega/common/logging.h>

namespace aiomega
{
namespace bridge
{

using namespace common;

Task<void> ProgressCallback::invoke(SuspendingFunction function,
                                    TransferProgress progress)
{
    co_await function(progress);
}

ProgressCallback::ProgressCallback()
  : mFunction()
{
}

ProgressCallback::ProgressCallback(std::nullptr_t)
  : ProgressCallback()
{
}

ProgressCallback::ProgressCallback(DirectFunction function)
  : mFunction()
{
    if (function)
        mFunction = std::move(function);
}

ProgressCallback::ProgressCallback(SuspendingFunction function)
  : mFunction()
{
    if (function)
        mFunction = std::move(function);
}

ProgressCallback::operator bool() const
{
    return !std::holds_alternative<std::monostate>(mFunction);
}

void ProgressCallback::dispatch(EventLoop& loop,
                                Logger& logger,
                                const TransferProgress& progress) const
{
    if (auto* function = std::get_if<DirectFunction>(&mFunction))
    {
        loop.post([&logger, function = *function, progress]() {
            try
            {
                function(progress);
            }
            catch (std::exception& exception)
            {
                LogWarningF(logger,
                            "Progress callback failed: %s",
                            exception.what());
            }
            catch (...)
            {
                LogWarning1(logger,
                            "Progress callback failed: unknown exception");
            }
        });

        return;
    }

    auto* function = std::get_if<SuspendingFunction>(&mFunction);

    // No function to call.
    if (!function)
        return;

    loop.post([&loop, &logger, function = *function, progress]() {
        try
        {
            loop.spawn(ProgressCallback::invoke(function, progress));
        }
        catch (std::exception& exception)
        {
            LogWarningF(logger,
                        "Couldn't start progress callback: %s",
                        exception.what());
        }
        catch (...)
        {
            LogWarning1(logger,
                        "Couldn't start progress callback: unknown exception");
        }
    });
}

bool ProgressCallback::suspending() const
{
    return std::holds_alternative<SuspendingFunction>(mFunction);
}

} // bridge
} // aiomega

