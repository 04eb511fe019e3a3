#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <aiomega/common/log_level.h>

namespace aiomega
{
namespace client
{

// Describes how the client should reach the cloud through a proxy.
struct ProxyOptions
{
    // Where is the proxy?
    std::string mURL;

    // Who should we authenticate as, if anyone?
    std::optional<std::string> mUsername{};

    // What password should we authenticate with?
    std::optional<std::string> mPassword{};
}; // ProxyOptions

struct ClientOptions
{
    // Identifies the application to the cloud.
    std::string mAppKey;

    // Where should the SDK store its local state?
    std::optional<std::string> mBasePath{};

    // Should all traffic use HTTPS?
    bool mHttpsOnly = false;

    // Only messages at or below this level are emitted.
    common::LogLevel mLogLevel = common::logInfo;

    // Should our messages be sent through the SDK's logging pipeline?
    bool mLogToSdk = true;

    // Should we reach the cloud through a custom proxy?
    std::optional<ProxyOptions> mProxy{};

    // How many bytes can a stream buffer before its transfer is paused?
    std::size_t mStreamBufferSize = 1u << 22;

    // How large is each chunk produced by a stream by default?
    std::size_t mStreamChunkSize = 1u << 21;

    // How does the client identify itself?
    std::optional<std::string> mUserAgent{};
}; // ClientOptions

} // client
} // aiomega

