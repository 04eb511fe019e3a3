#include <filesystem>
#include <utility>

#include <aiomega/client/client.h>
#include <aiomega/client/logger.h>
#include <aiomega/client/sdk_log_output.h>
#include <aiomega/common/event_loop.h>
#include <aiomega/common/logging.h>

namespace aiomega
{
namespace client
{

using namespace common;

// Translates a C string returned by the SDK.
static std::string fromSdk(const char* value);

// Builds an SDK instance as described by options.
static std::unique_ptr<mega::MegaApi> makeApi(const ClientOptions& options);

// Convenience.
static const char* toSdk(const std::optional<std::string>& value);

Client::Client(EventLoop& loop, ClientOptions options)
  : mLoop(loop)
  , mOptions(std::move(options))
  , mApi(makeApi(mOptions))
  , mRequests(*mApi, mLoop)
  , mStreams(*mApi, mLoop, mOptions.mStreamBufferSize)
  , mTransfers(*mApi, mLoop)
{
    static SdkLogOutput sdkLogOutput;

    SimpleLogger::setLogLevel(mOptions.mLogLevel);

    mega::MegaApi::setLogLevel(mOptions.mLogLevel);

    if (mOptions.mLogToSdk)
        SimpleLogger::setOutputClass(&sdkLogOutput);

    LogDebug1(logger(), "Client constructed");
}

Client::~Client()
{
    LogDebug1(logger(), "Client destroyed");
}

auto Client::accountDetails() -> Task<ErrorOr<AccountDetailsPtr>>
{
    auto request = co_await mRequests.submit(&mega::MegaApi::getAccountDetails);

    if (!request)
        co_return unexpected(std::move(request).error());

    co_return AccountDetailsPtr((*request)->getMegaAccountDetails());
}

mega::MegaApi& Client::api()
{
    return *mApi;
}

auto Client::copyNode(NodeId node,
                      NodeId parent,
                      std::optional<std::string> name) -> Task<Error>
{
    auto source = co_await this->node(std::move(node));

    if (!source)
        co_return source.error();

    auto target = co_await this->node(std::move(parent));

    if (!target)
        co_return target.error();

    // Copy the node keeping its name.
    if (!name)
    {
        auto request = co_await mRequests.submit(
          [](mega::MegaApi& api,
             mega::MegaNode* node,
             mega::MegaNode* parent,
             mega::MegaRequestListener* listener) {
              api.copyNode(node, parent, listener);
          },
          source->get(),
          target->get());

        co_return request.status();
    }

    // Copy the node giving it a new name.
    auto request = co_await mRequests.submit(
      [](mega::MegaApi& api,
         mega::MegaNode* node,
         mega::MegaNode* parent,
         const char* name,
         mega::MegaRequestListener* listener) {
          api.copyNode(node, parent, name, listener);
      },
      source->get(),
      target->get(),
      name->c_str());

    co_return request.status();
}

auto Client::createFolder(std::string name,
                          NodeId parent) -> Task<ErrorOr<mega::MegaHandle>>
{
    auto target = co_await node(std::move(parent));

    if (!target)
        co_return unexpected(std::move(target).error());

    auto request = co_await mRequests.submit(&mega::MegaApi::createFolder,
                                             name.c_str(),
                                             target->get());

    if (!request)
        co_return unexpected(std::move(request).error());

    co_return (*request)->getNodeHandle();
}

auto Client::download(NodeId node,
                      std::string localPath,
                      bridge::ProgressCallback progress)
  -> Task<ErrorOr<TransferPtr>>
{
    auto source = co_await this->node(std::move(node));

    if (!source)
        co_return unexpected(std::move(source).error());

    co_return co_await mTransfers.submit(&mega::MegaApi::startDownload,
                                         std::move(progress),
                                         source->get(),
                                         localPath.c_str());
}

auto Client::exportNode(NodeId node,
                        std::optional<std::int64_t> expireTime)
  -> Task<ErrorOr<std::string>>
{
    auto source = co_await this->node(std::move(node));

    if (!source)
        co_return unexpected(std::move(source).error());

    Task<ErrorOr<RequestPtr>> task;

    // Generate a link that never expires.
    if (!expireTime)
    {
        task = mRequests.submit(
          [](mega::MegaApi& api,
             mega::MegaNode* node,
             mega::MegaRequestListener* listener) {
              api.exportNode(node, listener);
          },
          source->get());
    }
    else
    {
        task = mRequests.submit(
          [](mega::MegaApi& api,
             mega::MegaNode* node,
             std::int64_t expireTime,
             mega::MegaRequestListener* listener) {
              api.exportNode(node, expireTime, listener);
          },
          source->get(),
          *expireTime);
    }

    auto request = co_await std::move(task);

    if (!request)
        co_return unexpected(std::move(request).error());

    co_return fromSdk((*request)->getLink());
}

auto Client::fetchNodes() -> Task<Error>
{
    auto request = co_await mRequests.submit(&mega::MegaApi::fetchNodes);

    co_return request.status();
}

bool Client::loggedIn()
{
    return mApi->isLoggedIn() > 0;
}

auto Client::login(std::string email, std::string password) -> Task<Error>
{
    auto request = co_await mRequests.submit(&mega::MegaApi::login,
                                             email.c_str(),
                                             password.c_str());

    co_return request.status();
}

auto Client::logout() -> Task<Error>
{
    auto request = co_await mRequests.submit(&mega::MegaApi::logout);

    co_return request.status();
}

auto Client::moveNode(NodeId node,
                      NodeId parent,
                      std::optional<std::string> name) -> Task<Error>
{
    auto source = co_await this->node(std::move(node));

    if (!source)
        co_return source.error();

    auto target = co_await this->node(std::move(parent));

    if (!target)
        co_return target.error();

    auto request = co_await mRequests.submit(&mega::MegaApi::moveNode,
                                             source->get(),
                                             target->get());

    // Couldn't move the node or it doesn't need to be renamed.
    if (!request || !name)
        co_return request.status();

    request = co_await mRequests.submit(&mega::MegaApi::renameNode,
                                        source->get(),
                                        name->c_str());

    co_return request.status();
}

auto Client::node(NodeId id) -> Task<ErrorOr<NodePtr>>
{
    // Make sure the identifier's sane before we do any real work.
    if (auto result = validate(id); result.failed())
        co_return unexpected(std::move(result));

    // Caller's already resolved the node.
    if (auto* node = std::get_if<NodePtr>(&id))
        co_return *node;

    // Make sure the filesystem's been loaded.
    if (!mApi->isFilesystemAvailable())
    {
        auto result = co_await fetchNodes();

        if (result.failed())
            co_return unexpected(std::move(result));
    }

    NodePtr node;

    if (auto* handle = std::get_if<mega::MegaHandle>(&id))
        node.reset(mApi->getNodeByHandle(*handle));
    else
        node.reset(mApi->getNodeByPath(std::get<std::string>(id).c_str()));

    if (node)
        co_return node;

    co_return unexpected(notFound(id));
}

bool Client::online()
{
    return mApi->isOnline();
}

const ClientOptions& Client::options() const
{
    return mOptions;
}

auto Client::publicNode(std::string link) -> Task<ErrorOr<NodePtr>>
{
    auto request = co_await mRequests.submit(&mega::MegaApi::getPublicNode,
                                             link.c_str());

    if (!request)
        co_return unexpected(std::move(request).error());

    co_return NodePtr((*request)->getPublicMegaNode());
}

auto Client::remove(NodeId node) -> Task<Error>
{
    auto target = co_await this->node(std::move(node));

    if (!target)
        co_return target.error();

    auto request = co_await mRequests.submit(&mega::MegaApi::remove,
                                             target->get());

    co_return request.status();
}

auto Client::retryTransfer(mega::MegaTransfer& transfer,
                           bridge::ProgressCallback progress)
  -> Task<ErrorOr<TransferPtr>>
{
    co_return co_await mTransfers.submit(&mega::MegaApi::retryTransfer,
                                         std::move(progress),
                                         &transfer);
}

auto Client::share(NodeId node, std::string email, int level) -> Task<Error>
{
    auto target = co_await this->node(std::move(node));

    if (!target)
        co_return target.error();

    auto request = co_await mRequests.submit(
      [](mega::MegaApi& api,
         mega::MegaNode* node,
         const char* email,
         int level,
         mega::MegaRequestListener* listener) {
          api.share(node, email, level, listener);
      },
      target->get(),
      email.c_str(),
      level);

    co_return request.status();
}

auto Client::stream(NodeId node,
                    std::int64_t offset,
                    std::optional<std::int64_t> limit,
                    std::optional<std::size_t> chunkSize,
                    bridge::ProgressCallback progress)
  -> Task<ErrorOr<TransferStream>>
{
    if (offset < 0)
        co_return unexpected(invalidArgument(mega::MegaError::API_EARGS,
                                             "Invalid stream offset"));

    if (chunkSize && !*chunkSize)
        co_return unexpected(invalidArgument(mega::MegaError::API_EARGS,
                                             "Invalid stream chunk size"));

    auto source = co_await this->node(std::move(node));

    if (!source)
        co_return unexpected(std::move(source).error());

    // Stream the node's content by default.
    if (!limit)
        limit = (*source)->getSize();

    co_return mStreams.stream(**source,
                              offset,
                              *limit,
                              chunkSize.value_or(mOptions.mStreamChunkSize),
                              std::move(progress));
}

auto Client::upload(NodeId parent,
                    std::string localPath,
                    std::optional<std::string> fileName,
                    bridge::ProgressCallback progress)
  -> Task<ErrorOr<TransferPtr>>
{
    auto target = co_await node(std::move(parent));

    if (!target)
        co_return unexpected(std::move(target).error());

    // Use the local file's name by default.
    if (!fileName)
        fileName = std::filesystem::path(localPath).filename().string();

    co_return co_await mTransfers.submit(
      [](mega::MegaApi& api,
         const char* localPath,
         mega::MegaNode* parent,
         const char* fileName,
         mega::MegaTransferListener* listener) {
          api.startUpload(localPath, parent, fileName, listener);
      },
      std::move(progress),
      localPath.c_str(),
      target->get(),
      fileName->c_str());
}

auto Client::whyAmIBlocked() -> Task<ErrorOr<BlockedReason>>
{
    auto request = co_await mRequests.submit(&mega::MegaApi::whyAmIBlocked);

    if (!request)
        co_return unexpected(std::move(request).error());

    BlockedReason reason;

    reason.mCode = (*request)->getNumber();
    reason.mText = fromSdk((*request)->getText());

    co_return reason;
}

std::string fromSdk(const char* value)
{
    if (value)
        return value;

    return std::string();
}

std::unique_ptr<mega::MegaApi> makeApi(const ClientOptions& options)
{
    auto api = std::make_unique<mega::MegaApi>(options.mAppKey.c_str(),
                                               toSdk(options.mBasePath),
                                               toSdk(options.mUserAgent));

    // Route traffic through a custom proxy.
    if (options.mProxy)
    {
        mega::MegaProxy proxy;

        proxy.setProxyType(mega::MegaProxy::PROXY_CUSTOM);
        proxy.setProxyURL(options.mProxy->mURL.c_str());
        proxy.setCredentials(toSdk(options.mProxy->mUsername),
                             toSdk(options.mProxy->mPassword));

        api->setProxySettings(&proxy);
    }

    api->useHttpsOnly(options.mHttpsOnly);

    return api;
}

const char* toSdk(const std::optional<std::string>& value)
{
    if (value)
        return value->c_str();

    return nullptr;
}

} // client
} // aiomega

