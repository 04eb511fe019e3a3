#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <megaapi.h>

#include <aiomega/bridge/progress_callback.h>
#include <aiomega/bridge/transfer_stream.h>
#include <aiomega/client/client_options.h>
#include <aiomega/client/node_id.h>
#include <aiomega/client/request_bridge.h>
#include <aiomega/client/streaming_transfer_bridge.h>
#include <aiomega/client/transfer_bridge.h>
#include <aiomega/client/types.h>
#include <aiomega/common/error.h>
#include <aiomega/common/error_or.h>
#include <aiomega/common/event_loop_forward.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace client
{

// Lets coroutines drive a MEGA account.
//
// Every coroutine must be awaited on the client's event loop.
class Client
{
    // Convenience.
    using Error = common::Error;

    template<typename T>
    using ErrorOr = common::ErrorOr<T>;

    template<typename T>
    using Task = common::Task<T>;

    // Where our coroutines execute.
    common::EventLoop& mLoop;

    // How was the client configured?
    const ClientOptions mOptions;

    // Performs the actual work.
    std::unique_ptr<mega::MegaApi> mApi;

    // Issues requests on our behalf.
    RequestBridge mRequests;

    // Streams content on our behalf.
    StreamingTransferBridge mStreams;

    // Performs transfers on our behalf.
    TransferBridge mTransfers;

public:
    Client(common::EventLoop& loop, ClientOptions options);

    Client(const Client& other) = delete;

    ~Client();

    Client& operator=(const Client& rhs) = delete;

    // Retrieve the details of the current account.
    Task<ErrorOr<AccountDetailsPtr>> accountDetails();

    // Give direct access to the SDK.
    mega::MegaApi& api();

    // Copy node below parent, optionally giving the copy a new name.
    Task<Error> copyNode(NodeId node,
                         NodeId parent,
                         std::optional<std::string> name = std::nullopt);

    // Create a new folder below parent.
    //
    // Returns the new folder's handle.
    Task<ErrorOr<mega::MegaHandle>> createFolder(std::string name,
                                                 NodeId parent = std::string("/"));

    // Download node's content to localPath.
    Task<ErrorOr<TransferPtr>> download(NodeId node,
                                        std::string localPath,
                                        bridge::ProgressCallback progress = nullptr);

    // Generate a public link for node.
    Task<ErrorOr<std::string>> exportNode(NodeId node,
                                          std::optional<std::int64_t> expireTime = std::nullopt);

    // Load the account's filesystem.
    Task<Error> fetchNodes();

    // Is the client logged in?
    bool loggedIn();

    // Log in to an account.
    Task<Error> login(std::string email, std::string password);

    // Log out of the current account.
    Task<Error> logout();

    // Move node below parent, optionally renaming it.
    Task<Error> moveNode(NodeId node,
                         NodeId parent,
                         std::optional<std::string> name = std::nullopt);

    // Resolve an identifier to a node.
    //
    // The account's filesystem is loaded if necessary.
    Task<ErrorOr<NodePtr>> node(NodeId id);

    // Is the client connected to the cloud?
    bool online();

    const ClientOptions& options() const;

    // Retrieve the node described by a public link.
    Task<ErrorOr<NodePtr>> publicNode(std::string link);

    // Remove node from the cloud.
    Task<Error> remove(NodeId node);

    // Retry a transfer that previously failed.
    Task<ErrorOr<TransferPtr>> retryTransfer(mega::MegaTransfer& transfer,
                                             bridge::ProgressCallback progress = nullptr);

    // Share a node with another user.
    Task<Error> share(NodeId node, std::string email, int level);

    // Stream node's content.
    //
    // If limit isn't specified, the node's content is streamed to its end.
    // If chunkSize isn't specified, the client's default is used.
    Task<ErrorOr<TransferStream>> stream(NodeId node,
                                         std::int64_t offset = 0,
                                         std::optional<std::int64_t> limit = std::nullopt,
                                         std::optional<std::size_t> chunkSize = std::nullopt,
                                         bridge::ProgressCallback progress = nullptr);

    // Upload a local file below parent.
    //
    // If fileName isn't specified, the local file's name is used.
    Task<ErrorOr<TransferPtr>> upload(NodeId parent,
                                      std::string localPath,
                                      std::optional<std::string> fileName = std::nullopt,
                                      bridge::ProgressCallback progress = nullptr);

    // Ask the cloud why the account has been blocked.
    Task<ErrorOr<BlockedReason>> whyAmIBlocked();
}; // Client

} // client
} // aiomega

