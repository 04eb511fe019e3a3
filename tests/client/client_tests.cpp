#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <megaapi.h>

#include <aiomega/client/client.h>
#include <aiomega/client/node_id.h>
#include <aiomega/client/request_bridge.h>
#include <aiomega/client/streaming_transfer_bridge.h>
#include <aiomega/client/transfer_bridge.h>
#include <aiomega/common/error.h>
#include <aiomega/common/event_loop.h>

#include <engine_thread.h>
#include <fakes.h>

namespace aiomega
{
namespace testing
{

using namespace client;
using namespace common;

using ::testing::ElementsAre;

class ClientTests
  : public ::testing::Test
{
public:
    static ClientOptions options()
    {
        ClientOptions options;

        options.mAppKey = "aiomega-tests";
        options.mLogToSdk = false;
        options.mStreamChunkSize = 1u << 16;

        return options;
    }

    ClientTests()
      : Test()
      , mLoop()
      , mClient(mLoop, options())
      , mEngine()
    {
    }

    // Collect a stream's chunks until it ends or fails.
    static Task<Error> drain(TransferStream& stream,
                             std::vector<std::string>& chunks)
    {
        while (true)
        {
            auto chunk = co_await stream.next();

            if (!chunk)
                co_return std::move(chunk).error();

            if (!*chunk)
                co_return Error();

            chunks.emplace_back(std::move(**chunk));
        }
    }

    EventLoop mLoop;
    Client mClient;
    EngineThread mEngine;
}; // ClientTests

TEST_F(ClientTests, starts_logged_out)
{
    EXPECT_FALSE(mClient.loggedIn());
    EXPECT_EQ(mClient.options().mAppKey, "aiomega-tests");
    EXPECT_EQ(mClient.options().mStreamChunkSize, 1u << 16);
}

TEST_F(ClientTests, invalid_handle_is_rejected)
{
    auto result = mLoop.run(mClient.node(mega::INVALID_HANDLE));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), EK_INVALID_ARGUMENT);
    EXPECT_EQ(result.error().code(), mega::MegaError::API_EARGS);
}

TEST_F(ClientTests, empty_path_is_rejected)
{
    auto result = mLoop.run(mClient.node(std::string()));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), EK_INVALID_ARGUMENT);
}

TEST_F(ClientTests, null_node_is_rejected)
{
    auto result = mLoop.run(mClient.remove(NodePtr()));

    EXPECT_EQ(result.kind(), EK_INVALID_ARGUMENT);
}

TEST_F(ClientTests, resolved_node_is_used_as_is)
{
    auto resolved = NodePtr(std::make_shared<FakeNode>(7));

    auto result = mLoop.run(mClient.node(resolved));

    ASSERT_TRUE(result);
    EXPECT_EQ(result->get(), resolved.get());
}

TEST_F(ClientTests, invalid_stream_arguments_are_rejected)
{
    auto result = mLoop.run(mClient.stream(std::string("/file"), -1));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), EK_INVALID_ARGUMENT);

    result = mLoop.run(mClient.stream(std::string("/file"), 0, std::nullopt, 0));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), EK_INVALID_ARGUMENT);
}

TEST_F(ClientTests, request_bridge_yields_payload)
{
    RequestBridge requests(mClient.api(), mLoop);

    auto result = mLoop.run(requests.submit(
      [this](mega::MegaApi&,
             mega::MegaHandle handle,
             mega::MegaRequestListener* listener) {
          mEngine.post([handle, listener]() {
              FakeRequest request(handle, "https://mega.nz/file/x");
              mega::MegaError error(mega::MegaError::API_OK);

              listener->onRequestFinish(nullptr, &request, &error);
          });
      },
      mega::MegaHandle(42)));

    ASSERT_TRUE(result);
    EXPECT_EQ((*result)->getNodeHandle(), 42u);
    EXPECT_STREQ((*result)->getLink(), "https://mega.nz/file/x");
}

TEST_F(ClientTests, request_bridge_reports_failure)
{
    RequestBridge requests(mClient.api(), mLoop);

    auto result = mLoop.run(requests.submit(
      [this](mega::MegaApi&, mega::MegaRequestListener* listener) {
          mEngine.post([listener]() {
              FakeRequest request(0, "");
              mega::MegaError error(5);

              listener->onRequestFinish(nullptr, &request, &error);
          });
      }));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), EK_REQUEST_FAILED);
    EXPECT_EQ(result.error().code(), 5);
    EXPECT_EQ(result.error().message(), mega::MegaError::getErrorString(5));
}

TEST_F(ClientTests, transfer_bridge_delivers_progress_in_order)
{
    std::vector<std::int64_t> observed;
    TransferBridge transfers(mClient.api(), mLoop);

    auto progress = bridge::makeProgressCallback(
      [&observed](std::int64_t transferred, std::int64_t total, std::int64_t) {
          EXPECT_EQ(total, 30);

          observed.emplace_back(transferred);
      });

    auto result = mLoop.run([](ClientTests& test,
                               TransferBridge& transfers,
                               bridge::ProgressCallback progress,
                               std::vector<std::int64_t>& observed)
                            -> Task<ErrorOr<TransferPtr>> {
        auto result = co_await transfers.submit(
          [&test](mega::MegaApi&,
                  const char* name,
                  mega::MegaTransferListener* listener) {
              test.mEngine.post([listener, name]() {
                  for (auto transferred : {10, 20, 30})
                  {
                      FakeTransfer transfer(name, transferred, 30, 5);

                      listener->onTransferUpdate(nullptr, &transfer);
                  }

                  FakeTransfer transfer(name, 30, 30, 5);
                  mega::MegaError error(mega::MegaError::API_OK);

                  listener->onTransferFinish(nullptr, &transfer, &error);
              });
          },
          std::move(progress),
          "file.bin");

        // Every update was delivered before we were resumed.
        EXPECT_THAT(observed, ElementsAre(10, 20, 30));

        co_return result;
    }(*this, transfers, std::move(progress), observed));

    ASSERT_TRUE(result);
    EXPECT_STREQ((*result)->getFileName(), "file.bin");
}

TEST_F(ClientTests, streaming_bridge_yields_chunks)
{
    StreamingTransferBridge streams(mClient.api(), mLoop, 8);

    auto stream = streams.submit(
      [this](mega::MegaApi&,
             std::string data,
             mega::MegaTransferListener* listener) {
          mEngine.post([data, listener]() mutable {
              FakeTransfer transfer("file.bin", 10, 10, 0);
              mega::MegaError error(mega::MegaError::API_OK);

              EXPECT_TRUE(listener->onTransferData(nullptr,
                                                   &transfer,
                                                   data.data(),
                                                   data.size()));

              listener->onTransferFinish(nullptr, &transfer, &error);
          });
      },
      4,
      nullptr,
      std::string("0123456789"));

    std::vector<std::string> chunks;

    auto result = mLoop.run(drain(stream, chunks));

    EXPECT_TRUE(result.ok());
    EXPECT_THAT(chunks, ElementsAre("0123", "4567", "89"));
}

TEST_F(ClientTests, streaming_bridge_reports_failure_after_data)
{
    StreamingTransferBridge streams(mClient.api(), mLoop, 8);

    auto stream = streams.submit(
      [this](mega::MegaApi&, mega::MegaTransferListener* listener) {
          mEngine.post([listener]() {
              std::string data = "0123";
              FakeTransfer transfer("file.bin", 4, 10, 0);
              mega::MegaError error(1);

              EXPECT_TRUE(listener->onTransferData(nullptr,
                                                   &transfer,
                                                   data.data(),
                                                   data.size()));

              listener->onTransferFinish(nullptr, &transfer, &error);
          });
      },
      4,
      nullptr);

    std::vector<std::string> chunks;

    auto result = mLoop.run(drain(stream, chunks));

    EXPECT_THAT(chunks, ElementsAre("0123"));
    EXPECT_EQ(result.kind(), EK_TRANSFER_FAILED);
    EXPECT_EQ(result.code(), 1);
    EXPECT_EQ(result.message(), mega::MegaError::getErrorString(1));
}

TEST(NodeIdTests, unresolved_identifiers_are_not_found)
{
    auto error = notFound(NodeId(mega::MegaHandle(42)));

    EXPECT_EQ(error.kind(), EK_NODE_NOT_FOUND);
    EXPECT_EQ(error.code(), mega::MegaError::API_ENOENT);
    EXPECT_EQ(error.message(), "The node with the handle 42 doesn't exist anymore");

    error = notFound(NodeId(std::string("/a/b")));

    EXPECT_EQ(error.kind(), EK_NODE_NOT_FOUND);
    EXPECT_EQ(error.message(), "The node with path /a/b doesn't exist anymore");
}

TEST(NodeIdTests, validates_identifier)
{
    EXPECT_TRUE(validate(NodeId(mega::MegaHandle(7))).ok());
    EXPECT_TRUE(validate(NodeId(std::string("/a"))).ok());
    EXPECT_TRUE(validate(NodeId(NodePtr(std::make_shared<FakeNode>(9)))).ok());

    EXPECT_EQ(validate(NodeId(mega::INVALID_HANDLE)).kind(), EK_INVALID_ARGUMENT);
    EXPECT_EQ(validate(NodeId(std::string())).kind(), EK_INVALID_ARGUMENT);
    EXPECT_EQ(validate(NodeId(NodePtr())).kind(), EK_INVALID_ARGUMENT);
}

TEST(NodeIdTests, describes_identifier)
{
    EXPECT_EQ(toString(NodeId(mega::MegaHandle(7))), "handle 7");
    EXPECT_EQ(toString(NodeId(std::string("/a/b"))), "path /a/b");
    EXPECT_EQ(toString(NodeId(NodePtr())), "null node");
    EXPECT_EQ(toString(NodeId(NodePtr(std::make_shared<FakeNode>(9)))), "node 9");
}

} // testing
} // aiomega

