#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <aiomega/bridge/execute.h>
#include <aiomega/bridge/logger.h>
#include <aiomega/bridge/progress_callback.h>
#include <aiomega/bridge/transfer_operation.h>
#include <aiomega/common/cross_thread_signal.h>
#include <aiomega/common/error.h>
#include <aiomega/common/event_loop.h>

#include <engine_thread.h>
#include <mock_log_output.h>

namespace aiomega
{
namespace testing
{

using namespace bridge;
using namespace common;

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::NiceMock;

using Transfer = TransferOperation<std::string>;

// Records the progress reported to a callback.
struct ProgressRecorder
{
    // Progress observed when a callback began executing.
    std::vector<std::int64_t> mStarted;

    // Progress observed when a callback completed.
    std::vector<std::int64_t> mFinished;

    // Callbacks wait for this before completing.
    std::unique_ptr<CrossThreadSignal> mGate;
}; // ProgressRecorder

class TransferOperationTests
  : public ::testing::Test
{
public:
    TransferOperationTests()
      : Test()
      , mLoop()
      , mEngine()
    {
    }

    // Report progress for each step and then complete the transfer.
    Task<ErrorOr<std::string>> transfer(ProgressCallback progress,
                                        std::vector<std::int64_t> steps,
                                        int code = ENGINE_OK,
                                        std::string message = std::string())
    {
        auto operation = std::make_shared<Transfer>(mLoop,
                                                    bridge::logger(),
                                                    std::move(progress));

        return execute(operation, [=, this](Transfer&) {
            mEngine.post([=]() {
                for (auto step : steps)
                    EXPECT_TRUE(operation->progress({step, steps.back(), 1024}));

                EXPECT_TRUE(operation->complete("done", code, message));
            });
        });
    }

    EventLoop mLoop;
    EngineThread mEngine;
}; // TransferOperationTests

TEST_F(TransferOperationTests, progress_precedes_completion)
{
    std::vector<std::int64_t> observed;

    auto progress = makeProgressCallback(
      [](std::int64_t transferred,
         std::int64_t total,
         std::int64_t speed,
         std::vector<std::int64_t>* observed) {
          EXPECT_EQ(total, 5);
          EXPECT_EQ(speed, 1024);

          observed->emplace_back(transferred);
      },
      &observed);

    EXPECT_FALSE(progress.suspending());

    auto result = mLoop.run([](TransferOperationTests& test,
                               ProgressCallback progress,
                               std::vector<std::int64_t>& observed)
                            -> Task<ErrorOr<std::string>> {
        std::vector<std::int64_t> steps{1, 2, 3, 4, 5};

        auto result = co_await test.transfer(std::move(progress), std::move(steps));

        // Every notification was delivered before we were resumed.
        EXPECT_THAT(observed, ElementsAre(1, 2, 3, 4, 5));

        co_return result;
    }(*this, std::move(progress), observed));

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "done");
}

TEST_F(TransferOperationTests, failure_is_reported_after_progress)
{
    std::vector<std::int64_t> observed;

    auto progress = makeProgressCallback(
      [&observed](std::int64_t transferred, std::int64_t, std::int64_t) {
          observed.emplace_back(transferred);
      });

    auto result = mLoop.run(transfer(std::move(progress), {10, 20}, 1, "access denied"));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), EK_TRANSFER_FAILED);
    EXPECT_EQ(result.error().code(), 1);
    EXPECT_EQ(result.error().message(), "access denied");
    EXPECT_THAT(observed, ElementsAre(10, 20));
}

TEST_F(TransferOperationTests, overlapping_suspending_callbacks)
{
    ProgressRecorder recorder;

    recorder.mGate = std::make_unique<CrossThreadSignal>(mLoop);

    auto progress = makeProgressCallback(
      [](std::int64_t transferred,
         std::int64_t,
         std::int64_t,
         ProgressRecorder* recorder) -> Task<void> {
          recorder->mStarted.emplace_back(transferred);

          co_await recorder->mGate->wait();

          recorder->mFinished.emplace_back(transferred);
      },
      &recorder);

    EXPECT_TRUE(progress.suspending());

    auto result = mLoop.run([](TransferOperationTests& test,
                               ProgressCallback progress,
                               ProgressRecorder& recorder)
                            -> Task<ErrorOr<std::string>> {
        std::vector<std::int64_t> steps{1, 2};

        auto result = co_await test.transfer(std::move(progress), std::move(steps));

        // Both callbacks are running and neither delayed the transfer.
        EXPECT_THAT(recorder.mStarted, ElementsAre(1, 2));
        EXPECT_THAT(recorder.mFinished, IsEmpty());
        EXPECT_EQ(test.mLoop.detached(), 2u);

        recorder.mGate->set();

        while (test.mLoop.detached())
            co_await test.mLoop.yield();

        EXPECT_THAT(recorder.mFinished, ElementsAre(1, 2));

        co_return result;
    }(*this, std::move(progress), recorder));

    ASSERT_TRUE(result);
}

TEST_F(TransferOperationTests, failing_callbacks_are_contained)
{
    auto direct = makeProgressCallback(
      [](std::int64_t, std::int64_t, std::int64_t) {
          throw std::runtime_error("direct");
      });

    auto result = mLoop.run(transfer(std::move(direct), {1, 2}));

    ASSERT_TRUE(result);

    auto suspending = makeProgressCallback(
      [](std::int64_t, std::int64_t, std::int64_t) -> Task<void> {
          throw std::runtime_error("suspending");

          co_return;
      });

    result = mLoop.run(transfer(std::move(suspending), {1, 2}));

    ASSERT_TRUE(result);
    EXPECT_EQ(mLoop.detached(), 0u);
}

TEST_F(TransferOperationTests, callbacks_throwing_non_exceptions_are_contained)
{
    std::vector<std::int64_t> observed;

    auto direct = makeProgressCallback(
      [&observed](std::int64_t transferred, std::int64_t, std::int64_t) {
          observed.emplace_back(transferred);

          throw 42;
      });

    auto result = mLoop.run(transfer(std::move(direct), {1, 2}));

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "done");
    EXPECT_THAT(observed, ElementsAre(1, 2));

    auto suspending = makeProgressCallback(
      [](std::int64_t, std::int64_t, std::int64_t) -> Task<void> {
          throw 42;

          co_return;
      });

    result = mLoop.run(transfer(std::move(suspending), {1, 2}));

    ASSERT_TRUE(result);
    EXPECT_EQ(mLoop.detached(), 0u);

    // The loop remains usable.
    result = mLoop.run(transfer(nullptr, {1}));

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "done");
}

TEST_F(TransferOperationTests, progress_is_logged_at_info_level)
{
    NiceMock<MockLogOutput> output;
    ScopedLogOutput scope(output, logInfo);

    EXPECT_CALL(output, log(_, _, _, _)).Times(AnyNumber());

    EXPECT_CALL(output,
                log(_,
                    logInfo,
                    _,
                    HasSubstr("Transfer progress: 2 KB of 4 KB, 1 KB/s")));

    auto result = mLoop.run(transfer(nullptr, {2048, 4096}));

    ASSERT_TRUE(result);
}

TEST_F(TransferOperationTests, progress_after_completion_is_ignored)
{
    std::vector<std::int64_t> observed;

    auto operation = std::make_shared<Transfer>(mLoop,
                                                bridge::logger(),
                                                makeProgressCallback(
      [&observed](std::int64_t transferred, std::int64_t, std::int64_t) {
          observed.emplace_back(transferred);
      }));

    EXPECT_TRUE(operation->progress({1, 2, 0}));
    EXPECT_TRUE(operation->complete("done", ENGINE_OK, ""));
    EXPECT_FALSE(operation->progress({2, 2, 0}));

    auto result = mLoop.run(operation->result());

    ASSERT_TRUE(result);
    EXPECT_THAT(observed, ElementsAre(1));
}

TEST_F(TransferOperationTests, no_callback)
{
    auto result = mLoop.run(transfer(nullptr, {1, 2, 3}));

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, "done");
}

} // testing
} // aiomega

