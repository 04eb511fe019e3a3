#include <algorithm>
#include <cassert>
#include <utility>

#include <aiomega/common/conduit.h>
#include <aiomega/common/event_loop.h>

namespace aiomega
{
namespace common
{

class Conduit::Context
  : public std::enable_shared_from_this<Context>
{
public:
    Context(EventLoop& loop, std::size_t capacity);

    // Move up to maximum buffered bytes into chunk.
    //
    // Returns the number of bytes moved.
    std::size_t drain(std::string& chunk, std::size_t maximum);

    // Is there anything for the reader to do?
    //
    // Caller must hold mLock.
    bool readable() const;

    // Resume the reader if it's still waiting.
    //
    // Called on the loop's thread.
    void resumeReader();

    // Schedule the reader's resumption if it's waiting.
    //
    // Caller must hold mLock.
    void wakeReader();

    // Buffered bytes.
    std::string mBuffer;

    // How many bytes may be buffered.
    const std::size_t mCapacity;

    // Where the reader is resumed.
    EventLoop& mLoop;

    // Serializes access to instance members.
    mutable std::mutex mLock;

    // Who's waiting for something to read?
    std::coroutine_handle<> mReader;

    // Has the read end been closed?
    bool mReaderClosed;

    // Has the reader's resumption been scheduled?
    bool mWakePending;

    // Signalled when space becomes available or the read end is closed.
    std::condition_variable mWritable;

    // Has the write end been closed?
    bool mWriterClosed;
}; // Context

Conduit::Context::Context(EventLoop& loop, std::size_t capacity)
  : mBuffer()
  , mCapacity(capacity)
  , mLoop(loop)
  , mLock()
  , mReader()
  , mReaderClosed(false)
  , mWakePending(false)
  , mWritable()
  , mWriterClosed(false)
{
    mBuffer.reserve(mCapacity);
}

std::size_t Conduit::Context::drain(std::string& chunk, std::size_t maximum)
{
    std::size_t count = 0;

    {
        std::lock_guard<std::mutex> guard(mLock);

        count = std::min(mBuffer.size(), maximum);

        chunk.append(mBuffer, 0, count);
        mBuffer.erase(0, count);
    }

    // Let the producer know there's space available.
    if (count)
        mWritable.notify_all();

    return count;
}

bool Conduit::Context::readable() const
{
    return !mBuffer.empty() || mReaderClosed || mWriterClosed;
}

void Conduit::Context::resumeReader()
{
    std::coroutine_handle<> reader;

    {
        std::lock_guard<std::mutex> guard(mLock);

        mWakePending = false;

        reader = std::exchange(mReader, nullptr);
    }

    // Reader's gone away.
    if (reader)
        reader.resume();
}

void Conduit::Context::wakeReader()
{
    // Reader isn't waiting or has already been woken.
    if (!mReader || mWakePending)
        return;

    mWakePending = true;

    mLoop.post([context = shared_from_this()]() {
        context->resumeReader();
    });
}

Conduit::ReadableAwaiter::ReadableAwaiter(ContextPtr context)
  : mContext(std::move(context))
  , mReader()
{
}

Conduit::ReadableAwaiter::~ReadableAwaiter()
{
    // Never suspended.
    if (!mReader)
        return;

    std::lock_guard<std::mutex> guard(mContext->mLock);

    if (mContext->mReader == mReader)
        mContext->mReader = nullptr;
}

bool Conduit::ReadableAwaiter::await_ready() const
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    return mContext->readable();
}

bool Conduit::ReadableAwaiter::await_suspend(std::coroutine_handle<> reader)
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    // Something arrived while we were getting ready to suspend.
    if (mContext->readable())
        return false;

    // Sanity.
    assert(!mContext->mReader);

    mContext->mReader = reader;

    mReader = reader;

    return true;
}

void Conduit::ReadableAwaiter::await_resume() const noexcept
{
}

Conduit::Conduit(EventLoop& loop, std::size_t capacity)
  : mContext(std::make_shared<Context>(loop, std::max<std::size_t>(capacity, 1u)))
{
}

Conduit::~Conduit()
{
    closeReader();
}

std::size_t Conduit::capacity() const
{
    return mContext->mCapacity;
}

void Conduit::closeReader()
{
    {
        std::lock_guard<std::mutex> guard(mContext->mLock);

        mContext->mReaderClosed = true;

        // Let a waiting reader know the stream has been closed.
        mContext->wakeReader();

        // Nobody's going to read these bytes.
        mContext->mBuffer.clear();
        mContext->mBuffer.shrink_to_fit();
    }

    // Release the producer.
    mContext->mWritable.notify_all();
}

bool Conduit::closeWriter()
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    if (mContext->mWriterClosed)
        return false;

    mContext->mWriterClosed = true;

    // Let the reader know it has reached the end of the stream.
    mContext->wakeReader();

    return true;
}

Task<std::string> Conduit::read(std::size_t maximum)
{
    // Sanity.
    assert(maximum);
    assert(mContext->mLoop.onLoopThread());

    // Keep our state alive even if we're destroyed while suspended.
    auto context = mContext;

    std::string chunk;

    while (chunk.size() < maximum)
    {
        // Wait for something to read.
        co_await ReadableAwaiter(context);

        // Collect whatever's available.
        if (context->drain(chunk, maximum - chunk.size()))
            continue;

        // Nothing was buffered so one of the ends must have been closed.
        break;
    }

    co_return chunk;
}

bool Conduit::readerClosed() const
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    return mContext->mReaderClosed;
}

std::size_t Conduit::size() const
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    return mContext->mBuffer.size();
}

bool Conduit::write(const void* data, std::size_t length)
{
    // Sanity.
    assert(data || !length);
    assert(!mContext->mLoop.onLoopThread());

    auto* bytes = static_cast<const char*>(data);

    std::unique_lock<std::mutex> lock(mContext->mLock);

    while (length)
    {
        // Wait for space to become available.
        mContext->mWritable.wait(lock, [&]() {
            return mContext->mReaderClosed
                   || mContext->mWriterClosed
                   || mContext->mBuffer.size() < mContext->mCapacity;
        });

        // Nobody's reading anymore.
        if (mContext->mReaderClosed || mContext->mWriterClosed)
            return false;

        auto count = std::min(length,
                              mContext->mCapacity - mContext->mBuffer.size());

        mContext->mBuffer.append(bytes, count);

        bytes += count;
        length -= count;

        // Let the reader know there's something to read.
        mContext->wakeReader();
    }

    return true;
}

bool Conduit::writerClosed() const
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    return mContext->mWriterClosed;
}

} // common
} // aiomega

