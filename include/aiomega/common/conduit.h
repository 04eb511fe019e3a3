#pragma once

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <aiomega/common/event_loop_forward.h>
#include <aiomega/common/task.h>

namespace aiomega
{
namespace common
{

// A bounded byte buffer connecting a producer thread to a consumer
// coroutine.
//
// The producer blocks while the buffer is full. The consumer suspends
// while the buffer is empty and is woken through its event loop.
class Conduit
{
    // State shared with wake-ups that are still in flight.
    class Context;

    using ContextPtr = std::shared_ptr<Context>;

    // Suspends the consumer until there's something to read.
    class ReadableAwaiter
    {
        ContextPtr mContext;

        // Who's waiting for something to read?
        std::coroutine_handle<> mReader;

    public:
        explicit ReadableAwaiter(ContextPtr context);

        ReadableAwaiter(const ReadableAwaiter& other) = delete;

        // Forgets the reader if it was destroyed before being resumed.
        ~ReadableAwaiter();

        ReadableAwaiter& operator=(const ReadableAwaiter& rhs) = delete;

        bool await_ready() const;

        bool await_suspend(std::coroutine_handle<> reader);

        void await_resume() const noexcept;
    }; // ReadableAwaiter

    ContextPtr mContext;

public:
    Conduit(EventLoop& loop, std::size_t capacity);

    Conduit(const Conduit& other) = delete;

    // Closes the read end.
    ~Conduit();

    Conduit& operator=(const Conduit& rhs) = delete;

    // How many bytes can the conduit buffer?
    std::size_t capacity() const;

    // Close the read end.
    //
    // Discards anything buffered and releases a blocked producer.
    void closeReader();

    // Close the write end.
    //
    // Returns false if the write end had already been closed.
    bool closeWriter();

    // Read up to maximum bytes.
    //
    // Only returns fewer than maximum bytes when the write end has been
    // closed. An empty result means the conduit has been drained.
    //
    // Must be called on the loop's thread.
    Task<std::string> read(std::size_t maximum);

    // Has the read end been closed?
    bool readerClosed() const;

    // How many bytes are currently buffered?
    std::size_t size() const;

    // Write length bytes, blocking while the conduit is full.
    //
    // Returns false if the read or write end was closed before every
    // byte could be written.
    //
    // Must not be called on the loop's thread.
    bool write(const void* data, std::size_t length);

    // Has the write end been closed?
    bool writerClosed() const;
}; // Conduit

} // common
} // aiomega

