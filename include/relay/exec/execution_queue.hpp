#pragma once

/// @file execution_queue.hpp
/// @brief Worker pool and per-instance serialized execution queues
///
/// Every instance owns exactly one ExecutionQueue. Tasks posted to it run
/// one at a time in posting order on some worker of the shared Executor,
/// so script callbacks never observe concurrent mutation of their state.

#include <relay/core/error.hpp>

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relay_exec {

// =============================================================================
// Executor
// =============================================================================

/// Process-wide worker threads that drain all instance queues
class Executor {
public:
    explicit Executor(std::size_t workers);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    [[nodiscard]] boost::asio::thread_pool& pool() { return m_pool; }
    [[nodiscard]] std::size_t worker_count() const { return m_workers; }

    /// Let queued work finish and join the workers
    void shutdown();

private:
    std::size_t m_workers;
    boost::asio::thread_pool m_pool;
    std::atomic<bool> m_joined{false};
};

// =============================================================================
// Queue Statistics
// =============================================================================

struct QueueStats {
    std::uint64_t tasks_posted = 0;
    std::uint64_t tasks_run = 0;
    std::uint64_t tasks_failed = 0;
    std::uint64_t tasks_dropped = 0;
};

// =============================================================================
// ExecutionQueue
// =============================================================================

/// Single-threaded FIFO queue layered on an asio strand
class ExecutionQueue : public std::enable_shared_from_this<ExecutionQueue> {
public:
    using Task = std::function<void()>;
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    /// Create a queue on the executor
    /// @return OutOfMemory error if the queue cannot be allocated
    static relay_core::Result<std::shared_ptr<ExecutionQueue>> create(Executor& executor, std::string name);

    ExecutionQueue(Strand strand, std::string name);

    ExecutionQueue(const ExecutionQueue&) = delete;
    ExecutionQueue& operator=(const ExecutionQueue&) = delete;

    /// Queue name (the owning instance id)
    [[nodiscard]] const std::string& name() const { return m_name; }

    /// Enqueue a task; exceptions escaping it are logged and contained
    /// @return false if the queue is closed and the task was dropped
    bool post(Task task);

    /// Block until every task posted before this call has run
    /// @return InvalidState when called from the queue itself, Timeout when
    ///         the barrier did not run in time
    relay_core::Result<void> flush(std::chrono::milliseconds timeout = std::chrono::seconds(10));

    /// True while the calling thread is executing a task of this queue
    [[nodiscard]] bool running_in_this_thread() const;

    /// Stop accepting tasks; tasks already posted still run
    void close();

    [[nodiscard]] bool is_closed() const { return m_closed.load(); }

    /// Tasks posted but not yet finished
    [[nodiscard]] std::uint64_t pending() const;

    [[nodiscard]] QueueStats stats() const;

private:
    void run_task(const Task& task);

    Strand m_strand;
    std::string m_name;
    std::atomic<bool> m_closed{false};

    std::atomic<std::uint64_t> m_posted{0};
    std::atomic<std::uint64_t> m_run{0};
    std::atomic<std::uint64_t> m_failed{0};
    std::atomic<std::uint64_t> m_dropped{0};
};

} // namespace relay_exec
