/// @file execution_queue.cpp
/// @brief Executor and ExecutionQueue implementation

#include <relay/exec/execution_queue.hpp>
#include <relay/core/log.hpp>

#include <boost/asio/post.hpp>

#include <future>
#include <new>

namespace relay_exec {

// =============================================================================
// Executor
// =============================================================================

Executor::Executor(std::size_t workers)
    : m_workers(workers == 0 ? 1 : workers)
    , m_pool(m_workers)
{
    relay_core::host_logger()->debug("Executor started with {} workers", m_workers);
}

Executor::~Executor() {
    shutdown();
}

void Executor::shutdown() {
    if (m_joined.exchange(true)) {
        return;
    }
    m_pool.join();
    relay_core::host_logger()->debug("Executor joined");
}

// =============================================================================
// ExecutionQueue
// =============================================================================

relay_core::Result<std::shared_ptr<ExecutionQueue>> ExecutionQueue::create(Executor& executor, std::string name) {
    try {
        return std::make_shared<ExecutionQueue>(boost::asio::make_strand(executor.pool()), std::move(name));
    } catch (const std::bad_alloc&) {
        return relay_core::Error(relay_core::ErrorCode::OutOfMemory,
            "Cannot allocate execution queue for '" + name + "'");
    }
}

ExecutionQueue::ExecutionQueue(Strand strand, std::string name)
    : m_strand(std::move(strand))
    , m_name(std::move(name))
{
}

bool ExecutionQueue::post(Task task) {
    if (m_closed.load()) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    m_posted.fetch_add(1, std::memory_order_relaxed);
    boost::asio::post(m_strand, [self = shared_from_this(), task = std::move(task)]() {
        self->run_task(task);
    });
    return true;
}

void ExecutionQueue::run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        m_failed.fetch_add(1, std::memory_order_relaxed);
        relay_core::host_logger()->error("Task on queue '{}' threw: {}", m_name, e.what());
    } catch (...) {
        m_failed.fetch_add(1, std::memory_order_relaxed);
        relay_core::host_logger()->error("Task on queue '{}' threw a non-standard exception", m_name);
    }
    m_run.fetch_add(1, std::memory_order_relaxed);
}

relay_core::Result<void> ExecutionQueue::flush(std::chrono::milliseconds timeout) {
    if (running_in_this_thread()) {
        return relay_core::Error(relay_core::ErrorCode::InvalidState,
            "flush() called from inside queue '" + m_name + "'");
    }

    auto barrier = std::make_shared<std::promise<void>>();
    auto done = barrier->get_future();

    // Bypasses the closed check so a closing queue can still be drained
    m_posted.fetch_add(1, std::memory_order_relaxed);
    boost::asio::post(m_strand, [self = shared_from_this(), barrier]() {
        self->run_task([barrier]() { barrier->set_value(); });
    });

    if (done.wait_for(timeout) != std::future_status::ready) {
        return relay_core::Error(relay_core::ErrorCode::Timeout,
            "Queue '" + m_name + "' did not drain in time");
    }
    return relay_core::Ok();
}

bool ExecutionQueue::running_in_this_thread() const {
    return m_strand.running_in_this_thread();
}

void ExecutionQueue::close() {
    m_closed.store(true);
}

std::uint64_t ExecutionQueue::pending() const {
    return m_posted.load(std::memory_order_relaxed) - m_run.load(std::memory_order_relaxed);
}

QueueStats ExecutionQueue::stats() const {
    QueueStats s;
    s.tasks_posted = m_posted.load(std::memory_order_relaxed);
    s.tasks_run = m_run.load(std::memory_order_relaxed);
    s.tasks_failed = m_failed.load(std::memory_order_relaxed);
    s.tasks_dropped = m_dropped.load(std::memory_order_relaxed);
    return s;
}

} // namespace relay_exec
