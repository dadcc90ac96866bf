#pragma once
/**
 * @file worker_pool.hpp
 * @brief Bounded thread pool for threaded handlers
 *
 */

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <stop_token>

namespace lark {

class WorkerPool
{
public:
    using Job = std::function<void(std::stop_token)>;

private:
    boost::asio::thread_pool pool_;
    std::stop_source stop_;
    std::size_t const capacity_;
    std::atomic<std::size_t> pending_ {0};
    std::atomic<bool> joined_ {false};

public:
    /**
     * @brief Construct a new Worker Pool object
     *
     * @param threads number of worker threads
     * @param capacity maximum number of queued or running jobs
     */
    WorkerPool(std::size_t threads, std::size_t capacity);
    ~WorkerPool();

    WorkerPool(WorkerPool const&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    auto operator=(WorkerPool const&) -> WorkerPool& = delete;
    auto operator=(WorkerPool&&) -> WorkerPool& = delete;

    /**
     * @brief Queue a job
     *
     * The job receives a stop token that is triggered by shutdown.
     *
     * @return false when the pool is full or shutting down
     */
    auto submit(Job job) -> bool;

    /**
     * @brief Request cancellation and wait for running jobs to finish
     *
     * Jobs that have not started yet are abandoned.
     */
    auto shutdown() -> void;

    /// @brief Stop token shared by all jobs
    auto token() const -> std::stop_token { return stop_.get_token(); }

    auto pending() const -> std::size_t { return pending_.load(); }
    auto capacity() const -> std::size_t { return capacity_; }
};

} // namespace lark
