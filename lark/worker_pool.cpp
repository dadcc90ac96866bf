#include "lark/worker_pool.hpp"

#include "lark/logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/core/demangle.hpp>

#include <algorithm>
#include <exception>
#include <typeinfo>

namespace lark {

WorkerPool::WorkerPool(std::size_t const threads, std::size_t const capacity)
    : pool_{std::max<std::size_t>(threads, 1)}
    , capacity_{std::max<std::size_t>(capacity, 1)}
{
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

auto WorkerPool::submit(Job job) -> bool
{
    if (stop_.stop_requested()) return false;

    if (pending_.fetch_add(1) >= capacity_)
    {
        pending_--;
        return false;
    }

    boost::asio::post(pool_, [this, job = std::move(job), token = stop_.get_token()]() {
        try
        {
            job(token);
        }
        catch (std::exception const& e)
        {
            log::error("worker", boost::core::demangle(typeid(e).name()), ": ", e.what());
        }
        catch (...)
        {
            log::error("worker", "unknown exception");
        }
        pending_--;
    });
    return true;
}

auto WorkerPool::shutdown() -> void
{
    stop_.request_stop();
    if (not joined_.exchange(true))
    {
        pool_.stop();
        pool_.join();
    }
}

} // namespace lark
