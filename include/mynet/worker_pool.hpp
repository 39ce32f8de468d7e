#ifndef SHELF_HTTPD_MYNET_WORKER_POOL_HPP
#define SHELF_HTTPD_MYNET_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "mycore/errors.hpp"

namespace ShelfHttpd::Net {
    /// NOTE: One connection's full request / response cycle. A job is queued once and run once.
    using Job = std::move_only_function<Core::Result<void>()>;

    /**
     * @brief A fixed set of long-lived worker threads that drain a shared, unbounded FIFO job queue.
     * @note `submit` never waits for a free worker. A failed job is logged and the worker moves on to the next one.
     */
    class WorkerPool {
    private:
        std::deque<Job> m_jobs;
        std::vector<std::thread> m_workers;
        std::mutex m_queue_mtx;
        std::condition_variable m_queue_cv;
        bool m_stopping;

        explicit WorkerPool(std::size_t worker_count);

        void worker_loop(std::size_t worker_id);

    public:
        /// NOTE: Zero workers is `Core::ErrorKind::invalid`.
        [[nodiscard]] static auto create(std::size_t worker_count) -> Core::Result<std::unique_ptr<WorkerPool>>;

        /// NOTE: Lets the workers finish every queued job, then joins them.
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        void submit(Job job);

        [[nodiscard]] auto worker_count() const noexcept -> std::size_t;
    };
}

#endif
