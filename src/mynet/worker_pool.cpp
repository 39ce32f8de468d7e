#include <exception>
#include <utility>

#include "mycore/logging.hpp"
#include "mynet/worker_pool.hpp"

namespace ShelfHttpd::Net {
    WorkerPool::WorkerPool(std::size_t worker_count)
    : m_jobs {}, m_workers {}, m_queue_mtx {}, m_queue_cv {}, m_stopping {false} {
        m_workers.reserve(worker_count);

        for (std::size_t worker_id = 0; worker_id < worker_count; ++worker_id) {
            m_workers.emplace_back(&WorkerPool::worker_loop, this, worker_id);
        }
    }

    void WorkerPool::worker_loop(std::size_t worker_id) {
        while (true) {
            Job job;

            // 1. Hold the queue lock only while waiting for and taking the next job.
            {
                std::unique_lock queue_lock {m_queue_mtx};

                m_queue_cv.wait(queue_lock, [this] {
                    return m_stopping || !m_jobs.empty();
                });

                if (m_jobs.empty()) {
                    // Only reachable when stopping with a drained queue.
                    return;
                }

                job = std::move(m_jobs.front());
                m_jobs.pop_front();
            }

            // 2. Run the job outside the lock so other workers can dequeue meanwhile. A throwing job only costs its own connection.
            try {
                if (auto job_res = job(); !job_res) {
                    Core::log_warn("Worker {}: {}", worker_id, job_res.error().message);
                }
            } catch (const std::exception& job_err) {
                Core::log_error("Worker {}: job threw: {}", worker_id, job_err.what());
            }
        }
    }

    auto WorkerPool::create(std::size_t worker_count) -> Core::Result<std::unique_ptr<WorkerPool>> {
        if (worker_count < 1) {
            return Core::make_error(Core::ErrorKind::invalid, "Worker pool needs at least one worker");
        }

        return std::unique_ptr<WorkerPool> {new WorkerPool {worker_count}};
    }

    WorkerPool::~WorkerPool() {
        {
            std::lock_guard queue_lock {m_queue_mtx};
            m_stopping = true;
        }

        m_queue_cv.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    void WorkerPool::submit(Job job) {
        {
            std::lock_guard queue_lock {m_queue_mtx};
            m_jobs.push_back(std::move(job));
        }

        m_queue_cv.notify_one();
    }

    auto WorkerPool::worker_count() const noexcept -> std::size_t {
        return m_workers.size();
    }
}
