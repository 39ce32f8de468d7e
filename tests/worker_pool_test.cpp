#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mynet/worker_pool.hpp"

using namespace ShelfHttpd;

// NOLINTNEXTLINE
TEST(worker_pool, zero_workers_is_invalid) {
    auto pool = Net::WorkerPool::create(0);

    ASSERT_FALSE(pool.has_value());
    EXPECT_EQ(pool.error().kind, Core::ErrorKind::invalid);
}

// NOLINTNEXTLINE
TEST(worker_pool, runs_every_job_exactly_once) {
    constexpr auto job_count = 200;
    std::atomic<int> run_count {0};
    std::vector<std::atomic<int>> per_job(job_count);

    {
        auto pool = Net::WorkerPool::create(4);
        ASSERT_TRUE(pool.has_value());
        EXPECT_EQ(pool.value()->worker_count(), 4U);

        for (auto job_id = 0; job_id < job_count; ++job_id) {
            pool.value()->submit([&run_count, &per_job, job_id]() -> Core::Result<void> {
                per_job[job_id].fetch_add(1);
                run_count.fetch_add(1);

                return {};
            });
        }
    }

    EXPECT_EQ(run_count.load(), job_count);

    for (const auto& job_runs : per_job) {
        EXPECT_EQ(job_runs.load(), 1);
    }
}

// NOLINTNEXTLINE
TEST(worker_pool, failed_job_does_not_stop_worker) {
    std::atomic<int> run_count {0};

    {
        auto pool = Net::WorkerPool::create(1);
        ASSERT_TRUE(pool.has_value());

        pool.value()->submit([&run_count]() -> Core::Result<void> {
            run_count.fetch_add(1);

            return Core::make_error(Core::ErrorKind::io, "client went away");
        });

        pool.value()->submit([&run_count]() -> Core::Result<void> {
            run_count.fetch_add(1);

            return {};
        });
    }

    EXPECT_EQ(run_count.load(), 2);
}

// NOLINTNEXTLINE
TEST(worker_pool, throwing_job_does_not_stop_worker) {
    std::atomic<int> run_count {0};

    {
        auto pool = Net::WorkerPool::create(1);
        ASSERT_TRUE(pool.has_value());

        pool.value()->submit([]() -> Core::Result<void> {
            throw std::runtime_error {"boom"};
        });

        pool.value()->submit([&run_count]() -> Core::Result<void> {
            run_count.fetch_add(1);

            return {};
        });
    }

    EXPECT_EQ(run_count.load(), 1);
}

// NOLINTNEXTLINE
TEST(worker_pool, single_worker_keeps_fifo_order) {
    std::mutex order_mtx;
    std::vector<int> order;

    {
        auto pool = Net::WorkerPool::create(1);
        ASSERT_TRUE(pool.has_value());

        for (auto job_id = 0; job_id < 20; ++job_id) {
            pool.value()->submit([&order_mtx, &order, job_id]() -> Core::Result<void> {
                std::lock_guard order_lock {order_mtx};
                order.push_back(job_id);

                return {};
            });
        }
    }

    ASSERT_EQ(order.size(), 20U);

    for (auto job_id = 0; job_id < 20; ++job_id) {
        EXPECT_EQ(order[job_id], job_id);
    }
}

// NOLINTNEXTLINE
TEST(worker_pool, move_only_jobs) {
    std::atomic<int> seen {0};

    {
        auto pool = Net::WorkerPool::create(2);
        ASSERT_TRUE(pool.has_value());

        auto owned = std::make_unique<int>(42);

        pool.value()->submit([owned = std::move(owned), &seen]() -> Core::Result<void> {
            seen.store(*owned);

            return {};
        });
    }

    EXPECT_EQ(seen.load(), 42);
}

// NOLINTNEXTLINE
TEST(worker_pool, jobs_run_concurrently) {
    std::atomic<int> started {0};
    std::atomic<bool> release {false};
    std::atomic<bool> saw_both {false};

    {
        auto pool = Net::WorkerPool::create(2);
        ASSERT_TRUE(pool.has_value());

        for (auto job_id = 0; job_id < 2; ++job_id) {
            pool.value()->submit([&]() -> Core::Result<void> {
                started.fetch_add(1);

                // Each job waits until both are running, which a single busy worker could never satisfy.
                while (!release.load()) {
                    if (started.load() == 2) {
                        saw_both.store(true);
                        release.store(true);
                    }

                    std::this_thread::yield();
                }

                return {};
            });
        }
    }

    EXPECT_TRUE(saw_both.load());
}
