#include <utility>

#include "myapp/exchange_service.hpp"
#include "myapp/msg_task.hpp"

namespace ShelfHttpd::App {
    ExchangeService::ExchangeService(AppState& state, std::unique_ptr<Net::WorkerPool> pool)
    : m_state {state}, m_routes {make_app_routes(state)}, m_pool {std::move(pool)} {}

    auto ExchangeService::create(AppState& state, std::size_t worker_count) -> Core::Result<std::unique_ptr<ExchangeService>> {
        auto pool_result = Net::WorkerPool::create(worker_count);

        if (!pool_result) {
            return std::unexpected {std::move(pool_result.error())};
        }

        return std::unique_ptr<ExchangeService> {new ExchangeService {state, std::move(pool_result.value())}};
    }

    void ExchangeService::serve(Net::ClientHandle client) {
        m_pool->submit([client = std::move(client), this]() mutable -> Core::Result<void> {
            MsgExchangeTask exchange_task {m_routes, m_state};

            return exchange_task(client.fd());
        });
    }

    auto ExchangeService::worker_count() const noexcept -> std::size_t {
        return m_pool->worker_count();
    }
}
