#ifndef SHELF_HTTPD_MYAPP_EXCHANGE_SERVICE_HPP
#define SHELF_HTTPD_MYAPP_EXCHANGE_SERVICE_HPP

#include <cstddef>
#include <memory>

#include "mycore/errors.hpp"
#include "mynet/handles.hpp"
#include "mynet/worker_pool.hpp"
#include "myapp/routes.hpp"
#include "myapp/state.hpp"

namespace ShelfHttpd::App {
    /**
     * @brief Owns the route table and the worker pool that answers accepted connections with it.
     * @note `m_pool` is declared after `m_routes`, so destruction drains and joins the workers before the routes go away.
     */
    class ExchangeService {
    private:
        const AppState& m_state;
        Routes m_routes;
        std::unique_ptr<Net::WorkerPool> m_pool;

        ExchangeService(AppState& state, std::unique_ptr<Net::WorkerPool> pool);

    public:
        /// NOTE: `state` must outlive the service. Zero workers is `Core::ErrorKind::invalid`.
        [[nodiscard]] static auto create(AppState& state, std::size_t worker_count) -> Core::Result<std::unique_ptr<ExchangeService>>;

        ExchangeService(const ExchangeService&) = delete;
        ExchangeService& operator=(const ExchangeService&) = delete;

        /// NOTE: Queues one exchange on `client`, which is closed once its reply is written.
        void serve(Net::ClientHandle client);

        [[nodiscard]] auto worker_count() const noexcept -> std::size_t;
    };
}

#endif
