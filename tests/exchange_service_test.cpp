#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "mynet/handles.hpp"
#include "myapp/exchange_service.hpp"
#include "myapp/state.hpp"
#include "test_support.hpp"

using namespace ShelfHttpd;

// NOLINTNEXTLINE
TEST(exchange_service, zero_workers_is_invalid) {
    Testing::ScratchDir scratch;
    App::AppState state {scratch.uploads(), scratch.templates()};

    auto service = App::ExchangeService::create(state, 0);

    ASSERT_FALSE(service.has_value());
    EXPECT_EQ(service.error().kind, Core::ErrorKind::invalid);
}

// NOLINTNEXTLINE
TEST(exchange_service, queued_exchanges_finish_after_shutdown) {
    constexpr auto connection_count = 8;

    Testing::ScratchDir scratch;
    scratch.write_file(scratch.uploads() / "a.txt", "hello");

    App::AppState state {scratch.uploads(), scratch.templates()};
    std::vector<std::unique_ptr<Testing::SocketPair>> clients;

    {
        auto service = App::ExchangeService::create(state, 1);
        ASSERT_TRUE(service.has_value());

        // One worker and several connections: most are still queued when the service is destroyed.
        for (auto conn_id = 0; conn_id < connection_count; ++conn_id) {
            auto& sockets = clients.emplace_back(std::make_unique<Testing::SocketPair>());

            sockets->send_from_client((conn_id % 2 == 0) ? "GET / HTTP/1.1\r\n\r\n" : "GET /uploads/a.txt HTTP/1.1\r\n\r\n");
            sockets->finish_client_writes();

            service.value()->serve(Net::ClientHandle {sockets->release_server()});
        }
    }

    for (const auto& sockets : clients) {
        const auto reply = sockets->drain_client();

        EXPECT_EQ(reply.substr(0, reply.find("\r\n")), "HTTP/1.1 200 OK");
    }
}
