#ifndef IFLOW_TESTS_MOCKS_MOCK_CONNECTION_HPP
#define IFLOW_TESTS_MOCKS_MOCK_CONNECTION_HPP

#include "iflow/connection/protocol_connection.hpp"
#include "mocks/mock_transport.hpp"

#include <atomic>
#include <memory>

namespace iflow::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockConnection - The real connection logic over a scripted transport
// ─────────────────────────────────────────────────────────────────────────────

class MockConnection final : public ProtocolConnection {
public:
    MockConnection(std::shared_ptr<EventChannel> events, std::shared_ptr<MockScript> script)
        : ProtocolConnection(std::move(events))
        , script_(std::move(script))
    {}

    ~MockConnection() override {
        close();
    }

    Result<void> initialize(const IFlowOptions& options) override {
        return run_handshake(std::make_unique<MockTransport>(script_), options, false);
    }

    void close() override {
        close_protocol();
    }

private:
    std::shared_ptr<MockScript> script_;
};

/// ConnectionFactory over `script`; counts the connections it creates.
inline ConnectionFactory mock_connection_factory(
    std::shared_ptr<MockScript> script,
    std::shared_ptr<std::atomic<int>> created = std::make_shared<std::atomic<int>>(0)
) {
    return [script, created](const IFlowOptions& /*options*/, std::shared_ptr<EventChannel> events)
        -> std::unique_ptr<IConnection> {
        ++*created;
        return std::make_unique<MockConnection>(std::move(events), script);
    };
}

}  // namespace iflow::testing

#endif  // IFLOW_TESTS_MOCKS_MOCK_CONNECTION_HPP
