#include "iflow/client/iflow_client.hpp"
#include "iflow/log/logger.hpp"

namespace iflow {

IFlowClient::IFlowClient(IFlowOptions options)
    : IFlowClient(std::move(options), make_connection)
{}

IFlowClient::IFlowClient(IFlowOptions options, ConnectionFactory connection_factory)
    : options_(std::move(options))
    , connection_factory_(std::move(connection_factory))
    , channel_(std::make_shared<EventChannel>())
{}

IFlowClient::~IFlowClient() {
    disconnect();
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Result<void> IFlowClient::connect() {
    if (connected_.load()) {
        IFLOW_LOG_DEBUG("connect() called while already connected");
        return {};
    }

    // A disconnected client gets a fresh channel; the old one stays closed
    if (channel_->is_closed()) {
        channel_ = std::make_shared<EventChannel>();
    }

    connection_ = connection_factory_(options_, channel_);
    if (connection_ == nullptr) {
        return tl::unexpected(Error::connection("No connection available for these options"));
    }

    auto initialized = connection_->initialize(options_);
    if (initialized.has_value() == false) {
        IFLOW_LOG_ERROR("Connect failed: " + initialized.error().describe());
        connection_->close();
        connection_.reset();
        return initialized;
    }

    if (options_.logging.enabled) {
        auto logger = MessageLogger::create(options_.logging);
        if (logger.has_value()) {
            message_logger_ = std::move(*logger);
        } else {
            IFLOW_LOG_WARN("Message log disabled: " + logger.error());
        }
    }

    stopping_.store(false);
    connected_.store(true);
    IFLOW_LOG_INFO("Connected to agent");
    return {};
}

void IFlowClient::disconnect() {
    if (connected_.exchange(false) == false) {
        return;
    }

    stopping_.store(true);
    connection_->cancel();
    join_worker();

    connection_->close();
    connection_.reset();
    channel_->close();
    session_id_.reset();

    if (message_logger_ != nullptr) {
        message_logger_->flush();
    }
    IFLOW_LOG_INFO("Disconnected from agent");
}

void IFlowClient::join_worker() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Messaging
// ─────────────────────────────────────────────────────────────────────────────

Result<void> IFlowClient::send_message(std::string_view text) {
    if (connected_.load() == false) {
        return tl::unexpected(Error::not_connected());
    }

    join_worker();

    if (session_id_.has_value() == false) {
        auto session = connection_->create_session(options_);
        if (session.has_value() == false) {
            return tl::unexpected(session.error());
        }
        session_id_ = std::move(*session);
    }

    worker_ = std::thread([this, session = *session_id_, prompt = std::string(text), channel = channel_] {
        auto sent = connection_->send_message(session, prompt);
        if (sent.has_value()) {
            return;
        }
        if (stopping_.load()) {
            IFLOW_LOG_DEBUG("Prompt abandoned by disconnect: " + sent.error().message);
            return;
        }

        const Error& error = sent.error();
        IFLOW_LOG_ERROR("Prompt failed: " + error.describe());
        ErrorEvent event;
        event.code = static_cast<std::int32_t>(
            error.rpc_error.has_value() ? error.rpc_error->code : rpc_error_code::kInternalError);
        event.message = error.describe();
        if (error.rpc_error.has_value() && error.rpc_error->data.has_value()) {
            event.details = error.rpc_error->data;
        }
        channel->push(std::move(event));
    });

    return {};
}

std::optional<Event> IFlowClient::receive_message() {
    auto event = channel_->receive();
    record(event);
    return event;
}

std::optional<Event> IFlowClient::receive_message_for(std::chrono::milliseconds timeout) {
    auto event = channel_->receive_for(timeout);
    record(event);
    return event;
}

void IFlowClient::record(const std::optional<Event>& event) {
    if (event.has_value() && (message_logger_ != nullptr)) {
        message_logger_->log_event(*event);
    }
}

Result<void> IFlowClient::interrupt() {
    if (connected_.load() == false) {
        return tl::unexpected(Error::not_connected());
    }
    channel_->push(TaskFinished{std::string("interrupted")});
    IFLOW_LOG_INFO("Interrupt requested");
    return {};
}

}  // namespace iflow
