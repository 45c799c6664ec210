#pragma once

#include "iflow/client/event_channel.hpp"
#include "iflow/protocol/file_access.hpp"
#include "iflow/protocol/json_rpc.hpp"
#include "iflow/protocol/permission.hpp"
#include "iflow/transport.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace iflow {

// Server -> client methods
inline constexpr std::string_view kMethodSessionUpdate{"session/update"};
inline constexpr std::string_view kMethodRequestPermission{"session/request_permission"};

/// Placeholder text when a chunk's content carries no text
inline constexpr std::string_view kUnknownText{"<unknown>"};

// ═══════════════════════════════════════════════════════════════════════════
// NotificationDispatcher
// ═══════════════════════════════════════════════════════════════════════════
// Turns server-initiated calls into Domain Events and writes the synchronous
// replies some of them require. A malformed payload is logged and recovered
// with defaults; only transport failures are reported to the caller.

class NotificationDispatcher {
public:
    NotificationDispatcher(
        std::shared_ptr<EventChannel> events,
        PermissionMode permission_mode,
        FileAccessConfig file_access = {}
    );

    /// Handle one server call, replying through `transport` where required.
    [[nodiscard]] TransportResult<void> dispatch(const ServerCallFrame& call, ITransport& transport);

    /// A response nobody is waiting for (stale, duplicate, or foreign id).
    void route_unmatched_response(const ResponseFrame& response);

    [[nodiscard]] PermissionMode permission_mode() const noexcept { return permission_mode_; }
    void set_permission_mode(PermissionMode mode) noexcept { permission_mode_ = mode; }

    [[nodiscard]] const FileAccessHandler& file_access() const noexcept { return file_access_; }

    [[nodiscard]] std::size_t unmatched_responses() const noexcept { return unmatched_responses_; }

private:
    using CallHandler = TransportResult<void> (NotificationDispatcher::*)(const ServerCallFrame&, ITransport&);

    TransportResult<void> handle_session_update(const ServerCallFrame& call, ITransport& transport);
    TransportResult<void> handle_permission_request(const ServerCallFrame& call, ITransport& transport);
    TransportResult<void> handle_read_text_file(const ServerCallFrame& call, ITransport& transport);
    TransportResult<void> handle_write_text_file(const ServerCallFrame& call, ITransport& transport);

    TransportResult<void> reply(ITransport& transport, const Json& id, const tl::expected<Json, JsonRpcError>& outcome);

    void emit(Event event);

    std::shared_ptr<EventChannel> events_;
    PermissionMode permission_mode_;
    FileAccessHandler file_access_;
    std::size_t unmatched_responses_{0};
};

}  // namespace iflow
