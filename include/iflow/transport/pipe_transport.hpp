#pragma once

// Platform check - PipeTransport requires POSIX APIs
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "PipeTransport is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "iflow/transport.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace iflow {

struct PipeTransportConfig {
    int read_fd{-1};    ///< Agent's stdout
    int write_fd{-1};   ///< Agent's stdin
    std::size_t max_line_length{16 * 1024 * 1024};
};

// ═══════════════════════════════════════════════════════════════════════════
// Pipe Transport
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited text frames over a pair of file descriptors, normally the
// piped stdio of a spawned agent. Takes ownership of both descriptors.

class PipeTransport final : public ITransport {
public:
    explicit PipeTransport(PipeTransportConfig config);
    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;
    PipeTransport(PipeTransport&&) = delete;
    PipeTransport& operator=(PipeTransport&&) = delete;

    [[nodiscard]] TransportResult<void> connect() override;
    [[nodiscard]] TransportResult<void> send_text(std::string_view text) override;
    [[nodiscard]] TransportResult<Frame> receive() override;
    [[nodiscard]] TransportResult<std::optional<Frame>> receive_with_timeout(std::chrono::milliseconds timeout) override;
    TransportResult<void> close() override;
    [[nodiscard]] bool is_connected() const noexcept override;

private:
    /// Pop one complete non-empty line from the buffer, if any.
    [[nodiscard]] std::optional<std::string> take_line();

    /// Read whatever is available into the buffer.
    [[nodiscard]] TransportResult<void> fill_buffer();

    /// Drop an unterminated line that has grown past max_line_length.
    [[nodiscard]] TransportResult<void> check_line_length();

    /// Wait for read_fd to be readable: true when readable, false when the
    /// timeout elapsed. -1 timeout blocks indefinitely.
    [[nodiscard]] static TransportResult<bool> wait_for_readable(int fd, int timeout_ms);

    PipeTransportConfig config_;
    bool connected_{false};
    std::string buffer_;

    static constexpr std::size_t kReadChunkSize = 8192;
};

}  // namespace iflow
