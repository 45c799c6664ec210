#include "iflow/transport/pipe_transport.hpp"
#include "iflow/log/logger.hpp"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

namespace iflow {

namespace {

TransportError make_error(TransportError::Category category, std::string message) {
    return TransportError{category, std::move(message)};
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

PipeTransport::PipeTransport(PipeTransportConfig config)
    : config_(config)
{}

PipeTransport::~PipeTransport() {
    close();
}

TransportResult<void> PipeTransport::connect() {
    if (connected_) {
        return {};
    }
    if ((config_.read_fd == -1) || (config_.write_fd == -1)) {
        return tl::unexpected(make_error(TransportError::Category::Network, "Pipe descriptors are not available"));
    }
    // A dead agent must surface as EPIPE from write(), not terminate the client
    std::signal(SIGPIPE, SIG_IGN);
    connected_ = true;
    return {};
}

TransportResult<void> PipeTransport::close() {
    close_fd(config_.write_fd);
    close_fd(config_.read_fd);
    buffer_.clear();
    connected_ = false;
    return {};
}

bool PipeTransport::is_connected() const noexcept {
    return connected_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Sending
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> PipeTransport::send_text(std::string_view text) {
    if (connected_ == false) {
        return tl::unexpected(make_error(TransportError::Category::Network, "Pipe is not connected"));
    }

    std::string data(text);
    data += '\n';

    // Large frames may be written in several chunks
    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(config_.write_fd, ptr, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            const auto category = (errno == EPIPE) ? TransportError::Category::Closed : TransportError::Category::Network;
            return tl::unexpected(make_error(category, "Failed to write to agent: " + std::string(std::strerror(errno))));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Receiving
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<Frame> PipeTransport::receive() {
    while (true) {
        if (auto line = take_line()) {
            return Frame::text(std::move(*line));
        }
        if (auto oversized = check_line_length(); oversized.has_value() == false) {
            return tl::unexpected(oversized.error());
        }
        if (connected_ == false) {
            return tl::unexpected(make_error(TransportError::Category::Closed, "Pipe is closed"));
        }
        auto readable = wait_for_readable(config_.read_fd, -1);
        if (readable.has_value() == false) {
            return tl::unexpected(readable.error());
        }
        if (*readable == false) {
            continue;
        }
        auto filled = fill_buffer();
        if (filled.has_value() == false) {
            return tl::unexpected(filled.error());
        }
    }
}

TransportResult<std::optional<Frame>> PipeTransport::receive_with_timeout(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (auto line = take_line()) {
            return std::optional<Frame>(Frame::text(std::move(*line)));
        }
        if (auto oversized = check_line_length(); oversized.has_value() == false) {
            return tl::unexpected(oversized.error());
        }
        if (connected_ == false) {
            return tl::unexpected(make_error(TransportError::Category::Closed, "Pipe is closed"));
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::optional<Frame>{};
        }
        auto readable = wait_for_readable(config_.read_fd, static_cast<int>(remaining.count()));
        if (readable.has_value() == false) {
            return tl::unexpected(readable.error());
        }
        if (*readable == false) {
            return std::optional<Frame>{};
        }

        auto filled = fill_buffer();
        if (filled.has_value() == false) {
            return tl::unexpected(filled.error());
        }
    }
}

TransportResult<void> PipeTransport::check_line_length() {
    if (buffer_.size() > config_.max_line_length) {
        buffer_.clear();
        return tl::unexpected(make_error(TransportError::Category::Protocol, "Line from agent exceeds size limit"));
    }
    return {};
}

std::optional<std::string> PipeTransport::take_line() {
    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            return std::nullopt;
        }
        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.pop_back();
        }
        if (line.empty() == false) {
            return line;
        }
    }
}

TransportResult<void> PipeTransport::fill_buffer() {
    std::array<char, kReadChunkSize> chunk{};
    while (true) {
        const ssize_t n = ::read(config_.read_fd, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(make_error(TransportError::Category::Network,
                "Failed to read from agent: " + std::string(std::strerror(errno))));
        }
        if (n == 0) {
            connected_ = false;
            if (buffer_.empty() == false) {
                // Deliver an unterminated last line before reporting the close
                buffer_ += '\n';
                return {};
            }
            return tl::unexpected(make_error(TransportError::Category::Closed, "Agent closed its output stream"));
        }
        buffer_.append(chunk.data(), static_cast<std::size_t>(n));
        return {};
    }
}

TransportResult<bool> PipeTransport::wait_for_readable(int fd, int timeout_ms) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    while (true) {
        const int result = ::poll(&pfd, 1, timeout_ms);
        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(make_error(TransportError::Category::Network,
                "Failed waiting for agent output: " + std::string(std::strerror(errno))));
        }
        if (result == 0) {
            return false;
        }
        // POLLHUP still leaves buffered data (or EOF) to read
        if ((pfd.revents & (POLLIN | POLLHUP)) != 0) {
            return true;
        }
        if ((pfd.revents & POLLNVAL) != 0) {
            return tl::unexpected(make_error(TransportError::Category::Network,
                "Failed waiting for agent output: invalid descriptor"));
        }
        return tl::unexpected(make_error(TransportError::Category::Network,
            "Failed waiting for agent output: descriptor error"));
    }
}

}  // namespace iflow
