#include "iflow/protocol/file_access.hpp"
#include "iflow/log/logger.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace iflow {

namespace fs = std::filesystem;

namespace {

fs::path normalized(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) {
        return path.lexically_normal();
    }
    return absolute;
}

bool is_within(const fs::path& candidate, const fs::path& root) {
    auto candidate_it = candidate.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++candidate_it) {
        // A trailing separator yields an empty last element
        if (root_it->empty()) {
            continue;
        }
        if ((candidate_it == candidate.end()) || (*candidate_it != *root_it)) {
            return false;
        }
    }
    return true;
}

std::string select_lines(const std::string& content, std::size_t first_line, std::optional<std::size_t> limit) {
    std::istringstream input(content);
    std::string output;
    std::string line;
    std::size_t line_number = 0;
    std::size_t emitted = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line_number < first_line) {
            continue;
        }
        if (limit.has_value() && (emitted >= *limit)) {
            break;
        }
        output += line;
        output += '\n';
        ++emitted;
    }
    return output;
}

std::optional<std::size_t> positive_field(const Json& params, const char* key) {
    const auto it = params.find(key);
    if ((it == params.end()) || (it->is_number_integer() == false)) {
        return std::nullopt;
    }
    const auto value = it->get<std::int64_t>();
    if (value <= 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

FileAccessHandler::FileAccessHandler(FileAccessConfig config)
    : config_(std::move(config))
{}

Json FileAccessHandler::capabilities() const {
    return Json{
        {"readTextFile", config_.enabled},
        {"writeTextFile", config_.enabled && (config_.read_only == false)}
    };
}

bool FileAccessHandler::is_path_allowed(const fs::path& path) const {
    if (config_.allowed_dirs.empty()) {
        return true;
    }
    const auto candidate = normalized(path);
    for (const auto& dir : config_.allowed_dirs) {
        if (is_within(candidate, normalized(dir))) {
            return true;
        }
    }
    return false;
}

tl::expected<fs::path, JsonRpcError> FileAccessHandler::resolve_path(const Json& params) const {
    if (config_.enabled == false) {
        return tl::unexpected(JsonRpcError::method_not_found("fs"));
    }
    if ((params.is_object() == false) || (params.contains("path") == false) || (params.at("path").is_string() == false)) {
        return tl::unexpected(JsonRpcError::invalid_params("Missing 'path' parameter"));
    }
    fs::path path(params.at("path").get<std::string>());
    if (is_path_allowed(path) == false) {
        IFLOW_LOG_WARN("Rejected file access outside allowed directories: " + path.string());
        return tl::unexpected(JsonRpcError::invalid_params("Path is outside the allowed directories: " + path.string()));
    }
    return path;
}

tl::expected<Json, JsonRpcError> FileAccessHandler::read_text_file(const Json& params) const {
    auto path = resolve_path(params);
    if (path.has_value() == false) {
        return tl::unexpected(path.error());
    }

    std::error_code ec;
    const auto size = fs::file_size(*path, ec);
    if (ec) {
        return tl::unexpected(JsonRpcError::internal_error(
            std::format("Cannot read {}: {}", path->string(), ec.message())));
    }
    if (size > config_.max_size) {
        return tl::unexpected(JsonRpcError::invalid_params(
            std::format("File {} is {} bytes, limit is {}", path->string(), size, config_.max_size)));
    }

    std::ifstream input(*path, std::ios::binary);
    if (input.is_open() == false) {
        return tl::unexpected(JsonRpcError::internal_error("Cannot open " + path->string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    std::string content = buffer.str();

    const auto line = positive_field(params, "line");
    const auto limit = positive_field(params, "limit");
    if (line.has_value() || limit.has_value()) {
        content = select_lines(content, line.value_or(1), limit);
    }

    IFLOW_LOG_DEBUG(std::format("Served fs/read_text_file for {} ({} bytes)", path->string(), content.size()));
    return Json{{"content", std::move(content)}};
}

tl::expected<Json, JsonRpcError> FileAccessHandler::write_text_file(const Json& params) const {
    auto path = resolve_path(params);
    if (path.has_value() == false) {
        return tl::unexpected(path.error());
    }
    if (config_.read_only) {
        return tl::unexpected(JsonRpcError::invalid_params("File access is read-only"));
    }
    if ((params.contains("content") == false) || (params.at("content").is_string() == false)) {
        return tl::unexpected(JsonRpcError::invalid_params("Missing 'content' parameter"));
    }

    const auto& content = params.at("content").get_ref<const std::string&>();
    if (content.size() > config_.max_size) {
        return tl::unexpected(JsonRpcError::invalid_params(
            std::format("Content is {} bytes, limit is {}", content.size(), config_.max_size)));
    }

    std::ofstream output(*path, std::ios::binary | std::ios::trunc);
    if (output.is_open() == false) {
        return tl::unexpected(JsonRpcError::internal_error("Cannot open " + path->string() + " for writing"));
    }
    output << content;
    output.flush();
    if (output.fail()) {
        return tl::unexpected(JsonRpcError::internal_error("Failed to write " + path->string()));
    }

    IFLOW_LOG_DEBUG(std::format("Served fs/write_text_file for {} ({} bytes)", path->string(), content.size()));
    return Json(nullptr);
}

}  // namespace iflow
