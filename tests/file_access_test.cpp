#include <catch2/catch_test_macros.hpp>

#include "iflow/protocol/file_access.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace iflow;
namespace fs = std::filesystem;

namespace {

/// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("iflowpp_" + name))
    {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

    fs::path write(const std::string& name, const std::string& content) const {
        const auto file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

std::string read_back(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

TEST_CASE("FileAccessHandler advertises capabilities from its config", "[fs]") {
    REQUIRE(FileAccessHandler{}.capabilities() == Json{{"readTextFile", false}, {"writeTextFile", false}});

    FileAccessConfig enabled;
    enabled.with_enabled(true);
    REQUIRE(FileAccessHandler{enabled}.capabilities() == Json{{"readTextFile", true}, {"writeTextFile", true}});

    enabled.with_read_only(true);
    REQUIRE(FileAccessHandler{enabled}.capabilities() == Json{{"readTextFile", true}, {"writeTextFile", false}});
}

TEST_CASE("FileAccessHandler disabled answers method-not-found", "[fs]") {
    FileAccessHandler handler;
    const auto result = handler.read_text_file(Json{{"path", "/etc/hostname"}});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == rpc_error_code::kMethodNotFound);
}

TEST_CASE("FileAccessHandler reads whole files and line ranges", "[fs]") {
    TempDir dir("fs_read");
    const auto file = dir.write("notes.txt", "one\ntwo\nthree\nfour\n");

    FileAccessHandler handler(FileAccessConfig{}.with_enabled(true));

    SECTION("whole file") {
        const auto result = handler.read_text_file(Json{{"path", file.string()}});
        REQUIRE(result.has_value());
        REQUIRE(result->at("content") == "one\ntwo\nthree\nfour\n");
    }

    SECTION("line and limit select a window") {
        const auto result = handler.read_text_file(Json{{"path", file.string()}, {"line", 2}, {"limit", 2}});
        REQUIRE(result.has_value());
        REQUIRE(result->at("content") == "two\nthree\n");
    }

    SECTION("line alone reads to the end") {
        const auto result = handler.read_text_file(Json{{"path", file.string()}, {"line", 4}});
        REQUIRE(result.has_value());
        REQUIRE(result->at("content") == "four\n");
    }

    SECTION("missing file is an internal error") {
        const auto result = handler.read_text_file(Json{{"path", (dir.path() / "absent.txt").string()}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == rpc_error_code::kInternalError);
    }

    SECTION("missing path parameter is invalid params") {
        const auto result = handler.read_text_file(Json{{"line", 1}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == rpc_error_code::kInvalidParams);
    }
}

TEST_CASE("FileAccessHandler enforces the size limit", "[fs]") {
    TempDir dir("fs_size");
    const auto file = dir.write("big.txt", std::string(64, 'x'));

    FileAccessHandler handler(FileAccessConfig{}.with_enabled(true).with_max_size(16));

    const auto read = handler.read_text_file(Json{{"path", file.string()}});
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().code == rpc_error_code::kInvalidParams);

    const auto write = handler.write_text_file(Json{{"path", file.string()}, {"content", std::string(32, 'y')}});
    REQUIRE_FALSE(write.has_value());
    REQUIRE(read_back(file) == std::string(64, 'x'));
}

TEST_CASE("FileAccessHandler confines paths to allowed directories", "[fs]") {
    TempDir allowed("fs_allowed");
    TempDir outside("fs_outside");
    const auto inside_file = allowed.write("ok.txt", "inside");
    const auto outside_file = outside.write("secret.txt", "outside");

    FileAccessHandler handler(FileAccessConfig{}.with_enabled(true).add_allowed_dir(allowed.path().string()));

    REQUIRE(handler.is_path_allowed(inside_file));
    REQUIRE(handler.is_path_allowed(outside_file) == false);
    REQUIRE(handler.is_path_allowed(allowed.path() / ".." / "fs_outside" / "secret.txt") == false);

    const auto ok = handler.read_text_file(Json{{"path", inside_file.string()}});
    REQUIRE(ok.has_value());
    REQUIRE(ok->at("content") == "inside");

    const auto rejected = handler.read_text_file(Json{{"path", outside_file.string()}});
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error().code == rpc_error_code::kInvalidParams);
}

TEST_CASE("FileAccessHandler writes files unless read-only", "[fs]") {
    TempDir dir("fs_write");
    const auto target = dir.path() / "out.txt";

    FileAccessConfig config;
    config.with_enabled(true);

    SECTION("writable") {
        FileAccessHandler handler(config);
        const auto result = handler.write_text_file(Json{{"path", target.string()}, {"content", "written"}});
        REQUIRE(result.has_value());
        REQUIRE(result->is_null());
        REQUIRE(read_back(target) == "written");
    }

    SECTION("read-only") {
        FileAccessHandler handler(config.with_read_only(true));
        const auto result = handler.write_text_file(Json{{"path", target.string()}, {"content", "written"}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == rpc_error_code::kInvalidParams);
        REQUIRE(fs::exists(target) == false);
    }

    SECTION("missing content") {
        FileAccessHandler handler(config);
        const auto result = handler.write_text_file(Json{{"path", target.string()}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == rpc_error_code::kInvalidParams);
    }
}
