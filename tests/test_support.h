// Shared helpers for hubcache tests: temp dirs, env restoration, in-process HTTP servers.
#pragma once

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hubcache::test {

using namespace std::chrono_literals;

class TempDir {
public:
    explicit TempDir(const std::string& prefix = "hubcache-test") {
        auto base = std::filesystem::temp_directory_path();
        path = base / (prefix + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::filesystem::path path;
};

class EnvGuard {
public:
    explicit EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline void wait_for_server(httplib::Server& server, std::chrono::milliseconds timeout) {
    const auto start = std::chrono::steady_clock::now();
    while (!server.is_running()) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            FAIL() << "Server failed to start within timeout";
        }
        std::this_thread::sleep_for(10ms);
    }
}

// Runs an httplib::Server on an ephemeral localhost port for the lifetime of the object.
// Register handlers on `server` before calling start().
class LocalServer {
public:
    ~LocalServer() { stop(); }

    void start() {
        port_ = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server.listen_after_bind(); });
        wait_for_server(server, 5s);
    }

    void stop() {
        if (thread_.joinable()) {
            server.stop();
            thread_.join();
        }
    }

    int port() const { return port_; }
    std::string url(const std::string& path = "") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    httplib::Server server;

private:
    int port_{0};
    std::thread thread_;
};

}  // namespace hubcache::test
