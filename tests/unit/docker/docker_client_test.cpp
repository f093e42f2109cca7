/**
 * libcurl client behaviour against unusable hosts and a scripted unix-socket
 * responder standing in for the daemon.
 */

#include <gtest/gtest.h>
#include <flocker/docker/docker_client.h>

#include "../../common/test_env.h"

#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace flocker;
using namespace flocker::docker;
using namespace std::chrono_literals;

namespace {

DockerClientConfig configFor(const std::string& host) {
    DockerClientConfig config;
    config.host = host;
    config.connectTimeout = 500ms;
    config.requestTimeout = 2000ms;
    return config;
}

/**
 * Minimal HTTP responder on a unix socket. Answers one request per connection
 * with the next scripted status and records each request line.
 */
class ScriptedDaemon {
public:
    ScriptedDaemon(const std::filesystem::path& socketPath, std::vector<int> statuses)
        : statuses_(std::move(statuses)) {
        fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);
        listening_ = fd_ >= 0 &&
                     ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                     ::listen(fd_, 4) == 0;
        if (listening_)
            worker_ = std::thread([this] { serve(); });
    }

    ~ScriptedDaemon() {
        if (worker_.joinable())
            worker_.join();
        if (fd_ >= 0)
            ::close(fd_);
    }

    ScriptedDaemon(const ScriptedDaemon&) = delete;
    ScriptedDaemon& operator=(const ScriptedDaemon&) = delete;

    bool listening() const { return listening_; }

    std::vector<std::string> requestLines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    static const char* reason(int status) {
        switch (status) {
            case 204: return "No Content";
            case 304: return "Not Modified";
            case 404: return "Not Found";
            default: return "Status";
        }
    }

    void serve() {
        for (int status : statuses_) {
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 5000) <= 0)
                return;
            int conn = ::accept(fd_, nullptr, nullptr);
            if (conn < 0)
                return;

            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                auto n = ::recv(conn, buf, sizeof(buf), 0);
                if (n <= 0)
                    break;
                request.append(buf, static_cast<size_t>(n));
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request.substr(0, request.find("\r\n")));
            }

            std::string body = status == 404 ? R"({"message":"No such container: abc"})" : "";
            std::string response = "HTTP/1.1 " + std::to_string(status) + " " + reason(status) +
                                   "\r\nContent-Type: application/json\r\nContent-Length: " +
                                   std::to_string(body.size()) +
                                   "\r\nConnection: close\r\n\r\n" + body;
            ::send(conn, response.data(), response.size(), MSG_NOSIGNAL);
            ::close(conn);
        }
    }

    int fd_{-1};
    bool listening_{false};
    std::vector<int> statuses_;
    std::thread worker_;
    std::mutex mutex_;
    std::vector<std::string> requests_;
};

} // namespace

TEST(DockerClientTest, UnsupportedHostSchemeIsInvalidArgument) {
    auto client = makeDockerClient(configFor("ftp://docker.example"));
    auto list = client->listContainers(true);
    ASSERT_FALSE(list);
    EXPECT_EQ(list.error().code, ErrorCode::InvalidArgument);

    auto pull = client->pullImage(ImageReference::parse("fluree/server").value(), {});
    ASSERT_FALSE(pull);
    EXPECT_EQ(pull.error().code, ErrorCode::InvalidArgument);
}

TEST(DockerClientTest, MissingSocketIsDaemonUnreachable) {
    flocker::test::TempDir dir("flocker_sock");
    auto client = makeDockerClient(configFor("unix://" + (dir.path() / "docker.sock").string()));

    auto inspect = client->inspectContainer("abc");
    ASSERT_FALSE(inspect);
    EXPECT_EQ(inspect.error().code, ErrorCode::DaemonUnreachable);

    auto stats = client->streamStats("abc");
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::DaemonUnreachable);
}

TEST(DockerClientTest, StoppingTwiceSucceedsBothTimes) {
    flocker::test::TempDir dir("flocker_sock");
    auto socketPath = dir.path() / "docker.sock";
    ScriptedDaemon daemon(socketPath, {204, 304});
    ASSERT_TRUE(daemon.listening());

    auto client = makeDockerClient(configFor("unix://" + socketPath.string()));
    EXPECT_TRUE(client->stopContainer("abc", 10s));
    EXPECT_TRUE(client->stopContainer("abc", 10s));

    auto lines = daemon.requestLines();
    ASSERT_EQ(lines.size(), 2u);
    for (const auto& line : lines) {
        EXPECT_EQ(line.rfind("POST /", 0), 0u) << line;
        EXPECT_NE(line.find("/containers/abc/stop?t=10"), std::string::npos) << line;
    }
}

TEST(DockerClientTest, StoppingRemovedContainerIsNotFound) {
    flocker::test::TempDir dir("flocker_sock");
    auto socketPath = dir.path() / "docker.sock";
    ScriptedDaemon daemon(socketPath, {404});
    ASSERT_TRUE(daemon.listening());

    auto client = makeDockerClient(configFor("unix://" + socketPath.string()));
    auto stopped = client->stopContainer("abc", 1s);
    ASSERT_FALSE(stopped);
    EXPECT_EQ(stopped.error().code, ErrorCode::NotFound);
}
