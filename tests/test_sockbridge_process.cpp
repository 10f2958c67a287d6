#include <gtest/gtest.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <optional>
#include <string>
#include <vector>

#include "socket_test_helpers.hpp"

#ifndef SOCKBRIDGE_BINARY_PATH
#error "SOCKBRIDGE_BINARY_PATH must point at the built sockbridge executable"
#endif

using namespace testing_support;

// Runs the real binary in a child process.
class BridgeProcess {
    private:
        pid_t pid_ = -1;
        bool running_ = false;
        std::optional<int> exit_status_;

    public:
        ~BridgeProcess() {
            stop();
        }

        bool start(const std::vector<std::string>& extra_args) {
            if (running_) return false;

            std::vector<std::string> args{SOCKBRIDGE_BINARY_PATH};
            args.insert(args.end(), extra_args.begin(), extra_args.end());
            std::vector<char*> argv;
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);

            pid_ = fork();
            if (pid_ == 0) {
                int null_fd = open("/dev/null", O_WRONLY);
                if (null_fd >= 0) {
                    dup2(null_fd, STDERR_FILENO);
                    dup2(null_fd, STDOUT_FILENO);
                    close(null_fd);
                }
                execv(argv[0], argv.data());
                _exit(127);
            }
            running_ = pid_ > 0;
            return running_;
        }

        // Waits for the child to exit on its own; returns its exit code.
        std::optional<int> wait_exit(std::chrono::milliseconds timeout = 5000ms) {
            if (exit_status_) return exit_status_;
            if (!running_) return std::nullopt;
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline) {
                int status = 0;
                if (waitpid(pid_, &status, WNOHANG) == pid_) {
                    running_ = false;
                    exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
                    return exit_status_;
                }
                std::this_thread::sleep_for(10ms);
            }
            return std::nullopt;
        }

        std::optional<int> terminate() {
            if (!running_) return exit_status_;
            kill(pid_, SIGTERM);
            return wait_exit();
        }

        void stop() {
            if (running_ && !terminate()) {
                kill(pid_, SIGKILL);
                waitpid(pid_, nullptr, 0);
                running_ = false;
            }
        }
};

namespace {
    uint16_t free_port() {
        auto probe = sockbridge::net::Listener::open(sockbridge::core::EndpointKind::Network, "127.0.0.1:0");
        return probe->local_port();
    }

    bool connect_with_retry(TestClient& client, uint16_t port, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (client.connect_tcp(port)) return true;
            std::this_thread::sleep_for(20ms);
        }
        return false;
    }
}

TEST(SockBridgeProcessTest, NoArgumentsIsFatal) {
    BridgeProcess proc;
    ASSERT_TRUE(proc.start({}));
    auto code = proc.wait_exit();
    ASSERT_TRUE(code.has_value());
    EXPECT_NE(*code, 0);
}

TEST(SockBridgeProcessTest, MissingTargetIsFatal) {
    BridgeProcess proc;
    ASSERT_TRUE(proc.start({"-source", ":0"}));
    auto code = proc.wait_exit();
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 1);
}

TEST(SockBridgeProcessTest, UnknownOptionIsUsageError) {
    BridgeProcess proc;
    ASSERT_TRUE(proc.start({"--listen-port", "9000"}));
    auto code = proc.wait_exit();
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 2);
}

TEST(SockBridgeProcessTest, HelpExitsCleanly) {
    BridgeProcess proc;
    ASSERT_TRUE(proc.start({"-h"}));
    auto code = proc.wait_exit();
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
}

TEST(SockBridgeProcessTest, PortInUseIsFatal) {
    auto taken = sockbridge::net::Listener::open(sockbridge::core::EndpointKind::Network, "127.0.0.1:0");
    std::string addr = "127.0.0.1:" + std::to_string(taken->local_port());

    BridgeProcess proc;
    ASSERT_TRUE(proc.start({"-source", addr, "-target", "127.0.0.1:1"}));
    auto code = proc.wait_exit();
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 1);
}

TEST(SockBridgeProcessTest, ForwardsAndExitsZeroOnSigterm) {
    MockTargetServer target(MockTargetServer::echo());
    ASSERT_TRUE(target.start_tcp());
    uint16_t port = free_port();

    BridgeProcess proc;
    ASSERT_TRUE(proc.start({"--source=127.0.0.1:" + std::to_string(port),
                            "--target=127.0.0.1:" + std::to_string(target.port()), "-v"}));

    TestClient client;
    ASSERT_TRUE(connect_with_retry(client, port));
    ASSERT_TRUE(client.send("ping"));
    EXPECT_EQ(client.recv(4), "ping");

    auto code = proc.terminate();
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
    EXPECT_TRUE(client.eof());
}
