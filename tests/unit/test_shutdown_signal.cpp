#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include "net/Dialer.hpp"
#include "relay/Acceptor.hpp"
#include "relay/ShutdownSignal.hpp"

using namespace sockbridge;
using namespace std::chrono_literals;

TEST(ShutdownSignalTest, CallbacksRunOnceOnFirstTrigger) {
    relay::ShutdownSignal signal;
    std::atomic<int> calls{0};
    signal.subscribe([&]() { calls++; });
    signal.subscribe([&]() { calls++; });

    EXPECT_FALSE(signal.triggered());
    signal.trigger();
    signal.trigger();

    EXPECT_TRUE(signal.triggered());
    EXPECT_EQ(calls.load(), 2);
}

TEST(ShutdownSignalTest, LateSubscriberRunsImmediately) {
    relay::ShutdownSignal signal;
    signal.trigger();

    bool ran = false;
    signal.subscribe([&]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(ShutdownSignalTest, UnsubscribedCallbackIsSkipped) {
    relay::ShutdownSignal signal;
    bool kept = false;
    bool dropped = false;
    signal.subscribe([&]() { kept = true; });
    auto id = signal.subscribe([&]() { dropped = true; });
    signal.unsubscribe(id);

    signal.trigger();
    EXPECT_TRUE(kept);
    EXPECT_FALSE(dropped);
}

TEST(ShutdownSignalTest, WaitForWakesOnTrigger) {
    relay::ShutdownSignal signal;
    EXPECT_FALSE(signal.wait_for(10ms));

    std::thread t([&]() {
        std::this_thread::sleep_for(20ms);
        signal.trigger();
    });
    EXPECT_TRUE(signal.wait_for(5s));
    t.join();
}

TEST(AcceptorTest, InjectedShutdownClosesListenerAndEndsRun) {
    relay::ShutdownSignal signal;
    std::atomic<int> handled{0};
    relay::Acceptor acceptor(core::EndpointKind::Network, "127.0.0.1:0", signal,
                             [&](std::unique_ptr<net::Connection>) { handled++; });

    std::atomic<bool> done{false};
    std::thread runner([&]() {
        acceptor.run();
        done = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(done.load());
    signal.trigger();
    runner.join();

    EXPECT_TRUE(done.load());
    EXPECT_TRUE(acceptor.listener().closed());
    EXPECT_EQ(handled.load(), 0);
}

TEST(AcceptorTest, AlreadyTriggeredSignalStopsImmediately) {
    relay::ShutdownSignal signal;
    signal.trigger();
    relay::Acceptor acceptor(core::EndpointKind::Network, "127.0.0.1:0", signal,
                             [](std::unique_ptr<net::Connection>) {});
    acceptor.run();
    EXPECT_TRUE(acceptor.listener().closed());
}

TEST(AcceptorTest, HandsTunedConnectionsToHandler) {
    relay::ShutdownSignal signal;
    std::atomic<int> handled{0};
    std::atomic<bool> nodelay{false};
    relay::Acceptor acceptor(core::EndpointKind::Network, "127.0.0.1:0", signal,
                             [&](std::unique_ptr<net::Connection> conn) {
                                 int value = 0;
                                 socklen_t len = sizeof(value);
                                 auto fd = conn->tunable_fd();
                                 if (fd && ::getsockopt(*fd, IPPROTO_TCP, TCP_NODELAY, &value, &len) == 0) {
                                     nodelay = value != 0;
                                 }
                                 handled++;
                             });
    std::thread runner([&]() { acceptor.run(); });

    std::vector<std::unique_ptr<net::Connection>> clients;
    std::string addr = "127.0.0.1:" + std::to_string(acceptor.listener().local_port());
    for (int i = 0; i < 3; ++i) {
        clients.push_back(net::Dialer::dial(core::EndpointKind::Network, addr));
    }

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (handled.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    signal.trigger();
    runner.join();

    EXPECT_EQ(handled.load(), 3);
    EXPECT_TRUE(nodelay.load());
}
