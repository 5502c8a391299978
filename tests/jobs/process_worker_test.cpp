#include <gtest/gtest.h>
#include "rpl/jobs/process_worker.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace rpl;
using namespace rpl::jobs;
using namespace std::chrono_literals;

namespace {

struct IoThread {
    IoThread() : work(boost::asio::make_work_guard(io)), thread([this] { io.run(); }) {}

    ~IoThread() {
        work.reset();
        io.stop();
        thread.join();
    }

    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    std::thread thread;
};

std::shared_ptr<WorkerHandle> launch(ProcessWorkerLauncher& launcher, boost::asio::io_context& io,
                                     const std::string& script) {
    auto worker = launcher.launch({{"/bin/sh", "-c", script}}, io);
    if (worker.is_error()) {
        ADD_FAILURE() << worker.error().message;
        return nullptr;
    }
    auto handle = std::make_shared<WorkerHandle>();
    handle->worker = std::move(worker.value());
    handle->pid = handle->worker->pid();
    handle->worker->start({});
    return handle;
}

} // namespace

TEST(ProcessWorker, ReportsOutputAndExit) {
    IoThread io;
    ProcessWorkerLauncher launcher;
    std::atomic<std::size_t> bytes{0};
    std::atomic<bool> eof{false};

    auto worker = launcher.launch({{"/bin/sh", "-c", "printf 'sending incremental file list\\n'"}}, io.io);
    ASSERT_TRUE(worker.is_ok()) << worker.error().message;
    WorkerCallbacks callbacks;
    callbacks.on_output = [&](std::size_t n) { bytes += n; };
    callbacks.on_eof = [&] { eof = true; };
    worker.value()->start(callbacks);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    std::optional<int> code;
    while ((!eof || !code) && std::chrono::steady_clock::now() < deadline) {
        if (!code) {
            code = worker.value()->try_reap();
        }
        std::this_thread::sleep_for(10ms);
    }

    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, 0);
    EXPECT_TRUE(eof.load());
    EXPECT_GT(bytes.load(), 0u);
}

TEST(ProcessWorker, StopWorkersSharesOneDeadline) {
    IoThread io;
    ProcessWorkerLauncher launcher;
    std::vector<std::shared_ptr<WorkerHandle>> handles;
    for (int i = 0; i < 4; ++i) {
        auto handle = launch(launcher, io.io, "trap '' TERM; while :; do sleep 0.05; done");
        ASSERT_NE(handle, nullptr);
        handles.push_back(handle);
    }
    // Give the shells time to install their traps
    std::this_thread::sleep_for(200ms);

    const auto start = std::chrono::steady_clock::now();
    const auto failures = stop_workers(handles, 300ms, 2s);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(failures.empty());
    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 1000ms);
    for (const auto& handle : handles) {
        auto code = handle->worker->try_reap();
        ASSERT_TRUE(code.has_value());
        EXPECT_EQ(*code, 128 + SIGKILL);
    }
}

TEST(ProcessWorker, StopWorkersLeavesPoliteWorkersToSigterm) {
    IoThread io;
    ProcessWorkerLauncher launcher;
    std::vector<std::shared_ptr<WorkerHandle>> handles;
    for (int i = 0; i < 3; ++i) {
        auto handle = launch(launcher, io.io, "sleep 30");
        ASSERT_NE(handle, nullptr);
        handles.push_back(handle);
    }

    const auto start = std::chrono::steady_clock::now();
    const auto failures = stop_workers(handles, 5s, 5s);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(failures.empty());
    EXPECT_LT(elapsed, 3s);
    for (const auto& handle : handles) {
        EXPECT_EQ(handle->worker->try_reap().value_or(-1), 128 + SIGTERM);
    }
}
