#pragma once

#include "rpl/jobs/worker.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rpl::test {

/// Exit code meaning "never exits until terminated"
inline constexpr int kHang = -1;

/**
 * Launcher whose workers exit on a script instead of running a copy tool.
 *
 * Workers are keyed by the source argument of the copy command (the
 * second-to-last argv entry, without its trailing slash). Each launch of
 * the same source consumes the next scripted exit code; unscripted
 * launches exit 0.
 */
class FakeLauncher : public jobs::WorkerLauncher {
public:
    struct Shared {
        std::atomic<int> exit_code{kHang};
        std::atomic<bool> reaped{false};
    };

    class FakeWorker : public jobs::Worker {
    public:
        FakeWorker(FakeLauncher& owner, boost::asio::io_context& io, int pid, int scripted)
            : owner_(owner), io_(io), pid_(pid), scripted_(scripted),
              shared_(std::make_shared<Shared>()) {}

        int pid() const noexcept override { return pid_; }

        void start(jobs::WorkerCallbacks callbacks) override {
            if (scripted_ == kHang) {
                return;
            }
            auto timer = std::make_shared<boost::asio::steady_timer>(io_, owner_.run_time);
            auto shared = shared_;
            const int code = scripted_;
            timer->async_wait([timer, shared, code, callbacks](const boost::system::error_code& ec) {
                if (ec) {
                    return;
                }
                shared->exit_code = code;
                if (callbacks.on_output) {
                    callbacks.on_output(64);
                }
                callbacks.on_eof();
            });
        }

        std::optional<int> try_reap() override {
            const int code = shared_->exit_code.load();
            if (code == kHang) {
                return std::nullopt;
            }
            if (!shared_->reaped.exchange(true)) {
                owner_.on_reaped();
            }
            return code;
        }

        Result<void> request_stop() override {
            ++owner_.terminate_calls;
            return deliver(143);
        }

        Result<void> force_kill() override {
            ++owner_.kill_calls;
            return deliver(137);
        }

    private:
        Result<void> deliver(int code) {
            if (owner_.fail_terminate_pid == pid_) {
                return Err<void>(ErrorKind::WorkerFailure, "killpg(" + std::to_string(pid_) + "): EPERM");
            }
            int expected = kHang;
            shared_->exit_code.compare_exchange_strong(expected, code);
            return Ok();
        }

        FakeLauncher& owner_;
        boost::asio::io_context& io_;
        int pid_;
        int scripted_;
        std::shared_ptr<Shared> shared_;
    };

    Result<std::unique_ptr<jobs::Worker>> launch(const jobs::CopyCommand& command,
                                                 boost::asio::io_context& io) override {
        std::lock_guard lock(mutex_);
        auto source = command.argv.at(command.argv.size() - 2);
        if (!source.empty() && source.back() == '/') {
            source.pop_back();
        }
        commands_.push_back(command.argv);
        launched_.push_back(source);

        if (std::find(refuse.begin(), refuse.end(), source) != refuse.end()) {
            return Err<std::unique_ptr<jobs::Worker>>(ErrorKind::WorkerFailure, "Cannot execute 'rsync'");
        }

        int code = 0;
        auto& queue = script[source];
        if (!queue.empty()) {
            code = queue.front();
            queue.erase(queue.begin());
        }
        const int now_live = ++live_;
        max_live_ = std::max(max_live_.load(), now_live);
        return Ok(std::unique_ptr<jobs::Worker>(
            std::make_unique<FakeWorker>(*this, io, next_pid_++, code)));
    }

    std::vector<std::string> launched() const {
        std::lock_guard lock(mutex_);
        return launched_;
    }

    std::vector<std::vector<std::string>> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    std::size_t launches_of(const std::string& source) const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count(launched_.begin(), launched_.end(), source));
    }

    int max_live() const { return max_live_.load(); }
    int live() const { return live_.load(); }

    /// source -> exit code per launch
    std::map<std::string, std::vector<int>> script;
    std::vector<std::string> refuse;
    std::chrono::milliseconds run_time{20};
    int fail_terminate_pid = -1;
    std::atomic<int> terminate_calls{0}; ///< SIGTERM requests
    std::atomic<int> kill_calls{0};

private:
    void on_reaped() { --live_; }

    mutable std::mutex mutex_;
    std::vector<std::string> launched_;
    std::vector<std::vector<std::string>> commands_;
    std::atomic<int> live_{0};
    std::atomic<int> max_live_{0};
    int next_pid_ = 1000;
};

} // namespace rpl::test
