#include "rpl/jobs/process_worker.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <csignal>

#include <unistd.h>

namespace rpl::jobs {

// ──────────────────────────────────────────────────────────
// OutputPump
// ──────────────────────────────────────────────────────────

OutputPump::OutputPump(boost::asio::io_context& io, int fd)
    : io_(io), stream_(io, fd) {}

void OutputPump::start(WorkerCallbacks callbacks) {
    boost::asio::post(io_, [self = shared_from_this(), callbacks = std::move(callbacks)]() mutable {
        self->callbacks_ = std::move(callbacks);
        self->read();
    });
}

void OutputPump::close() {
    boost::asio::post(io_, [self = shared_from_this()]() {
        boost::system::error_code ec;
        self->stream_.close(ec);
    });
}

void OutputPump::read() {
    if (!stream_.is_open()) {
        return;
    }
    stream_.async_read_some(boost::asio::buffer(buffer_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
            if (bytes > 0 && self->callbacks_.on_output) {
                self->callbacks_.on_output(bytes);
            }
            if (ec) {
                if (ec != boost::asio::error::operation_aborted && self->callbacks_.on_eof) {
                    self->callbacks_.on_eof();
                }
                return;
            }
            self->read();
        });
}

// ──────────────────────────────────────────────────────────
// ProcessWorker
// ──────────────────────────────────────────────────────────

ProcessWorker::ProcessWorker(process::ChildProcess child, std::shared_ptr<OutputPump> pump)
    : child_(std::move(child)), pump_(std::move(pump)) {}

ProcessWorker::~ProcessWorker() {
    pump_->close();
}

void ProcessWorker::start(WorkerCallbacks callbacks) {
    pump_->start(std::move(callbacks));
}

std::optional<int> ProcessWorker::try_reap() {
    return child_.try_wait();
}

Result<void> ProcessWorker::request_stop() {
    spdlog::debug("[Worker] SIGTERM to pid {}", child_.pid());
    return child_.signal(SIGTERM);
}

Result<void> ProcessWorker::force_kill() {
    spdlog::debug("[Worker] SIGKILL to pid {}", child_.pid());
    return child_.signal(SIGKILL);
}

// ──────────────────────────────────────────────────────────
// ProcessWorkerLauncher
// ──────────────────────────────────────────────────────────

Result<std::unique_ptr<Worker>> ProcessWorkerLauncher::launch(const CopyCommand& command,
                                                              boost::asio::io_context& io) {
    process::LaunchOptions options;
    options.argv = command.argv;
    options.capture_output = true;
    options.merge_stderr = true;

    auto child = process::ChildProcess::spawn(options);
    if (child.is_error()) {
        return Err<std::unique_ptr<Worker>>(ErrorKind::WorkerFailure, child.error().message);
    }

    const int fd = child.value().release_stdout();
    std::shared_ptr<OutputPump> pump;
    try {
        pump = std::make_shared<OutputPump>(io, fd);
    } catch (const boost::system::system_error& e) {
        ::close(fd);
        return Err<std::unique_ptr<Worker>>(ErrorKind::WorkerFailure,
            std::string("Cannot watch worker output: ") + e.what());
    }

    std::unique_ptr<Worker> worker =
        std::make_unique<ProcessWorker>(std::move(child.value()), std::move(pump));
    return Ok(std::move(worker));
}

} // namespace rpl::jobs
