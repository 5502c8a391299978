#pragma once

#include "rpl/jobs/worker.hpp"
#include "rpl/process/child_process.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <array>
#include <memory>

namespace rpl::jobs {

/**
 * @brief Reads a worker's output pipe on the io thread
 *
 * Only counts bytes; the content is discarded. Owned jointly by the worker
 * and its pending read, so it outlives the worker until the read is
 * cancelled.
 */
class OutputPump : public std::enable_shared_from_this<OutputPump> {
public:
    OutputPump(boost::asio::io_context& io, int fd);

    void start(WorkerCallbacks callbacks);

    /// Cancel the pending read and close the pipe (posted to the io thread)
    void close();

private:
    void read();

    boost::asio::io_context& io_;
    boost::asio::posix::stream_descriptor stream_;
    std::array<char, 8192> buffer_{};
    WorkerCallbacks callbacks_;
};

class ProcessWorker : public Worker {
public:
    ProcessWorker(process::ChildProcess child, std::shared_ptr<OutputPump> pump);
    ~ProcessWorker() override;

    int pid() const noexcept override { return child_.pid(); }
    void start(WorkerCallbacks callbacks) override;
    std::optional<int> try_reap() override;
    Result<void> request_stop() override;
    Result<void> force_kill() override;

private:
    process::ChildProcess child_;
    std::shared_ptr<OutputPump> pump_;
};

/// Spawns the copy tool as a subprocess with its output on an asio pipe
class ProcessWorkerLauncher : public WorkerLauncher {
public:
    Result<std::unique_ptr<Worker>> launch(const CopyCommand& command,
                                           boost::asio::io_context& io) override;
};

} // namespace rpl::jobs
