/// @file process_channel.hpp
/// @brief Worker running as a child process, speaking JSON lines.

#pragma once

#include <offload-cpp/channel.hpp>

#include <sys/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace offload_cpp {

namespace detail {
class HandlerRegistry;
}  // namespace detail

/// How to launch a worker executable.
struct ProcessOptions {
    std::string executable;          ///< Path passed to execv().
    std::vector<std::string> args;   ///< argv[1..]; argv[0] is executable.
};

/// A MessageChannel backed by a child process.
///
/// The child's stdin and stdout are both connected to one end of a
/// socketpair; each message is one line of JSON (see encode()). stderr is
/// inherited. A reader thread decodes the child's lines and delivers them
/// to subscribers; undecodable lines are logged and dropped. If the child
/// exits or closes stdout without terminate() having been called, a
/// worker-level WorkerFailure is delivered.
class ProcessChannel final : public MessageChannel {
public:
    /// Fork and exec the worker.
    /// @throws WorkerError{channel_closed} if the process cannot be started.
    explicit ProcessChannel(ProcessOptions options);
    ~ProcessChannel() override;

    ProcessChannel(const ProcessChannel&) = delete;
    auto operator=(const ProcessChannel&) -> ProcessChannel& = delete;

    void send(const ToWorkerMessage& msg) override;
    auto subscribe(MessageHandler handler) -> SubscriptionId override;
    void unsubscribe(SubscriptionId id) override;

    /// SIGKILL the child, reap it and join the reader.
    void terminate() override;
    auto terminated() const -> bool override;

    auto pid() const -> pid_t { return pid_; }

    /// Factory launching a new process per call.
    static auto factory(ProcessOptions options) -> ChannelFactory;

private:
    void read_loop(std::stop_token st);

    std::unique_ptr<detail::HandlerRegistry> handlers_;
    int fd_{-1};
    pid_t pid_{-1};
    std::atomic<bool> terminated_{false};
    std::atomic<bool> exited_{false};
    std::mutex write_mutex_;
    std::jthread reader_;
};

}  // namespace offload_cpp
