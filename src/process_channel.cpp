#include <offload-cpp/process_channel.hpp>
#include <offload-cpp/error.hpp>
#include <offload-cpp/logging.hpp>

#include "handler_registry.hpp"

#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string_view>

namespace offload_cpp {

namespace {

auto errno_message(std::string_view what) -> std::string {
    return std::string{what} + ": " + std::strerror(errno);
}

}  // namespace

ProcessChannel::ProcessChannel(ProcessOptions options)
    : handlers_{std::make_unique<detail::HandlerRegistry>()} {
    if (::access(options.executable.c_str(), X_OK) != 0) {
        throw WorkerError{ErrorKind::channel_closed, errno_message(options.executable)};
    }

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw WorkerError{ErrorKind::channel_closed, errno_message("socketpair")};
    }

    // Build argv before forking; the child may only call async-signal-safe functions.
    auto argv = std::vector<char*>{};
    argv.push_back(options.executable.data());
    for (auto& arg : options.args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_ = ::fork();
    if (pid_ < 0) {
        auto message = errno_message("fork");
        ::close(fds[0]);
        ::close(fds[1]);
        throw WorkerError{ErrorKind::channel_closed, message};
    }
    if (pid_ == 0) {
        ::dup2(fds[1], STDIN_FILENO);
        ::dup2(fds[1], STDOUT_FILENO);
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    fd_ = fds[0];
    logger()->debug("started worker process {} ({})", pid_, options.executable);
    reader_ = std::jthread{[this](std::stop_token st) { read_loop(st); }};
}

ProcessChannel::~ProcessChannel() {
    terminate();
}

void ProcessChannel::send(const ToWorkerMessage& msg) {
    auto line = encode(msg);
    line.push_back('\n');

    auto lock = std::scoped_lock{write_mutex_};
    if (terminated_) {
        throw WorkerError{ErrorKind::channel_closed,
                          "send on terminated channel: " + std::string{message_type(msg)}};
    }
    auto remaining = std::string_view{line};
    while (!remaining.empty()) {
        auto n = ::send(fd_, remaining.data(), remaining.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw WorkerError{ErrorKind::channel_closed, errno_message("write to worker")};
        }
        remaining.remove_prefix(static_cast<std::size_t>(n));
    }
}

void ProcessChannel::read_loop(std::stop_token st) {
    auto buffer = std::string{};
    char chunk[4096];

    while (!st.stop_requested()) {
        auto n = ::read(fd_, chunk, sizeof chunk);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buffer.append(chunk, static_cast<std::size_t>(n));

        auto start = std::size_t{0};
        for (auto nl = buffer.find('\n'); nl != std::string::npos; nl = buffer.find('\n', start)) {
            auto line = std::string_view{buffer}.substr(start, nl - start);
            start = nl + 1;
            if (line.empty()) continue;
            try {
                handlers_->dispatch(decode_from_worker(line));
            } catch (const WorkerError& e) {
                logger()->warn("worker process {} sent a bad line: {}", pid_, e.what());
            }
        }
        buffer.erase(0, start);
    }

    exited_ = true;
    if (!terminated_) {
        logger()->warn("worker process {} exited", pid_);
        handlers_->dispatch(WorkerFailure{std::nullopt, "worker process exited"});
    }
}

auto ProcessChannel::subscribe(MessageHandler handler) -> SubscriptionId {
    return handlers_->add(std::move(handler));
}

void ProcessChannel::unsubscribe(SubscriptionId id) {
    handlers_->remove(id);
}

void ProcessChannel::terminate() {
    {
        auto lock = std::scoped_lock{write_mutex_};
        if (terminated_.exchange(true)) return;
    }
    handlers_->close();

    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
    if (reader_.joinable()) {
        reader_.request_stop();
        reader_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto ProcessChannel::terminated() const -> bool {
    return terminated_ || exited_;
}

auto ProcessChannel::factory(ProcessOptions options) -> ChannelFactory {
    return [options = std::move(options)]() -> std::shared_ptr<MessageChannel> {
        return std::make_shared<ProcessChannel>(options);
    };
}

}  // namespace offload_cpp
