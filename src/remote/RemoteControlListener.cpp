// SPDX-License-Identifier: Apache-2.0
#include "RemoteControlListener.hpp"

#include <core/Log.hpp>

#include <sys/socket.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <future>
#include <list>
#include <mutex>
#include <string_view>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <llmtui/EventBus.hpp>
#include <netinet/in.h>
#include <poll.h>
#include <remote/RemoteCommand.hpp>
#include <unistd.h>

namespace llmtui
{

namespace
{
    constexpr auto ListenBacklog = 4;

    /// Granularity at which a connection waiting for a reply notices shutdown.
    constexpr auto ReplyPollInterval = std::chrono::milliseconds(100);

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto sendAll(int fd, std::string_view data) -> bool
    {
        while (!data.empty())
        {
            auto const sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (sent < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            data.remove_prefix(static_cast<std::size_t>(sent));
        }
        return true;
    }
} // namespace

struct RemoteControlListener::Impl
{
    struct Connection
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    RemoteControlConfig config;
    EventBus& bus;

    int listenFd = -1;
    int stopPipe[2] = { -1, -1 };
    std::uint16_t boundPort = 0;
    std::atomic<bool> running = false;

    std::jthread acceptThread;
    std::mutex connectionsMutex;
    std::list<Connection> connections;

    Impl(RemoteControlConfig cfg, EventBus& eventBus): config(std::move(cfg)), bus(eventBus) {}

    ~Impl()
    {
        closeFd(listenFd);
        closeFd(stopPipe[0]);
        closeFd(stopPipe[1]);
    }

    /// @brief Waits until @p fd is readable. Returns false once shutdown was signalled.
    [[nodiscard]] auto waitReadable(int fd) const -> bool
    {
        auto fds = std::array<struct pollfd, 2> {};
        fds[0] = { .fd = fd, .events = POLLIN, .revents = 0 };
        fds[1] = { .fd = stopPipe[0], .events = POLLIN, .revents = 0 };

        while (true)
        {
            auto const result = ::poll(fds.data(), fds.size(), -1);
            if (result < 0 && errno == EINTR)
                continue;
            if (result < 0 || (fds[1].revents & POLLIN) != 0)
                return false;
            return (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0;
        }
    }

    void acceptLoop()
    {
        while (waitReadable(listenFd))
        {
            auto peer = sockaddr_in {};
            auto peerLength = socklen_t { sizeof(peer) };
            auto const clientFd = ::accept4(listenFd, reinterpret_cast<sockaddr*>(&peer), &peerLength, SOCK_CLOEXEC);
            if (clientFd < 0)
            {
                if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
                    log::warning("Remote control: accept() failed: {}", strerror(errno));
                continue;
            }

            auto peerAddress = std::array<char, INET_ADDRSTRLEN> {};
            inet_ntop(AF_INET, &peer.sin_addr, peerAddress.data(), peerAddress.size());
            auto peerName = std::format("{}:{}", peerAddress.data(), ntohs(peer.sin_port));
            log::info("Remote control: connection from {}", peerName);

            auto lock = std::lock_guard(connectionsMutex);
            std::erase_if(connections, [](auto const& c) { return c.finished->load(); });

            auto finished = std::make_shared<std::atomic<bool>>(false);
            auto thread = std::jthread([this, clientFd, finished, peerName = std::move(peerName)](
                                           std::stop_token stopToken) {
                serve(stopToken, clientFd, peerName);
                finished->store(true);
            });
            connections.push_back(Connection { .thread = std::move(thread), .finished = std::move(finished) });
        }
    }

    void serve(const std::stop_token& stopToken, int clientFd, const std::string& peerName)
    {
        auto buffer = std::string {};
        auto discarding = false;

        while (!stopToken.stop_requested() && waitReadable(clientFd))
        {
            auto chunk = std::array<char, 4096> {};
            auto const received = ::recv(clientFd, chunk.data(), chunk.size(), 0);
            if (received < 0 && errno == EINTR)
                continue;
            if (received <= 0)
                break;

            buffer.append(chunk.data(), static_cast<std::size_t>(received));

            auto newline = std::string::npos;
            while ((newline = buffer.find('\n')) != std::string::npos)
            {
                auto const line = buffer.substr(0, newline);
                buffer.erase(0, newline + 1);

                if (std::exchange(discarding, false))
                    continue;
                if (!handleLine(stopToken, clientFd, peerName, line))
                {
                    ::close(clientFd);
                    return;
                }
            }

            if (buffer.size() > remote::MaxLineLength)
            {
                log::warning("Remote control: dropping oversized line from {}", peerName);
                buffer.clear();
                discarding = true;
            }
        }

        log::info("Remote control: {} disconnected", peerName);
        ::close(clientFd);
    }

    /// @brief Handles one command line. Returns false if the connection broke.
    [[nodiscard]] auto handleLine(const std::stop_token& stopToken,
                                  int clientFd,
                                  const std::string& peerName,
                                  std::string_view line) -> bool
    {
        auto command = remote::parseCommand(line);
        if (auto const* ignored = std::get_if<remote::Ignored>(&command))
        {
            log::warning("Remote control: ignoring malformed command from {}: {}", peerName, ignored->reason);
            return true;
        }

        log::debug("Remote control: {} from {}", remote::commandName(command), peerName);

        auto reply = std::make_shared<std::promise<std::string>>();
        auto future = reply->get_future();
        bus.push(RemoteRequest { .command = std::move(command), .reply = std::move(reply) });

        auto const deadline = std::chrono::steady_clock::now() + config.replyTimeout;
        auto answer = std::string {};
        while (true)
        {
            if (future.wait_for(ReplyPollInterval) == std::future_status::ready)
            {
                answer = future.get();
                break;
            }
            if (stopToken.stop_requested())
                return false;
            if (std::chrono::steady_clock::now() >= deadline)
            {
                answer = "ERROR timed out waiting for the application";
                break;
            }
        }

        answer += '\n';
        return sendAll(clientFd, answer);
    }
};

RemoteControlListener::RemoteControlListener(RemoteControlConfig config, EventBus& bus):
    _impl(std::make_unique<Impl>(std::move(config), bus))
{
}

RemoteControlListener::~RemoteControlListener()
{
    stop();
}

auto isLoopbackAddress(std::string_view host) -> bool
{
    auto addr = in_addr {};
    if (inet_pton(AF_INET, std::string(host).c_str(), &addr) != 1)
        return false;
    return (ntohl(addr.s_addr) >> 24) == 127;
}

auto RemoteControlListener::start() -> VoidResult
{
    if (_impl->running)
        return {};

    auto const& config = _impl->config;
    auto addr = sockaddr_in {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config.port);
    if (inet_pton(AF_INET, config.host.c_str(), &addr.sin_addr) != 1)
        return makeError(ErrorCode::ListenerBindFailure, std::format("Invalid listen address '{}'", config.host));
    if (!isLoopbackAddress(config.host))
        return makeError(ErrorCode::ListenerBindFailure,
                         std::format("Listen address '{}' is not a loopback address", config.host));

    auto fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return makeError(ErrorCode::ListenerBindFailure, std::format("socket() failed: {}", strerror(errno)));

    auto const opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0
        || ::listen(fd, ListenBacklog) < 0)
    {
        auto const bindError = errno;
        ::close(fd);
        return makeError(ErrorCode::ListenerBindFailure,
                         std::format("Cannot listen on {}:{}: {}", config.host, config.port, strerror(bindError)));
    }

    auto bound = sockaddr_in {};
    auto boundLength = socklen_t { sizeof(bound) };
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLength) == 0)
        _impl->boundPort = ntohs(bound.sin_port);
    else
        _impl->boundPort = config.port;

    if (pipe2(_impl->stopPipe, O_CLOEXEC) != 0)
    {
        ::close(fd);
        return makeError(ErrorCode::ListenerBindFailure, "Failed to create listener stop pipe");
    }

    _impl->listenFd = fd;
    _impl->running = true;
    _impl->acceptThread = std::jthread([impl = _impl.get()] { impl->acceptLoop(); });

    log::info("Remote control listening on {}", address());
    return {};
}

void RemoteControlListener::stop()
{
    if (!_impl->running.exchange(false))
        return;

    // The stop pipe stays readable once written, waking every poller.
    auto const byte = char { 1 };
    if (::write(_impl->stopPipe[1], &byte, 1) < 0)
        log::warning("Remote control: failed to signal shutdown: {}", strerror(errno));

    if (_impl->acceptThread.joinable())
        _impl->acceptThread.join();

    auto connections = std::list<Impl::Connection> {};
    {
        auto lock = std::lock_guard(_impl->connectionsMutex);
        connections.swap(_impl->connections);
    }
    for (auto& connection: connections)
        connection.thread.request_stop();
    connections.clear();

    closeFd(_impl->listenFd);
    closeFd(_impl->stopPipe[0]);
    closeFd(_impl->stopPipe[1]);
    log::debug("Remote control stopped");
}

auto RemoteControlListener::isRunning() const noexcept -> bool
{
    return _impl->running;
}

auto RemoteControlListener::port() const noexcept -> std::uint16_t
{
    return _impl->boundPort;
}

auto RemoteControlListener::address() const -> std::string
{
    return std::format("{}:{}", _impl->config.host, _impl->boundPort);
}

} // namespace llmtui
