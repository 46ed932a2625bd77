// SPDX-License-Identifier: Apache-2.0
#include "EventBus.hpp"

#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <format>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace llmtui
{

struct EventBus::Impl
{
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<Event> queue;
    bool closed = false;
    int wakePipe[2] = { -1, -1 };

    ~Impl()
    {
        for (auto& fd: wakePipe)
            if (fd != -1)
                ::close(fd);
    }

    /// Writes one byte per push; the consumer drains the pipe once the queue is empty.
    void signal() const
    {
        if (wakePipe[1] == -1)
            return;
        auto const byte = char { 1 };
        auto const result = ::write(wakePipe[1], &byte, 1);
        static_cast<void>(result); // A full pipe already wakes the reader.
    }

    void clearSignal() const
    {
        if (wakePipe[0] == -1)
            return;
        auto buf = std::array<char, 64> {};
        while (::read(wakePipe[0], buf.data(), buf.size()) > 0)
            ;
    }
};

EventBus::EventBus(): _impl(std::make_unique<Impl>())
{
}

EventBus::~EventBus() = default;

auto EventBus::initialize() -> VoidResult
{
    if (_impl->wakePipe[0] != -1)
        return {};

    if (pipe2(_impl->wakePipe, O_NONBLOCK | O_CLOEXEC) == -1)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create event bus wake-up pipe: {}", strerror(errno)));
    return {};
}

void EventBus::push(Event event)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->closed)
            return;
        _impl->queue.push_back(std::move(event));
    }
    _impl->cv.notify_one();
    _impl->signal();
}

auto EventBus::drain(std::size_t maxEvents) -> std::vector<Event>
{
    auto events = std::vector<Event> {};
    auto lock = std::lock_guard(_impl->mutex);

    while (!_impl->queue.empty() && events.size() < maxEvents)
    {
        events.push_back(std::move(_impl->queue.front()));
        _impl->queue.pop_front();
    }

    if (_impl->queue.empty())
        _impl->clearSignal();
    return events;
}

auto EventBus::waitPop(std::chrono::milliseconds timeout) -> std::optional<Event>
{
    auto lock = std::unique_lock(_impl->mutex);
    if (!_impl->cv.wait_for(lock, timeout, [this] { return !_impl->queue.empty() || _impl->closed; }))
        return std::nullopt;
    if (_impl->queue.empty())
        return std::nullopt;

    auto event = std::move(_impl->queue.front());
    _impl->queue.pop_front();
    if (_impl->queue.empty())
        _impl->clearSignal();
    return event;
}

auto EventBus::size() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

auto EventBus::wakeFd() const noexcept -> int
{
    return _impl->wakePipe[0];
}

void EventBus::close()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->closed = true;
    }
    _impl->cv.notify_all();
    _impl->signal();
}

} // namespace llmtui
