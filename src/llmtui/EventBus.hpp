// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <llmtui/Event.hpp>

namespace llmtui
{

/// @brief Multi-producer, single-consumer event channel feeding the orchestrator.
///
/// Any thread may push(). Only the orchestrator thread drains. Besides the
/// internal condition variable, the bus exposes a readable file descriptor
/// that becomes ready whenever events are queued, so the consumer can wait
/// on terminal input and bus traffic with a single poll().
class EventBus
{
  public:
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// @brief Creates the wake-up pipe.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Enqueues an event. Events pushed after close() are discarded.
    void push(Event event);

    /// @brief Removes up to @p maxEvents events in FIFO order without blocking.
    [[nodiscard]] auto drain(std::size_t maxEvents) -> std::vector<Event>;

    /// @brief Blocks until an event is available or the timeout expires.
    [[nodiscard]] auto waitPop(std::chrono::milliseconds timeout) -> std::optional<Event>;

    /// @brief Number of queued events.
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool { return size() == 0; }

    /// @brief Read end of the wake-up pipe, or -1 if initialize() was not called.
    [[nodiscard]] auto wakeFd() const noexcept -> int;

    /// @brief Stops accepting events and wakes any waiter.
    void close();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace llmtui
