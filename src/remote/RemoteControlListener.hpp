// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace llmtui
{

class EventBus;

/// @brief Address and timing of the remote control channel.
struct RemoteControlConfig
{
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;                          ///< 0 picks an ephemeral port.
    std::chrono::milliseconds replyTimeout { 5'000 };   ///< How long a connection waits for the orchestrator.
};

/// @brief Returns true if @p host is an IPv4 address in 127.0.0.0/8.
[[nodiscard]] auto isLoopbackAddress(std::string_view host) -> bool;

/// @brief TCP side channel that lets other processes drive the application.
///
/// One thread accepts connections; each connection is served by its own
/// thread that reads newline-delimited commands, forwards them as
/// RemoteRequest events and writes back the single reply line produced by the
/// orchestrator. The listener never touches session state itself.
class RemoteControlListener
{
  public:
    RemoteControlListener(RemoteControlConfig config, EventBus& bus);
    ~RemoteControlListener();

    RemoteControlListener(const RemoteControlListener&) = delete;
    RemoteControlListener& operator=(const RemoteControlListener&) = delete;

    /// @brief Binds the listening socket and starts accepting connections.
    /// @return Success, or ListenerBindFailure if the address is unavailable or not a loopback address.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Closes the listening socket and all connections, joining their threads.
    void stop();

    [[nodiscard]] auto isRunning() const noexcept -> bool;

    /// @brief The bound port (useful when the configured port was 0).
    [[nodiscard]] auto port() const noexcept -> std::uint16_t;

    /// @brief "host:port" of the listening socket.
    [[nodiscard]] auto address() const -> std::string;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace llmtui
