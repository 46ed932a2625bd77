// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <memory>

#include <llmtui/Config.hpp>

namespace llmtui
{

/// @brief Wires the terminal, the event bus, the tool bridge and the remote listener together.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the model list and starts the background services.
    ///
    /// Only an unusable event bus is fatal. A failing model listing or an
    /// occupied remote control port is logged and the application runs without it.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive loop until the user quits.
    /// @return Process exit code.
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace llmtui
