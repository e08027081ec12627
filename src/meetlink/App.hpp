// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <meetlink/Config.hpp>

#include <memory>

namespace meetlink
{

/// @brief Console application that wires capture, session and playback together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Sets up playback and message handlers.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Starts the session and reads interactive commands from stdin until `q` or EOF.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace meetlink
