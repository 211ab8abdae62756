/// @file service_runner.cpp
/// @brief Implementation of the session executable utilities.

#include "csync/service/service_runner.hpp"

#include "csync/foundation/game_logger.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

namespace csync::service {

using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

std::size_t GracefulShutdown::execute() {
    const auto deadline = std::chrono::steady_clock::now() + drainTimeout_;
    std::size_t completed = 0;

    for (std::size_t i = 0; i < hooks_.size(); ++i) {
        const auto& hook = hooks_[i];
        if (std::chrono::steady_clock::now() >= deadline) {
            CSYNC_LOG_WARN(LogCategory::Core,
                           "shutdown timeout: skipping " +
                               std::to_string(hooks_.size() - i) + " hook(s) from '" +
                               hook.name + "'");
            break;
        }

        CSYNC_LOG_DEBUG(LogCategory::Core, "shutdown hook: " + hook.name);
        try {
            if (hook.callback) {
                hook.callback();
            }
            ++completed;
        } catch (const std::exception& e) {
            CSYNC_LOG_ERROR(LogCategory::Core,
                            "shutdown hook '" + hook.name + "' failed: " + e.what());
        }
    }
    return completed;
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

void GracefulShutdown::setDrainTimeout(std::chrono::milliseconds timeout) {
    drainTimeout_ = timeout;
}

// -- Config loading ----------------------------------------------------------

csync::foundation::GameResult<void>
loadConfig(csync::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("CSYNC_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

}  // namespace csync::service
