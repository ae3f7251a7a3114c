#pragma once

#include <pubmirror/cli/command.h>
#include <pubmirror/config/settings.h>
#include <pubmirror/transport/transport.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/logger.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pubmirror::cli {

/**
 * Main CLI application
 */
class PubmirrorCLI {
public:
    using TransportFactory =
        std::function<std::unique_ptr<transport::ITransport>(std::shared_ptr<spdlog::logger>)>;

    PubmirrorCLI();
    ~PubmirrorCLI();

    /**
     * Run the CLI with given arguments. Returns the process exit code.
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Called from a subcommand callback; the command runs once setup is complete.
     */
    void setPendingCommand(ICommand* command) { pendingCommand_ = command; }

    [[nodiscard]] const config::Settings& settings() const { return settings_; }
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const { return logger_; }

    /**
     * Replace the transport used by sync (tests inject an in-memory one)
     */
    void setTransportFactory(TransportFactory factory) { transportFactory_ = std::move(factory); }
    [[nodiscard]] std::unique_ptr<transport::ITransport> makeTransport() const;

private:
    Result<void> initialize();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string configPath_;
    bool verbose_{false};
    std::string logLevel_;
    std::string logFile_;

    config::Settings settings_{};
    std::shared_ptr<spdlog::logger> logger_;
    TransportFactory transportFactory_;
};

} // namespace pubmirror::cli
