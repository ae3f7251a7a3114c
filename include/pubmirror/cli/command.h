#pragma once

#include <pubmirror/core/types.h>

#include <CLI/CLI.hpp>

#include <memory>
#include <string>

namespace pubmirror::cli {

// Forward declarations
class PubmirrorCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "sync", "extract")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, PubmirrorCLI* cli) = 0;

    /**
     * Execute the command. Runs after global options, config and logging are set up.
     */
    virtual Result<void> execute() = 0;
};

} // namespace pubmirror::cli
