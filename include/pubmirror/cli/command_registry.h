#pragma once

#include <pubmirror/cli/command.h>

#include <memory>

namespace pubmirror::cli {

class PubmirrorCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(PubmirrorCLI* cli);

    /**
     * Create sync command (alias: download)
     */
    static std::unique_ptr<ICommand> createSyncCommand();

    /**
     * Create extract command
     */
    static std::unique_ptr<ICommand> createExtractCommand();
};

} // namespace pubmirror::cli
