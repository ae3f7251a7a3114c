#include <pubmirror/cli/command_registry.h>
#include <pubmirror/cli/pubmirror_cli.h>

namespace pubmirror::cli {

// Factories defined beside each command
std::unique_ptr<ICommand> createSyncCommand();
std::unique_ptr<ICommand> createExtractCommand();

void CommandRegistry::registerAllCommands(PubmirrorCLI* cli) {
    cli->registerCommand(CommandRegistry::createSyncCommand());
    cli->registerCommand(CommandRegistry::createExtractCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createSyncCommand() {
    return ::pubmirror::cli::createSyncCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createExtractCommand() {
    return ::pubmirror::cli::createExtractCommand();
}

} // namespace pubmirror::cli
