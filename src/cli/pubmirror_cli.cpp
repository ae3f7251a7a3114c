#include <pubmirror/cli/command_registry.h>
#include <pubmirror/cli/pubmirror_cli.h>
#include <pubmirror/config/config_helpers.h>
#include <pubmirror/logging/logging.h>

#include <spdlog/spdlog.h>

#include <iostream>
#include <system_error>

namespace pubmirror::cli {

namespace fs = std::filesystem;

PubmirrorCLI::PubmirrorCLI() {
    app_ = std::make_unique<CLI::App>("pubmirror - incremental PubChem FTP mirror and ingester");
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_,
                     "Config file (default: $PUBMIRROR_CONFIG or "
                     "~/.config/pubmirror/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_option("--log-level", logLevel_,
                     "Log level: trace|debug|info|warn|error|critical|off")
        ->check(CLI::Validator(
            [](std::string& s) {
                return logging::parseLevel(s) ? std::string{}
                                              : std::string{"unknown log level '" + s + "'"};
            },
            "LEVEL"));
    app_->add_option("--log-file", logFile_, "Also log to this file (rotated)");

    CommandRegistry::registerAllCommands(this);
}

PubmirrorCLI::~PubmirrorCLI() = default;

void PubmirrorCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

std::unique_ptr<transport::ITransport> PubmirrorCLI::makeTransport() const {
    if (transportFactory_) {
        return transportFactory_(logger_);
    }
    return transport::makeCurlFtpTransport(logger_);
}

Result<void> PubmirrorCLI::initialize() {
    const auto path = config::get_config_path(configPath_);
    std::error_code ec;
    if (!configPath_.empty() && !fs::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    auto loaded = config::loadSettings(path);
    if (!loaded) {
        return loaded.error();
    }
    settings_ = std::move(loaded).value();

    // Precedence: --log-level > -v > config file
    if (!logLevel_.empty()) {
        settings_.log.level = logLevel_;
    } else if (verbose_) {
        settings_.log.level = "debug";
    }
    if (!logFile_.empty()) {
        settings_.log.file = config::expand_tilde(logFile_);
    }

    logger_ = logging::makeLogger(settings_.log);
    logger_->debug("Using config {}", fs::exists(path, ec) ? path.string() : "(none)");
    return {};
}

int PubmirrorCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        if (auto r = initialize(); !r) {
            std::cerr << "[FAIL] " << r.error().message << "\n";
            return 1;
        }

        if (!pendingCommand_) {
            std::cout << app_->help() << std::endl;
            return 1;
        }

        auto result = pendingCommand_->execute();
        if (!result) {
            logger_->error("{} failed: {}", pendingCommand_->getName(), result.error().message);
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace pubmirror::cli
