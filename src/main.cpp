#include <iostream>
#include <vector>
#include <string>
#include <fmt/format.h>
#include "cli/uploader_cli.hpp"
#include "cli/theme.hpp"
#include "core/cancellation.hpp"
#include "core/constants.hpp"
#include "core/credentials.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "managers/study_uploader.hpp"
#include "platform/signals.hpp"
#include "remote/synapse_client.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_command_line(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Run studyup --help for usage.");
        return 1;
    }

    CliOptions& opts = parsed.value;
    if (opts.action == CliAction::Help) {
        print_usage();
        return 0;
    }
    if (opts.action == CliAction::Version) {
        print_version();
        return 0;
    }

    UploaderConfig& cfg = opts.config;
    log_init(cfg.log_file, cfg.log_level);
    if (!opts.config_file.empty()) {
        log_debug(fmt::format("Defaults from {}", opts.config_file.string()));
    }

    int rc = 0;
    try {
        // Before the interrupt watcher: Ctrl-C at a prompt just ends the process
        auto creds = resolve_credentials(cfg.username, cfg.password, CredentialStore(), prompt_user);
        cfg.username = creds.username;
        cfg.password = creds.password;

        CancellationToken token;
        platform::InterruptWatcher watcher([&token](int) {
            if (token.cancel()) {
                log_warning("Canceling...");
            }
        });

        SynapseService service(cfg.endpoints);
        StudyUploader uploader(cfg, service, token);
        RunSummary summary = uploader.run();

        if (summary.uploads.failed > 0) {
            log_warning(fmt::format("{} of {} files failed to upload. See {} for details.",
                                    summary.uploads.failed, summary.files, cfg.log_file.string()));
        }
    } catch (const CancellationRequested&) {
        log_warning("Canceled.");
        rc = EXIT_CANCELED;
    } catch (const ConfigurationError& e) {
        log_error(fmt::format("Configuration error: {}", e.what()));
        rc = 1;
    } catch (const FolderCreationError& e) {
        log_error(e.what());
        rc = 1;
    } catch (const std::exception& e) {
        log_error(e.what());
        rc = 1;
    }

    log_shutdown();
    return rc;
}
