#include <iostream>
#include <signal.h>

#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = hubcache::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    // `cat` into a closed pipe must fail the write, not kill the process
    signal(SIGPIPE, SIG_IGN);

    hubcache::logger::init_from_env();
    auto [config, sources] = hubcache::loadHubConfigWithLog();
    spdlog::debug("Config: cache_dir={} endpoint={} {}", config.cache_dir.string(), config.endpoint, sources);

    namespace commands = hubcache::cli::commands;
    switch (cli_result.subcommand) {
        case hubcache::Subcommand::Download:
            return commands::download(config, cli_result.download_options);
        case hubcache::Subcommand::Snapshot:
            return commands::snapshot(config, cli_result.snapshot_options);
        case hubcache::Subcommand::Resume:
            return commands::resume(config, cli_result.resume_options);
        case hubcache::Subcommand::Cat:
            return commands::cat(config, cli_result.cat_options);
        case hubcache::Subcommand::Stats:
            return commands::stats(config);
        case hubcache::Subcommand::Clear:
            return commands::clear(config, cli_result.clear_options);
        case hubcache::Subcommand::Evict:
            return commands::evict(config, cli_result.evict_options);
        case hubcache::Subcommand::Verify:
            return commands::verify(config);
        case hubcache::Subcommand::Fingerprint:
            return commands::fingerprint(cli_result.fingerprint_options);
        case hubcache::Subcommand::Upload:
            return commands::upload(config, cli_result.upload_options);
        case hubcache::Subcommand::None:
            break;
    }
    std::cout << hubcache::getHelpMessage();
    return 0;
}
