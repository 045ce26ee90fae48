/**
 * postbuild CLI - build-whitelist command
 *
 * Print the read whitelist for the artifacts in HDIST_IMPORT.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <postbuild/build_spec.hpp>
#include <postbuild/build_store.hpp>
#include <postbuild/whitelist.hpp>

namespace postbuild::cli::commands {

namespace {

int cmd_whitelist(const GlobalOptions& opts) {
    setup_logging(opts);

    auto config = load_cli_config(opts);
    if (!config) {
        return 1;
    }

    auto artifacts = parse_import_envvar(get_env(ENV_IMPORT).value_or(""));
    BuildStore store(config->artifact_root, config->build_dir);
    return exit_code(write_whitelist(store.build_dir(), artifacts, store, std::cout));
}

} // anonymous namespace

void setup_whitelist(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_whitelist(opts));
    });
}

} // namespace postbuild::cli::commands
