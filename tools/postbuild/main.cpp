/**
 * postbuild CLI - Entry Point
 *
 * Build-time helpers run from inside artifact build scripts.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace postbuild::cli::commands {
    void setup_create_links(CLI::App* app, GlobalOptions& opts);
    void setup_unpack_sources(CLI::App* app, GlobalOptions& opts);
    void setup_write_files(CLI::App* app, GlobalOptions& opts);
    void setup_whitelist(CLI::App* app, GlobalOptions& opts);
    void setup_build_profile(CLI::App* app, GlobalOptions& opts);
    void setup_postprocess(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace postbuild::cli;

    CLI::App app{"postbuild - artifact build helpers"};
    app.set_version_flag("-V,--version", POSTBUILD_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Only log errors");

    // Commands
    auto* links_cmd = app.add_subcommand("create-links", "Create links from a links DSL document");
    commands::setup_create_links(links_cmd, opts);

    auto* unpack_cmd = app.add_subcommand("build-unpack-sources",
                                          "Unpack the sources listed in build.json");
    commands::setup_unpack_sources(unpack_cmd, opts);

    auto* files_cmd = app.add_subcommand("build-write-files",
                                         "Write the files listed in build.json");
    commands::setup_write_files(files_cmd, opts);

    auto* whitelist_cmd = app.add_subcommand("build-whitelist",
                                             "Print the sandbox read whitelist for the imports");
    commands::setup_whitelist(whitelist_cmd, opts);

    auto* profile_cmd = app.add_subcommand("build-profile",
                                           "Push or pop the temporary build profile");
    commands::setup_build_profile(profile_cmd, opts);

    auto* postprocess_cmd = app.add_subcommand("build-postprocess",
                                               "Relocate scripts and write-protect an artifact");
    commands::setup_postprocess(postprocess_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
