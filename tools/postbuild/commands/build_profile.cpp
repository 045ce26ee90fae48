/**
 * postbuild CLI - build-profile command
 *
 * push links the imports of $BUILD/build.json into $ARTIFACT;
 * pop removes exactly those files again.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <postbuild/build_profile.hpp>
#include <postbuild/build_spec.hpp>
#include <postbuild/build_store.hpp>

namespace postbuild::cli::commands {

namespace {

struct BuildProfileOptions {
    std::string action;
};

int cmd_push(const GlobalOptions& opts, const std::string& build, const std::string& artifact) {
    auto config = load_cli_config(opts);
    if (!config) {
        return 1;
    }
    auto virtuals = parse_virtuals(get_env(ENV_VIRTUALS).value_or(""));
    if (virtuals.isErr()) {
        print_error(virtuals.error());
        return 1;
    }

    ProfilePushOptions push_opts;
    push_opts.target_dir = artifact;
    push_opts.build_spec_path = build + "/" + BUILD_SPEC_FILE;
    push_opts.manifest_path = build + "/" + PROFILE_MANIFEST_FILE;
    push_opts.virtuals = std::move(virtuals.value());

    BuildStore store(config->artifact_root, config->build_dir);
    SymlinkFarmBuilder builder(store);
    auto manifest = push_build_profile(push_opts, builder);
    if (manifest.isErr()) {
        print_error(manifest.error());
        return 1;
    }
    spdlog::info("build profile: {} file(s) linked into {}",
                 manifest.value().installed_files.size(), artifact);
    return 0;
}

int cmd_build_profile(const GlobalOptions& opts, const BuildProfileOptions& profile_opts) {
    setup_logging(opts);

    auto build = require_env(ENV_BUILD);
    auto artifact = require_env(ENV_ARTIFACT);
    if (!build || !artifact) {
        return 1;
    }

    if (profile_opts.action == "push") {
        return cmd_push(opts, *build, *artifact);
    }
    return exit_code(pop_build_profile_file(*build + "/" + PROFILE_MANIFEST_FILE, *artifact));
}

} // anonymous namespace

void setup_build_profile(CLI::App* app, GlobalOptions& opts) {
    static BuildProfileOptions profile_opts;

    app->add_option("action", profile_opts.action, "push or pop")
        ->required()
        ->check(CLI::IsMember({"push", "pop"}));

    app->callback([&opts]() {
        std::exit(cmd_build_profile(opts, profile_opts));
    });
}

} // namespace postbuild::cli::commands
