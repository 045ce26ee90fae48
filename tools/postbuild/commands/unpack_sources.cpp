/**
 * postbuild CLI - build-unpack-sources command
 *
 * Extract the sources of a build spec into the current directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <postbuild/build_spec.hpp>
#include <postbuild/source_cache.hpp>

namespace postbuild::cli::commands {

namespace {

struct UnpackSourcesOptions {
    std::string key = "sources";
    std::string input = BUILD_SPEC_FILE;
};

int cmd_unpack_sources(const GlobalOptions& opts, const UnpackSourcesOptions& unpack_opts) {
    setup_logging(opts);

    auto config = load_cli_config(opts);
    if (!config) {
        return 1;
    }

    auto doc = load_json_parameters(unpack_opts.input, unpack_opts.key);
    if (doc.isErr()) {
        print_error(doc.error());
        return 1;
    }
    auto items = parse_source_items(doc.value());
    if (items.isErr()) {
        print_error(items.error());
        return 1;
    }

    // Already extracted contents are left behind on failure
    SourceCache cache(config->source_cache_root);
    return exit_code(unpack_sources(items.value(), ".", cache));
}

} // anonymous namespace

void setup_unpack_sources(CLI::App* app, GlobalOptions& opts) {
    static UnpackSourcesOptions unpack_opts;

    app->add_option("--key", unpack_opts.key, "Key to read from the JSON file (default: sources)");
    app->add_option("--input", unpack_opts.input, "JSON parameter file (default: build.json)");

    app->callback([&opts]() {
        std::exit(cmd_unpack_sources(opts, unpack_opts));
    });
}

} // namespace postbuild::cli::commands
