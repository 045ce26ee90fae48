/**
 * postbuild CLI - build-write-files command
 *
 * Write the files embedded in a build spec.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <postbuild/build_spec.hpp>
#include <postbuild/files_dsl.hpp>

namespace postbuild::cli::commands {

namespace {

struct WriteFilesOptions {
    std::string key = "files";
    std::string input = BUILD_SPEC_FILE;
};

int cmd_write_files(const GlobalOptions& opts, const WriteFilesOptions& files_opts) {
    setup_logging(opts);

    auto doc = load_json_parameters(files_opts.input, files_opts.key);
    if (doc.isErr()) {
        print_error(doc.error());
        return 1;
    }
    auto specs = parse_file_specs(doc.value());
    if (specs.isErr()) {
        print_error(specs.error());
        return 1;
    }

    return exit_code(execute_files_dsl(specs.value(), get_all_env()));
}

} // anonymous namespace

void setup_write_files(CLI::App* app, GlobalOptions& opts) {
    static WriteFilesOptions files_opts;

    app->add_option("--key", files_opts.key, "Key to read from the JSON file (default: files)");
    app->add_option("--input", files_opts.input, "JSON parameter file (default: build.json)");

    app->callback([&opts]() {
        std::exit(cmd_write_files(opts, files_opts));
    });
}

} // namespace postbuild::cli::commands
