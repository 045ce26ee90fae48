/**
 * postbuild CLI - create-links command
 *
 * Run a links DSL document read from a JSON file.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <postbuild/build_spec.hpp>
#include <postbuild/links.hpp>
#include <postbuild/shebang.hpp>

namespace postbuild::cli::commands {

namespace {

struct CreateLinksOptions {
    std::string key = "/";
    std::string input;
};

int cmd_create_links(const GlobalOptions& opts, const CreateLinksOptions& links_opts) {
    setup_logging(opts);

    auto doc = load_json_parameters(links_opts.input, links_opts.key);
    if (doc.isErr()) {
        print_error(doc.error());
        return 1;
    }
    auto rules = parse_link_rules(doc.value());
    if (rules.isErr()) {
        print_error(rules.error());
        return 1;
    }

    std::optional<std::string> launcher;
    if (auto prefix = get_env(ENV_LAUNCHER)) {
        launcher = launcher_program_path(*prefix);
    }

    GlobLinksExecutor executor;
    return exit_code(executor.execute(rules.value(), get_all_env(), launcher));
}

} // anonymous namespace

void setup_create_links(CLI::App* app, GlobalOptions& opts) {
    static CreateLinksOptions links_opts;

    app->add_option("--key", links_opts.key, "Read a sub-key from the JSON file");
    app->add_option("input", links_opts.input, "JSON parameter file")->required();

    app->callback([&opts]() {
        std::exit(cmd_create_links(opts, links_opts));
    });
}

} // namespace postbuild::cli::commands
