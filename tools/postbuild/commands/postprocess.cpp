/**
 * postbuild CLI - build-postprocess command
 *
 * Walk an artifact (default $ARTIFACT) applying shebang relocation and
 * write protection.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <postbuild/postprocess.hpp>
#include <postbuild/shebang.hpp>

namespace postbuild::cli::commands {

namespace {

struct PostprocessCliOptions {
    std::string shebang = "none";
    bool write_protect = false;
    std::string path;
};

int cmd_postprocess(const GlobalOptions& opts, const PostprocessCliOptions& pp_opts) {
    setup_logging(opts);

    auto strategy = parse_shebang_strategy(pp_opts.shebang);
    if (strategy.isErr()) {
        print_error(strategy.error());
        return 1;
    }

    PostprocessOptions options;
    options.shebang = strategy.value();
    options.write_protect = pp_opts.write_protect;
    if (options.shebang == ShebangStrategy::Launcher) {
        auto launcher = require_env(ENV_LAUNCHER);
        if (!launcher) {
            return 1;
        }
        options.launcher_program = launcher_program_path(*launcher);
    }

    std::string path = pp_opts.path;
    if (path.empty()) {
        auto artifact = get_env(ENV_ARTIFACT);
        if (!artifact || artifact->empty()) {
            print_error("path not given and ARTIFACT environment variable not set");
            return 1;
        }
        path = *artifact;
    }

    auto handlers = make_postprocess_handlers(options);
    if (handlers.isErr()) {
        print_error(handlers.error());
        return 1;
    }

    auto summary = postprocess_tree(path, handlers.value());
    if (summary.isErr()) {
        print_error(summary.error());
        return 1;
    }
    return 0;
}

} // anonymous namespace

void setup_postprocess(CLI::App* app, GlobalOptions& opts) {
    static PostprocessCliOptions pp_opts;

    app->add_option("--shebang", pp_opts.shebang, "Shebang relocation technique")
        ->check(CLI::IsMember({"multiline", "launcher", "none"}));
    app->add_flag("--write-protect", pp_opts.write_protect, "Remove all write mode bits");
    app->add_option("path", pp_opts.path,
                    "File or directory to post-process (directories are walked recursively)");

    app->callback([&opts]() {
        std::exit(cmd_postprocess(opts, pp_opts));
    });
}

} // namespace postbuild::cli::commands
