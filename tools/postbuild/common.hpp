/**
 * postbuild CLI - Common utilities and types
 */

#pragma once

#include <postbuild/config.hpp>
#include <postbuild/platform.hpp>
#include <postbuild/result.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#ifndef POSTBUILD_VERSION
#define POSTBUILD_VERSION "unknown"
#endif

namespace postbuild::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

// Environment variables shared with build scripts
inline constexpr const char* ENV_ARTIFACT = "ARTIFACT";
inline constexpr const char* ENV_BUILD = "BUILD";
inline constexpr const char* ENV_LAUNCHER = "LAUNCHER";
inline constexpr const char* ENV_IMPORT = "HDIST_IMPORT";
inline constexpr const char* ENV_VIRTUALS = "HDIST_VIRTUALS";

inline constexpr const char* BUILD_SPEC_FILE = "build.json";
inline constexpr const char* PROFILE_MANIFEST_FILE = "temp_build_profile_manifest.json";

/**
 * Route logs to stderr and pick the level.
 * -v selects debug, -q errors only.
 */
inline void setup_logging(const GlobalOptions& opts) {
    static auto logger = spdlog::stderr_color_mt("postbuild");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%^%l%$: %v");

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

inline void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << std::endl;
}

inline void print_error(const Error& error) {
    print_error(error.message());
}

/**
 * Read a variable the build environment must provide.
 */
inline std::optional<std::string> require_env(const char* name) {
    auto value = get_env(name);
    if (!value || value->empty()) {
        print_error(std::string("environment variable ") + name + " is not set");
        return std::nullopt;
    }
    return value;
}

/**
 * Load the configuration selected by --config / POSTBUILD_CONFIG.
 */
inline std::optional<Config> load_cli_config(const GlobalOptions& opts) {
    std::string path = resolve_config_path(
        opts.config.empty() ? std::nullopt : std::make_optional(opts.config));
    auto config = load_config(path);
    if (config.isErr()) {
        print_error(config.error());
        return std::nullopt;
    }
    spdlog::debug("configuration: {}", path);
    return config.value();
}

/**
 * Finish a command from a library result.
 */
inline int exit_code(const VoidResult& result) {
    if (result.isErr()) {
        print_error(result.error());
        return 1;
    }
    return 0;
}

} // namespace postbuild::cli
