#pragma once

#include "postbuild/result.hpp"

#include <optional>
#include <string>

namespace postbuild {

// ============================================================================
// Configuration
// ============================================================================
//
// {
//   "build_store":  {"artifact_root": "~/.postbuild/opt", "build_dir": "~/.postbuild/bld"},
//   "source_cache": {"root": "~/.postbuild/src"}
// }

inline constexpr const char* CONFIG_ENV_VAR = "POSTBUILD_CONFIG";

struct Config {
    std::string artifact_root;
    std::string build_dir;
    std::string source_cache_root;
};

// Defaults below $HOME/.postbuild
Config default_config();

// Parse a config document. Missing keys keep their defaults, "~" expands to
// $HOME. CONFIG_INVALID on malformed JSON or wrongly typed values.
Result<Config> parse_config(const std::string& json_str);

// Load a config file. A missing file yields the defaults.
Result<Config> load_config(const std::string& path);

// Config file location. Priority: explicit path > POSTBUILD_CONFIG >
// $HOME/.postbuild/config.json
std::string resolve_config_path(const std::optional<std::string>& override_path);

} // namespace postbuild
