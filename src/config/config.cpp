#include "postbuild/config.hpp"
#include "postbuild/platform.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

std::string postbuild_home() {
    auto home = get_env("HOME");
    return (home && !home->empty()) ? *home + "/.postbuild" : ".postbuild";
}

// Read an optional string member into out
VoidResult read_path(const nlohmann::json& section, const char* key,
                     const std::string& where, std::string& out) {
    if (!section.contains(key)) {
        return VoidResult::ok();
    }
    if (!section[key].is_string()) {
        return VoidResult::err(Error(ErrorCode::CONFIG_INVALID,
            where + "." + key + " must be a string"));
    }
    out = expand_user(section[key].get<std::string>());
    return VoidResult::ok();
}

Result<const nlohmann::json*> section_of(const nlohmann::json& j, const char* name) {
    if (!j.contains(name)) {
        return Result<const nlohmann::json*>::ok(nullptr);
    }
    if (!j[name].is_object()) {
        return Result<const nlohmann::json*>::err(Error(ErrorCode::CONFIG_INVALID,
            std::string(name) + " must be an object"));
    }
    return Result<const nlohmann::json*>::ok(&j[name]);
}

} // namespace

Config default_config() {
    std::string home = postbuild_home();
    Config config;
    config.artifact_root = home + "/opt";
    config.build_dir = home + "/bld";
    config.source_cache_root = home + "/src";
    return config;
}

Result<Config> parse_config(const std::string& json_str) {
    Config config = default_config();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Config>::err(Error(ErrorCode::CONFIG_INVALID,
            std::string("invalid JSON: ") + e.what()));
    }
    if (!j.is_object()) {
        return Result<Config>::err(Error(ErrorCode::CONFIG_INVALID,
            "config must be a JSON object"));
    }

    auto store = section_of(j, "build_store");
    if (store.isErr()) {
        return Result<Config>::err(store.error());
    }
    if (store.value()) {
        auto r = read_path(*store.value(), "artifact_root", "build_store", config.artifact_root);
        if (r.isErr()) return Result<Config>::err(r.error());
        r = read_path(*store.value(), "build_dir", "build_store", config.build_dir);
        if (r.isErr()) return Result<Config>::err(r.error());
    }

    auto cache = section_of(j, "source_cache");
    if (cache.isErr()) {
        return Result<Config>::err(cache.error());
    }
    if (cache.value()) {
        auto r = read_path(*cache.value(), "root", "source_cache", config.source_cache_root);
        if (r.isErr()) return Result<Config>::err(r.error());
    }

    return Result<Config>::ok(std::move(config));
}

Result<Config> load_config(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::ok(default_config());
    }
    auto content = read_file(path);
    if (!content) {
        return Result<Config>::err(Error(ErrorCode::CONFIG_INVALID,
            "cannot read config file " + path));
    }
    auto config = parse_config(*content);
    if (config.isErr()) {
        config.error().withContext(path);
    }
    return config;
}

std::string resolve_config_path(const std::optional<std::string>& override_path) {
    if (override_path && !override_path->empty()) {
        return expand_user(*override_path);
    }
    auto env_path = get_env(CONFIG_ENV_VAR);
    if (env_path && !env_path->empty()) {
        return expand_user(*env_path);
    }
    return postbuild_home() + "/config.json";
}

} // namespace postbuild
