#include "postbuild/postprocess.hpp"
#include "postbuild/platform.hpp"
#include "postbuild/shebang.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

VoidResult apply_handlers(const std::string& path,
                          const std::vector<FileHandler>& handlers,
                          WalkSummary& summary) {
    ++summary.files_visited;
    for (const auto& handler : handlers) {
        auto result = handler.apply(path);
        if (result.isOk()) {
            continue;
        }
        if (result.error().code() == ErrorCode::UNSUPPORTED_INTERPRETER) {
            spdlog::warn("{}", result.error().message());
            summary.unsupported.push_back(path);
            continue;
        }
        return VoidResult::err(result.error().withContext(handler.name));
    }
    return VoidResult::ok();
}

VoidResult walk_directory(const fs::path& dir,
                          const std::vector<FileHandler>& handlers,
                          WalkSummary& summary) {
    std::vector<fs::path> subdirs;
    std::vector<fs::path> files;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "cannot list " + dir.string() + ": " + ec.message()));
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code sec;
        if (fs::is_directory(it->symlink_status(sec))) {
            subdirs.push_back(it->path());
        } else {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "cannot list " + dir.string() + ": " + ec.message()));
    }
    std::sort(subdirs.begin(), subdirs.end());
    std::sort(files.begin(), files.end());

    for (const auto& sub : subdirs) {
        auto result = walk_directory(sub, handlers, summary);
        if (result.isErr()) {
            return result;
        }
    }
    for (const auto& file : files) {
        auto result = apply_handlers(file.string(), handlers, summary);
        if (result.isErr()) {
            return result;
        }
    }
    return VoidResult::ok();
}

} // namespace

Result<WalkSummary> postprocess_tree(const std::string& root,
                                     const std::vector<FileHandler>& handlers) {
    WalkSummary summary;

    std::error_code ec;
    auto status = fs::symlink_status(root, ec);
    if (ec || !fs::exists(status)) {
        return Result<WalkSummary>::err(Error(ErrorCode::FILE_NOT_FOUND,
            "path does not exist: " + root));
    }

    VoidResult result = fs::is_directory(status)
        ? walk_directory(fs::path(root), handlers, summary)
        : apply_handlers(root, handlers, summary);
    if (result.isErr()) {
        return Result<WalkSummary>::err(result.error());
    }

    if (!summary.unsupported.empty()) {
        spdlog::warn("{} script(s) with unsupported interpreters left as-is",
                     summary.unsupported.size());
    }
    spdlog::debug("postprocessed {} file(s) below {}", summary.files_visited, root);
    return Result<WalkSummary>::ok(std::move(summary));
}

Result<ShebangStrategy> parse_shebang_strategy(const std::string& name) {
    if (name == "none") return Result<ShebangStrategy>::ok(ShebangStrategy::None);
    if (name == "multiline") return Result<ShebangStrategy>::ok(ShebangStrategy::Multiline);
    if (name == "launcher") return Result<ShebangStrategy>::ok(ShebangStrategy::Launcher);
    return Result<ShebangStrategy>::err(Error(ErrorCode::INVALID_SPEC,
        "unknown shebang strategy: " + name));
}

FileHandler multiline_shebang_handler() {
    return FileHandler{"multiline shebang", [](const std::string& path) -> VoidResult {
        auto result = relocate_multiline(path);
        if (result.isErr()) {
            return VoidResult::err(result.error());
        }
        return VoidResult::ok();
    }};
}

FileHandler launcher_shebang_handler(const std::string& launcher_program) {
    return FileHandler{"launcher shebang", [launcher_program](const std::string& path) -> VoidResult {
        auto result = relocate_with_launcher(path, launcher_program);
        if (result.isErr()) {
            return VoidResult::err(result.error());
        }
        return VoidResult::ok();
    }};
}

FileHandler write_protect_handler() {
    return FileHandler{"write protect", [](const std::string& path) {
        return write_protect(path);
    }};
}

Result<std::vector<FileHandler>> make_postprocess_handlers(const PostprocessOptions& options) {
    std::vector<FileHandler> handlers;

    switch (options.shebang) {
        case ShebangStrategy::None:
            break;
        case ShebangStrategy::Multiline:
            handlers.push_back(multiline_shebang_handler());
            break;
        case ShebangStrategy::Launcher: {
            auto check = check_launcher_program(options.launcher_program);
            if (check.isErr()) {
                return Result<std::vector<FileHandler>>::err(check.error());
            }
            handlers.push_back(launcher_shebang_handler(options.launcher_program));
            break;
        }
    }

    if (options.write_protect) {
        handlers.push_back(write_protect_handler());
    }

    return Result<std::vector<FileHandler>>::ok(std::move(handlers));
}

} // namespace postbuild
