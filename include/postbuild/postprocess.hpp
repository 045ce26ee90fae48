#pragma once

#include "postbuild/result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace postbuild {

// ============================================================================
// Postprocess Walker
// ============================================================================

// A handler is applied to every non-directory entry of the walked tree.
// Handlers must tolerate symlinks and files they do not apply to.
struct FileHandler {
    std::string name;
    std::function<VoidResult(const std::string& path)> apply;
};

struct WalkSummary {
    size_t files_visited = 0;
    std::vector<std::string> unsupported;  // skipped scripts, in walk order
};

/**
 * Apply handlers to root, or to every entry below it if root is a directory.
 *
 * Directories are walked post-order with entries sorted by name: child
 * directories first, then the directory's own files. Symlinked directories
 * are not descended into. Each directory is listed before any handler runs on
 * its files, so files a handler creates are not visited.
 *
 * UNSUPPORTED_INTERPRETER from a handler is logged and recorded in the
 * summary; any other error stops the walk. FILE_NOT_FOUND if root is missing.
 */
Result<WalkSummary> postprocess_tree(const std::string& root,
                                     const std::vector<FileHandler>& handlers);

// ============================================================================
// Handler Chain
// ============================================================================

enum class ShebangStrategy {
    None,
    Multiline,
    Launcher,
};

// Parse "none" / "multiline" / "launcher"
Result<ShebangStrategy> parse_shebang_strategy(const std::string& name);

struct PostprocessOptions {
    ShebangStrategy shebang = ShebangStrategy::None;
    bool write_protect = false;
    std::string launcher_program;  // required for ShebangStrategy::Launcher
};

FileHandler multiline_shebang_handler();
FileHandler launcher_shebang_handler(const std::string& launcher_program);
FileHandler write_protect_handler();

// Build the handler chain: shebang relocation first, then write protection.
// MISSING_LAUNCHER if the launcher strategy is chosen and the program is absent.
Result<std::vector<FileHandler>> make_postprocess_handlers(const PostprocessOptions& options);

} // namespace postbuild
