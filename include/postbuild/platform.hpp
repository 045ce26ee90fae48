#pragma once

#include "postbuild/result.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace postbuild {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// File Helpers
// ============================================================================

// Read an entire file in binary mode
std::optional<std::string> read_file(const std::string& path);

// Translate an errno value into an Error, prefixing the message with context
Error errno_error(int err, const std::string& context);

// True if the path is a regular file (symlinks are not followed)
bool is_plain_file(const std::string& path);

// True if any execute bit is set on the file (follows symlinks)
bool is_executable(const std::string& path);

// Remove all write permission bits from a file
VoidResult write_protect(const std::string& path);

// Relative path from base_dir to target, computed lexically on absolute
// paths (symlinks are not resolved). Returns "." when both are equal.
std::string relative_path(const std::string& target, const std::string& base_dir);

// Absolute, lexically normalized form of a path
std::string absolute_normal(const std::string& path);

// Recursively list every non-directory entry below dir (symlinks included,
// never followed). Returns absolute paths; a missing dir yields an empty set.
Result<std::set<std::string>> list_files_recursive(const std::string& dir);

// True if path equals root or lies below it, comparing whole components
// lexically. Both paths must already be normalized.
bool is_under(const std::filesystem::path& path, const std::filesystem::path& root);

// Remove dir if it is empty, then its parents while they are empty, stopping
// before root. Fails with PATH_TRAVERSAL if dir is not below root.
VoidResult remove_empty_dirs_up_to(const std::string& dir, const std::string& root);

// ============================================================================
// Environment
// ============================================================================

using EnvMap = std::unordered_map<std::string, std::string>;

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get all environment variables as a map
EnvMap get_all_env();

// Replace a leading "~" with $HOME
std::string expand_user(const std::string& path);


} // namespace postbuild
