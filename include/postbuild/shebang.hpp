#pragma once

#include "postbuild/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace postbuild {

// ============================================================================
// Shebang Parsing
// ============================================================================

struct ShebangLine {
    std::string interpreter;              // e.g. "/opt/python/bin/python2.7"
    std::optional<std::string> argument;  // remaining tokens joined by " "
};

// Parse a "#!interpreter [arg]" line (trailing newline allowed).
// INVALID_SPEC if the line does not start with "#!" or names no interpreter.
Result<ShebangLine> parse_shebang(const std::string& line);

// True for interpreters below /bin or /usr/bin; these are left alone
bool is_system_interpreter(const ShebangLine& shebang);

// Split text into lines, each keeping its terminating "\n"
std::vector<std::string> split_lines(const std::string& text);

// ============================================================================
// Multi-line Shebang
// ============================================================================
//
// A script whose interpreter lives inside an artifact gets a preamble that is
// valid both as /bin/sh and as the script's own language:
//
//   #!/bin/sh
//   "true" '''\';<one-line launcher snippet>
//   ''' # end multi-line shebang
//
// The shell runs the snippet, which execs the interpreter of the profile the
// script was reached through (a directory holding "profile.json"), or the
// interpreter at the original location relative to the script.

inline constexpr const char* PROFILE_MARKER_FILE = "profile.json";

struct LauncherDescriptor {
    std::string relative_interpreter_dir;  // from the script's directory
    std::string interpreter_name;          // base name, looked up in <profile>/bin
    std::string argument_assignment;       // arg="..." or empty
    std::string argument_expression;       // " \"$arg\" " or " "
};

LauncherDescriptor make_launcher_descriptor(const std::string& script_path,
                                            const ShebangLine& shebang);

// Multi-line, commented shell source of the launcher snippet
std::string render_launcher_script(const LauncherDescriptor& descriptor);

// Minify shell source into one line: comments and blank lines are dropped,
// lines ending in " do" or " then" get a trailing space, all others ";"
std::string pack_sh_script(const std::string& script);

// Add Emacs and vi mode lines unless the script already has them
std::vector<std::string> add_modelines(std::vector<std::string> lines,
                                       const std::string& language);

// Rewrite a Python script (lines[0] is its shebang) into the multi-line form
std::vector<std::string> patch_python_shebang(const std::string& script_path,
                                              std::vector<std::string> lines);

// ============================================================================
// Interpreter Registry
// ============================================================================

struct InterpreterPatcher {
    std::string language;
    // Decides from the interpreter base name
    std::function<bool(const std::string& interpreter_name)> matches;
    std::function<std::vector<std::string>(const std::string& script_path,
                                           std::vector<std::string> lines)> patch;
};

// Patchers tried in order; currently Python only
const std::vector<InterpreterPatcher>& default_interpreter_patchers();

// Apply the first matching patcher to the script lines. System interpreters
// come back unchanged; UNSUPPORTED_INTERPRETER if no patcher matches.
Result<std::vector<std::string>> make_relative_multiline_shebang(
    const std::string& script_path,
    std::vector<std::string> lines,
    const std::vector<InterpreterPatcher>& patchers = default_interpreter_patchers());

// ============================================================================
// File Relocation
// ============================================================================

// Multi-line strategy. Applies to regular executable files starting with "#!";
// returns true when the file was rewritten.
Result<bool> relocate_multiline(
    const std::string& path,
    const std::vector<InterpreterPatcher>& patchers = default_interpreter_patchers());

// Launcher program inside a launcher artifact: <launcher_root>/bin/launcher
std::string launcher_program_path(const std::string& launcher_root);

// MISSING_LAUNCHER unless the launcher program exists
VoidResult check_launcher_program(const std::string& launcher_program);

// Launcher strategy. Applies to regular executable "#!" files whose path
// contains "bin": the script moves to <path>.real (write-protected, shebang
// rewritten to "${PROFILE_BIN_DIR}/<name>:${ORIGIN}/<relpath>") and <path>
// becomes a relative symlink to the launcher program. Returns true when the
// file was relocated.
Result<bool> relocate_with_launcher(const std::string& path,
                                    const std::string& launcher_program);

} // namespace postbuild
