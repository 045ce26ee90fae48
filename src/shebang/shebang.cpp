#include "postbuild/shebang.hpp"
#include "postbuild/platform.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

VoidResult overwrite_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return VoidResult::err(errno_error(errno, "cannot open " + path + " for writing"));
    }
    file << content;
    file.close();
    if (!file) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR, "failed writing " + path));
    }
    return VoidResult::ok();
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
    }
    return out;
}

} // namespace

Result<ShebangLine> parse_shebang(const std::string& line) {
    if (!starts_with(line, "#!")) {
        return Result<ShebangLine>::err(Error(ErrorCode::INVALID_SPEC, "expected a shebang"));
    }

    std::istringstream tokens(line.substr(2));
    std::vector<std::string> cmd;
    std::string token;
    while (tokens >> token) {
        cmd.push_back(token);
    }
    if (cmd.empty()) {
        return Result<ShebangLine>::err(Error(ErrorCode::INVALID_SPEC, "empty shebang"));
    }

    ShebangLine shebang;
    shebang.interpreter = cmd[0];
    if (cmd.size() > 1) {
        // The kernel passes everything after the interpreter as one argument
        std::string arg;
        for (size_t i = 1; i < cmd.size(); ++i) {
            if (i > 1) arg += ' ';
            arg += cmd[i];
        }
        shebang.argument = arg;
    }
    return Result<ShebangLine>::ok(std::move(shebang));
}

bool is_system_interpreter(const ShebangLine& shebang) {
    return starts_with(shebang.interpreter, "/bin/") ||
           starts_with(shebang.interpreter, "/usr/bin/");
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

// ============================================================================
// Multi-line Strategy
// ============================================================================

Result<bool> relocate_multiline(const std::string& path,
                                const std::vector<InterpreterPatcher>& patchers) {
    if (!is_plain_file(path) || !is_executable(path)) {
        return Result<bool>::ok(false);
    }

    auto content = read_file(path);
    if (!content) {
        return Result<bool>::err(errno_error(errno, "cannot read " + path));
    }
    if (!starts_with(*content, "#!")) {
        return Result<bool>::ok(false);
    }

    auto lines = split_lines(*content);
    auto patched = make_relative_multiline_shebang(path, lines, patchers);
    if (patched.isErr()) {
        return Result<bool>::err(patched.error());
    }

    std::string rewritten = join_lines(patched.value());
    if (rewritten == *content) {
        return Result<bool>::ok(false);
    }

    auto written = overwrite_file(path, rewritten);
    if (written.isErr()) {
        return Result<bool>::err(written.error());
    }
    spdlog::debug("multi-line shebang written to {}", path);
    return Result<bool>::ok(true);
}

// ============================================================================
// Launcher Strategy
// ============================================================================

std::string launcher_program_path(const std::string& launcher_root) {
    return (fs::path(launcher_root) / "bin" / "launcher").string();
}

VoidResult check_launcher_program(const std::string& launcher_program) {
    std::error_code ec;
    if (!fs::exists(launcher_program, ec)) {
        return VoidResult::err(Error(ErrorCode::MISSING_LAUNCHER,
            launcher_program + " does not exist"));
    }
    return VoidResult::ok();
}

Result<bool> relocate_with_launcher(const std::string& path,
                                    const std::string& launcher_program) {
    if (!is_plain_file(path)) {
        return Result<bool>::ok(false);
    }
    // Coarse test for "installed entry point"
    if (path.find("bin") == std::string::npos) {
        return Result<bool>::ok(false);
    }
    if (!is_executable(path)) {
        return Result<bool>::ok(false);
    }

    auto content = read_file(path);
    if (!content) {
        return Result<bool>::err(errno_error(errno, "cannot read " + path));
    }
    if (!starts_with(*content, "#!")) {
        return Result<bool>::ok(false);
    }

    auto lines = split_lines(*content);
    auto shebang = parse_shebang(lines[0]);
    if (shebang.isErr()) {
        return Result<bool>::err(Error(ErrorCode::UNSUPPORTED_INTERPRETER,
            shebang.error().message() + " in \"" + path + "\""));
    }

    std::string dirname = fs::path(absolute_normal(path)).parent_path().string();
    const auto& interpreter = shebang.value().interpreter;

    // Set up:
    //   thescript       symlink to ../../path/to/launcher
    //   thescript.real  non-executable script with the rewritten shebang
    std::string interpreters = "${PROFILE_BIN_DIR}/" + fs::path(interpreter).filename().string() +
                               ":${ORIGIN}/" + relative_path(interpreter, dirname);
    lines[0] = "#!" + interpreters;
    if (shebang.value().argument) {
        lines[0] += " " + *shebang.value().argument;
    }
    lines[0] += "\n";

    std::string real_path = path + ".real";
    auto written = overwrite_file(real_path, join_lines(lines));
    if (written.isErr()) {
        return Result<bool>::err(written.error());
    }
    auto protect = write_protect(real_path);
    if (protect.isErr()) {
        return Result<bool>::err(protect.error());
    }

    std::string rel_launcher = relative_path(launcher_program, dirname);
    if (unlink(path.c_str()) != 0) {
        return Result<bool>::err(errno_error(errno, "cannot remove " + path));
    }
    if (symlink(rel_launcher.c_str(), path.c_str()) != 0) {
        return Result<bool>::err(errno_error(errno, "cannot link " + path + " to launcher"));
    }

    spdlog::debug("{} now runs through launcher {}", path, rel_launcher);
    return Result<bool>::ok(true);
}

} // namespace postbuild
