#include "postbuild/shebang.hpp"
#include "postbuild/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Blank or comment-only line
bool is_python_empty_line(const std::string& line) {
    std::string t = trim(line);
    return t.empty() || t[0] == '#';
}

// Line starting a string literal, optionally with u/b/r prefixes
bool is_python_docstring_line(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    while (i < line.size() && line[i] != '\0' && std::strchr("ubrUBR", line[i]) != nullptr) ++i;
    return i < line.size() && (line[i] == '"' || line[i] == '\'');
}

const char* const PYTHON_PREAMBLE_OPEN = "\"true\" '''\\';";
const char* const PYTHON_PREAMBLE_CLOSE = "''' # end multi-line shebang, see postbuild build-postprocess\n";

} // namespace

LauncherDescriptor make_launcher_descriptor(const std::string& script_path,
                                            const ShebangLine& shebang) {
    LauncherDescriptor desc;
    fs::path interpreter(shebang.interpreter);
    desc.interpreter_name = interpreter.filename().string();
    desc.relative_interpreter_dir =
        relative_path(interpreter.parent_path().string(),
                      fs::path(absolute_normal(script_path)).parent_path().string());
    if (shebang.argument) {
        desc.argument_assignment = "arg=\"" + *shebang.argument + "\"";
        desc.argument_expression = " \"$arg\" ";
    } else {
        desc.argument_expression = " ";
    }
    return desc;
}

std::string render_launcher_script(const LauncherDescriptor& d) {
    std::ostringstream s;
    s << "r=\"" << d.relative_interpreter_dir << "\" # interpreter directory relative to the script\n"
      << "i=\"" << d.interpreter_name << "\" # interpreter base name\n"
      << d.argument_assignment << " # set when the original shebang had an argument\n"
      << "o=`pwd`\n"
      << "\n"
      << "# Follow the chain of links from $0. p is the current link; after the\n"
      << "# loop the working directory is the one holding the real script.\n"
      << "p=\"$0\"\n"
      << "while true; do\n"
      << "  # test for a link before changing directory\n"
      << "  test -L \"$p\"\n"
      << "  il=$?\n"
      << "  cd `dirname \"$p\"`\n"
      << "  pdir=`pwd -P`\n"
      << "  d=\"$pdir\"\n"
      << "\n"
      << "  # walk towards / looking for a profile marker\n"
      << "  while [ \"$d\" != / ]; do\n"
      << "    [ -e " << PROFILE_MARKER_FILE << " ]&&cd \"$o\"&&exec \"$d/bin/$i\" \"$0\""
      << d.argument_expression << "\"$@\"\n"
      << "    cd ..\n"
      << "    d=`pwd -P`\n"
      << "  done\n"
      << "\n"
      << "  cd \"$pdir\"\n"
      << "  if [ \"$il\" -ne 0 ];then break;fi\n"
      << "  # $p is relative to the directory we left, resolve it by base name\n"
      << "  b=`basename \"$p\"`\n"
      << "  p=`readlink \"$b\"`\n"
      << "done\n"
      << "\n"
      << "# no profile found, use the interpreter relative to the script\n"
      << "cd \"$r\"\n"
      << "p=`pwd -P`\n"
      << "cd \"$o\"\n"
      << "exec \"$p/$i\" \"$0\"" << d.argument_expression << "\"$@\"\n"
      << "exit 127\n";
    return s.str();
}

std::string pack_sh_script(const std::string& script) {
    std::string packed;
    std::istringstream in(script);
    std::string line;
    while (std::getline(in, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) continue;
        if (ends_with(line, " do") || ends_with(line, " then")) {
            packed += line + " ";
        } else {
            packed += line + ";";
        }
    }
    return packed;
}

std::vector<std::string> add_modelines(std::vector<std::string> lines,
                                       const std::string& language) {
    if (lines.empty()) {
        return lines;
    }

    bool has_emacs = std::any_of(lines.begin(), lines.end(), [](const std::string& l) {
        return l.find("-*-") != std::string::npos;
    });
    bool has_vi = std::any_of(lines.begin(), lines.end(), [](const std::string& l) {
        return l.find(" vi:") != std::string::npos;
    });

    if (!has_emacs) {
        lines.insert(lines.begin() + 1, "# -*- mode: " + language + " -*-\n");
    }
    if (!has_vi) {
        if (!lines.back().empty() && lines.back().back() != '\n') {
            lines.back() += "\n";
        }
        lines.push_back("# vi: filetype=" + language + "\n");
    }
    return lines;
}

std::vector<std::string> patch_python_shebang(const std::string& script_path,
                                              std::vector<std::string> lines) {
    auto shebang = parse_shebang(lines.empty() ? std::string() : lines[0]);
    if (shebang.isErr()) {
        return lines;
    }
    lines.erase(lines.begin());

    // The preamble string becomes the first statement, so an existing module
    // docstring has to be assigned explicitly to stay the docstring.
    for (auto& line : lines) {
        if (is_python_docstring_line(line)) {
            line = "__doc__ = " + line;
        }
        if (!is_python_empty_line(line)) {
            break;
        }
    }

    auto descriptor = make_launcher_descriptor(script_path, shebang.value());
    std::vector<std::string> result;
    result.reserve(lines.size() + 5);
    result.push_back("#!/bin/sh\n");
    result.push_back(std::string(PYTHON_PREAMBLE_OPEN) +
                     pack_sh_script(render_launcher_script(descriptor)) + "\n");
    result.push_back(PYTHON_PREAMBLE_CLOSE);
    result.insert(result.end(), lines.begin(), lines.end());

    return add_modelines(std::move(result), "python");
}

const std::vector<InterpreterPatcher>& default_interpreter_patchers() {
    static const std::vector<InterpreterPatcher> patchers = {
        InterpreterPatcher{
            "python",
            [](const std::string& name) { return name.find("python") != std::string::npos; },
            patch_python_shebang,
        },
    };
    return patchers;
}

Result<std::vector<std::string>> make_relative_multiline_shebang(
    const std::string& script_path,
    std::vector<std::string> lines,
    const std::vector<InterpreterPatcher>& patchers) {

    auto shebang = parse_shebang(lines.empty() ? std::string() : lines[0]);
    if (shebang.isErr()) {
        return Result<std::vector<std::string>>::err(Error(ErrorCode::UNSUPPORTED_INTERPRETER,
            shebang.error().message() + " in \"" + script_path + "\""));
    }

    if (is_system_interpreter(shebang.value())) {
        return Result<std::vector<std::string>>::ok(std::move(lines));
    }

    std::string name = fs::path(shebang.value().interpreter).filename().string();
    for (const auto& patcher : patchers) {
        if (patcher.matches(name)) {
            return Result<std::vector<std::string>>::ok(patcher.patch(script_path, std::move(lines)));
        }
    }

    return Result<std::vector<std::string>>::err(Error(ErrorCode::UNSUPPORTED_INTERPRETER,
        "no support for shebang \"" + trim(lines[0]) + "\" in file \"" + script_path + "\""));
}

} // namespace postbuild
