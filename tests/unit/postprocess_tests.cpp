#include <doctest/doctest.h>
#include "../test_helpers.hpp"
#include <postbuild/platform.hpp>
#include <postbuild/postprocess.hpp>
#include <postbuild/shebang.hpp>

#include <filesystem>
#include <fstream>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace postbuild;
using postbuild::testing::TempDir;

static void write_file(const std::string& path, const std::string& content, unsigned mode = 0644) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream(path, std::ios::binary) << content;
    REQUIRE(chmod(path.c_str(), mode) == 0);
}

static unsigned mode_of(const std::string& path) {
    struct stat st;
    REQUIRE(lstat(path.c_str(), &st) == 0);
    return st.st_mode & 0777;
}

static FileHandler recorder(std::vector<std::string>& seen) {
    return FileHandler{"record", [&seen](const std::string& path) {
        seen.push_back(path);
        return VoidResult::ok();
    }};
}

TEST_CASE("postprocess_tree visits children before parents in sorted order") {
    TempDir temp;
    write_file(temp.path() + "/b.txt", "");
    write_file(temp.path() + "/a.txt", "");
    write_file(temp.path() + "/sub/z.txt", "");
    write_file(temp.path() + "/sub/deeper/y.txt", "");
    write_file(temp.path() + "/other/x.txt", "");

    std::vector<std::string> seen;
    auto summary = postprocess_tree(temp.path(), {recorder(seen)});
    REQUIRE(summary.isOk());
    CHECK(summary.value().files_visited == 5);

    std::vector<std::string> expected = {
        temp.path() + "/other/x.txt",
        temp.path() + "/sub/deeper/y.txt",
        temp.path() + "/sub/z.txt",
        temp.path() + "/a.txt",
        temp.path() + "/b.txt",
    };
    CHECK(seen == expected);
}

TEST_CASE("postprocess_tree does not descend into symlinked directories") {
    TempDir temp;
    write_file(temp.path() + "/outside/secret.txt", "");
    fs::create_directories(temp.path() + "/tree");
    fs::create_directory_symlink(temp.path() + "/outside", temp.path() + "/tree/link");

    std::vector<std::string> seen;
    auto summary = postprocess_tree(temp.path() + "/tree", {recorder(seen)});
    REQUIRE(summary.isOk());
    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == temp.path() + "/tree/link");
}

TEST_CASE("postprocess_tree applies handlers to a single file") {
    TempDir temp;
    write_file(temp.path() + "/one", "");

    std::vector<std::string> seen;
    auto summary = postprocess_tree(temp.path() + "/one", {recorder(seen)});
    REQUIRE(summary.isOk());
    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == temp.path() + "/one");
}

TEST_CASE("postprocess_tree reports a missing root") {
    TempDir temp;
    auto summary = postprocess_tree(temp.path() + "/missing", {});
    REQUIRE(summary.isErr());
    CHECK(summary.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("postprocess_tree records unsupported interpreters and continues") {
    TempDir temp;
    write_file(temp.path() + "/bin/a_ruby", "#!/opt/ruby/bin/ruby\n", 0755);
    write_file(temp.path() + "/bin/b_py", "#!/opt/py/bin/python\n", 0755);

    auto handlers = make_postprocess_handlers({ShebangStrategy::Multiline, true, ""});
    REQUIRE(handlers.isOk());
    auto summary = postprocess_tree(temp.path(), handlers.value());
    REQUIRE(summary.isOk());

    REQUIRE(summary.value().unsupported.size() == 1);
    CHECK(summary.value().unsupported[0] == temp.path() + "/bin/a_ruby");
    CHECK(read_file(temp.path() + "/bin/b_py").value().rfind("#!/bin/sh\n", 0) == 0);
    CHECK(mode_of(temp.path() + "/bin/a_ruby") == 0555u);
    CHECK(mode_of(temp.path() + "/bin/b_py") == 0555u);
}

TEST_CASE("postprocess_tree stops at the first hard error") {
    TempDir temp;
    write_file(temp.path() + "/a", "");
    write_file(temp.path() + "/b", "");

    int calls = 0;
    FileHandler failing{"fail", [&calls](const std::string&) {
        ++calls;
        return VoidResult::err(Error(ErrorCode::IO_ERROR, "boom"));
    }};
    auto summary = postprocess_tree(temp.path(), {failing});
    REQUIRE(summary.isErr());
    CHECK(summary.error().code() == ErrorCode::IO_ERROR);
    CHECK(calls == 1);
}

TEST_CASE("write protection leaves directories and symlink targets alone") {
    TempDir temp;
    write_file(temp.path() + "/tree/file", "x", 0664);
    write_file(temp.path() + "/target", "t", 0644);
    REQUIRE(symlink((temp.path() + "/target").c_str(), (temp.path() + "/tree/link").c_str()) == 0);

    auto summary = postprocess_tree(temp.path() + "/tree", {write_protect_handler()});
    REQUIRE(summary.isOk());
    CHECK(mode_of(temp.path() + "/tree/file") == 0444u);
    CHECK(mode_of(temp.path() + "/target") == 0644u);
    CHECK((mode_of(temp.path() + "/tree") & 0200) != 0);
}

TEST_CASE("launcher relocation does not revisit the files it creates") {
    TempDir temp;
    std::string launcher = launcher_program_path(temp.path() + "/launcher");
    write_file(launcher, "binary", 0755);
    write_file(temp.path() + "/art/bin/tool", "#!/opt/py/bin/python\n", 0755);

    PostprocessOptions options;
    options.shebang = ShebangStrategy::Launcher;
    options.write_protect = true;
    options.launcher_program = launcher;
    auto handlers = make_postprocess_handlers(options);
    REQUIRE(handlers.isOk());

    auto summary = postprocess_tree(temp.path() + "/art", handlers.value());
    REQUIRE(summary.isOk());
    CHECK(summary.value().files_visited == 1);
    CHECK(fs::is_symlink(temp.path() + "/art/bin/tool"));
    CHECK(mode_of(temp.path() + "/art/bin/tool.real") == 0444u);
}

TEST_CASE("make_postprocess_handlers checks the launcher before walking") {
    TempDir temp;
    PostprocessOptions options;
    options.shebang = ShebangStrategy::Launcher;
    options.launcher_program = launcher_program_path(temp.path());

    auto handlers = make_postprocess_handlers(options);
    REQUIRE(handlers.isErr());
    CHECK(handlers.error().code() == ErrorCode::MISSING_LAUNCHER);
}

TEST_CASE("parse_shebang_strategy") {
    CHECK(parse_shebang_strategy("none").value() == ShebangStrategy::None);
    CHECK(parse_shebang_strategy("multiline").value() == ShebangStrategy::Multiline);
    CHECK(parse_shebang_strategy("launcher").value() == ShebangStrategy::Launcher);
    CHECK(parse_shebang_strategy("magic").isErr());
}
