/**
 * End-to-end run of the build helpers in the order a build script uses them:
 * push the profile, write files, postprocess, pop the profile.
 */

#include <doctest/doctest.h>
#include "../test_helpers.hpp"
#include <postbuild/build_profile.hpp>
#include <postbuild/build_spec.hpp>
#include <postbuild/files_dsl.hpp>
#include <postbuild/platform.hpp>
#include <postbuild/postprocess.hpp>
#include <postbuild/shebang.hpp>

#include <filesystem>
#include <fstream>

#include <sys/stat.h>

namespace fs = std::filesystem;

using namespace postbuild;
using postbuild::testing::TempDir;

static void put(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

TEST_CASE("build cycle leaves only the artifact's own files behind") {
    TempDir temp;
    std::string opt = temp.path() + "/opt";
    std::string art = temp.path() + "/art";
    std::string bld = temp.path() + "/bld";

    put(opt + "/python/p1/bin/python", "#!/bin/sh\n");
    put(opt + "/python/p1/lib/libpython.so", "lib");
    put(opt + "/python/p1/artifact.json", "{}");
    fs::create_directories(art);

    put(bld + "/build.json", R"({
        "build": {"import": [{"id": "virtual:python"}]},
        "files": [
            {"target": "$ARTIFACT/bin/tool", "executable": true,
             "text": ["#!$ARTIFACT/bin/python", "import sys", "print(sys.argv)"],
             "expandvars": true},
            {"target": "$ARTIFACT/share/tool.json", "object": {"name": "tool", "version": 1}}
        ]
    })");

    BuildStore store(opt, bld);
    SymlinkFarmBuilder farm(store);
    EnvMap env = {{"ARTIFACT", art}, {"BUILD", bld}};

    // push
    ProfilePushOptions push;
    push.target_dir = art;
    push.build_spec_path = bld + "/build.json";
    push.manifest_path = bld + "/temp_build_profile_manifest.json";
    push.virtuals = {{"virtual:python", "python/p1"}};
    auto pushed = push_build_profile(push, farm);
    REQUIRE(pushed.isOk());
    CHECK(pushed.value().installed_files.count(art + "/bin/python") == 1);
    CHECK(fs::is_symlink(art + "/bin/python"));
    CHECK_FALSE(fs::exists(art + "/artifact.json"));

    // write files
    auto files_doc = load_json_parameters(bld + "/build.json", "files");
    REQUIRE(files_doc.isOk());
    auto specs = parse_file_specs(files_doc.value());
    REQUIRE(specs.isOk());
    REQUIRE(execute_files_dsl(specs.value(), env).isOk());
    CHECK(read_file(art + "/bin/tool").value().rfind("#!" + art + "/bin/python\n", 0) == 0);
    CHECK(read_file(art + "/share/tool.json").value() ==
          "{\n  \"name\": \"tool\",\n  \"version\": 1\n}");

    // postprocess
    PostprocessOptions post;
    post.shebang = ShebangStrategy::Multiline;
    post.write_protect = true;
    auto handlers = make_postprocess_handlers(post);
    REQUIRE(handlers.isOk());
    auto summary = postprocess_tree(art, handlers.value());
    REQUIRE(summary.isOk());
    CHECK(summary.value().unsupported.empty());

    auto lines = split_lines(read_file(art + "/bin/tool").value());
    REQUIRE(lines.size() > 3);
    CHECK(lines[0] == "#!/bin/sh\n");
    CHECK(lines[2].find("i=\"python\"") != std::string::npos);

    struct stat st;
    REQUIRE(stat((art + "/share/tool.json").c_str(), &st) == 0);
    CHECK((st.st_mode & 0222) == 0);
    REQUIRE(stat((opt + "/python/p1/lib/libpython.so").c_str(), &st) == 0);
    CHECK((st.st_mode & 0200) != 0);

    // pop
    REQUIRE(pop_build_profile_file(push.manifest_path, art).isOk());
    CHECK_FALSE(fs::exists(fs::symlink_status(art + "/bin/python")));
    CHECK_FALSE(fs::exists(art + "/lib"));
    CHECK_FALSE(fs::exists(push.manifest_path));
    CHECK_FALSE(fs::exists(art + "/profile.json"));
    CHECK(fs::exists(art + "/bin/tool"));
    CHECK(fs::exists(art + "/share/tool.json"));
    CHECK(fs::exists(opt + "/python/p1/bin/python"));
}
