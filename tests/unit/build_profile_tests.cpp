#include <doctest/doctest.h>
#include "../test_helpers.hpp"
#include <postbuild/build_profile.hpp>
#include <postbuild/platform.hpp>

#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

using namespace postbuild;
using postbuild::testing::TempDir;

static void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

// Relative path -> content of every file below dir
static std::map<std::string, std::string> snapshot(const std::string& dir) {
    std::map<std::string, std::string> files;
    auto listed = list_files_recursive(dir);
    REQUIRE(listed.isOk());
    for (const auto& path : listed.value()) {
        files[relative_path(path, dir)] = read_file(path).value_or("<unreadable>");
    }
    return files;
}

// A store with two artifacts and a build directory holding build.json
struct ProfileFixture {
    TempDir temp;
    std::string opt = temp.path() + "/opt";
    std::string art = temp.path() + "/art";
    std::string bld = temp.path() + "/bld";
    BuildStore store{opt, bld};

    ProfileFixture() {
        write_file(opt + "/zlib/h1/lib/libz.so", "zlib");
        write_file(opt + "/zlib/h1/include/zlib.h", "header");
        write_file(opt + "/zlib/h1/artifact.json", "{}");
        write_file(opt + "/zlib/h1/build.log", "log");
        write_file(opt + "/py/h2/bin/python", "python");
        write_file(opt + "/py/h2/lib/libz.so", "bundled zlib");

        write_file(art + "/bin/mytool", "mine");
        write_file(art + "/lib/own.a", "own");

        write_file(bld + "/build.json", R"({
            "build": {"import": [{"id": "zlib/h1"}, {"id": "virtual:python"}]}
        })");
    }

    ProfilePushOptions push_options() const {
        ProfilePushOptions options;
        options.target_dir = art;
        options.build_spec_path = bld + "/build.json";
        options.manifest_path = bld + "/manifest.json";
        options.virtuals = {{"virtual:python", "py/h2"}};
        return options;
    }
};

// ============================================================================
// Manifest
// ============================================================================

TEST_CASE("manifest serialization uses a sorted installed-files list") {
    ProfileManifest manifest;
    manifest.installed_files = {"/p/b", "/p/a"};
    auto json_str = serialize_manifest(manifest);
    CHECK(json_str == "{\n  \"installed-files\": [\n    \"/p/a\",\n    \"/p/b\"\n  ]\n}\n");

    auto parsed = parse_manifest(json_str);
    REQUIRE(parsed.isOk());
    CHECK(parsed.value().installed_files == manifest.installed_files);
}

TEST_CASE("parse_manifest rejects malformed manifests") {
    CHECK(parse_manifest("[]").isErr());
    CHECK(parse_manifest(R"({"installed-files": [1]})").isErr());
    CHECK(parse_manifest("{").isErr());
}

// ============================================================================
// Symlink Farm
// ============================================================================

TEST_CASE("SymlinkFarmBuilder links artifact files, first artifact wins") {
    ProfileFixture fx;
    SymlinkFarmBuilder builder(fx.store);
    std::vector<ArtifactImport> imports = {{"zlib/h1", std::nullopt, true},
                                           {"virtual:python", std::nullopt, true}};

    auto result = builder.make_profile(imports, fx.art, {{"virtual:python", "py/h2"}});
    REQUIRE(result.isOk());

    CHECK(fs::is_symlink(fx.art + "/lib/libz.so"));
    CHECK(fs::read_symlink(fx.art + "/lib/libz.so").string() == fx.store.resolve("zlib/h1").value() + "/lib/libz.so");
    CHECK(read_file(fx.art + "/bin/python").value() == "python");
    CHECK(read_file(fx.art + "/bin/mytool").value() == "mine");
    CHECK_FALSE(fs::exists(fx.art + "/artifact.json"));
    CHECK_FALSE(fs::exists(fx.art + "/build.log"));

    auto marker = nlohmann::json::parse(read_file(fx.art + "/profile.json").value());
    CHECK(marker["artifacts"] == nlohmann::json::array({"zlib/h1", "py/h2"}));
}

TEST_CASE("SymlinkFarmBuilder fails on unknown artifacts") {
    ProfileFixture fx;
    SymlinkFarmBuilder builder(fx.store);

    auto missing = builder.make_profile({{"nope/h9", std::nullopt, true}}, fx.art, {});
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::ARTIFACT_NOT_FOUND);

    auto unmapped = builder.make_profile({{"virtual:gcc", std::nullopt, true}}, fx.art, {});
    REQUIRE(unmapped.isErr());
    CHECK(unmapped.error().code() == ErrorCode::ARTIFACT_NOT_FOUND);
}

// ============================================================================
// Push / Pop
// ============================================================================

TEST_CASE("push records exactly the files it added") {
    ProfileFixture fx;
    SymlinkFarmBuilder builder(fx.store);

    auto manifest = push_build_profile(fx.push_options(), builder);
    REQUIRE(manifest.isOk());

    std::set<std::string> expected = {
        fx.art + "/bin/python",
        fx.art + "/include/zlib.h",
        fx.art + "/lib/libz.so",
        fx.art + "/profile.json",
    };
    CHECK(manifest.value().installed_files == expected);

    auto stored = read_manifest(fx.bld + "/manifest.json");
    REQUIRE(stored.isOk());
    CHECK(stored.value().installed_files == expected);
}

TEST_CASE("push then pop restores the target exactly") {
    ProfileFixture fx;
    auto before = snapshot(fx.art);
    SymlinkFarmBuilder builder(fx.store);

    REQUIRE(push_build_profile(fx.push_options(), builder).isOk());
    CHECK(snapshot(fx.art) != before);

    auto popped = pop_build_profile_file(fx.bld + "/manifest.json", fx.art);
    REQUIRE(popped.isOk());

    CHECK(snapshot(fx.art) == before);
    CHECK_FALSE(fs::exists(fx.art + "/include"));
    CHECK(fs::is_directory(fx.art + "/lib"));
    CHECK(fs::is_directory(fx.art));
    CHECK_FALSE(fs::exists(fx.bld + "/manifest.json"));
}

TEST_CASE("pop keeps the root even when it ends up empty") {
    TempDir temp;
    std::string root = temp.path() + "/root";
    write_file(root + "/a/b/c.txt", "");

    ProfileManifest manifest;
    manifest.installed_files = {root + "/a/b/c.txt"};
    REQUIRE(pop_build_profile(manifest, root).isOk());
    CHECK_FALSE(fs::exists(root + "/a"));
    CHECK(fs::is_directory(root));
}

TEST_CASE("pop fails on a missing file") {
    TempDir temp;
    ProfileManifest manifest;
    manifest.installed_files = {temp.path() + "/gone"};

    auto result = pop_build_profile(manifest, temp.path());
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::MISSING_FILE);
}

TEST_CASE("pop refuses files outside the root") {
    TempDir temp;
    write_file(temp.path() + "/outside.txt", "keep");
    fs::create_directories(temp.path() + "/root");

    ProfileManifest manifest;
    manifest.installed_files = {temp.path() + "/outside.txt"};
    auto result = pop_build_profile(manifest, temp.path() + "/root");
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::PATH_TRAVERSAL);
    CHECK(fs::exists(temp.path() + "/outside.txt"));
}

TEST_CASE("pop removes nothing when any entry is invalid") {
    TempDir temp;
    std::string root = temp.path() + "/root";
    write_file(root + "/a/inside", "profile");
    write_file(temp.path() + "/zoutside/victim", "keep");

    SUBCASE("an entry outside the root") {
        ProfileManifest manifest;
        manifest.installed_files = {root + "/a/inside", temp.path() + "/zoutside/victim"};
        auto result = pop_build_profile(manifest, root);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PATH_TRAVERSAL);
    }

    SUBCASE("a missing entry") {
        ProfileManifest manifest;
        manifest.installed_files = {root + "/a/inside", root + "/z/gone"};
        auto result = pop_build_profile(manifest, root);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::MISSING_FILE);
    }

    CHECK(read_file(root + "/a/inside").value() == "profile");
    CHECK(fs::exists(temp.path() + "/zoutside/victim"));
}

TEST_CASE("pop accepts directories whose names start with two dots") {
    TempDir temp;
    std::string root = temp.path() + "/root";
    write_file(root + "/..cache/entry", "x");

    ProfileManifest manifest;
    manifest.installed_files = {root + "/..cache/entry"};
    REQUIRE(pop_build_profile(manifest, root).isOk());
    CHECK_FALSE(fs::exists(root + "/..cache"));
    CHECK(fs::is_directory(root));
}

TEST_CASE("push without imports only adds the profile marker") {
    ProfileFixture fx;
    write_file(fx.bld + "/build.json", "{}");
    SymlinkFarmBuilder builder(fx.store);

    auto manifest = push_build_profile(fx.push_options(), builder);
    REQUIRE(manifest.isOk());
    CHECK(manifest.value().installed_files == std::set<std::string>{fx.art + "/profile.json"});
}
