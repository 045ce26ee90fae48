#include <doctest/doctest.h>
#include "../test_helpers.hpp"
#include <postbuild/build_spec.hpp>
#include <postbuild/platform.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace postbuild;
using postbuild::testing::TempDir;

// ============================================================================
// Key Selection
// ============================================================================

TEST_CASE("select_json_key walks objects and arrays") {
    auto doc = nlohmann::json::parse(R"({"parameters": {"links": [{"a": 1}, {"b": 2}]}})");

    auto links = select_json_key(doc, "parameters/links");
    REQUIRE(links.isOk());
    CHECK(links.value().is_array());

    auto second = select_json_key(doc, "/parameters/links/1/b");
    REQUIRE(second.isOk());
    CHECK(second.value() == 2);
}

TEST_CASE("select_json_key with an empty path returns the document") {
    auto doc = nlohmann::json::parse(R"({"x": 1})");
    CHECK(select_json_key(doc, "/").value() == doc);
    CHECK(select_json_key(doc, "").value() == doc);
}

TEST_CASE("select_json_key reports unknown keys") {
    auto doc = nlohmann::json::parse(R"({"files": []})");
    auto result = select_json_key(doc, "sources");
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_SPEC);
}

TEST_CASE("load_json_parameters reads and selects from a file") {
    TempDir temp;
    std::string path = temp.path() + "/build.json";
    std::ofstream(path) << R"({"files": [{"target": "x", "text": []}]})";

    auto files = load_json_parameters(path, "files");
    REQUIRE(files.isOk());
    CHECK(files.value().size() == 1);

    auto missing = load_json_parameters(temp.path() + "/nope.json", "/");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("load_json_parameters rejects malformed JSON") {
    TempDir temp;
    std::string path = temp.path() + "/build.json";
    std::ofstream(path) << "{not json";

    auto result = load_json_parameters(path, "/");
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::INVALID_SPEC);
}

// ============================================================================
// Imports and Virtuals
// ============================================================================

TEST_CASE("parse_imports reads build.import") {
    auto spec = nlohmann::json::parse(R"({
        "build": {"import": [
            {"id": "zlib/abc", "ref": "ZLIB"},
            {"id": "virtual:unix", "in_env": false}
        ]}
    })");

    auto imports = parse_imports(spec);
    REQUIRE(imports.isOk());
    REQUIRE(imports.value().size() == 2);
    CHECK(imports.value()[0].id == "zlib/abc");
    CHECK(imports.value()[0].ref.value() == "ZLIB");
    CHECK(imports.value()[0].in_env);
    CHECK_FALSE(imports.value()[0].is_virtual());
    CHECK(imports.value()[1].is_virtual());
    CHECK_FALSE(imports.value()[1].in_env);
}

TEST_CASE("parse_imports treats a missing section as no imports") {
    auto imports = parse_imports(nlohmann::json::parse(R"({"files": []})"));
    REQUIRE(imports.isOk());
    CHECK(imports.value().empty());
}

TEST_CASE("parse_imports requires an id") {
    auto imports = parse_imports(nlohmann::json::parse(R"({"build": {"import": [{"ref": "X"}]}})"));
    REQUIRE(imports.isErr());
    CHECK(imports.error().code() == ErrorCode::INVALID_SPEC);
}

TEST_CASE("parse_virtuals and format_virtuals") {
    auto virtuals = parse_virtuals("virtual:unix=unix/h1;virtual:gcc=gcc/h2");
    REQUIRE(virtuals.isOk());
    CHECK(virtuals.value().size() == 2);
    CHECK(virtuals.value().at("virtual:unix") == "unix/h1");
    CHECK(format_virtuals(virtuals.value()) == "virtual:gcc=gcc/h2;virtual:unix=unix/h1");

    CHECK(parse_virtuals("").value().empty());
    CHECK(parse_virtuals("novalue").isErr());
    CHECK(parse_virtuals("a=b=c").isErr());
}

TEST_CASE("resolve_virtual maps virtual ids and passes others through") {
    VirtualsMap virtuals{{"virtual:unix", "unix/h1"}};
    CHECK(resolve_virtual("virtual:unix", virtuals).value() == "unix/h1");
    CHECK(resolve_virtual("zlib/abc", virtuals).value() == "zlib/abc");

    auto missing = resolve_virtual("virtual:gcc", virtuals);
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::ARTIFACT_NOT_FOUND);
}

TEST_CASE("parse_import_envvar splits on whitespace") {
    auto ids = parse_import_envvar("  a/1 b/2\tc/3 ");
    REQUIRE(ids.size() == 3);
    CHECK(ids[0] == "a/1");
    CHECK(ids[2] == "c/3");
    CHECK(parse_import_envvar("").empty());
}

// ============================================================================
// Sources
// ============================================================================

TEST_CASE("parse_source_items applies defaults") {
    auto items = parse_source_items(nlohmann::json::parse(R"([
        {"key": "tar.gz:aa"},
        {"key": "tar:bb", "target": "src", "strip": 1}
    ])"));
    REQUIRE(items.isOk());
    REQUIRE(items.value().size() == 2);
    CHECK(items.value()[0].target == ".");
    CHECK(items.value()[0].strip == 0);
    CHECK(items.value()[1].target == "src");
    CHECK(items.value()[1].strip == 1);
}

TEST_CASE("parse_source_items rejects bad entries") {
    CHECK(parse_source_items(nlohmann::json::parse(R"({"key": "x"})")).isErr());
    CHECK(parse_source_items(nlohmann::json::parse(R"([{"target": "x"}])")).isErr());
    CHECK(parse_source_items(nlohmann::json::parse(R"([{"key": "x", "strip": -1}])")).isErr());
}
