#include <catch2/catch.hpp>
#include <stencil/adapters/local.hpp>
#include "test_support.hpp"

using namespace stencil;

TEST_CASE("LocalAdapter lists templates under the root", "[local]") {
    TempDir tmp;
    write_template(tmp.path(), "starter", "vue");
    write_template(tmp.path(), "api", "express");

    LocalAdapter adapter;
    auto r = adapter.fetch_list(LocalSource{tmp.str()});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].name == "api");
    REQUIRE(r.value()[1].name == "starter");
}

TEST_CASE("LocalAdapter resolves a template to a directory with its files", "[local]") {
    TempDir tmp;
    write_template(tmp.path(), "starter", "vue");

    LocalAdapter adapter;
    auto r = adapter.fetch_one(LocalSource{tmp.str()}, "starter");
    REQUIRE(r.is_ok());
    fs::path dir = r.value().path;
    REQUIRE(fs::is_regular_file(dir / "template.json"));
    REQUIRE(read_file(dir / "README.md") == "# starter\n");
    REQUIRE(r.value().metadata.project_type == "vue");
}

TEST_CASE("LocalAdapter returns absolute paths for relative roots", "[local]") {
    TempDir tmp;
    write_template(tmp / "templates", "starter", "vue");
    auto saved = fs::current_path();
    fs::current_path(tmp.path());

    LocalAdapter adapter;
    auto r = adapter.fetch_one(LocalSource{"templates"}, "starter");
    fs::current_path(saved);

    REQUIRE(r.is_ok());
    REQUIRE(fs::path(r.value().path).is_absolute());
}

TEST_CASE("LocalAdapter error classes", "[local]") {
    TempDir tmp;
    write_template(tmp.path(), "starter", "vue");
    write_file(tmp / "plain.txt", "x");
    LocalAdapter adapter;

    SECTION("missing root is unavailable") {
        auto r = adapter.fetch_list(LocalSource{(tmp / "absent").string()});
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StencilError::SourceUnavailable);
    }
    SECTION("root that is a file is unavailable") {
        auto r = adapter.fetch_one(LocalSource{(tmp / "plain.txt").string()}, "starter");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StencilError::SourceUnavailable);
    }
    SECTION("unknown template is not found") {
        auto r = adapter.fetch_one(LocalSource{tmp.str()}, "other");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StencilError::TemplateNotFound);
    }
    SECTION("wrong source kind") {
        auto r = adapter.fetch_list(HttpSource{"https://h/t.tgz", {}, {}});
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StencilError::InvalidArg);
    }
}
