#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <yaml-cpp/yaml.h>
#include <strata/extraction/yaml_processor.h>

#include "../../common/test_helpers_catch2.h"

using namespace strata::extraction;
using strata::test::find_record;
using strata::test::new_records;
using strata::test::props_of;
using strata::test::ScopedTempDir;

namespace {
struct YamlFixture {
    ProcessingResult run(const std::string& name, std::string_view source) {
        return processor.processFile(dir.write(name, source));
    }

    ScopedTempDir dir{"strata_yaml_"};
    YamlProcessor processor;
};
} // namespace

TEST_CASE_METHOD(YamlFixture, "YAML mappings and sequences open scopes", "[extraction][yaml]") {
    auto result = run("compose.yaml", "version: 3\n"
                                      "services:\n"
                                      "  web:\n"
                                      "    image: nginx\n"
                                      "    ports:\n"
                                      "      - 80\n"
                                      "      - 443\n");
    REQUIRE(result.isSuccess());
    auto records = new_records(result);
    REQUIRE(records.size() == 8);

    CHECK(records[0].name == "document_0");
    CHECK(records[0].elementType == ElementType::Document);
    CHECK(records[0].nestingLevel == 0);

    CHECK(records[1].name == "version");
    CHECK(records[1].elementType == ElementType::Scalar);
    CHECK(records[1].parentPath == "Document:document_0");
    CHECK(props_of(records[1])["yaml_type"] == "int");

    CHECK(records[2].name == "services");
    CHECK(records[2].elementType == ElementType::Mapping);
    CHECK(props_of(records[2])["size"] == 1);

    CHECK(records[4].name == "image");
    CHECK(records[4].content == "nginx");
    CHECK(records[4].parentPath == "Document:document_0/Mapping:services/Mapping:web");
    CHECK(records[4].nestingLevel == 3);
    CHECK(props_of(records[4])["line"] == 4);

    CHECK(records[5].name == "ports");
    CHECK(records[5].elementType == ElementType::Sequence);
    CHECK(records[6].name == "ports[0]");
    CHECK(records[7].name == "ports[1]");
    CHECK(records[7].parentPath ==
          "Document:document_0/Mapping:services/Mapping:web/Sequence:ports");

    CHECK(result.metadata["documents"] == 1);
}

TEST_CASE_METHOD(YamlFixture, "YAML scalar types are inferred", "[extraction][yaml]") {
    auto result = run("types.yml", "s: hello\n"
                                   "q: \"42\"\n"
                                   "i: -17\n"
                                   "h: 0x1F\n"
                                   "f: 2.5\n"
                                   "b: yes\n"
                                   "n: ~\n"
                                   "e:\n");
    REQUIRE(result.isSuccess());
    auto records = new_records(result);

    auto typeOf = [&](const std::string& name) {
        const auto* r = find_record(records, name);
        REQUIRE(r != nullptr);
        return props_of(*r)["yaml_type"].get<std::string>();
    };
    CHECK(typeOf("s") == "str");
    CHECK(typeOf("q") == "str");
    CHECK(typeOf("i") == "int");
    CHECK(typeOf("h") == "int");
    CHECK(typeOf("f") == "float");
    CHECK(typeOf("b") == "bool");
    CHECK(typeOf("n") == "null");
    CHECK(typeOf("e") == "null");
}

TEST_CASE_METHOD(YamlFixture, "YAML env vars and URLs in scalars", "[extraction][yaml]") {
    auto result = run("env.yaml", "db: ${DB_HOST:-localhost}:$DB_PORT\n"
                                  "docs: https://example.org/guide\n");
    REQUIRE(result.isSuccess());
    auto records = new_records(result);

    const auto* db = find_record(records, "db");
    REQUIRE(db != nullptr);
    CHECK(props_of(*db)["env_vars"] == nlohmann::json::array({"DB_HOST", "DB_PORT"}));

    const auto* docs = find_record(records, "docs");
    REQUIRE(docs != nullptr);
    CHECK(props_of(*docs)["urls"] == nlohmann::json::array({"https://example.org/guide"}));
}

TEST_CASE_METHOD(YamlFixture, "YAML multi-document streams", "[extraction][yaml]") {
    auto result = run("multi.yaml", "a: 1\n"
                                    "---\n"
                                    "- x\n"
                                    "- y\n");
    REQUIRE(result.isSuccess());
    auto records = new_records(result);
    REQUIRE(records.size() == 5);

    CHECK(records[0].name == "document_0");
    CHECK(records[1].name == "a");
    CHECK(records[2].name == "document_1");
    CHECK(records[2].nestingLevel == 0);
    CHECK(records[3].name == "item[0]");
    CHECK(records[3].parentPath == "Document:document_1");
    CHECK(records[4].name == "item[1]");
    CHECK(result.metadata["documents"] == 2);
}

TEST_CASE_METHOD(YamlFixture, "YAML parse errors yield no records", "[extraction][yaml]") {
    auto result = run("bad.yaml", "key: [unclosed\n"
                                  "other: value\n");
    REQUIRE(result.errors.size() == 1);
    CHECK_THAT(result.errors.front(), Catch::Matchers::StartsWith("YAML parse error at line"));
    CHECK(result.newRecords == 0);
    CHECK(processor.table().empty());
}

TEST_CASE_METHOD(YamlFixture, "YAML pathological nesting is a parse error",
                 "[extraction][yaml]") {
    auto result = run("abyss.yaml", "key: " + std::string(100000, '[') + std::string(100000, ']'));
    REQUIRE(result.errors.size() == 1);
    CHECK_THAT(result.errors.front(), Catch::Matchers::StartsWith("YAML parse error"));
    CHECK(result.newRecords == 0);
}

TEST_CASE_METHOD(YamlFixture, "YAML comment-only file has an empty document",
                 "[extraction][yaml]") {
    auto result = run("comments.yaml", "# nothing here\n");
    CHECK(result.isSuccess());
    CHECK(new_records(result).size() <= 1);
}

TEST_CASE("yamlToJson converts typed scalars", "[extraction][yaml]") {
    auto node = YAML::Load("title: Post\ncount: 3\nratio: 0.5\ndraft: false\ntags: [a, b]\n");
    auto json = yamlToJson(node);
    CHECK(json["title"] == "Post");
    CHECK(json["count"] == 3);
    CHECK(json["ratio"] == 0.5);
    CHECK(json["draft"] == false);
    CHECK(json["tags"] == nlohmann::json::array({"a", "b"}));
}
