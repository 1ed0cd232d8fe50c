#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <strata/extraction/jupyter_processor.h>

#include "../../common/test_helpers_catch2.h"

using namespace strata::extraction;
using strata::test::find_record;
using strata::test::new_records;
using strata::test::props_of;
using strata::test::records_of_type;
using strata::test::ScopedTempDir;

namespace {

nlohmann::json sampleNotebook() {
    return nlohmann::json::parse(R"({
      "nbformat": 4,
      "nbformat_minor": 5,
      "metadata": {
        "kernelspec": {"name": "python3", "language": "python"},
        "language_info": {"name": "python"}
      },
      "cells": [
        {"cell_type": "markdown", "metadata": {}, "source": ["# Analysis\n", "Intro text"]},
        {"cell_type": "code", "execution_count": 1, "metadata": {"tags": ["setup"]},
         "source": ["%matplotlib inline\n", "import numpy as np\n", "def mean(xs):\n",
                    "    return sum(xs) / len(xs)\n"],
         "outputs": []},
        {"cell_type": "code", "execution_count": 2, "metadata": {},
         "source": "mean([1, 2, 3])",
         "outputs": [
           {"output_type": "execute_result", "execution_count": 2,
            "data": {"text/plain": ["2.0"]}, "metadata": {}},
           {"output_type": "stream", "name": "stdout", "text": ["done\n"]}
         ]},
        {"cell_type": "code", "execution_count": null, "metadata": {}, "source": "", "outputs": []}
      ]
    })");
}

struct JupyterFixture {
    ProcessingResult run(const std::string& name, std::string_view source) {
        return processor.processFile(dir.write(name, source));
    }

    ScopedTempDir dir{"strata_nb_"};
    JupyterProcessor processor;
};

} // namespace

TEST_CASE_METHOD(JupyterFixture, "Jupyter cells, code and outputs", "[extraction][jupyter]") {
    auto result = run("analysis.ipynb", sampleNotebook().dump(2));
    REQUIRE(result.isSuccess());
    auto records = new_records(result);

    auto cells = records_of_type(records, ElementType::Cell);
    REQUIRE(cells.size() == 4);
    CHECK(cells[0].name == "cell_0_markdown");
    CHECK(cells[0].content == "# Analysis\nIntro text");
    CHECK(cells[1].name == "cell_1_code_[1]");
    CHECK(props_of(cells[1])["tags"] == nlohmann::json::array({"setup"}));
    CHECK(props_of(cells[1])["has_outputs"] == false);
    CHECK(cells[3].name == "cell_3_code");
    for (const auto& cell : cells) {
        CHECK(cell.nestingLevel == 0);
    }

    const auto* import = find_record(records, "numpy as np");
    REQUIRE(import != nullptr);
    CHECK(import->elementType == ElementType::Import);
    CHECK(import->parentPath == "Cell:cell_1_code_[1]");

    const auto* mean = find_record(records, "mean");
    REQUIRE(mean != nullptr);
    CHECK(mean->elementType == ElementType::Function);
    CHECK(mean->nestingLevel == 1);
    CHECK(props_of(*mean)["line"] == 3);

    auto outputs = records_of_type(records, ElementType::Output);
    REQUIRE(outputs.size() == 2);
    CHECK(outputs[0].name == "cell_2_code_[2]_output_0_execute_result");
    CHECK(outputs[0].content == "2.0");
    CHECK(outputs[0].parentPath == "Cell:cell_2_code_[2]");
    CHECK(props_of(outputs[0])["mime_types"] == nlohmann::json::array({"text/plain"}));
    CHECK(outputs[1].name == "cell_2_code_[2]_output_1_stream");
    CHECK(outputs[1].content == "done\n");

    CHECK(result.metadata["nbformat"] == 4);
    CHECK(result.metadata["kernelspec"]["name"] == "python3");
}

TEST_CASE_METHOD(JupyterFixture, "Jupyter records are numbered across cells",
                 "[extraction][jupyter]") {
    auto result = run("order.ipynb", sampleNotebook().dump());
    auto records = new_records(result);
    REQUIRE_FALSE(records.empty());
    for (size_t i = 0; i < records.size(); ++i) {
        CHECK(records[i].order == i + 1);
    }
}

TEST_CASE("Jupyter code traversal can be disabled", "[extraction][jupyter]") {
    ScopedTempDir dir{"strata_nb_"};
    ProcessorOptions options;
    options.traverseNotebookCode = false;
    JupyterProcessor processor(options);

    auto result = processor.processFile(dir.write("plain.ipynb", sampleNotebook().dump()));
    REQUIRE(result.isSuccess());
    auto records = new_records(result);
    CHECK(records_of_type(records, ElementType::Function).empty());
    CHECK(records_of_type(records, ElementType::Cell).size() == 4);
}

TEST_CASE_METHOD(JupyterFixture, "Jupyter non-Python kernels are not traversed",
                 "[extraction][jupyter]") {
    auto nb = sampleNotebook();
    nb["metadata"]["language_info"]["name"] = "R";
    auto result = run("r.ipynb", nb.dump());
    REQUIRE(result.isSuccess());
    CHECK(records_of_type(new_records(result), ElementType::Import).empty());
}

TEST_CASE_METHOD(JupyterFixture, "Jupyter cell syntax errors are labelled with the cell",
                 "[extraction][jupyter]") {
    auto nb = nlohmann::json::parse(R"({"nbformat": 4, "metadata": {}, "cells": [
      {"cell_type": "code", "execution_count": 3, "metadata": {}, "outputs": [],
       "source": "def f(:\n    pass\n"}
    ]})");
    auto result = run("bad_cell.ipynb", nb.dump());
    REQUIRE(result.errors.size() == 1);
    CHECK_THAT(result.errors.front(), Catch::Matchers::StartsWith("cell_0_code_[3]: "));
    CHECK(records_of_type(new_records(result), ElementType::Cell).size() == 1);
}

TEST_CASE_METHOD(JupyterFixture, "Jupyter malformed notebooks", "[extraction][jupyter]") {
    SECTION("invalid JSON") {
        auto result = run("bad.ipynb", "{\"cells\": [");
        REQUIRE(result.errors.size() == 1);
        CHECK_THAT(result.errors.front(), Catch::Matchers::StartsWith("Invalid JSON"));
        CHECK(result.newRecords == 0);
    }

    SECTION("missing cells") {
        auto result = run("nocells.ipynb", "{\"metadata\": {}}");
        REQUIRE(result.errors.size() == 1);
        CHECK(result.errors.front() == "Invalid notebook: missing cells array");
        CHECK(result.newRecords == 0);
    }

    SECTION("non-object cell is skipped") {
        auto result = run("odd.ipynb", R"({"cells": [42, {"cell_type": "raw", "source": "x"}]})");
        REQUIRE(result.errors.size() == 1);
        auto records = new_records(result);
        REQUIRE(records.size() == 1);
        CHECK(records[0].name == "cell_1_raw");
    }
}

TEST_CASE_METHOD(JupyterFixture, "Jupyter pathological nesting is rejected",
                 "[extraction][jupyter]") {
    std::string notebook = "{\"nbformat\": 4, \"cells\": [], \"metadata\": {\"x\": ";
    notebook += std::string(100000, '[') + std::string(100000, ']') + "}}";
    auto result = run("abyss.ipynb", notebook);
    REQUIRE(result.errors.size() == 1);
    CHECK_THAT(result.errors.front(), Catch::Matchers::ContainsSubstring("nesting exceeds"));
    CHECK(result.newRecords == 0);
}
