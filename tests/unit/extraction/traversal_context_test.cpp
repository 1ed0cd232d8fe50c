#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <strata/extraction/element_record.h>
#include <strata/extraction/traversal_context.h>

using namespace strata::extraction;

namespace {

Element makeElement(ElementType type, std::string name) {
    Element el;
    el.type = type;
    el.name = std::move(name);
    el.content = "body";
    return el;
}

} // namespace

TEST_CASE("TraversalContext numbers records in discovery order", "[extraction][context]") {
    TraversalContext ctx("a.py");

    ctx.emit(makeElement(ElementType::Import, "os"));
    ctx.emit(makeElement(ElementType::Class, "Foo"));
    ctx.emit(makeElement(ElementType::Function, "main"));

    const auto& records = ctx.records();
    REQUIRE(records.size() == 3);
    for (size_t i = 0; i < records.size(); ++i) {
        CHECK(records[i].order == i + 1);
        CHECK(records[i].filepath == "a.py");
    }
}

TEST_CASE("TraversalContext records nesting and parent path at emit time",
          "[extraction][context]") {
    TraversalContext ctx("a.js");

    ctx.emit(makeElement(ElementType::Class, "Foo"));
    {
        auto classScope = ctx.enter(ElementType::Class, "Foo");
        ctx.emit(makeElement(ElementType::Method, "bar"));
        {
            auto methodScope = ctx.enter(ElementType::Method, "bar");
            CHECK(ctx.depth() == 2);
            CHECK(ctx.parentPath() == "Class:Foo/Method:bar");
            ctx.emit(makeElement(ElementType::Function, "helper"));
        }
        CHECK(ctx.depth() == 1);
    }
    CHECK(ctx.depth() == 0);
    ctx.emit(makeElement(ElementType::Function, "after"));

    const auto& r = ctx.records();
    REQUIRE(r.size() == 4);
    CHECK(r[0].nestingLevel == 0);
    CHECK(r[0].parentPath.empty());
    CHECK(r[1].nestingLevel == 1);
    CHECK(r[1].parentPath == "Class:Foo");
    CHECK(r[2].nestingLevel == 2);
    CHECK(r[2].parentPath == "Class:Foo/Method:bar");
    CHECK(r[3].nestingLevel == 0);
    CHECK(r[3].parentPath.empty());
}

TEST_CASE("TraversalContext escapes separators in frame names", "[extraction][context]") {
    TraversalContext ctx("guide.md");
    {
        auto io = ctx.enter(ElementType::Header, "Input/Output");
        auto win = ctx.enter(ElementType::Header, "C:\\Temp");
        CHECK(ctx.parentPath() == "Header:Input\\/Output/Header:C:\\\\Temp");
    }
    auto plain = ctx.enter(ElementType::Header, "Input");
    ctx.emit(makeElement(ElementType::Header, "h2"));
    CHECK(ctx.records().back().parentPath == "Header:Input");
}

TEST_CASE("TraversalContext folds parameters, comments and line into props",
          "[extraction][context]") {
    TraversalContext ctx("a.py");

    Element el = makeElement(ElementType::Function, "f");
    el.parameters = {"a", "b"};
    el.comments = "# doc";
    el.line = 7;
    el.props["async"] = true;
    const auto& record = ctx.emit(std::move(el));

    auto props = nlohmann::json::parse(record.props);
    CHECK(props["parameters"] == nlohmann::json::array({"a", "b"}));
    CHECK(props["comments"] == "# doc");
    CHECK(props["line"] == 7);
    CHECK(props["async"] == true);

    const auto& bare = ctx.emit(makeElement(ElementType::Scalar, "x"));
    CHECK(nlohmann::json::parse(bare.props) == nlohmann::json::object());
}

TEST_CASE("TraversalContext synthesizes names per kind", "[extraction][context]") {
    TraversalContext ctx("a.py");
    CHECK(ctx.nextSynthetic("lambda") == 0);
    CHECK(ctx.nextSynthetic("lambda") == 1);
    CHECK(ctx.nextSynthetic("table") == 0);
    CHECK(ctx.nextSynthetic("lambda") == 2);
}

TEST_CASE("TraversalContext parse failure discards records", "[extraction][context]") {
    TraversalContext ctx("broken.json");
    ctx.emit(makeElement(ElementType::Document, "document_0"));
    auto scope = ctx.enter(ElementType::Document, "document_0");
    ctx.emit(makeElement(ElementType::Value, "a"));

    ctx.parseFailure("Invalid JSON");

    CHECK(ctx.records().empty());
    REQUIRE(ctx.errors().size() == 1);
    CHECK(ctx.errors().front() == "Invalid JSON");
    CHECK(ctx.depth() == 1);
}

TEST_CASE("TraversalContext tolerates unbalanced pops", "[extraction][context]") {
    TraversalContext ctx("a.py");
    ctx.pop();
    CHECK(ctx.depth() == 0);
    CHECK(ctx.innermost() == nullptr);

    ctx.push(ElementType::Class, "A");
    REQUIRE(ctx.innermost() != nullptr);
    CHECK(ctx.innermost()->label() == "Class:A");
}

TEST_CASE("ElementTable keeps appended rows in order", "[extraction][table]") {
    TraversalContext first("a.py");
    first.emit(makeElement(ElementType::Function, "a1"));
    first.emit(makeElement(ElementType::Function, "a2"));
    TraversalContext second("b.py");
    second.emit(makeElement(ElementType::Class, "B"));

    ElementTable table;
    CHECK(table.empty());
    table.append(first.records());
    table.append(second.records());

    REQUIRE(table.size() == 3);
    CHECK(table[0].name == "a1");
    CHECK(table[2].name == "B");
    CHECK(table[2].order == 1);
    CHECK(table.rowsFor("a.py").size() == 2);
    CHECK(table.rowsFor("missing.py").empty());

    SECTION("column order is fixed") {
        const std::vector<std::string> expected = {"filepath", "parent_path", "order", "name",
                                                   "content",  "props",       "element_type"};
        CHECK(ElementTable::columns() == expected);
        auto values = table[2].values();
        REQUIRE(values.size() == expected.size());
        CHECK(values[0] == "b.py");
        CHECK(values[2] == "1");
        CHECK(values[6] == "Class");
    }

    SECTION("JSON export") {
        auto json = table.toJson();
        REQUIRE(json.size() == 3);
        CHECK(json[1]["name"] == "a2");
        CHECK(json[1]["order"] == 2);
        CHECK(json[1]["element_type"] == "Function");
        CHECK(json[1]["nesting_level"] == 0);
    }
}

TEST_CASE("ElementType names", "[extraction][table]") {
    CHECK(std::string(toString(ElementType::Class)) == "Class");
    CHECK(std::string(toString(ElementType::CodeBlock)) == "CodeBlock");
    CHECK(std::string(toString(ElementType::Output)) == "Output");
}
