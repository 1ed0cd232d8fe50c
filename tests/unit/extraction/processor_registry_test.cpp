#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <strata/detection/file_type_detector.h>
#include <strata/extraction/javascript_processor.h>
#include <strata/extraction/processor_registry.h>
#include <strata/extraction/python_processor.h>

#include "../../common/test_helpers_catch2.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

using namespace strata;
using namespace strata::extraction;
using strata::detection::FileTypeDetector;
using strata::test::ScopedTempDir;

namespace {

struct RegistryFixture {
    RegistryFixture() { REQUIRE(detector.initialize()); }

    ScopedTempDir dir{"strata_registry_"};
    FileTypeDetector& detector = FileTypeDetector::instance();
    ProcessorRegistry registry = ProcessorRegistry::createDefault();
};

// Claims a type that no extension maps to
class OrphanProcessor : public LanguageProcessor {
public:
    std::vector<std::string> supportedTypes() const override { return {"text/x-orphan"}; }
    ProcessorKind kind() const override { return ProcessorKind::Python; }
    std::string name() const override { return "OrphanProcessor"; }

protected:
    void extract(const SourceFile&, TraversalContext&, nlohmann::json&) override {}
};

// Raises from every extract call
class ThrowingProcessor : public LanguageProcessor {
public:
    std::vector<std::string> supportedTypes() const override { return {"text/x-python"}; }
    ProcessorKind kind() const override { return ProcessorKind::Python; }
    std::string name() const override { return "ThrowingProcessor"; }

protected:
    void extract(const SourceFile&, TraversalContext& ctx, nlohmann::json&) override {
        Element el;
        el.type = ElementType::Function;
        el.name = "partial";
        ctx.emit(std::move(el));
        throw std::runtime_error("boom");
    }
};

} // namespace

TEST_CASE_METHOD(RegistryFixture, "Default registry covers every extractable type",
                 "[extraction][registry]") {
    CHECK(registry.size() == 7);
    REQUIRE(registry.validateCoverage(detector));

    for (const auto& mime : FileTypeDetector::extractableMimeTypes()) {
        INFO(mime);
        CHECK(registry.processorFor(mime) != nullptr);
    }
    CHECK(registry.processorFor("text/plain") == nullptr);
    CHECK(registry.supportedTypes().size() == FileTypeDetector::extractableMimeTypes().size());
}

TEST_CASE("Coverage check reports configuration defects", "[extraction][registry]") {
    auto& detector = FileTypeDetector::instance();

    SECTION("missing processors") {
        ProcessorRegistry registry(detector);
        registry.registerProcessor(std::make_unique<PythonProcessor>());
        auto result = registry.validateCoverage(detector);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::InvalidState);
        CHECK_THAT(result.error().message,
                   Catch::Matchers::ContainsSubstring("no processor for application/javascript"));
    }

    SECTION("duplicate kinds and unreachable types") {
        ProcessorRegistry registry = ProcessorRegistry::createDefault();
        REQUIRE(registry.registerProcessor(std::make_unique<OrphanProcessor>()));
        auto result = registry.validateCoverage(detector);
        REQUIRE_FALSE(result);
        CHECK_THAT(result.error().message,
                   Catch::Matchers::ContainsSubstring("duplicate processor kind python"));
        CHECK_THAT(result.error().message, Catch::Matchers::ContainsSubstring("text/x-orphan"));
    }
}

TEST_CASE_METHOD(RegistryFixture, "Re-registering a claimed type is ignored",
                 "[extraction][registry]") {
    auto* original = registry.processorFor("text/x-python");
    CHECK_FALSE(registry.registerProcessor(std::make_unique<PythonProcessor>()));
    CHECK_FALSE(registry.registerProcessor(nullptr));
    CHECK(registry.size() == 7);
    CHECK(registry.processorFor("text/x-python") == original);
}

TEST_CASE_METHOD(RegistryFixture, "Registry dispatches by detected type",
                 "[extraction][registry]") {
    SECTION("JavaScript class") {
        auto report = registry.processFile(dir.write("foo.js", "class Foo { bar() {} }"));
        REQUIRE(report);
        CHECK(report.value().status == FileStatus::Processed);
        REQUIRE(report.value().processor);
        CHECK(*report.value().processor == ProcessorKind::JavaScript);
        CHECK(report.value().mimeType == "application/javascript");
        CHECK(report.value().result.newRecords == 2);

        const auto* table = registry.tableFor(ProcessorKind::JavaScript);
        REQUIRE(table != nullptr);
        CHECK(table->size() == 2);
    }

    SECTION("shell script") {
        auto report = registry.processFile(dir.write("deploy.sh", "deploy() {\n    echo $1\n}\n"));
        REQUIRE(report);
        REQUIRE(report.value().processor);
        CHECK(*report.value().processor == ProcessorKind::Shell);
        CHECK(report.value().mimeType == "application/x-sh");
        CHECK(report.value().result.newRecords == 1);
    }

    SECTION("extensionless script detected by shebang") {
        auto report =
            registry.processFile(dir.write("tool", "#!/usr/bin/env python3\ndef run():\n    pass\n"));
        REQUIRE(report);
        CHECK(*report.value().processor == ProcessorKind::Python);
        CHECK(report.value().result.newRecords == 1);
    }

    SECTION("unsupported type") {
        auto report = registry.processFile(dir.write("notes.txt", "plain"));
        REQUIRE_FALSE(report);
        CHECK(report.error().code == ErrorCode::NotSupported);
    }

    SECTION("missing file") {
        auto report = registry.processFile(dir.path() / "gone.py");
        REQUIRE_FALSE(report);
        CHECK(report.error().code == ErrorCode::FileNotFound);
    }

    SECTION("empty file of a recognized type") {
        auto report = registry.processFile(dir.write("empty.yaml", ""));
        REQUIRE(report);
        const auto& result = report.value().result;
        CHECK(result.newRecords == 0);
        CHECK(result.errors.empty());
        CHECK(result.fileInfo.size == 0);
    }
}

TEST_CASE_METHOD(RegistryFixture, "Processor exceptions stay inside the file result",
                 "[extraction][registry]") {
    ProcessorRegistry custom(detector);
    REQUIRE(custom.registerProcessor(std::make_unique<ThrowingProcessor>()));

    auto report = custom.processFile(dir.write("raise.py", "x = 1\n"));
    REQUIRE(report);
    CHECK(report.value().status == FileStatus::Processed);
    REQUIRE(report.value().errors.size() == 1);
    CHECK_THAT(report.value().errors.front(), Catch::Matchers::ContainsSubstring("boom"));
    CHECK(report.value().result.newRecords == 0);
    CHECK(custom.tableFor(ProcessorKind::Python)->empty());
}

TEST_CASE_METHOD(RegistryFixture, "Directory walk reports valid and invalid files",
                 "[extraction][registry]") {
    dir.write("good.py", "def fine():\n    pass\n");
    dir.write("bad.py", "def broken(:\n    pass\n");

    auto report = registry.processDirectory(dir.path());
    CHECK(report.errors.empty());
    REQUIRE(report.fileCount() == 2);
    REQUIRE(report.folders.count(".") == 1);

    const auto* good = report.find("good.py");
    const auto* bad = report.find("bad.py");
    REQUIRE(good != nullptr);
    REQUIRE(bad != nullptr);
    CHECK_FALSE(good->hasErrors());
    CHECK(bad->hasErrors());

    const auto* table = registry.tableFor(ProcessorKind::Python);
    REQUIRE(table != nullptr);
    auto rows = table->rowsFor(good->path.string());
    REQUIRE(rows.size() == 1);
    CHECK(rows.front().name == "fine");
}

TEST_CASE_METHOD(RegistryFixture, "Directory walk prunes ignored directories and groups folders",
                 "[extraction][registry]") {
    dir.write("src/app.js", "function app() {}\n");
    dir.write("src/lib/util.py", "def util():\n    pass\n");
    dir.write("docs/readme.md", "# Readme\n");
    dir.write("docs/logo.png", "\x89PNG");
    dir.write("node_modules/dep/index.js", "function dep() {}\n");
    dir.write(".git/config.yaml", "a: 1\n");
    dir.write("vendor/extra.py", "def extra():\n    pass\n");

    auto report = registry.processDirectory(dir.path(), {"vendor"});
    CHECK(report.errors.empty());
    CHECK(report.fileCount() == 4);
    CHECK(report.folders.count("src") == 1);
    CHECK(report.folders.count("src/lib") == 1);
    CHECK(report.folders.count("docs") == 1);
    CHECK(report.folders.count("node_modules") == 0);
    CHECK(report.folders.count("node_modules/dep") == 0);
    CHECK(report.folders.count("vendor") == 0);

    CHECK(report.count(FileStatus::Processed) == 3);
    CHECK(report.count(FileStatus::Unsupported) == 1);
    const auto* logo = report.find("logo.png");
    REQUIRE(logo != nullptr);
    CHECK(logo->status == FileStatus::Unsupported);
    CHECK(logo->mimeType == "image/png");

    for (const auto& [kind, table] : registry.tables()) {
        for (const auto& row : table->rows()) {
            CHECK(row.filepath.find("node_modules") == std::string::npos);
        }
    }
}

TEST_CASE_METHOD(RegistryFixture, "Directory walk on a missing root", "[extraction][registry]") {
    auto report = registry.processDirectory(dir.path() / "absent");
    CHECK(report.fileCount() == 0);
    REQUIRE(report.errors.size() == 1);
    CHECK_THAT(report.errors.front(), Catch::Matchers::StartsWith("Not a directory"));
}

TEST_CASE_METHOD(RegistryFixture, "Tables accumulate across files in processing order",
                 "[extraction][registry]") {
    auto a = registry.processFile(dir.write("a.py", "def a1():\n    pass\ndef a2():\n    pass\n"));
    auto b = registry.processFile(dir.write("b.py", "class B:\n    pass\n"));
    REQUIRE(a);
    REQUIRE(b);

    const auto* table = registry.tableFor(ProcessorKind::Python);
    REQUIRE(table != nullptr);
    REQUIRE(table->size() == 3);
    CHECK(table->rows()[0].name == "a1");
    CHECK(table->rows()[1].order == 2);
    CHECK(table->rows()[2].name == "B");
    CHECK(table->rows()[2].order == 1);

    // Same file through a fresh registry gives identical rows
    ProcessorRegistry fresh = ProcessorRegistry::createDefault();
    auto again = fresh.processFile(dir.path() / "a.py");
    REQUIRE(again);
    auto freshRows = fresh.tableFor(ProcessorKind::Python)->rows();
    std::vector<ElementRecord> firstRows(table->rows().begin(), table->rows().begin() + 2);
    CHECK(freshRows == firstRows);
}

TEST_CASE_METHOD(RegistryFixture, "Malformed inputs never escape the registry",
                 "[extraction][registry]") {
    dir.write("a.js", "}}}{{{ function (");
    dir.write("b.yaml", "key: [\n  - : :\n");
    dir.write("c.json", "{\"unterminated\": ");
    dir.write("d.ipynb", "{\"cells\": 5}");
    dir.write("e.md", "```\nnever closed\n");
    dir.write("f.py", "class (:\n");
    dir.write("g.mdx", "<Broken attr=\n");

    DirectoryReport report;
    REQUIRE_NOTHROW(report = registry.processDirectory(dir.path()));
    CHECK(report.fileCount() == 7);
    CHECK(report.count(FileStatus::Failed) == 0);
    for (const auto& [folder, files] : report.folders) {
        for (const auto& file : files) {
            INFO(file.path.string());
            if (file.path.extension() != ".mdx") {
                CHECK(file.hasErrors());
            }
        }
    }
}

TEST_CASE("File status names", "[extraction][registry]") {
    CHECK(std::string(toString(FileStatus::Processed)) == "processed");
    CHECK(std::string(toString(FileStatus::Unsupported)) == "unsupported");
    CHECK(std::string(toString(ProcessorKind::Jupyter)) == "jupyter");
    CHECK(std::string(toString(ProcessorKind::Shell)) == "shell");
}

TEST_CASE("Default registry applies the configured log level", "[extraction][registry]") {
    auto previous = spdlog::get_level();

    config::ExtractionConfig cfg;
    cfg.logLevel = "warn";
    auto registry = ProcessorRegistry::createDefault(cfg);
    CHECK(spdlog::get_level() == spdlog::level::warn);

    cfg.logLevel = "chatty";
    auto unchanged = ProcessorRegistry::createDefault(cfg);
    CHECK(spdlog::get_level() == spdlog::level::warn);
    CHECK(unchanged.size() == registry.size());

    spdlog::set_level(previous);
}
