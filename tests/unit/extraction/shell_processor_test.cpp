#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <strata/extraction/shell_processor.h>

#include "../../common/test_helpers_catch2.h"

using namespace strata::extraction;
using strata::test::find_record;
using strata::test::new_records;
using strata::test::props_of;
using strata::test::records_of_type;
using strata::test::ScopedTempDir;

namespace {
struct ShellFixture {
    ProcessingResult run(const std::string& name, std::string_view source) {
        return processor.processFile(dir.write(name, source));
    }

    ScopedTempDir dir{"strata_shell_"};
    ShellProcessor processor;
};

constexpr std::string_view kSystemUtils = "#!/bin/bash\n"
                                          "\n"
                                          "# Global configuration\n"
                                          "BACKUP_DIR=\"/var/backups\"\n"
                                          "MAX_BACKUPS=5\n"
                                          "\n"
                                          "source ./common/logging.sh\n"
                                          ". ./common/config.sh\n"
                                          "\n"
                                          "alias ll='ls -la'\n"
                                          "\n"
                                          "# Log management function\n"
                                          "#   $1 - Log file path\n"
                                          "function manage_logs() {\n"
                                          "    local log_file=\"$1\"\n"
                                          "    local max_size=\"$2\"\n"
                                          "    echo \"rotating $log_file\"\n"
                                          "}\n"
                                          "\n"
                                          "cleanup() {\n"
                                          "    rm -rf \"$BACKUP_DIR/tmp\"\n"
                                          "}\n"
                                          "\n"
                                          "export PATH=\"$HOME/bin:$PATH\"\n";
} // namespace

TEST_CASE_METHOD(ShellFixture, "Shell script structure in source order", "[extraction][shell]") {
    auto result = run("system_utils.sh", kSystemUtils);
    REQUIRE(result.isSuccess());
    auto records = new_records(result);
    REQUIRE(records.size() == 10);

    CHECK(records[0].name == "BACKUP_DIR");
    CHECK(records[0].elementType == ElementType::Variable);
    CHECK(records[1].name == "MAX_BACKUPS");
    CHECK(records[2].elementType == ElementType::Import);
    CHECK(records[3].elementType == ElementType::Import);
    CHECK(records[4].elementType == ElementType::Alias);
    CHECK(records[5].name == "manage_logs");
    CHECK(records[6].name == "log_file");
    CHECK(records[7].name == "max_size");
    CHECK(records[8].name == "cleanup");
    CHECK(records[9].name == "PATH");

    CHECK(result.metadata["language"] == "shell");
    CHECK(result.metadata["interpreter"] == "/bin/bash");
}

TEST_CASE_METHOD(ShellFixture, "Shell functions open a scope", "[extraction][shell]") {
    auto records = new_records(run("system_utils.sh", kSystemUtils));

    const auto* logs = find_record(records, "manage_logs");
    REQUIRE(logs != nullptr);
    CHECK(logs->elementType == ElementType::Function);
    CHECK(logs->parentPath.empty());
    auto props = props_of(*logs);
    CHECK(props["keyword"] == true);
    CHECK(props["positional_args"] == nlohmann::json::array({"$1", "$2"}));
    CHECK_THAT(props["comments"].get<std::string>(),
               Catch::Matchers::ContainsSubstring("Log management function"));

    const auto* local = find_record(records, "log_file");
    REQUIRE(local != nullptr);
    CHECK(local->parentPath == "Function:manage_logs");
    CHECK(local->nestingLevel == 1);
    auto localProps = props_of(*local);
    CHECK(localProps["scope"] == "local");
    CHECK(localProps["value"] == "$1");

    const auto* cleanup = find_record(records, "cleanup");
    REQUIRE(cleanup != nullptr);
    CHECK(props_of(*cleanup)["keyword"] == false);
    CHECK_FALSE(props_of(*cleanup).contains("positional_args"));
}

TEST_CASE_METHOD(ShellFixture, "Shell variables, aliases and sources", "[extraction][shell]") {
    auto records = new_records(run("system_utils.sh", kSystemUtils));

    const auto* backup = find_record(records, "BACKUP_DIR");
    REQUIRE(backup != nullptr);
    CHECK(backup->content == "BACKUP_DIR=\"/var/backups\"");
    CHECK(props_of(*backup)["value"] == "/var/backups");
    CHECK(props_of(*backup)["exported"] == false);

    const auto* path = find_record(records, "PATH");
    REQUIRE(path != nullptr);
    auto pathProps = props_of(*path);
    CHECK(pathProps["exported"] == true);
    CHECK(pathProps["scope"] == "export");
    CHECK(pathProps["env_vars"] == nlohmann::json::array({"HOME", "PATH"}));

    const auto* alias = find_record(records, "ll");
    REQUIRE(alias != nullptr);
    CHECK(alias->elementType == ElementType::Alias);
    CHECK(alias->content == "alias ll='ls -la'");
    CHECK(props_of(*alias)["value"] == "ls -la");

    auto imports = records_of_type(records, ElementType::Import);
    REQUIRE(imports.size() == 2);
    CHECK(imports[0].name == "./common/logging.sh");
    CHECK(props_of(imports[0])["command"] == "source");
    CHECK(imports[1].name == "./common/config.sh");
    CHECK(props_of(imports[1])["command"] == ".");
    CHECK(props_of(imports[1])["dynamic"] == false);
}

TEST_CASE_METHOD(ShellFixture, "Shell multi-alias and dynamic source", "[extraction][shell]") {
    auto result = run("aliases.sh", "alias gs='git status' gd='git diff'\n"
                                    "source \"$CONFIG_DIR/env.sh\"\n");
    REQUIRE(result.isSuccess());
    auto records = new_records(result);
    REQUIRE(records.size() == 3);

    CHECK(records[0].name == "gs");
    CHECK(records[0].content == "alias gs='git status'");
    CHECK(records[1].name == "gd");
    CHECK(props_of(records[1])["value"] == "git diff");

    CHECK(records[2].name == "$CONFIG_DIR/env.sh");
    CHECK(props_of(records[2])["dynamic"] == true);
    CHECK_FALSE(result.metadata.contains("interpreter"));
}

TEST_CASE_METHOD(ShellFixture, "Shell syntax errors keep the prefix", "[extraction][shell]") {
    auto result = run("broken.sh", "NAME=ok\n"
                                   "if [ -n \"$NAME\" ]; then\n"
                                   "    echo hi\n");
    REQUIRE(result.errors.size() == 1);
    CHECK_THAT(result.errors.front(), Catch::Matchers::StartsWith("Syntax error"));

    auto records = new_records(result);
    REQUIRE(records.size() == 1);
    CHECK(records[0].name == "NAME");
}

TEST_CASE_METHOD(ShellFixture, "Shell empty file", "[extraction][shell]") {
    auto result = run("empty.sh", "");
    CHECK(result.isSuccess());
    CHECK(result.newRecords == 0);
}
