/**
 * @file test_cli.cpp
 * @brief Workflow tests for the command-line commands (GoogleTest)
 *
 * Covers the library paths behind each command:
 * - serialize: load a state file and render it
 * - extract: read literal arguments from text
 * - compare: settings-driven comparison of two state files
 * - roundtrip: serialize then extract without loss
 *
 * The binary itself is not started here.
 */

#include <gtest/gtest.h>

#include "recon/Compare.hpp"
#include "recon/Extract.hpp"
#include "recon/Loader.hpp"
#include "recon/Serialize.hpp"
#include "recon/Settings.hpp"
#include "recon/Typed.hpp"
#include "test_helpers.hpp"

using namespace recon;
using recon_test::TempFile;

namespace {

Settings quiet_settings() {
    LoadOptions opts;
    opts.prefix = "";
    return Settings::load(opts);
}

} // namespace

TEST(CliSerialize, JsonStateWithSettings) {
    TempFile state(R"({"Name": "svc", "Ports": [80, 443]})", ".json");
    LoadOptions opts;
    opts.prefix = "";
    opts.overrides["render.expand"] = -1;
    const Settings settings = Settings::load(opts);

    EXPECT_EQ(serialize(load_property_bag(state.path()), settings.render_context()),
              "@{'Name'='svc';'Ports'=80,443}");
}

TEST(CliSerialize, WritesOutputFile) {
    TempFile state("started = 2024-05-01T10:00:00\n", ".toml");
    TempFile out("", ".rexpr");
    const RenderContext ctx = quiet_settings().render_context();
    const std::string text = serialize(load_property_bag(state.path()), ctx);
    write_text_file(out.path(), text + ctx.newline);

    EXPECT_EQ(load_text_file(out.path()), "@{'started' = [datetime]'2024-05-01T10:00:00'}\n");
    EXPECT_EQ(load_property_bag(out.path()),
              (Value{{"started", typed::datetime("2024-05-01T10:00:00")}}));
}

TEST(CliExtract, ArgumentsFromFile) {
    TempFile args("web01 @{\n    Port = 80\n    Run = { Start-Service web }\n}\n", ".txt");
    const auto literals = extract_arguments(load_text_file(args.path()));
    ASSERT_EQ(literals.size(), 2u);
    EXPECT_EQ(literals[0], "web01");
    EXPECT_EQ(literals[1]["Run"], typed::script(" Start-Service web "));
}

TEST(CliCompare, StateFiles) {
    TempFile current(R"({"Name": "SVC", "Tags": ["b", "a"], "Extra": 1})", ".json");
    TempFile desired("@{\n    Name = 'svc'\n    Tags = 'a', 'b'\n}\n", ".rexpr");

    LoadOptions opts;
    opts.prefix = "";
    opts.overrides["compare.sort_arrays"] = true;
    const Settings settings = Settings::load(opts);

    StateComparator comparator(settings.message_catalog());
    const Value cur = load_property_bag(current.path());
    const Value des = load_property_bag(desired.path());

    StateReport report = comparator.compare(cur, des, settings.compare_options());
    EXPECT_TRUE(report.in_desired_state);
    EXPECT_EQ(report.properties.size(), 2u);

    CompareOptions reverse = settings.compare_options();
    reverse.reverse_check = true;
    EXPECT_FALSE(comparator.test(cur, des, reverse));

    CompareOptions excluded = reverse;
    excluded.exclude = {"Extra"};
    EXPECT_TRUE(comparator.test(cur, des, excluded));
}

TEST(CliCompare, PropertyListForObjectState) {
    const Value desired = typed::object("Service", {{"Name", "svc"}, {"State", "Running"}});
    StateComparator comparator(quiet_settings().message_catalog());
    CompareOptions opts;
    opts.properties = std::vector<std::string>{"State"};
    EXPECT_TRUE(comparator.test(Value{{"State", "running"}}, desired, opts));
}

TEST(CliRoundTrip, TomlStateSurvives) {
    TempFile state(
        "name = \"svc\"\n"
        "ports = [80]\n"
        "[db]\n"
        "host = \"db01\"\n"
        "replicas = [\"a\", \"b\"]\n",
        ".toml");
    const Value original = load_property_bag(state.path());
    const std::string text = serialize(original, quiet_settings().render_context());
    const Value reparsed = extract_value(text);
    EXPECT_TRUE(Value::diff(original, reparsed).empty()) << text;
}
