//! # CLI Tests
//!
//! Runs the dispatcher against fixture projects and checks stdout and exit
//! codes.

#include "../common/temp_project.hpp"
#include "cli/driver.hpp"
#include "json/json.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace loom;

namespace {

/// Runs `loom_main` with `args` and returns (exit code, stdout).
auto run_cli(std::vector<std::string> args) -> std::pair<int, std::string> {
    args.insert(args.begin(), "loom");
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    int code = loom_main(static_cast<int>(argv.size()), argv.data());
    auto out = ::testing::internal::GetCapturedStdout();
    (void)::testing::internal::GetCapturedStderr();
    return {code, out};
}

} // namespace

class CliTest : public ::testing::Test {
protected:
    test::TempProject project;
};

TEST_F(CliTest, GraphPrintsListings) {
    test::write_normal_project(project);
    auto [code, out] = run_cli({"graph", project.root(), "-q"});
    EXPECT_EQ(code, 0);
    EXPECT_EQ(out, "bar_1.ts,bar_2.ts,foo.ts,index.ts\n"
                   "bar_1.ts -> foo.ts,bar_2.ts -> foo.ts,index.ts -> bar_1.ts,index.ts -> bar_2.ts\n");
}

TEST_F(CliTest, GraphJsonDocument) {
    test::write_css_project(project);
    auto [code, out] = run_cli({"graph", project.root(), "--json", "-q"});
    ASSERT_EQ(code, 0);

    auto doc = json::parse_json(out);
    ASSERT_TRUE(is_ok(doc)) << out;
    const auto& nodes = unwrap(doc).get("nodes")->as_array();
    const auto& edges = unwrap(doc).get("edges")->as_array();
    ASSERT_EQ(nodes.size(), 4u);
    EXPECT_EQ(edges.size(), 3u);

    EXPECT_EQ(nodes[0].get("id")->as_string(), "foo.css");
    EXPECT_EQ(nodes[0].get("kind")->as_string(), "style");
    EXPECT_EQ(nodes[2].get("id")->as_string(), "index.ts");
    EXPECT_TRUE(nodes[2].get("entry")->as_bool());
    EXPECT_EQ(nodes[3].get("kind")->as_string(), "asset");
}

TEST_F(CliTest, BuildPrintsSummary) {
    test::write_normal_project(project);
    auto [code, out] = run_cli({"build", project.root(), "-q"});
    EXPECT_EQ(code, 0);
    EXPECT_NE(out.find("Modules: 4"), std::string::npos);
    EXPECT_NE(out.find("Dependencies: 4"), std::string::npos);
}

TEST_F(CliTest, BuildErrorExitsNonZero) {
    project.write("index.ts", "import './missing';\n");
    auto [code, out] = run_cli({"build", project.root(), "-q"});
    EXPECT_EQ(code, 1);
}

TEST_F(CliTest, UsageErrors) {
    EXPECT_EQ(run_cli({"frobnicate", project.root()}).first, 1);
    EXPECT_EQ(run_cli({"build", "--bogus"}).first, 1);
    EXPECT_EQ(run_cli({"build", "a", "b"}).first, 1);
    EXPECT_EQ(run_cli({"--help"}).first, 0);
}
