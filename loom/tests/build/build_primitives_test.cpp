//! # Build Primitive Tests
//!
//! Completion channel, worker pool, style request rewriting, single-module
//! pipeline runs and error formatting.

#include "../common/temp_project.hpp"
#include "build/channel.hpp"
#include "build/error.hpp"
#include "build/pipeline.hpp"
#include "build/worker_pool.hpp"
#include "compiler/context.hpp"
#include "resolve/resolver.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace loom;
using namespace loom::build;

// ============================================================================
// Channel
// ============================================================================

TEST(ChannelTest, FifoOrder) {
    Channel<int> channel;
    EXPECT_TRUE(channel.send(1));
    EXPECT_TRUE(channel.send(2));
    EXPECT_TRUE(channel.send(3));
    EXPECT_EQ(channel.recv(), 1);
    EXPECT_EQ(channel.recv(), 2);
    EXPECT_EQ(channel.recv(), 3);
}

TEST(ChannelTest, CloseRejectsSendsAndDrains) {
    Channel<int> channel;
    channel.send(7);
    channel.close();
    EXPECT_FALSE(channel.send(8));
    EXPECT_EQ(channel.recv(), 7);
    EXPECT_EQ(channel.recv(), std::nullopt);
}

TEST(ChannelTest, RecvBlocksUntilSend) {
    Channel<std::string> channel;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.send("done");
    });
    EXPECT_EQ(channel.recv(), "done");
    producer.join();
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> channel;
    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.close();
    });
    EXPECT_EQ(channel.recv(), std::nullopt);
    closer.join();
}

TEST(ChannelTest, ManyProducersOneConsumer) {
    Channel<int> channel;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&channel, t] {
            for (int i = 0; i < 100; ++i)
                channel.send(t * 100 + i);
        });
    }
    std::set<int> seen;
    for (int i = 0; i < 400; ++i)
        seen.insert(*channel.recv());
    for (auto& p : producers)
        p.join();
    EXPECT_EQ(seen.size(), 400u);
}

// ============================================================================
// Worker Pool
// ============================================================================

TEST(WorkerPoolTest, RunsEveryJob) {
    std::atomic<int> count{0};
    {
        WorkerPool pool(4);
        EXPECT_EQ(pool.thread_count(), 4u);
        for (int i = 0; i < 100; ++i)
            EXPECT_TRUE(pool.submit([&count] { ++count; }));
    }
    EXPECT_EQ(count.load(), 100);
}

TEST(WorkerPoolTest, ZeroMeansDefaultThreadCount) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.thread_count(), WorkerPool::default_thread_count());
    EXPECT_GT(pool.thread_count(), 0u);
}

TEST(WorkerPoolTest, CancelDropsQueuedJobs) {
    std::atomic<int> count{0};
    Channel<int> started;
    Channel<int> release;
    {
        WorkerPool pool(1);
        pool.submit([&] {
            started.send(1);
            release.recv();
            ++count;
        });
        started.recv();
        for (int i = 0; i < 10; ++i)
            pool.submit([&count] { ++count; });

        pool.cancel();
        EXPECT_FALSE(pool.submit([&count] { ++count; }));
        release.send(1);
    }
    EXPECT_EQ(count.load(), 1);
}

TEST(WorkerPoolTest, JobsRunConcurrently) {
    Channel<int> arrived;
    Channel<int> go;
    {
        WorkerPool pool(3);
        for (int i = 0; i < 3; ++i) {
            pool.submit([&] {
                arrived.send(1);
                go.recv();
            });
        }
        // All three must be running at once to arrive
        for (int i = 0; i < 3; ++i)
            EXPECT_TRUE(arrived.recv().has_value());
        go.close();
    }
}

// ============================================================================
// Pipeline
// ============================================================================

TEST(ResolveRequestTest, ScriptSourcesUnchanged) {
    EXPECT_EQ(resolve_request({"react", graph::ResolveType::Import, 0}), "react");
    EXPECT_EQ(resolve_request({"./a?raw", graph::ResolveType::Require, 0}), "./a?raw");
}

TEST(ResolveRequestTest, StyleReferencesAreRelative) {
    EXPECT_EQ(resolve_request({"foo.css", graph::ResolveType::CssImport, 0}), "./foo.css");
    EXPECT_EQ(resolve_request({"../foo.css", graph::ResolveType::CssImport, 0}), "../foo.css");
    EXPECT_EQ(resolve_request({"~normalize.css", graph::ResolveType::CssImport, 0}),
              "normalize.css");
    EXPECT_EQ(resolve_request({"img/a.png?v=2#x", graph::ResolveType::CssUrl, 0}), "./img/a.png");
    EXPECT_EQ(resolve_request({"/abs/a.png", graph::ResolveType::CssUrl, 0}), "/abs/a.png");
}

class PipelineTest : public ::testing::Test {
protected:
    test::TempProject project;
};

TEST_F(PipelineTest, BuildsOneModuleWithResolvedDependencies) {
    test::write_normal_project(project);
    Context context(config::Config{}, project.root());
    resolve::Resolver resolver(resolve::Resolver::from_config(context.config, context.root));

    auto result = build_module(context, Task{project.path("index.ts"), true}, resolver);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& built = unwrap(result);

    EXPECT_EQ(built.module.id.id, project.path("index.ts"));
    EXPECT_TRUE(built.module.is_entry);
    ASSERT_TRUE(built.module.info.has_value());
    ASSERT_EQ(built.dependencies.size(), 2u);
    EXPECT_EQ(built.dependencies[0].resolution.path, project.path("bar_1.ts"));
    EXPECT_EQ(built.dependencies[0].dependency.source, "./bar_1");
    EXPECT_EQ(built.dependencies[1].resolution.path, project.path("bar_2.ts"));
    EXPECT_TRUE(context.module_graph.module_count() == 0);
}

TEST_F(PipelineTest, StyleDependenciesResolveRelative) {
    test::write_css_project(project);
    Context context(config::Config{}, project.root());
    resolve::Resolver resolver(resolve::Resolver::from_config(context.config, context.root));

    auto result = build_module(context, Task{project.path("index.css"), false}, resolver);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& deps = unwrap(result).dependencies;
    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps[0].dependency.resolve_type, graph::ResolveType::CssImport);
    EXPECT_EQ(deps[0].resolution.path, project.path("foo.css"));
    EXPECT_EQ(deps[1].dependency.resolve_type, graph::ResolveType::CssUrl);
    EXPECT_EQ(deps[1].resolution.path, project.path("umi-logo.png"));
}

TEST_F(PipelineTest, ResolveFailureNamesSpecifierAsWritten) {
    project.write("index.css", ".a { background: url(missing.png); }");
    Context context(config::Config{}, project.root());
    resolve::Resolver resolver(resolve::Resolver::from_config(context.config, context.root));

    auto result = build_module(context, Task{project.path("index.css"), true}, resolver);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ResolveError);
    EXPECT_EQ(unwrap_err(result).message,
              "cannot resolve 'missing.png' from " + project.path("index.css"));
}

// ============================================================================
// Errors
// ============================================================================

TEST(BuildErrorTest, FormatsKindAndChain) {
    auto err = BuildError::resolve("/p/bar.ts", "./missing");
    EXPECT_EQ(err.to_string(), "ResolveError: cannot resolve './missing' from /p/bar.ts");

    err.import_chain = {"/p/index.ts", "/p/bar.ts"};
    EXPECT_EQ(err.to_string(), "ResolveError: cannot resolve './missing' from /p/bar.ts\n"
                               "  imported by: /p/index.ts -> /p/bar.ts");
}

TEST(BuildErrorTest, LoadErrorsCarrySubKind) {
    auto err = BuildError::unsupported_ext("scss", "/p/a.scss");
    EXPECT_TRUE(err.is_load_error(LoadErrorKind::UnsupportedExtName));
    EXPECT_FALSE(err.is_load_error(LoadErrorKind::NotFound));
    EXPECT_EQ(err.to_string().rfind("LoadError(UnsupportedExtName): ", 0), 0u);

    EXPECT_FALSE(BuildError::parse("/p/a.ts", "1:1: x").is_load_error(LoadErrorKind::NotFound));
}
