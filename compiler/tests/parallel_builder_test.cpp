// Parallel Builder Tests
// Tests for DependencyGraph, BuildQueue, ParallelBuilder

#include "driver/parallel_builder.hpp"

#include <chrono>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace a2c;
using namespace a2c::driver;
using namespace a2c::tree;
namespace fs = std::filesystem;

namespace {

auto fragment(const std::string& module, std::vector<std::string> imports = {}) -> Fragment {
    Fragment f;
    f.module = module;
    f.imports = std::move(imports);
    return f;
}

/// `fn <name>() -> int { <callee>() }`, or a literal when there is no callee.
auto int_function(const std::string& name, const std::string& callee = "") -> FuncDecl {
    auto tail = callee.empty() ? make_int_literal(1) : make_call(callee, {}, types::make_i32());
    return make_function(name, {}, types::make_i32(),
                         make_block({}, std::move(tail), types::make_i32()));
}

/// A function assigning to an immutable binding.
auto broken_function() -> FuncDecl {
    return make_function(
        "broken", {}, types::make_unit(),
        make_block(move_list<StmtPtr>(
                       make_let("x", types::make_i32(), make_int_literal(1), false),
                       make_expr_stmt(make_assign(make_var("x", types::make_i32()),
                                                  make_int_literal(2)))),
                   nullptr, types::make_unit()));
}

auto read_file(const fs::path& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

// ============================================================================
// DependencyGraph Tests
// ============================================================================

class DependencyGraphTest : public ::testing::Test {
protected:
    DependencyGraph graph;
};

TEST_F(DependencyGraphTest, EmptyGraphNoCycles) {
    EXPECT_FALSE(graph.has_cycles());
    EXPECT_TRUE(graph.ready_modules().empty());
}

TEST_F(DependencyGraphTest, LinearDependencyChain) {
    // c imports b, b imports a
    graph.add_module("a", {});
    graph.add_module("b", {"a"});
    graph.add_module("c", {"b"});

    EXPECT_FALSE(graph.has_cycles());
    EXPECT_EQ(graph.ready_modules(), std::vector<std::string>{"a"});

    EXPECT_EQ(graph.mark_complete("a"), std::vector<std::string>{"b"});
    EXPECT_EQ(graph.ready_modules(), std::vector<std::string>{"b"});

    EXPECT_EQ(graph.mark_complete("b"), std::vector<std::string>{"c"});
    EXPECT_TRUE(graph.mark_complete("c").empty());
    EXPECT_TRUE(graph.ready_modules().empty());
}

TEST_F(DependencyGraphTest, DiamondDependency) {
    //       a
    //      / \
    //     b   c
    //      \ /
    //       d
    graph.add_module("a", {});
    graph.add_module("b", {"a"});
    graph.add_module("c", {"a"});
    graph.add_module("d", {"b", "c"});

    EXPECT_EQ(graph.mark_complete("a"), (std::vector<std::string>{"b", "c"}));
    EXPECT_TRUE(graph.mark_complete("c").empty());
    EXPECT_EQ(graph.mark_complete("b"), std::vector<std::string>{"d"});
}

TEST_F(DependencyGraphTest, RepeatedImportCountsOnce) {
    graph.add_module("a", {});
    graph.add_module("b", {"a", "a"});

    EXPECT_EQ(graph.mark_complete("a"), std::vector<std::string>{"b"});
}

TEST_F(DependencyGraphTest, DependentsAreTransitive) {
    graph.add_module("a", {});
    graph.add_module("b", {"a"});
    graph.add_module("c", {"b"});
    graph.add_module("other", {});

    EXPECT_EQ(graph.dependents_of("a"), (std::vector<std::string>{"b", "c"}));
    EXPECT_TRUE(graph.dependents_of("c").empty());
    EXPECT_TRUE(graph.dependents_of("other").empty());
}

TEST_F(DependencyGraphTest, CycleIsReportedAsClosedPath) {
    graph.add_module("a", {"b"});
    graph.add_module("b", {"a"});

    auto cycle = graph.find_cycle();
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(*cycle, (std::vector<std::string>{"a", "b", "a"}));
}

TEST_F(DependencyGraphTest, TopologicalSort) {
    graph.add_module("c", {"b"});
    graph.add_module("b", {"a"});
    graph.add_module("a", {});

    EXPECT_EQ(graph.topological_sort(), (std::vector<std::string>{"a", "b", "c"}));
}

// ============================================================================
// BuildQueue Tests
// ============================================================================

class BuildQueueTest : public ::testing::Test {
protected:
    BuildQueue queue;
};

TEST_F(BuildQueueTest, FIFOOrder) {
    for (const auto* name : {"first", "second", "third"}) {
        auto job = std::make_shared<ModuleJob>();
        job->module = name;
        queue.push(job);
    }

    EXPECT_EQ(queue.pop()->module, "first");
    EXPECT_EQ(queue.pop()->module, "second");
    EXPECT_EQ(queue.pop()->module, "third");
    EXPECT_TRUE(queue.is_empty());
}

TEST_F(BuildQueueTest, PopTimeoutOnEmpty) {
    auto start = std::chrono::steady_clock::now();
    auto result = queue.pop(50);
    auto end = std::chrono::steady_clock::now();

    EXPECT_EQ(result, nullptr);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    EXPECT_GE(elapsed, 45); // Allow some slack
}

TEST_F(BuildQueueTest, StopQueue) {
    queue.stop();
    EXPECT_EQ(queue.pop(1000), nullptr);
}

TEST(BuildStatsTest, FinishedCountsEveryOutcome) {
    BuildStats stats;
    stats.total = 5;
    stats.built++;
    stats.failed++;
    stats.skipped++;
    EXPECT_EQ(stats.finished(), 3);

    stats.reset();
    EXPECT_EQ(stats.total.load(), 0);
    EXPECT_EQ(stats.finished(), 0);
}

TEST(ModuleStatusTest, Names) {
    EXPECT_STREQ(module_status_name(ModuleStatus::Built), "built");
    EXPECT_STREQ(module_status_name(ModuleStatus::Skipped), "skipped");
}

// ============================================================================
// ParallelBuilder Tests
// ============================================================================

class ParallelBuilderTest : public ::testing::Test {
protected:
    assemble::MemoryFragmentProvider provider;
    fs::path output_dir;

    void SetUp() override {
        output_dir = fs::temp_directory_path() / "a2c_test_parallel_build";
        fs::remove_all(output_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(output_dir, ec);
    }

    /// base <- mid <- top, plus an unrelated module.
    void add_chain() {
        auto base = fragment("base");
        base.functions.push_back(int_function("one"));
        provider.add_shared(std::move(base));

        auto mid = fragment("mid", {"base"});
        mid.functions.push_back(int_function("two", "one"));
        provider.add_shared(std::move(mid));

        auto top = fragment("top", {"mid"});
        top.functions.push_back(int_function("three", "two"));
        provider.add_shared(std::move(top));

        auto other = fragment("other");
        other.functions.push_back(int_function("four"));
        provider.add_shared(std::move(other));
    }

    auto build(int threads, const std::vector<std::string>& modules = {},
               bool write = false) -> Result<BuildReport, diag::Diagnostic> {
        CompilationRun run;
        ParallelBuilder builder(run, threads);
        if (write)
            builder.set_output_dir(output_dir);
        auto report = builder.build(provider, modules);
        last_total = builder.stats().total;
        last_built = builder.stats().built;
        return report;
    }

    int last_total = 0;
    int last_built = 0;
};

TEST_F(ParallelBuilderTest, BuildsEveryModule) {
    add_chain();

    auto result = build(4);
    ASSERT_TRUE(is_ok(result));
    const auto& report = unwrap(result);
    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.count(ModuleStatus::Built), 4u);
    EXPECT_EQ(last_total, 4);
    EXPECT_EQ(last_built, 4);

    ASSERT_EQ(report.modules.size(), 4u);
    EXPECT_EQ(report.modules[0].module, "base");
    EXPECT_EQ(report.modules[1].module, "mid");
    EXPECT_EQ(report.modules[2].module, "other");
    EXPECT_EQ(report.modules[3].module, "top");

    const auto* top = report.find("top");
    ASSERT_NE(top, nullptr);
    ASSERT_NE(top->output, nullptr);
    EXPECT_NE(top->output->artifacts.source.find("return two();"), std::string::npos);
    EXPECT_NE(top->output->artifacts.header.find("#include \"mid.h\""), std::string::npos);
}

TEST_F(ParallelBuilderTest, ThreadCountDoesNotChangeOutput) {
    add_chain();

    auto serial = build(1);
    auto parallel = build(4);
    ASSERT_TRUE(is_ok(serial));
    ASSERT_TRUE(is_ok(parallel));
    for (const auto& module : unwrap(serial).modules) {
        const auto* other = unwrap(parallel).find(module.module);
        ASSERT_NE(other, nullptr);
        EXPECT_EQ(module.output->artifacts.header, other->output->artifacts.header);
        EXPECT_EQ(module.output->artifacts.source, other->output->artifacts.source);
    }
}

TEST_F(ParallelBuilderTest, RequestedModulesPullInTheirImports) {
    add_chain();

    auto result = build(2, {"mid"});
    ASSERT_TRUE(is_ok(result));
    const auto& report = unwrap(result);
    ASSERT_EQ(report.modules.size(), 2u);
    EXPECT_NE(report.find("base"), nullptr);
    EXPECT_NE(report.find("mid"), nullptr);
    EXPECT_EQ(report.find("top"), nullptr);
}

TEST_F(ParallelBuilderTest, FailureSkipsImportersOnly) {
    auto broken = fragment("broken");
    broken.functions.push_back(broken_function());
    provider.add_shared(std::move(broken));

    auto user = fragment("user", {"broken"});
    user.functions.push_back(int_function("use"));
    provider.add_shared(std::move(user));

    auto other = fragment("other");
    other.functions.push_back(int_function("four"));
    provider.add_shared(std::move(other));

    auto result = build(3);
    ASSERT_TRUE(is_ok(result));
    const auto& report = unwrap(result);
    EXPECT_FALSE(report.success());

    const auto* failed = report.find("broken");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->status, ModuleStatus::Failed);
    ASSERT_TRUE(failed->error.has_value());
    EXPECT_EQ(failed->error->kind, diag::ErrorKind::OwnershipViolation);

    const auto* skipped = report.find("user");
    ASSERT_NE(skipped, nullptr);
    EXPECT_EQ(skipped->status, ModuleStatus::Skipped);
    EXPECT_EQ(skipped->blocked_by, "broken");

    EXPECT_EQ(report.find("other")->status, ModuleStatus::Built);
}

TEST_F(ParallelBuilderTest, MissingImportFailsAndSkips) {
    auto app = fragment("app", {"ghost"});
    app.functions.push_back(int_function("main_value"));
    provider.add_shared(std::move(app));

    auto result = build(2);
    ASSERT_TRUE(is_ok(result));
    const auto& report = unwrap(result);
    ASSERT_EQ(report.modules.size(), 2u);

    const auto* ghost = report.find("ghost");
    ASSERT_NE(ghost, nullptr);
    EXPECT_EQ(ghost->status, ModuleStatus::Failed);
    EXPECT_EQ(ghost->error->kind, diag::ErrorKind::ModuleNotFound);
    EXPECT_EQ(report.find("app")->status, ModuleStatus::Skipped);
    EXPECT_EQ(report.find("app")->blocked_by, "ghost");
}

TEST_F(ParallelBuilderTest, ImportCycleFailsTheBuild) {
    provider.add_shared(fragment("a", {"b"}));
    provider.add_shared(fragment("b", {"a"}));

    auto result = build(2);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, diag::ErrorKind::MalformedTree);
    EXPECT_NE(unwrap_err(result).message.find("a -> b -> a"), std::string::npos);
}

TEST_F(ParallelBuilderTest, WritesArtifactsToOutputDir) {
    add_chain();

    auto result = build(2, {"base"}, true);
    ASSERT_TRUE(is_ok(result));
    const auto* base = unwrap(result).find("base");
    ASSERT_NE(base, nullptr);
    ASSERT_TRUE(base->written.has_value());
    EXPECT_EQ(base->written->header, output_dir / "base.h");
    EXPECT_EQ(base->written->source, output_dir / "base.c");
    EXPECT_EQ(read_file(output_dir / "base.h"), base->output->artifacts.header);
    EXPECT_EQ(read_file(output_dir / "base.c"), base->output->artifacts.source);
}

TEST_F(ParallelBuilderTest, EmptyProviderGivesEmptyReport) {
    auto result = build(2);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).modules.empty());
    EXPECT_TRUE(unwrap(result).success());
}
