/**
 * @file test_dependency_resolver.cpp
 * @brief Unit tests for DependencyResolver against an in-memory store.
 */

#include "resolver/dependency_resolver.hpp"
#include "store/memory_task_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace task_swarm;

class DependencyResolverTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    InMemoryTaskStore store_;
    SteadyTime now_{};
    DependencyResolver resolver_{store_, logger_, std::chrono::seconds{60},
                                 [this] { return now_; }};

    void add(const TaskId& id, std::vector<TaskId> deps = {},
             TaskStatus status = TaskStatus::Ready) {
        Task t;
        t.id = id;
        t.status = status;
        t.dependencies = std::move(deps);
        ASSERT_TRUE(static_cast<bool>(store_.insert_task(t))) << id;
        resolver_.invalidate_cache();
    }

    void set_status(const TaskId& id, TaskStatus status) {
        auto t = store_.get_task(id).value();
        ASSERT_TRUE(store_.update_status(id, status, t.version).has_value());
        resolver_.invalidate_cache();
    }
};

TEST_F(DependencyResolverTest, DepthOfChain) {
    add("a");
    add("b", {"a"}, TaskStatus::Blocked);
    add("c", {"b"}, TaskStatus::Blocked);

    EXPECT_EQ(resolver_.calculate_dependency_depth("a").value(), 0);
    EXPECT_EQ(resolver_.calculate_dependency_depth("b").value(), 1);
    EXPECT_EQ(resolver_.calculate_dependency_depth("c").value(), 2);

    auto missing = resolver_.calculate_dependency_depth("zzz");
    ASSERT_FALSE(missing.has_value());
    EXPECT_TRUE(missing.error().is(ErrorCode::TaskNotFound));
}

TEST_F(DependencyResolverTest, DetectCycle) {
    add("a");
    add("b", {"a"}, TaskStatus::Blocked);
    add("c", {"b"}, TaskStatus::Blocked);
    add("x");

    EXPECT_TRUE(resolver_.detect_cycle("a", "c").value());
    EXPECT_TRUE(resolver_.detect_cycle("a", "a").value());
    EXPECT_FALSE(resolver_.detect_cycle("c", "x").value());
    EXPECT_FALSE(resolver_.detect_cycle("c", "a").value());

    auto unknown = resolver_.detect_cycle("a", "ghost");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_TRUE(unknown.error().is(ErrorCode::TaskNotFound));
}

TEST_F(DependencyResolverTest, ValidateNewDependencyReportsCycle) {
    add("a");
    add("b", {"a"}, TaskStatus::Blocked);

    auto bad = resolver_.validate_new_dependency("a", "b");
    ASSERT_FALSE(static_cast<bool>(bad));
    EXPECT_TRUE(bad.error().is(ErrorCode::CircularDependency));

    // Rejection leaves the stored relation untouched.
    EXPECT_TRUE(store_.get_task("a").value().dependencies.empty());
    EXPECT_TRUE(static_cast<bool>(resolver_.validate_new_dependency("b", "a")));
}

TEST_F(DependencyResolverTest, BlockedTasksExcludeTerminalDependents) {
    add("root");
    add("d1", {"root"}, TaskStatus::Blocked);
    add("d2", {"root"}, TaskStatus::Blocked);
    add("d3", {"root"}, TaskStatus::Blocked);
    set_status("d3", TaskStatus::Cancelled);

    auto blocked = resolver_.get_blocked_tasks("root");
    ASSERT_TRUE(blocked.has_value());
    auto ids = blocked.value();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<TaskId>{"d1", "d2"}));
}

TEST_F(DependencyResolverTest, DependenciesMetSequential) {
    add("a");
    add("b");
    add("c", {"a", "b"}, TaskStatus::Blocked);

    EXPECT_FALSE(resolver_.are_all_dependencies_met("c").value());
    set_status("a", TaskStatus::Completed);
    EXPECT_FALSE(resolver_.are_all_dependencies_met("c").value());
    set_status("b", TaskStatus::Completed);
    EXPECT_TRUE(resolver_.are_all_dependencies_met("c").value());
    EXPECT_TRUE(resolver_.are_all_dependencies_met("a").value());
}

TEST_F(DependencyResolverTest, DependenciesMetParallelQuorum) {
    add("p1");
    add("p2");
    add("p3");

    Task join;
    join.id = "join";
    join.status = TaskStatus::Blocked;
    join.dependencies = {"p1", "p2", "p3"};
    join.dependency_type = DependencyType::Parallel;
    join.parallel_quorum = 2;
    ASSERT_TRUE(static_cast<bool>(store_.insert_task(join)));

    set_status("p1", TaskStatus::Completed);
    EXPECT_FALSE(resolver_.are_all_dependencies_met("join").value());
    set_status("p3", TaskStatus::Completed);
    EXPECT_TRUE(resolver_.are_all_dependencies_met("join").value());
}

TEST_F(DependencyResolverTest, ExecutionBatchesGroupByDepth) {
    add("a");
    add("b");
    add("c", {"a"}, TaskStatus::Blocked);
    add("d", {"a", "b"}, TaskStatus::Blocked);
    add("e", {"c"}, TaskStatus::Blocked);

    auto batches = resolver_.execution_batches({"a", "b", "c", "d", "e"});
    ASSERT_TRUE(batches.has_value());
    ASSERT_EQ(batches->size(), 3u);

    auto sorted = [](std::vector<TaskId> v) { std::sort(v.begin(), v.end()); return v; };
    EXPECT_EQ(sorted((*batches)[0]), (std::vector<TaskId>{"a", "b"}));
    EXPECT_EQ(sorted((*batches)[1]), (std::vector<TaskId>{"c", "d"}));
    EXPECT_EQ((*batches)[2], std::vector<TaskId>{"e"});
}

TEST_F(DependencyResolverTest, BatchesDropEmptyDepthLevels) {
    add("a");
    add("b", {"a"}, TaskStatus::Blocked);
    add("c", {"b"}, TaskStatus::Blocked);

    // b is left out, so depth 1 has no member.
    auto batches = resolver_.execution_batches({"a", "c"});
    ASSERT_TRUE(batches.has_value());
    ASSERT_EQ(batches->size(), 2u);
    EXPECT_EQ((*batches)[0], std::vector<TaskId>{"a"});
    EXPECT_EQ((*batches)[1], std::vector<TaskId>{"c"});
}

TEST_F(DependencyResolverTest, CacheHitsUntilInvalidated) {
    add("a");
    auto before = resolver_.cache_stats();

    (void)resolver_.calculate_dependency_depth("a");
    (void)resolver_.calculate_dependency_depth("a");
    auto after = resolver_.cache_stats();
    EXPECT_EQ(after.rebuilds, before.rebuilds + 1);
    EXPECT_EQ(after.hits, before.hits + 1);

    // Inserted behind the resolver's back: invisible until invalidation.
    Task late;
    late.id = "late";
    ASSERT_TRUE(static_cast<bool>(store_.insert_task(late)));
    EXPECT_FALSE(resolver_.calculate_dependency_depth("late").has_value());

    resolver_.invalidate_cache();
    EXPECT_EQ(resolver_.calculate_dependency_depth("late").value(), 0);
}

TEST_F(DependencyResolverTest, CacheExpiresAfterTtl) {
    add("a");
    (void)resolver_.calculate_dependency_depth("a");
    auto rebuilds = resolver_.cache_stats().rebuilds;

    now_ += std::chrono::seconds{61};
    (void)resolver_.calculate_dependency_depth("a");
    EXPECT_EQ(resolver_.cache_stats().rebuilds, rebuilds + 1);
}
