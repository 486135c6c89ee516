/**
 * @file test_task_queue.cpp
 * @brief Unit tests for the TaskQueue lifecycle service.
 */

#include "queue/task_queue.hpp"
#include "store/memory_task_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace task_swarm;

namespace {

struct CaptureSink : ILogSink {
    std::shared_ptr<std::vector<std::string>> lines = std::make_shared<std::vector<std::string>>();

    void write(std::string_view json_line) override { lines->emplace_back(json_line); }
    void flush() override {}
};

TaskSpec spec(const TaskId& id, std::vector<TaskId> prerequisites = {}, int base = 5) {
    TaskSpec s;
    s.id = id;
    s.summary = "task " + id;
    s.base_priority = base;
    s.prerequisites = std::move(prerequisites);
    return s;
}

}  // namespace

class TaskQueueTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    std::shared_ptr<std::vector<std::string>> events_;
    std::unique_ptr<MetricsCollector> metrics_;
    InMemoryTaskStore store_;
    DependencyResolver resolver_{store_, logger_};
    PriorityCalculator calculator_{store_, resolver_, logger_};
    std::unique_ptr<TaskQueue> queue_;

    void SetUp() override {
        auto sink = std::make_unique<CaptureSink>();
        events_ = sink->lines;
        metrics_ = std::make_unique<MetricsCollector>(std::move(sink));
        queue_ = std::make_unique<TaskQueue>(store_, resolver_, calculator_, logger_,
                                             QueueConfig{}, metrics_.get());
    }

    Task enqueue(const TaskSpec& s) {
        auto t = queue_->enqueue(s);
        EXPECT_TRUE(t.has_value()) << (t ? "" : t.error().what());
        return t ? t.value() : Task{};
    }

    TaskStatus status_of(const TaskId& id) {
        return queue_->get_task(id).value().status;
    }

    // Dequeue until @p id is claimed; fails the test if it never is.
    void run(const TaskId& id) {
        auto next = queue_->dequeue_next();
        ASSERT_TRUE(next.has_value());
        ASSERT_TRUE(next->has_value());
        ASSERT_EQ((*next)->id, id);
    }

    size_t count_events(std::string_view name) const {
        std::string needle = "\"event\":\"" + std::string(name) + "\"";
        return static_cast<size_t>(std::count_if(events_->begin(), events_->end(),
            [&](const std::string& line) { return line.find(needle) != std::string::npos; }));
    }
};

// ── Enqueue ──────────────────────────────────

TEST_F(TaskQueueTest, EnqueueRootIsReady) {
    auto t = enqueue(spec("a"));
    EXPECT_EQ(t.status, TaskStatus::Ready);
    EXPECT_EQ(t.dependency_depth, 0);
    EXPECT_GT(t.calculated_priority, 0.0);
    EXPECT_EQ(t.max_retries, 3u);
}

TEST_F(TaskQueueTest, EnqueueWithOpenPrerequisiteIsBlocked) {
    enqueue(spec("a"));
    auto b = enqueue(spec("b", {"a", "a"}));
    EXPECT_EQ(b.status, TaskStatus::Blocked);
    EXPECT_EQ(b.dependency_depth, 1);
    EXPECT_EQ(b.dependencies, std::vector<TaskId>{"a"});
}

TEST_F(TaskQueueTest, EnqueueGeneratesIdWhenMissing) {
    auto t = enqueue(spec(""));
    EXPECT_FALSE(t.id.empty());
    EXPECT_TRUE(queue_->get_task(t.id).has_value());
}

TEST_F(TaskQueueTest, EnqueueValidation) {
    enqueue(spec("a"));
    enqueue(spec("b"));

    auto bad_priority = queue_->enqueue(spec("p", {}, 11));
    ASSERT_FALSE(bad_priority.has_value());
    EXPECT_TRUE(bad_priority.error().is(ErrorCode::InvalidArgument));

    auto self = queue_->enqueue(spec("s", {"s"}));
    ASSERT_FALSE(self.has_value());
    EXPECT_TRUE(self.error().is(ErrorCode::CircularDependency));

    auto missing = queue_->enqueue(spec("m", {"ghost"}));
    ASSERT_FALSE(missing.has_value());
    EXPECT_TRUE(missing.error().is(ErrorCode::TaskNotFound));

    auto quorum = spec("q", {"a", "b"});
    quorum.dependency_type = DependencyType::Parallel;
    quorum.parallel_quorum = 3;
    auto bad_quorum = queue_->enqueue(quorum);
    ASSERT_FALSE(bad_quorum.has_value());
    EXPECT_TRUE(bad_quorum.error().is(ErrorCode::InvalidArgument));

    EXPECT_FALSE(queue_->get_task("q").has_value());
}

TEST_F(TaskQueueTest, EnqueueRescoresPrerequisites) {
    auto before = enqueue(spec("a")).calculated_priority;
    enqueue(spec("b", {"a"}));
    auto after = queue_->get_task("a").value().calculated_priority;
    EXPECT_GT(after, before);
}

// ── Dispatch and completion ──────────────────

TEST_F(TaskQueueTest, DequeueHighestPriorityFirst) {
    enqueue(spec("low", {}, 1));
    enqueue(spec("high", {}, 9));

    auto next = queue_->dequeue_next();
    ASSERT_TRUE(next.has_value() && next->has_value());
    EXPECT_EQ((*next)->id, "high");
    EXPECT_EQ((*next)->status, TaskStatus::Running);
    EXPECT_TRUE((*next)->started_at.has_value());
}

TEST_F(TaskQueueTest, DequeueEmpty) {
    auto next = queue_->dequeue_next();
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->has_value());
}

TEST_F(TaskQueueTest, CompleteUnblocksDependents) {
    enqueue(spec("a"));
    enqueue(spec("b", {"a"}));
    enqueue(spec("c", {"a"}));
    enqueue(spec("d", {"b", "c"}));

    run("a");
    auto unblocked = queue_->complete_task("a", "done");
    ASSERT_TRUE(unblocked.has_value());
    auto ids = unblocked.value();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<TaskId>{"b", "c"}));
    EXPECT_EQ(status_of("d"), TaskStatus::Blocked);

    auto a = queue_->get_task("a").value();
    EXPECT_EQ(a.status, TaskStatus::Completed);
    EXPECT_EQ(a.result_output, "done");
    EXPECT_TRUE(a.completed_at.has_value());
}

TEST_F(TaskQueueTest, ParallelQuorumUnblocksEarly) {
    enqueue(spec("p1"));
    enqueue(spec("p2"));
    enqueue(spec("p3"));
    auto join = spec("join", {"p1", "p2", "p3"});
    join.dependency_type = DependencyType::Parallel;
    join.parallel_quorum = 2;
    enqueue(join);

    auto first = queue_->dequeue_next().value().value();
    ASSERT_TRUE(queue_->complete_task(first.id).has_value());
    EXPECT_EQ(status_of("join"), TaskStatus::Blocked);

    auto second = queue_->dequeue_next().value().value();
    auto unblocked = queue_->complete_task(second.id);
    ASSERT_TRUE(unblocked.has_value());
    EXPECT_EQ(unblocked.value(), std::vector<TaskId>{"join"});
    EXPECT_EQ(status_of("join"), TaskStatus::Ready);
}

TEST_F(TaskQueueTest, CompleteRequiresRunning) {
    enqueue(spec("a"));
    auto result = queue_->complete_task("a");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::InvalidStatusTransition));
}

// ── Failure, retry, cancellation ─────────────

TEST_F(TaskQueueTest, RetryUntilExhausted) {
    auto s = spec("flaky");
    s.max_retries = 1;
    enqueue(s);
    enqueue(spec("after", {"flaky"}));

    run("flaky");
    auto first = queue_->fail_task("flaky", "timeout");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->retryable);
    EXPECT_TRUE(first->cascade.cancelled.empty());
    EXPECT_EQ(status_of("after"), TaskStatus::Blocked);

    auto retried = queue_->retry_task("flaky");
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(retried->status, TaskStatus::Ready);
    EXPECT_EQ(retried->retry_count, 1u);

    run("flaky");
    auto second = queue_->fail_task("flaky", "timeout again");
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second->retryable);
    EXPECT_EQ(second->cascade.cancelled, std::vector<TaskId>{"after"});
    EXPECT_EQ(status_of("after"), TaskStatus::Cancelled);

    auto exhausted = queue_->retry_task("flaky");
    ASSERT_FALSE(exhausted.has_value());
    EXPECT_TRUE(exhausted.error().is(ErrorCode::RetriesExhausted));
    EXPECT_EQ(status_of("flaky"), TaskStatus::Failed);
}

TEST_F(TaskQueueTest, CancelCascadesOnlyToDependents) {
    enqueue(spec("root"));
    enqueue(spec("child", {"root"}));
    enqueue(spec("grandchild", {"child"}));
    enqueue(spec("bystander"));

    auto report = queue_->cancel_task("root");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->cancelled,
              (std::vector<TaskId>{"root", "child", "grandchild"}));
    EXPECT_TRUE(report->unreachable.empty());

    EXPECT_EQ(status_of("bystander"), TaskStatus::Ready);
    EXPECT_EQ(count_events("cascade_cancellation"), 1u);
}

TEST_F(TaskQueueTest, CancelSkipsFinishedDependents) {
    enqueue(spec("a", {}, 1));
    enqueue(spec("b", {}, 9));
    enqueue(spec("c", {"a", "b"}));

    run("b");
    ASSERT_TRUE(queue_->complete_task("b").has_value());

    auto report = queue_->cancel_task("b");
    ASSERT_FALSE(report.has_value());
    EXPECT_TRUE(report.error().is(ErrorCode::InvalidStatusTransition));

    auto cancelled = queue_->cancel_task("a");
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(status_of("b"), TaskStatus::Completed);
    EXPECT_EQ(status_of("c"), TaskStatus::Cancelled);
}

// ── Graph edits ──────────────────────────────

TEST_F(TaskQueueTest, AddDependencyDemotesReadyTask) {
    enqueue(spec("a"));
    enqueue(spec("b"));

    auto b = queue_->add_dependency("b", "a");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->status, TaskStatus::Blocked);
    EXPECT_EQ(b->dependency_depth, 1);
}

TEST_F(TaskQueueTest, AddDependencyRejectsCycle) {
    enqueue(spec("a"));
    enqueue(spec("b", {"a"}));

    auto result = queue_->add_dependency("a", "b");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::CircularDependency));
    EXPECT_TRUE(queue_->get_task("a").value().dependencies.empty());
    EXPECT_EQ(status_of("a"), TaskStatus::Ready);
}

TEST_F(TaskQueueTest, AddDependencyOnRunningTaskRejected) {
    enqueue(spec("a"));
    enqueue(spec("b", {}, 1));
    run("a");

    auto result = queue_->add_dependency("a", "b");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::InvalidState));
}

TEST_F(TaskQueueTest, ResolveReadyPromotesSatisfiedTasks) {
    enqueue(spec("a"));
    enqueue(spec("b", {"a"}));

    // Complete behind the queue's back so b is left Blocked.
    auto a = store_.get_task("a").value();
    ASSERT_TRUE(store_.update_status("a", TaskStatus::Completed, a.version).has_value());
    resolver_.invalidate_cache();

    auto promoted = queue_->resolve_ready();
    ASSERT_TRUE(promoted.has_value());
    EXPECT_EQ(promoted.value(), std::vector<TaskId>{"b"});
    EXPECT_EQ(status_of("b"), TaskStatus::Ready);
}

// ── Queries ──────────────────────────────────

TEST_F(TaskQueueTest, QueueStatusCounts) {
    enqueue(spec("a"));
    enqueue(spec("b", {"a"}));
    enqueue(spec("c", {"b"}));
    run("a");

    auto stats = queue_->queue_status();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 3u);
    EXPECT_EQ(stats->count(TaskStatus::Running), 1u);
    EXPECT_EQ(stats->count(TaskStatus::Blocked), 2u);
    EXPECT_EQ(stats->count(TaskStatus::Completed), 0u);
    EXPECT_EQ(stats->max_depth, 2);
    EXPECT_TRUE(stats->oldest_waiting.has_value());
    EXPECT_GT(stats->average_priority, 0.0);

    auto blocked = queue_->list_tasks(TaskStatus::Blocked);
    ASSERT_TRUE(blocked.has_value());
    EXPECT_EQ(blocked->size(), 2u);
}

TEST_F(TaskQueueTest, ExecutionPlanLayers) {
    enqueue(spec("a"));
    enqueue(spec("b"));
    enqueue(spec("c", {"a", "b"}));

    auto plan = queue_->execution_plan({"a", "b", "c"});
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->size(), 2u);
    EXPECT_EQ((*plan)[0].size(), 2u);
    EXPECT_EQ((*plan)[1], std::vector<TaskId>{"c"});
}

TEST_F(TaskQueueTest, StatusChangesAreRecorded) {
    enqueue(spec("a"));
    run("a");
    ASSERT_TRUE(queue_->complete_task("a").has_value());
    EXPECT_GE(count_events("status_change"), 2u);
}

// ── Enqueue racing a completing prerequisite ─

namespace {

// Forwards to an in-memory store and runs a hook just before each insert.
class InterleavingStore final : public ITaskStore {
public:
    std::function<void(const Task&)> before_insert;

    Result<void> insert_task(const Task& task) override {
        if (before_insert) before_insert(task);
        return inner_.insert_task(task);
    }
    Result<Task> get_task(const TaskId& id) const override { return inner_.get_task(id); }
    Result<std::optional<Task>> get_next_ready_task() const override {
        return inner_.get_next_ready_task();
    }
    Result<Task> update_status(const TaskId& id, TaskStatus status, uint64_t version) override {
        return inner_.update_status(id, status, version);
    }
    Result<Task> update_task(const Task& task) override { return inner_.update_task(task); }
    Result<std::vector<Task>> list_tasks(std::optional<TaskStatus> status,
                                         size_t limit) const override {
        return inner_.list_tasks(status, limit);
    }
    Result<void> insert_dependency(const TaskId& task_id, const TaskId& dependency_id) override {
        return inner_.insert_dependency(task_id, dependency_id);
    }
    size_t size() const override { return inner_.size(); }

private:
    InMemoryTaskStore inner_;
};

}  // namespace

TEST(TaskQueueInterleaving, PrerequisiteCompletingDuringEnqueueLeavesChildReady) {
    Logger logger{std::make_unique<NullSink>()};
    InterleavingStore store;
    DependencyResolver resolver{store, logger};
    PriorityCalculator calculator{store, resolver, logger};
    TaskQueue queue{store, resolver, calculator, logger};

    ASSERT_TRUE(queue.enqueue(spec("p")).has_value());
    auto running = queue.dequeue_next();
    ASSERT_TRUE(running.has_value() && running->has_value());

    size_t unblocked_by_completion = 99;
    store.before_insert = [&](const Task& task) {
        if (task.id != "c") return;
        EXPECT_EQ(task.status, TaskStatus::Blocked);
        auto unblocked = queue.complete_task("p", "done");
        ASSERT_TRUE(unblocked.has_value());
        unblocked_by_completion = unblocked.value().size();
    };

    auto child = queue.enqueue(spec("c", {"p"}));
    ASSERT_TRUE(child.has_value()) << child.error().what();
    EXPECT_EQ(unblocked_by_completion, 0u);
    EXPECT_EQ(queue.get_task("p").value().status, TaskStatus::Completed);
    EXPECT_EQ(child.value().status, TaskStatus::Ready);

    auto next = queue.dequeue_next();
    ASSERT_TRUE(next.has_value() && next->has_value());
    EXPECT_EQ((*next)->id, "c");
}
