#include <gtest/gtest.h>

#include "capsule/core/execution_engine.hpp"
#include "capsule/core/result_translator.hpp"
#include "test_support.hpp"

#include <future>
#include <thread>

using namespace capsule::core;
using namespace std::chrono_literals;
using capsule::test_support::FastConfig;
using capsule::test_support::MakeStore;
using capsule::test_support::SampleFixtures;
using capsule::test_support::SlowStore;
using capsule::test_support::StoryById;
using json = nlohmann::json;

namespace {

ExecutionContext Context(const std::string& project,
                         std::optional<std::string> meeting = std::nullopt,
                         std::optional<std::string> user = std::nullopt) {
    ExecutionContext context;
    context.project_id = project;
    context.meeting_id = std::move(meeting);
    context.user_id = std::move(user);
    return context;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

class ExecutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = MakeStore();
        engine_ = std::make_unique<ExecutionEngine>(store_, FastConfig());
    }

    ExecutionResult Run(const std::string& program, const ExecutionContext& context = Context("P")) {
        return engine_->Execute(program, context);
    }

    std::shared_ptr<capsule::capabilities::MemoryStore> store_;
    std::unique_ptr<ExecutionEngine> engine_;
};

// ============================================================================
// Basic results
// ============================================================================

TEST_F(ExecutionEngineTest, LogOnlyProgramSucceeds) {
    auto result = Run("log('hello')");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "hello");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_GE(result.execution_time_ms, 0);
}

TEST_F(ExecutionEngineTest, LogLinesAreJoinedInCallOrder) {
    auto result = Run("log('a'); log('b', 'c'); console.log('d'); console.info('e')");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "a\nb c\nd\ne");
}

TEST_F(ExecutionEngineTest, LogUsesStringConversion) {
    auto result = Run("log({a: 1}, [1, 'x'], null, undefined, 3, true, new Error('bad'))");

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "[object Object] 1,x null undefined 3 true Error: bad");
}

TEST_F(ExecutionEngineTest, ConsoleLevelsWritePlainLines) {
    auto result = Run("console.warn('careful'); console.error('broken')");

    EXPECT_EQ(result.output, "careful\nbroken");
}

TEST_F(ExecutionEngineTest, CountsActiveStoriesOfProject) {
    auto result = Run("const s = await stories.findActive(); log(`Found ${s.length} active stories`);");

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "Found 3 active stories");
}

TEST_F(ExecutionEngineTest, ReturnValueIsIgnored) {
    auto result = Run("log('x'); return 42;");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "x");
}

TEST_F(ExecutionEngineTest, ContextConstantsAreVisible) {
    auto result = Run("log(projectId, meetingId, userId)", Context("P", std::string("m-1")));

    EXPECT_EQ(result.output, "P m-1 null");
}

TEST_F(ExecutionEngineTest, MeetingDefaultsToContext) {
    auto result = Run("const m = await meetings.get(); log(m.title)", Context("P", std::string("m-1")));

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "Sprint review");
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ExecutionEngineTest, UncaughtErrorReportsMessage) {
    auto result = Run("throw new Error('boom')");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "boom");
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error_kind, ErrorKind::RUNTIME);
}

TEST_F(ExecutionEngineTest, PartialOutputSurvivesFailure) {
    auto result = Run("log('step 1'); await stories.findAll(); log('step 2'); throw new Error('step 3 failed')");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "step 1\nstep 2");
    EXPECT_EQ(result.error.value_or(""), "step 3 failed");
}

TEST_F(ExecutionEngineTest, ThrownMemoryWordingIsAnOrdinaryError) {
    auto result = Run("throw new Error('ran out of memory')");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::RUNTIME);
    EXPECT_EQ(result.error.value_or(""), "ran out of memory");
    EXPECT_EQ(engine_->GetStats().pool.discarded, 0u);
}

TEST_F(ExecutionEngineTest, BodyCannotEscapeItsWrapper) {
    auto result = Run("})(); (() => {");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::COMPILE);
    EXPECT_TRUE(Contains(result.error.value_or(""), "SyntaxError")) << result.error.value_or("");
}

TEST_F(ExecutionEngineTest, ThrownNonErrorUsesStringForm) {
    auto result = Run("throw 'plain string'");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "plain string");
}

TEST_F(ExecutionEngineTest, SyntaxErrorIsCompileFailure) {
    auto result = Run("log('never printed'");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::COMPILE);
    EXPECT_EQ(result.output, "");
    EXPECT_TRUE(Contains(result.error.value_or(""), "SyntaxError")) << result.error.value_or("");
}

TEST_F(ExecutionEngineTest, EmptyProgramIsRejected) {
    auto result = Run("   \n  ");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::COMPILE);
    EXPECT_EQ(result.error.value_or(""), "Program is empty");
}

TEST_F(ExecutionEngineTest, CaughtCapabilityErrorStillSucceeds) {
    auto result = Run(R"(
        try {
            await stories.update('missing', { status: 'done' });
        } catch (e) {
            log('caught: ' + e.message);
        }
        log('done');
    )");

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "caught: Story not found: missing\ndone");
}

TEST_F(ExecutionEngineTest, UncaughtCapabilityErrorFailsProgram) {
    auto result = Run("await stories.update('missing', { status: 'done' }); log('unreachable')");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Story not found: missing");
    EXPECT_EQ(result.output, "");
}

TEST_F(ExecutionEngineTest, UnserializableArgumentThrowsSynchronously) {
    auto result = Run(R"(
        const cyclic = {}; cyclic.self = cyclic;
        try { stories.update('s-1', cyclic); } catch (e) { log(e instanceof TypeError); }
    )");

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "true");
    EXPECT_EQ(StoryById(*store_, "s-1")["status"], "in_progress");
}

TEST_F(ExecutionEngineTest, RunawayRecursionIsContained) {
    auto result = Run("function f(n) { return f(n + 1) + 1; } f(0);");

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.value_or("").empty());
}

// ============================================================================
// Mutations
// ============================================================================

TEST_F(ExecutionEngineTest, MutationsApplyToTheStore) {
    auto result = Run(R"(
        const story = await stories.findByKey('PROJ-2');
        const updated = await stories.update(story.id, { status: 'in_progress', assignee: 'lee' });
        await storyUpdates.create({ storyId: story.id, fieldChanged: 'status',
                                    oldValue: story.status, newValue: updated.status });
        const risk = await risks.create({ title: 'Card vendor', description: 'Sandbox keys missing' });
        log(updated.status, updated.assigned_to, risk.severity, risk.created_by);
    )", Context("P", std::string("m-1"), std::string("u-9")));

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "in_progress lee high u-9");

    auto snapshot = store_->Snapshot();
    ASSERT_EQ(snapshot["story_updates"].size(), 1u);
    EXPECT_EQ(snapshot["story_updates"][0]["old_value"], "ready");
    EXPECT_EQ(snapshot["story_updates"][0]["source_reference"], "m-1");
    ASSERT_EQ(snapshot["risks"].size(), 1u);
    EXPECT_EQ(snapshot["risks"][0]["project_id"], "P");
}

// ============================================================================
// Isolation
// ============================================================================

TEST_F(ExecutionEngineTest, ForbiddenPrimitivesAreUnreachable) {
    auto result = Run(
        "log(typeof require, typeof setTimeout, typeof setInterval, typeof process, "
        "typeof fetch, typeof std, typeof os, typeof XMLHttpRequest)");

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "undefined undefined undefined undefined undefined undefined undefined undefined");
}

TEST_F(ExecutionEngineTest, CallingRequireFails) {
    auto result = Run("const fs = require('fs'); log('loaded')");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "");
    EXPECT_TRUE(Contains(result.error.value_or(""), "require")) << result.error.value_or("");
}

TEST_F(ExecutionEngineTest, DynamicImportIsRejected) {
    auto result = Run(R"(
        try {
            await import('fs');
            log('loaded');
        } catch (e) {
            log('blocked');
        }
    )");

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "blocked");
}

TEST_F(ExecutionEngineTest, ProjectScopeCannotBeEscaped) {
    auto result = Run(R"(
        projectId = 'P';
        stories.findAll = async () => [1, 2, 3, 4, 5];
        const mine = await stories.findAll('P');
        const other = await stories.findByKey('PROJ-1');
        let updateError = '';
        try { await stories.update('s-1', { status: 'done' }); } catch (e) { updateError = e.message; }
        log(projectId, mine.map(s => s.story_key).join(','), other, updateError);
    )", Context("Q"));

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "Q Q-1,Q-2 null Story not found: s-1");
    EXPECT_EQ(StoryById(*store_, "s-1")["status"], "in_progress");
}

TEST_F(ExecutionEngineTest, SequentialInvocationsShareNothing) {
    auto first = Run("globalThis.cache = 'secret'; log('set')");
    auto second = Run("log(typeof cache)");

    EXPECT_EQ(first.output, "set");
    EXPECT_EQ(second.output, "undefined");
}

TEST_F(ExecutionEngineTest, ConcurrentInvocationsStayIndependent) {
    auto p = engine_->ExecuteAsync("const s = await stories.findAll(); log(projectId, s.length)", Context("P"));
    auto q = engine_->ExecuteAsync("const s = await stories.findAll(); log(projectId, s.length)", Context("Q"));

    auto p_result = p.get();
    auto q_result = q.get();

    EXPECT_EQ(p_result.output, "P 4");
    EXPECT_EQ(q_result.output, "Q 2");
}

TEST_F(ExecutionEngineTest, AsyncCallbackReceivesResult) {
    std::promise<std::string> seen;
    auto future = engine_->ExecuteAsync("log('via callback')", Context("P"),
                                        [&seen](const ExecutionResult& result) { seen.set_value(result.output); });

    EXPECT_EQ(future.get().output, "via callback");
    EXPECT_EQ(seen.get_future().get(), "via callback");
}

// ============================================================================
// Request envelope
// ============================================================================

TEST_F(ExecutionEngineTest, RequestEnvelopeRuns) {
    auto result = engine_->HandleRequest(json{{"code", "log(projectId, userId)"}, {"projectId", "Q"},
                                              {"userId", "u-1"}});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "Q u-1");
}

TEST_F(ExecutionEngineTest, RequestWithoutProjectIsRejected) {
    auto result = engine_->HandleRequest(json{{"code", "log(1)"}});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Missing required fields: code, projectId");
    EXPECT_EQ(ResultTranslator::ToJson(result)["error"], "Missing required fields: code, projectId");
}

TEST_F(ExecutionEngineTest, StatsTrackOutcomes) {
    Run("log(1)");
    Run("throw new Error('x')");

    auto stats = engine_->GetStats();
    EXPECT_EQ(stats.invocations, 2u);
    EXPECT_EQ(stats.succeeded, 1u);
    EXPECT_EQ(stats.failed, 1u);
}

// ============================================================================
// Limits
// ============================================================================

TEST(ExecutionEngineLimitsTest, BusyLoopHitsScriptTimeout) {
    auto config = EngineBuilder()
                      .WithScriptTimeout(500ms)
                      .WithOverallTimeout(3000ms)
                      .WithPoolSize(1)
                      .Build();
    ExecutionEngine engine(MakeStore(), config);

    auto result = engine.Execute("log('spinning'); while (true) {}", Context("P"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.error.value_or(""), "Execution timeout after 500ms");
    EXPECT_EQ(result.output, "spinning");
    EXPECT_GE(result.execution_time_ms, 500);
    EXPECT_LT(result.execution_time_ms, 2500);

    // The isolate stays usable
    auto next = engine.Execute("log('after')", Context("P"));
    EXPECT_TRUE(next.success) << next.error.value_or("");
    EXPECT_EQ(next.output, "after");
}

TEST(ExecutionEngineLimitsTest, TryCatchCannotSwallowTimeout) {
    auto config = EngineBuilder().WithScriptTimeout(300ms).WithOverallTimeout(2000ms).Build();
    ExecutionEngine engine(MakeStore(), config);

    auto result = engine.Execute("while (true) { try { while (true) {} } catch (e) { log('caught') } }",
                                 Context("P"));

    EXPECT_EQ(result.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.output, "");
}

TEST(ExecutionEngineLimitsTest, SlowCapabilityHitsOverallTimeout) {
    auto store = std::make_shared<SlowStore>(SampleFixtures(), 2500ms);
    auto config = EngineBuilder().WithScriptTimeout(500ms).WithOverallTimeout(1000ms).Build();
    ExecutionEngine engine(store, config);

    auto result = engine.Execute("log('asking'); await stories.findActive(); log('never')", Context("P"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Execution timeout after 1000ms");
    EXPECT_EQ(result.output, "asking");
    EXPECT_GE(result.execution_time_ms, 1000);
    EXPECT_LT(result.execution_time_ms, 2000);
}

TEST(ExecutionEngineLimitsTest, NeverSettlingProgramTimesOut) {
    auto config = EngineBuilder().WithScriptTimeout(200ms).WithOverallTimeout(600ms).Build();
    ExecutionEngine engine(MakeStore(), config);

    auto result = engine.Execute("await new Promise(() => {}); log('never')", Context("P"));

    EXPECT_EQ(result.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(result.error.value_or(""), "Execution timeout after 600ms");
}

TEST(ExecutionEngineLimitsTest, ParallelCallsOverlap) {
    auto store = std::make_shared<SlowStore>(SampleFixtures(), 300ms);
    ExecutionEngine engine(store, FastConfig());

    auto result = engine.Execute(
        "const [active, all] = await Promise.all([stories.findActive(), stories.findAll()]);"
        "log(active.length, all.length)",
        Context("P"));

    EXPECT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "3 4");
    EXPECT_EQ(store->Lookups(), 2);
    EXPECT_LT(result.execution_time_ms, 580);
}

TEST(ExecutionEngineLimitsTest, MemoryLimitIsEnforced) {
    auto config = EngineBuilder().WithMemoryLimit(16).WithPoolSize(1).Build();
    ExecutionEngine engine(MakeStore(), config);

    auto result = engine.Execute(
        "const chunks = []; log('allocating');"
        "while (true) { chunks.push('x'.repeat(1 << 20) + chunks.length); }",
        Context("P"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::RESOURCE_LIMIT);
    EXPECT_EQ(result.error.value_or(""), "Execution exceeded memory limit of 16 MB");
    EXPECT_EQ(result.output, "allocating");
    EXPECT_EQ(engine.GetStats().pool.discarded, 1u);

    auto next = engine.Execute("log('fresh isolate')", Context("P"));
    EXPECT_TRUE(next.success) << next.error.value_or("");
}

TEST(ExecutionEngineLimitsTest, OutputIsCapped) {
    auto config = EngineBuilder().WithMaxOutputBytes(32).Build();
    ExecutionEngine engine(MakeStore(), config);

    auto result = engine.Execute("for (let i = 0; i < 100; i++) log('line ' + i)", Context("P"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "line 0\nline 1\nline 2\nline 3\n[output truncated]");
}

TEST(ExecutionEngineLimitsTest, OversizedProgramIsRejected) {
    auto config = EngineBuilder().WithMaxProgramBytes(64).Build();
    ExecutionEngine engine(MakeStore(), config);

    auto result = engine.Execute("log('" + std::string(100, 'a') + "')", Context("P"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::COMPILE);
    EXPECT_TRUE(Contains(result.error.value_or(""), "too large"));
}

TEST(ExecutionEngineLimitsTest, WaitingForIsolateCountsTowardExecutionTime) {
    auto store = std::make_shared<SlowStore>(SampleFixtures(), 1500ms);
    auto config = EngineBuilder()
                      .WithScriptTimeout(400ms)
                      .WithOverallTimeout(800ms)
                      .WithPoolSize(1)
                      .Build();
    ExecutionEngine engine(store, config);

    auto holder = engine.ExecuteAsync("await stories.findAll()", Context("P"));
    std::this_thread::sleep_for(300ms);
    auto waiter = engine.Execute("log('queued')", Context("P"));

    EXPECT_EQ(holder.get().error_kind, ErrorKind::TIMEOUT);
    EXPECT_TRUE(waiter.success) << waiter.error.value_or("");
    EXPECT_EQ(waiter.output, "queued");
    EXPECT_GE(waiter.execution_time_ms, 400);
    EXPECT_EQ(engine.GetStats().pool.created, 1u);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(ExecutionEngineCancellationTest, QueuedCallsAreSkippedInFlightCallsFinish) {
    auto store = std::make_shared<SlowStore>(SampleFixtures(), 0ms, 1500ms);
    auto config = EngineBuilder()
                      .WithScriptTimeout(500ms)
                      .WithOverallTimeout(1000ms)
                      .WithDispatcherThreads(1)
                      .Build();
    {
        ExecutionEngine engine(store, config);

        auto result = engine.Execute(R"(
            stories.update('s-1', { status: 'review' });
            stories.update('s-2', { status: 'review' });
            await new Promise(() => {});
        )", Context("P"));

        EXPECT_EQ(result.error_kind, ErrorKind::TIMEOUT);

        // Let the in-flight update finish and the queued one be picked up
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (engine.GetStats().dispatcher_queue_depth > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(20ms);
        }
        std::this_thread::sleep_for(100ms);
    }

    EXPECT_EQ(store->UpdatesStarted(), 1);
    EXPECT_EQ(store->UpdatesFinished(), 1);
    EXPECT_EQ(StoryById(*store, "s-1")["status"], "review");
    EXPECT_EQ(StoryById(*store, "s-2")["status"], "ready");
}

TEST(ExecutionEngineCancellationTest, UnawaitedCallsRunAfterSuccess) {
    auto store = std::make_shared<SlowStore>(SampleFixtures(), 0ms, 200ms);
    auto config = EngineBuilder().WithDispatcherThreads(1).Build();
    {
        ExecutionEngine engine(store, config);

        auto result = engine.Execute(R"(
            stories.update('s-1', { status: 'review' });
            stories.update('s-2', { status: 'review' });
            log('done');
        )", Context("P"));

        EXPECT_TRUE(result.success) << result.error.value_or("");
        EXPECT_EQ(result.output, "done");

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (store->UpdatesFinished() < 2 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(20ms);
        }
    }

    EXPECT_EQ(store->UpdatesFinished(), 2);
    EXPECT_EQ(StoryById(*store, "s-1")["status"], "review");
    EXPECT_EQ(StoryById(*store, "s-2")["status"], "review");
}

TEST(ExecutionEngineCancellationTest, HungCallsDoNotStarveLaterInvocations) {
    auto store = std::make_shared<SlowStore>(SampleFixtures(), 0ms, 3000ms);
    auto config = EngineBuilder()
                      .WithScriptTimeout(300ms)
                      .WithOverallTimeout(600ms)
                      .WithDispatcherThreads(2)
                      .Build();
    ExecutionEngine engine(store, config);

    auto stuck = engine.Execute(R"(
        await Promise.all([stories.update('s-1', { status: 'review' }),
                           stories.update('s-2', { status: 'review' })]);
    )", Context("P"));
    ASSERT_EQ(stuck.error_kind, ErrorKind::TIMEOUT);
    EXPECT_EQ(store->UpdatesStarted(), 2);
    EXPECT_EQ(engine.GetStats().dispatcher_workers, 2u);
    EXPECT_EQ(engine.GetStats().dispatcher_threads, 4u);

    auto next = engine.Execute("const s = await stories.findAll(); log(s.length)", Context("Q"));

    EXPECT_TRUE(next.success) << next.error.value_or("");
    EXPECT_EQ(next.output, "2");
}
