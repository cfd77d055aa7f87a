#include <gtest/gtest.h>
#include "core/run_plan.h"
#include "core/types.h"

using namespace monthclose::core;

TEST(TypesTest, StepStateToString) {
    EXPECT_EQ(step_state_to_string(StepState::Pending), "pending");
    EXPECT_EQ(step_state_to_string(StepState::SkippedFresh), "skipped_fresh");
    EXPECT_EQ(step_state_to_string(StepState::SkippedOutOfScope), "skipped_out_of_scope");
    EXPECT_EQ(step_state_to_string(StepState::AwaitingManualConfirmation),
              "awaiting_manual_confirmation");
}

TEST(TypesTest, VerdictToString) {
    EXPECT_EQ(verdict_to_string(Verdict::Stale), "stale");
    EXPECT_EQ(verdict_to_string(Verdict::Fresh), "fresh");
    EXPECT_EQ(verdict_to_string(Verdict::MissingInputs), "missing_inputs");
}

TEST(TypesTest, RunIntentFactories) {
    auto full = RunIntent::full();
    EXPECT_EQ(full.mode, RunMode::Full);
    EXPECT_FALSE(full.force);

    auto single = RunIntent::single("step4_inventory", true);
    EXPECT_EQ(single.mode, RunMode::SingleStep);
    EXPECT_EQ(single.step_key, "step4_inventory");
    EXPECT_TRUE(single.force);

    auto j = RunIntent::start_from("step3_update_entradas").to_json();
    EXPECT_EQ(j["mode"], "start_from");
    EXPECT_EQ(j["step"], "step3_update_entradas");
    EXPECT_EQ(j["dry_run"], false);
}

TEST(TypesTest, ExitCodes) {
    EXPECT_EQ(exit_code_for(HaltReason::None), 0);
    EXPECT_EQ(exit_code_for(HaltReason::StepFailed), 1);
    EXPECT_EQ(exit_code_for(HaltReason::ManualPause), 3);
    EXPECT_EQ(exit_code_for(HaltReason::MissingInputs), 4);
    EXPECT_EQ(kExitConfigError, 2);
}

TEST(TypesTest, RunReportCounts) {
    RunReport report(PeriodContext(2024, 10), RunIntent::full(), "/data");

    StepReport a;
    a.key = "a";
    a.state = StepState::Succeeded;
    a.exit_code = 0;
    StepReport b;
    b.key = "b";
    b.state = StepState::SkippedFresh;
    StepReport c;
    c.key = "c";
    c.state = StepState::Failed;
    c.exit_code = 2;
    report.steps = {a, b, c};
    report.halt_reason = HaltReason::StepFailed;
    report.halted_at = "c";

    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.exit_code(), kExitStepFailed);
    EXPECT_EQ(report.executed_count(), 2);
    EXPECT_EQ(report.skipped_count(), 1);
    ASSERT_NE(report.find("b"), nullptr);
    EXPECT_EQ(report.find("missing"), nullptr);

    auto j = report.to_json();
    EXPECT_EQ(j["halt_reason"], "step_failed");
    EXPECT_EQ(j["halted_at"], "c");
    EXPECT_EQ(j["summary"]["failed"], 1);
    EXPECT_EQ(j["exit_code"], 1);
    EXPECT_EQ(j["steps"][2]["exit_code"], 2);
}

TEST(TypesTest, StepDefinitionFromJson) {
    nlohmann::json j = {
        {"key", "recalc"},
        {"manual", true},
        {"inputs", {"a/*.xlsx"}},
        {"outputs", {"b.xlsx"}},
        {"instruction", "Open {root}/b.xlsx"},
        {"depends_on", {"build"}}
    };

    auto step = StepDefinition::from_json(j);
    EXPECT_EQ(step.key, "recalc");
    EXPECT_TRUE(step.is_manual());
    EXPECT_TRUE(step.command.empty());
    EXPECT_FALSE(step.optional);
    ASSERT_EQ(step.depends_on.size(), 1);
    EXPECT_EQ(step.depends_on[0], "build");
}
