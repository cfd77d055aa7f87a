#include <gtest/gtest.h>
#include "temp_tree.h"
#include "core/staleness.h"
#include "core/step_registry.h"

using namespace monthclose::core;

class StalenessTest : public TempTreeTest {
protected:
    StalenessVerdict evaluate(const std::string& key, int year = 2024, int month = 10) {
        PathResolver resolver(root_, PeriodContext(year, month));
        return evaluator.evaluate(registry.at(key), resolver);
    }

    StepRegistry registry = StepRegistry::builtin();
    StalenessEvaluator evaluator;

    const std::string acct = "nfs/Mauricio/Contabilidade/2024_10/";
    const std::string data = "KBB MF/AAA/Balancetes/Fechamentos/data/";
};

TEST_F(StalenessTest, NoOutputsIsStale) {
    touch("nfs/2024/Serie 1/10-Outubro/nf1.xml", 0);

    auto v = evaluate("step1_nfi");
    EXPECT_TRUE(v.is_stale());
    EXPECT_EQ(v.reason, "no outputs found");
    ASSERT_EQ(v.inputs.size(), 1);
    EXPECT_TRUE(v.outputs.empty());
}

TEST_F(StalenessTest, OutputNewerThanInputsIsFresh) {
    touch("nfs/2024/Serie 1/10-Outubro/nf1.xml", 0);
    touch("nfs/2024/Serie 2/10-Outubro/nf2.xml", 2);
    touch(acct + "NFI_2024_10_Serie 1.xlsx", 5);

    auto v = evaluate("step1_nfi");
    EXPECT_TRUE(v.is_fresh());
    ASSERT_TRUE(v.newest_input.has_value());
    EXPECT_EQ(v.newest_input->filename(), "nf2.xml");
    EXPECT_EQ(*v.newest_input_time, at(2));
    EXPECT_EQ(*v.oldest_output_time, at(5));
}

TEST_F(StalenessTest, NewerInputMakesStepStale) {
    touch(acct + "Combined_NFs_2024_10.xlsx", 11);
    touch(acct + "NFI_2024_10_todos.xlsx", 3);
    touch(data + "clean/2024_09/R_Estoq_fdm_2024_09.xlsx", 1);
    touch(data + "Tables/T_Entradas.xlsx", 10);

    auto v = evaluate("step3_update_entradas");
    EXPECT_TRUE(v.is_stale());
    ASSERT_TRUE(v.newest_input.has_value());
    EXPECT_EQ(v.newest_input->filename(), "Combined_NFs_2024_10.xlsx");
    EXPECT_EQ(v.oldest_output->filename(), "T_Entradas.xlsx");
    EXPECT_NE(v.reason.find("is newer than output"), std::string::npos);
}

TEST_F(StalenessTest, EqualTimestampsAreFresh) {
    touch(acct + "NFI_2024_10_Serie 1.xlsx", 4);
    touch(acct + "NFI_2024_10_todos.xlsx", 4);

    EXPECT_TRUE(evaluate("step2_nfi_agg").is_fresh());
}

TEST_F(StalenessTest, OldestOutputDecides) {
    touch("nfs/2024/Serie 1/10-Outubro/nf1.xml", 5);
    touch(acct + "NFI_2024_10_Serie 1.xlsx", 9);
    touch(acct + "NFI_2024_10_Serie 2.xlsx", 3);

    auto v = evaluate("step1_nfi");
    EXPECT_TRUE(v.is_stale());
    EXPECT_EQ(v.oldest_output->filename(), "NFI_2024_10_Serie 2.xlsx");
    EXPECT_EQ(v.outputs.size(), 2);
}

TEST_F(StalenessTest, OneMissingOutputMakesStepStale) {
    StepDefinition step;
    step.key = "split";
    step.command = {"split"};
    step.inputs = {"in.txt"};
    step.outputs = {"a.txt", "b.txt"};
    touch("in.txt", 1);
    touch("a.txt", 5);

    PathResolver resolver(root_, PeriodContext(2024, 10));
    auto v = evaluator.evaluate(step, resolver);
    EXPECT_TRUE(v.is_stale());
    EXPECT_EQ(v.reason, "output " + (root_ / "b.txt").string() + " not found");
    EXPECT_EQ(v.outputs.size(), 1);

    touch("b.txt", 6);
    EXPECT_TRUE(evaluator.evaluate(step, resolver).is_fresh());
}

TEST_F(StalenessTest, NoInputsIsMissing) {
    touch(acct + "NFI_2024_10_todos.xlsx", 4);

    auto v = evaluate("step2_nfi_agg");
    EXPECT_TRUE(v.is_missing_inputs());
    EXPECT_TRUE(v.inputs.empty());
}

TEST_F(StalenessTest, OtherPeriodsAreIgnored) {
    touch("nfs/2024/Serie 1/09-Setembro/old.xml", 0);
    EXPECT_TRUE(evaluate("step1_nfi").is_missing_inputs());
}

TEST_F(StalenessTest, PreviousPeriodInput) {
    // January reads the previous December's inventory
    touch("nfs/Mauricio/Contabilidade/2025_01/NFI_2025_01_todos.xlsx", 1);
    touch(data + "clean/2024_12/R_Estoq_fdm_2024_12.xlsx", 6);
    touch(data + "Tables/T_Entradas.xlsx", 4);

    auto v = evaluate("step3_update_entradas", 2025, 1);
    EXPECT_TRUE(v.is_stale());
    EXPECT_EQ(v.newest_input->filename(), "R_Estoq_fdm_2024_12.xlsx");
}

TEST_F(StalenessTest, ToJson) {
    touch("nfs/2024/Serie 1/10-Outubro/nf1.xml", 0);
    touch(acct + "NFI_2024_10_Serie 1.xlsx", 1);

    auto j = evaluate("step1_nfi").to_json();
    EXPECT_EQ(j["step"], "step1_nfi");
    EXPECT_EQ(j["verdict"], "fresh");
    EXPECT_TRUE(j.contains("newest_input_time"));
    EXPECT_EQ(j["inputs"].size(), 1);
}
