#include <gtest/gtest.h>
#include "temp_tree.h"
#include "core/build_log.h"
#include <fstream>

using namespace monthclose::core;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        lines.push_back(line);
    }
    return lines;
}

BuildRecord make_record(const std::string& step) {
    BuildRecord rec;
    rec.timestamp = std::chrono::system_clock::now();
    rec.period = "2024-10";
    rec.step = step;
    rec.status = "succeeded";
    rec.exit_code = 0;
    rec.elapsed_seconds = 12.345;
    return rec;
}

} // anonymous namespace

TEST(BuildLogTest, DefaultPath) {
    EXPECT_EQ(BuildLog::default_path("/data"), std::filesystem::path("/data/_meta/_build_log.csv"));
}

TEST(BuildLogTest, Format) {
    auto line = BuildLog::format(make_record("step4_inventory"));
    // 2024-10-05T14:03:22,2024-10,step4_inventory,succeeded,0,12.35
    ASSERT_GT(line.size(), 20u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], 'T');
    EXPECT_NE(line.find(",2024-10,step4_inventory,succeeded,0,12.35"), std::string::npos);
}

TEST(BuildLogTest, FormatQuotesSpecialCharacters) {
    auto rec = make_record("odd,\"step\"");
    auto line = BuildLog::format(rec);
    EXPECT_NE(line.find(",\"odd,\"\"step\"\"\","), std::string::npos);
}

class BuildLogFileTest : public TempTreeTest {};

TEST_F(BuildLogFileTest, AppendWritesHeaderOnce) {
    BuildLog log(BuildLog::default_path(root_));
    ASSERT_TRUE(log.append(make_record("step1_nfi")));
    ASSERT_TRUE(log.append(make_record("step2_nfi_agg")));

    auto lines = read_lines(log.path());
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], BuildLog::kHeader);
    EXPECT_NE(lines[1].find("step1_nfi"), std::string::npos);
    EXPECT_NE(lines[2].find("step2_nfi_agg"), std::string::npos);
}

TEST_F(BuildLogFileTest, UnwritableLocation) {
    touch("blocker", 0);
    BuildLog log(root_ / "blocker" / "_build_log.csv");
    EXPECT_FALSE(log.append(make_record("step1_nfi")));
}
