#include <sqlgen/cmd_sql.hpp>

#include <arrow/status.h>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <folly/testing/TestUtil.h>
#include <folly/portability/GTest.h>
#include <folly/portability/GMock.h>
#include <glog/logging.h>

#include <filesystem>
#include <string>
#include <vector>

using namespace testing;

class CmdSqlTest : public Test {
 protected:
  std::string writeInput(const std::string &name, const std::string &text) {
    std::string path = (tmp_.path() / name).string();
    CHECK(folly::writeFile(text, path.c_str()));
    return path;
  }

  std::string readOutput() {
    std::string text;
    CHECK(folly::readFile(outputPath().c_str(), text));
    return text;
  }

  std::string outputPath() const {
    return (tmp_.path() / "out.sql").string();
  }

  CmdSqlOptions options(const std::string &input, int64_t batch = 1000) {
    CmdSqlOptions opts;
    opts.input_path = input;
    opts.output_path = outputPath();
    opts.batch_size = batch;
    return opts;
  }

  folly::test::TemporaryDirectory tmp_{"nem12sql"};
};

static const char* kSample =
  "100,NEM12,200506081149,UNITEDDP,NEMMCO\n"
  "200,NEM1201009,E1E2,1,E1,N1,01009,kWh,30,20050610\n"
  "300,20050301,0,0,0,0.461,0.810,0.568\n"
  "200,NEM1201010,E1E2,2,E2,,01009,kWh,30,20050610\n"
  "300,20050301,0.154,0.460\n"
  "900\n";

TEST_F(CmdSqlTest, ConvertsFile) {
  auto cmd = CmdSql::Make();
  ASSERT_TRUE(cmd->Init(options(writeInput("sample.csv", kSample), 3)).ok());
  ASSERT_TRUE(cmd->Run().ok());
  ASSERT_TRUE(cmd->Finish().ok());

  EXPECT_EQ(cmd->NumReadings(), 8u);
  EXPECT_EQ(cmd->NumStatements(), 3u);
  EXPECT_EQ(cmd->NumSkippedValues(), 0u);

  std::string sql = readOutput();
  std::vector<folly::StringPiece> lines;
  folly::split('\n', sql, lines);

  ASSERT_GE(lines.size(), 4u);
  EXPECT_EQ(lines[0].str(), "-- Generated from: sample.csv");
  EXPECT_THAT(lines[1].str(), StartsWith("-- Generated at: "));
  EXPECT_EQ(lines[2].str(), "-- Batch size: 3");
  EXPECT_EQ(lines[3].str(), "");

  EXPECT_THAT(sql, HasSubstr(
      "INSERT INTO meter_readings (\"nmi\", \"timestamp\", \"consumption\") VALUES\n"
      "('NEM1201009', '2005-03-01 00:30:00', 0),\n"
      "('NEM1201009', '2005-03-01 01:00:00', 0),\n"
      "('NEM1201009', '2005-03-01 01:30:00', 0);\n\n"));
  EXPECT_THAT(sql, HasSubstr(
      "('NEM1201010', '2005-03-01 00:30:00', 0.154),\n"
      "('NEM1201010', '2005-03-01 01:00:00', 0.460);\n\n"));
  EXPECT_THAT(sql, EndsWith("-- Total readings: 8\n"));
}

TEST_F(CmdSqlTest, EmptyDataWritesFramingOnly) {
  auto cmd = CmdSql::Make();
  ASSERT_TRUE(cmd->Init(options(writeInput("empty.csv", "100,NEM12\n900\n"))).ok());
  ASSERT_TRUE(cmd->Run().ok());
  ASSERT_TRUE(cmd->Finish().ok());

  std::string sql = readOutput();
  EXPECT_THAT(sql, Not(HasSubstr("INSERT")));
  EXPECT_THAT(sql, EndsWith("-- Batch size: 1000\n\n-- Total readings: 0\n"));
}

TEST_F(CmdSqlTest, MissingInput) {
  auto cmd = CmdSql::Make();
  arrow::Status st = cmd->Init(options((tmp_.path() / "nope.csv").string()));
  EXPECT_TRUE(st.IsIOError());
  EXPECT_THAT(st.message(), HasSubstr("Input file not found"));
}

TEST_F(CmdSqlTest, UnreadableInputPath) {
  std::string loop = (tmp_.path() / "loop.csv").string();
  std::filesystem::create_symlink(loop, loop);

  auto cmd = CmdSql::Make();
  arrow::Status st = cmd->Init(options(loop));
  EXPECT_TRUE(st.IsIOError());
  EXPECT_THAT(st.message(), HasSubstr("Cannot access"));
  EXPECT_THAT(st.message(), Not(HasSubstr("not found")));
}

TEST_F(CmdSqlTest, InputIsDirectory) {
  auto cmd = CmdSql::Make();
  arrow::Status st = cmd->Init(options(tmp_.path().string()));
  EXPECT_TRUE(st.IsIOError());
  EXPECT_THAT(st.message(), HasSubstr("Not a file"));
}

TEST_F(CmdSqlTest, BadBatchSize) {
  auto cmd = CmdSql::Make();
  arrow::Status st = cmd->Init(options(writeInput("sample.csv", kSample), 0));
  EXPECT_TRUE(st.IsInvalid());
  EXPECT_THAT(st.message(), HasSubstr("batch size"));
}

TEST_F(CmdSqlTest, MalformedInput) {
  auto cmd = CmdSql::Make();
  ASSERT_TRUE(cmd->Init(options(writeInput("broken.csv",
      "100,NEM12,200506081149,UNITEDDP,NEMMCO\n"
      "300,20050301,1,2\n"
      "900\n"))).ok());

  arrow::Status st = cmd->Run();
  EXPECT_TRUE(st.IsInvalid());
  EXPECT_EQ(st.message(),
            "broken.csv:2: 300 record found without preceding 200 record");
  EXPECT_TRUE(cmd->Finish(true).ok());
  EXPECT_THAT(readOutput(), Not(HasSubstr("Total readings")));
}

TEST_F(CmdSqlTest, InvalidValuesAreSkipped) {
  auto cmd = CmdSql::Make();
  ASSERT_TRUE(cmd->Init(options(writeInput("values.csv",
      "200,NMI1,,,,,,kWh,30\n"
      "300,20050301,1,x,3\n"
      "900\n"))).ok());
  ASSERT_TRUE(cmd->Run().ok());
  ASSERT_TRUE(cmd->Finish().ok());

  EXPECT_EQ(cmd->NumReadings(), 2u);
  EXPECT_EQ(cmd->NumSkippedValues(), 1u);
  EXPECT_THAT(readOutput(), HasSubstr("('NMI1', '2005-03-01 01:30:00', 3);"));
}

TEST_F(CmdSqlTest, Limit) {
  auto cmd = CmdSql::Make();
  ASSERT_TRUE(cmd->Init(options(writeInput("sample.csv", kSample), 2)).ok());
  ASSERT_TRUE(cmd->Run(1).ok());
  ASSERT_TRUE(cmd->Finish().ok());

  EXPECT_EQ(cmd->NumStatements(), 1u);
  EXPECT_THAT(readOutput(), EndsWith("-- Total readings: 2\n"));
}

TEST_F(CmdSqlTest, IncompleteFinishOmitsFooter) {
  auto cmd = CmdSql::Make();
  ASSERT_TRUE(cmd->Init(options(writeInput("sample.csv", kSample), 2)).ok());
  ASSERT_TRUE(cmd->Run(1).ok());
  ASSERT_TRUE(cmd->Finish(true).ok());

  std::string output = readOutput();
  EXPECT_THAT(output, HasSubstr("INSERT INTO meter_readings"));
  EXPECT_THAT(output, Not(HasSubstr("-- Total readings")));
}
