#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "staticss/driver/run_log.hpp"
#include "staticss/lowering/lower.hpp"
#include "staticss/lowering/styled_decl.hpp"

namespace staticss::driver {
namespace {

class RunLogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sink_ = std::tmpfile();
    ASSERT_NE(sink_, nullptr);
  }

  void TearDown() override {
    if (sink_ != nullptr) {
      std::fclose(sink_);
    }
  }

  auto Output() -> std::string {
    std::rewind(sink_);
    std::string out;
    for (int c = std::fgetc(sink_); c != EOF; c = std::fgetc(sink_)) {
      out += static_cast<char>(c);
    }
    return out;
  }

  static auto TwoComponentsOneBailed() -> lowering::FileResult {
    lowering::FileResult result;
    result.components.resize(2);
    result.components[1].bailed = true;
    return result;
  }

  FILE* sink_ = nullptr;
};

TEST_F(RunLogTest, VerboseReportsEachFile) {
  RunLog run_log(1, sink_);
  run_log.BeginFile("a.tsx");
  run_log.RecordPhase("scan", 1.0);
  run_log.RecordPhase("lower", 2.5);
  run_log.EndFile(TwoComponentsOneBailed());

  EXPECT_EQ(
      Output(),
      "[staticss] a.tsx: 2 component(s), 1 bailed, 0 warning(s) "
      "scan=1.0ms lower=2.5ms\n");
}

TEST_F(RunLogTest, QuietByDefault) {
  RunLog run_log(0, sink_);
  run_log.BeginFile("a.tsx");
  run_log.RecordPhase("scan", 1.0);
  run_log.EndFile(TwoComponentsOneBailed());

  EXPECT_EQ(Output(), "");
}

TEST_F(RunLogTest, StatsTotalAcrossFiles) {
  RunLog run_log(0, sink_);
  for (const char* path : {"a.tsx", "b.tsx"}) {
    run_log.BeginFile(path);
    run_log.RecordPhase("scan", 500.0);
    run_log.RecordPhase("lower", 250.0);
    run_log.EndFile(TwoComponentsOneBailed());
  }
  run_log.PrintStats(sink_);

  EXPECT_EQ(
      Output(),
      "[staticss][stats] files=2 components=4 bailed=2 scan=1.00s "
      "lower=0.50s\n");
}

}  // namespace
}  // namespace staticss::driver
