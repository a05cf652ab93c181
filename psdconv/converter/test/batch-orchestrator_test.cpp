#include "psdconv/batch-orchestrator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

#include "psdconv/converter-config.hpp"
#include "psdconv/fake-rasterizer.hpp"
#include "psdconv/temp-dir.hpp"
#include "psdconv/vector.hpp"

namespace psdconv {

namespace {

class BatchOrchestratorTest : public ::testing::Test {
 protected:
  BatchOrchestratorTest()
      : config(ConverterConfig{}
                   .withUploadDir(tmpDir.makeSubDir("uploads"))
                   .withConvertedDir(tmpDir.makeSubDir("converted"))
                   .withConversionTimeout(std::chrono::seconds{7})) {}

  [[nodiscard]] std::size_t nbFilesIn(const std::filesystem::path& dir) const {
    return static_cast<std::size_t>(
        std::distance(std::filesystem::directory_iterator(dir), std::filesystem::directory_iterator()));
  }

  test::ScopedTempDir tmpDir;
  ConverterConfig config;
  test::FakeRasterizer rasterizer;
};

std::vector<std::string> ToStd(const vector<std::string>& names) { return {names.begin(), names.end()}; }

}  // namespace

TEST_F(BatchOrchestratorTest, ConvertsInSubmissionOrder) {
  const BatchOrchestrator orchestrator(config, rasterizer);
  const std::vector<UploadedFile> files{{"b.psd", "bbb"}, {"a.psd", "aaa"}, {"c.PSD", "ccc"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_EQ(ToStd(outcome.converted), (std::vector<std::string>{"b.png", "a.png", "c.png"}));
  EXPECT_TRUE(outcome.failed.empty());

  // Uploads are removed, outputs are left for the packager.
  EXPECT_EQ(nbFilesIn(config.uploadDir), 0U);
  EXPECT_EQ(test::ReadFile(config.convertedDir / "b.png"), test::FakeRasterizer::OutputContentFor("bbb"));
  EXPECT_EQ(test::ReadFile(config.convertedDir / "c.png"), test::FakeRasterizer::OutputContentFor("ccc"));

  const auto calls = rasterizer.calls();
  ASSERT_EQ(calls.size(), 3U);
  EXPECT_EQ(calls[0].input, config.uploadDir / "b.psd");
  EXPECT_EQ(calls[0].output, config.convertedDir / "b.png");
  EXPECT_EQ(calls[0].inputContent, "bbb");
  EXPECT_EQ(calls[0].timeout, std::chrono::seconds{7});
}

TEST_F(BatchOrchestratorTest, SanitizesNames) {
  const BatchOrchestrator orchestrator(config, rasterizer);
  const std::vector<UploadedFile> files{{"../../evil name.psd", "x"}, {"макет.psd", "y"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_EQ(ToStd(outcome.converted), (std::vector<std::string>{"_.__._evil_name.png", "макет.png"}));
  EXPECT_TRUE(std::filesystem::exists(config.convertedDir / "_.__._evil_name.png"));
  EXPECT_EQ(rasterizer.calls()[0].input, config.uploadDir / "_.__._evil_name.psd");
}

TEST_F(BatchOrchestratorTest, SkipsUnnamedAndDisallowedFiles) {
  const BatchOrchestrator orchestrator(config, rasterizer);
  const std::vector<UploadedFile> files{{"", "x"}, {"notes.txt", "y"}, {"ok.psd", "z"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_EQ(ToStd(outcome.converted), std::vector<std::string>{"ok.png"});
  EXPECT_TRUE(outcome.failed.empty());
  EXPECT_EQ(rasterizer.nbCalls(), 1U);
}

TEST_F(BatchOrchestratorTest, PartialFailure) {
  rasterizer.setBehaviorFor("broken", test::FakeRasterizer::Behavior::Fail);
  rasterizer.setBehaviorFor("slow", test::FakeRasterizer::Behavior::Timeout);
  const BatchOrchestrator orchestrator(config, rasterizer);
  const std::vector<UploadedFile> files{{"good.psd", "1"}, {"broken file.psd", "2"}, {"slow.psd", "3"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_EQ(ToStd(outcome.converted), std::vector<std::string>{"good.png"});
  EXPECT_EQ(ToStd(outcome.failed), (std::vector<std::string>{"broken_file.psd", "slow.psd"}));

  // Partial output of the timed out conversion is removed.
  EXPECT_FALSE(std::filesystem::exists(config.convertedDir / "slow.png"));
  EXPECT_EQ(nbFilesIn(config.convertedDir), 1U);
  EXPECT_EQ(nbFilesIn(config.uploadDir), 0U);
}

TEST_F(BatchOrchestratorTest, FailedSameNamedFileKeepsEarlierOutput) {
  rasterizer.setBehaviorFor("corrupt", test::FakeRasterizer::Behavior::Fail);
  const BatchOrchestrator orchestrator(config, rasterizer);
  const std::vector<UploadedFile> files{{"a.psd", "first"}, {"a.psd", "corrupt"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_EQ(ToStd(outcome.converted), std::vector<std::string>{"a.png"});
  EXPECT_EQ(ToStd(outcome.failed), std::vector<std::string>{"a.psd"});

  ASSERT_TRUE(std::filesystem::exists(config.convertedDir / "a.png"));
  EXPECT_EQ(test::ReadFile(config.convertedDir / "a.png"), test::FakeRasterizer::OutputContentFor("first"));
  EXPECT_EQ(nbFilesIn(config.uploadDir), 0U);
}

TEST_F(BatchOrchestratorTest, FailedUploadWriteLeavesOutputsAlone) {
  tmpDir.writeFile("converted/a.png", "PNG:earlier");
  std::filesystem::remove_all(config.uploadDir);
  const BatchOrchestrator orchestrator(config, rasterizer);
  const std::vector<UploadedFile> files{{"a.psd", "1"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_EQ(ToStd(outcome.failed), std::vector<std::string>{"a.psd"});
  EXPECT_EQ(test::ReadFile(config.convertedDir / "a.png"), "PNG:earlier");
}

TEST_F(BatchOrchestratorTest, AllFailed) {
  test::FakeRasterizer failingRasterizer(test::FakeRasterizer::Behavior::Fail);
  const BatchOrchestrator orchestrator(config, failingRasterizer);
  const std::vector<UploadedFile> files{{"a.psd", "1"}, {"b.psd", "2"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_TRUE(outcome.converted.empty());
  EXPECT_EQ(ToStd(outcome.failed), (std::vector<std::string>{"a.psd", "b.psd"}));
  EXPECT_EQ(nbFilesIn(config.convertedDir), 0U);
}

TEST_F(BatchOrchestratorTest, UploadDirectoryMissing) {
  std::filesystem::remove_all(config.uploadDir);
  const BatchOrchestrator orchestrator(config, rasterizer);
  const std::vector<UploadedFile> files{{"a.psd", "1"}};

  const BatchOutcome outcome = orchestrator.process(files);
  EXPECT_TRUE(outcome.converted.empty());
  EXPECT_EQ(ToStd(outcome.failed), std::vector<std::string>{"a.psd"});
  EXPECT_EQ(rasterizer.nbCalls(), 0U);
}

TEST_F(BatchOrchestratorTest, OutputName) {
  const BatchOrchestrator orchestrator(config.withOutputExtension("webp"), rasterizer);
  EXPECT_EQ(orchestrator.outputName("a.b.psd"), "a.b.webp");
  EXPECT_EQ(orchestrator.outputName(".psd"), ".psd.webp");
  EXPECT_EQ(orchestrator.outputName("noext"), "noext.webp");
}

}  // namespace psdconv
