#include "chunkforge/upload/upload_service.hpp"
#include "chunkforge/utilities/errors.h"
#include "upload_test_utils.hpp"

#include <functional>
#include <gtest/gtest.h>

using namespace chunkforge;
using chunkforge::testing::readFile;
using chunkforge::testing::ScratchDir;

namespace {

ServerConfig scratchConfig(const ScratchDir &dir) {
  ServerConfig cfg;
  cfg.uploadDir = (dir / "uploads").string();
  cfg.chunksDir = (dir / "chunks").string();
  cfg.cleanupDelay = std::chrono::milliseconds(0);
  cfg.maxChunkBytes = 16;
  return cfg;
}

ErrorKind errorOf(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const UploadException &e) {
    return e.GetErrorKind();
  }
  ADD_FAILURE() << "no UploadException thrown";
  return ErrorKind::Io;
}

} // namespace

class UploadServiceTest : public ::testing::Test {
protected:
  ScratchDir dir_{"service"};
  UploadService service_{scratchConfig(dir_)};

  void SetUp() override { service_.start(); }
  void TearDown() override { service_.stop(); }
};

TEST_F(UploadServiceTest, StartCreatesStorageDirectories) {
  EXPECT_TRUE(std::filesystem::is_directory(dir_ / "uploads"));
  EXPECT_TRUE(std::filesystem::is_directory(dir_ / "chunks"));
}

TEST_F(UploadServiceTest, FullUploadLifecycle) {
  const std::string fileHash = "900150983cd24fb0d6963f7d28e17f72";

  EXPECT_FALSE(service_.checkExisting(fileHash, "abc.txt", 3).found);

  service_.uploadChunk(fileHash, "1-b", "b");
  service_.uploadChunk(fileHash, "0-a", "a");
  service_.uploadChunk(fileHash, "2-c", "c");

  MergeResult merged = service_.merge(fileHash, "abc.txt", 3);
  EXPECT_EQ(merged.url, "/uploads/abc.txt");
  EXPECT_EQ(readFile(dir_ / "uploads" / "abc.txt"), "abc");

  DedupResult again = service_.checkExisting(fileHash, "abc.txt", 3);
  ASSERT_TRUE(again.found);
  EXPECT_EQ(again.metadata->size, 3u);

  VerifyResult verified = service_.verify(fileHash, "abc.txt");
  EXPECT_TRUE(verified.verified);

  auto listed = service_.listArtifacts();
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0].name, "abc.txt");
}

TEST_F(UploadServiceTest, VerifyAcceptsTemporaryHashPrefix) {
  service_.uploadChunk("temp-1700000000-upload", "0-a", "abc");
  service_.merge("temp-1700000000-upload", "abc.txt", std::nullopt);
  VerifyResult verified = service_.verify(
      "temp-1700000000-900150983cd24fb0d6963f7d28e17f72", "abc.txt");
  EXPECT_TRUE(verified.verified);

  VerifyResult wrong = service_.verify("0123456789abcdef0123456789abcdef",
                                       "abc.txt");
  EXPECT_FALSE(wrong.verified);
  EXPECT_EQ(wrong.actual, "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(UploadServiceTest, CheckWithoutSizeReportsAbsent) {
  service_.uploadChunk("h", "0-a", "abc");
  service_.merge("h", "abc.txt", 3);
  EXPECT_FALSE(service_.checkExisting("h", "abc.txt", std::nullopt).found);
}

TEST_F(UploadServiceTest, MissingFieldsAreValidationErrors) {
  EXPECT_EQ(errorOf([&] { service_.checkExisting("", "a.bin", 1); }),
            ErrorKind::Validation);
  EXPECT_EQ(errorOf([&] { service_.uploadChunk("h", "", "x"); }),
            ErrorKind::Validation);
  EXPECT_EQ(errorOf([&] { service_.merge("h", "", 1); }),
            ErrorKind::Validation);
  EXPECT_EQ(errorOf([&] { service_.verify("", "a.bin"); }),
            ErrorKind::Validation);
}

TEST_F(UploadServiceTest, OversizedChunkIsRejected) {
  EXPECT_EQ(errorOf([&] {
              service_.uploadChunk("h", "0-a", std::string(17, 'x'));
            }),
            ErrorKind::Validation);
  EXPECT_FALSE(service_.chunks().hasUpload("h"));
  EXPECT_NO_THROW(service_.uploadChunk("h", "0-a", std::string(16, 'x')));
}

TEST_F(UploadServiceTest, StopRunsPendingCleanup) {
  ServerConfig cfg = scratchConfig(dir_);
  cfg.cleanupDelay = std::chrono::hours(1);
  cfg.chunksDir = (dir_ / "slow_chunks").string();
  UploadService slow(cfg);
  slow.start();
  slow.uploadChunk("h", "0-a", "abc");
  slow.merge("h", "slow.bin", 3);
  EXPECT_TRUE(slow.chunks().hasUpload("h"));
  slow.stop();
  EXPECT_FALSE(slow.chunks().hasUpload("h"));
}
