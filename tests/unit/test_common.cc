#include <gtest/gtest.h>
#include "splicerelay/common/config.h"
#include "splicerelay/common/logging.h"
#include "splicerelay/common/result.h"
#include "splicerelay/common/status.h"
#include <cerrno>
#include <filesystem>
#include <fstream>

namespace splicerelay::common {
namespace {

TEST(StatusTest, MakeStatus) {
  auto status = MakeStatus(RelayErrorCode::kOk);
  EXPECT_TRUE(status.ok());

  auto error_status = MakeStatus(RelayErrorCode::kSourceReadFailure, "connection reset");
  EXPECT_FALSE(error_status.ok());
  EXPECT_EQ(error_status.code(), absl::StatusCode::kUnavailable);
  EXPECT_EQ(error_status.message(), "connection reset");
}

TEST(StatusTest, ErrorCodeSurvivesAsPayload) {
  for (auto code : {RelayErrorCode::kSourceReadFailure, RelayErrorCode::kDestinationWriteFailure,
                    RelayErrorCode::kFastPathNotApplicable, RelayErrorCode::kShutdownInduced,
                    RelayErrorCode::kInvalidArgument, RelayErrorCode::kInternal}) {
    auto status = MakeStatus(code, "x");
    EXPECT_EQ(GetRelayErrorCode(status), code) << ToString(code);
    EXPECT_EQ(status.code(), ToAbslStatusCode(code));
  }
}

TEST(StatusTest, ForeignStatusIsInternal) {
  EXPECT_EQ(GetRelayErrorCode(absl::OkStatus()), RelayErrorCode::kOk);
  EXPECT_EQ(GetRelayErrorCode(absl::UnavailableError("plain")), RelayErrorCode::kInternal);
}

TEST(StatusTest, Classification) {
  EXPECT_TRUE(IsShutdownInduced(MakeStatus(RelayErrorCode::kShutdownInduced, "closed")));
  EXPECT_FALSE(IsShutdownInduced(absl::CancelledError("closed")));
  EXPECT_TRUE(IsFastPathNotApplicable(MakeStatus(RelayErrorCode::kFastPathNotApplicable)));
  EXPECT_FALSE(IsFastPathNotApplicable(MakeStatus(RelayErrorCode::kDestinationWriteFailure)));
}

TEST(StatusTest, ErrnoStatus) {
  auto status = ErrnoStatus(RelayErrorCode::kDestinationWriteFailure, EPIPE, "write");
  EXPECT_EQ(GetRelayErrorCode(status), RelayErrorCode::kDestinationWriteFailure);
  EXPECT_NE(status.message().find("write: "), std::string::npos);
}

TEST(ResultTest, Ok) {
  auto result = Ok(42);
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, Error) {
  auto result = Error<int>(RelayErrorCode::kInvalidArgument, "test error");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(UnwrapOr(result, 7), 7);
}

TEST(ConfigTest, Defaults) {
  auto config = ConfigLoader::ParseRelayConfig("");
  EXPECT_EQ(config.buffer_size_bytes, kDefaultBufferSize);
  EXPECT_EQ(config.splice_chunk_bytes, kDefaultSpliceChunkSize);
  EXPECT_TRUE(config.disabled_pairs.empty());
  EXPECT_EQ(config.log_level, "info");
  EXPECT_TRUE(config.log_file.empty());
}

TEST(ConfigTest, ParsesValues) {
  auto config = ConfigLoader::ParseRelayConfig(
      "# relay tuning\n"
      "buffer_size_bytes: 65536\n"
      "splice_chunk_bytes: 131072\n"
      "splice_available: false\n"
      "disabled_pairs: [tcp->unix, \"pipe->tcp\"]\n"
      "log_level: \"debug\"\n");
  EXPECT_EQ(config.buffer_size_bytes, 65536u);
  EXPECT_EQ(config.splice_chunk_bytes, 131072u);
  EXPECT_FALSE(config.splice_available);
  ASSERT_EQ(config.disabled_pairs.size(), 2u);
  EXPECT_EQ(config.disabled_pairs[0], "tcp->unix");
  EXPECT_EQ(config.disabled_pairs[1], "pipe->tcp");
  EXPECT_EQ(config.log_level, "debug");
}

TEST(ConfigTest, MalformedNumbersFallBackToDefaults) {
  auto config = ConfigLoader::ParseRelayConfig("buffer_size_bytes: lots\nsplice_chunk_bytes: 0\n");
  EXPECT_EQ(config.buffer_size_bytes, kDefaultBufferSize);
  EXPECT_EQ(config.splice_chunk_bytes, kDefaultSpliceChunkSize);
}

TEST(ConfigTest, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() / "splicerelay_config_test.yaml";
  {
    std::ofstream out(path);
    out << "buffer_size_bytes: 4096\n";
  }
  auto config = ConfigLoader::LoadRelayConfig(path.string());
  EXPECT_EQ(config.buffer_size_bytes, 4096u);
  std::filesystem::remove(path);
}

TEST(ConfigTest, MissingFileThrows) {
  EXPECT_THROW((void)ConfigLoader::LoadRelayConfig("/nonexistent/splicerelay.yaml"), std::runtime_error);
}

TEST(LoggingTest, ParseLevel) {
  EXPECT_EQ(Logging::ParseLevel("debug"), spdlog::level::debug);
  EXPECT_EQ(Logging::ParseLevel("warn"), spdlog::level::warn);
  EXPECT_EQ(Logging::ParseLevel("error"), spdlog::level::err);
  EXPECT_EQ(Logging::ParseLevel("chatty"), spdlog::level::info);
}

TEST(LoggingTest, InitializeRegistersLogger) {
  Logging::Initialize("warn");
  auto logger = spdlog::get(kLoggerName);
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->level(), spdlog::level::warn);
  EXPECT_EQ(spdlog::default_logger(), logger);

  // Re-initializing replaces the registered logger instead of failing
  Logging::Initialize("info");
  EXPECT_EQ(spdlog::get(kLoggerName)->level(), spdlog::level::info);
}

}
}
