#include <gtest/gtest.h>

#include "archive/archive_config.hpp"

namespace {

using archive::ArchiveConfig;

TEST(ArchiveConfigTest, DefaultsAreValid) {
    const ArchiveConfig config{};
    EXPECT_EQ(archive::validate(config), "");
    EXPECT_EQ(config.segment_file_length, 128 * 1024 * 1024);
    EXPECT_EQ(config.file_sync_level, persist::FileSyncLevel::None);
    EXPECT_TRUE(config.catalog_sync);
    EXPECT_EQ(config.threading_mode, archive::ThreadingMode::Dedicated);
    EXPECT_EQ(config.replay_stall_timeout.count(), 0);
}

TEST(ArchiveConfigTest, AppliesOptions) {
    ArchiveConfig config{};
    std::string error;
    EXPECT_TRUE(archive::apply_option(config, "--archive-dir", "/tmp/arc", error));
    EXPECT_TRUE(archive::apply_option(config, "--segment-file-length", "1048576", error));
    EXPECT_TRUE(archive::apply_option(config, "--file-sync", "interval", error));
    EXPECT_TRUE(archive::apply_option(config, "--sync-interval-bytes", "4096", error));
    EXPECT_TRUE(archive::apply_option(config, "--catalog-sync", "false", error));
    EXPECT_TRUE(archive::apply_option(config, "--threading", "shared", error));
    EXPECT_TRUE(archive::apply_option(config, "--replay-stall-timeout-ms", "250", error));
    EXPECT_TRUE(archive::apply_option(config, "--log-level", "debug", error));

    EXPECT_EQ(config.archive_dir, "/tmp/arc");
    EXPECT_EQ(config.segment_file_length, 1048576);
    EXPECT_EQ(config.file_sync_level, persist::FileSyncLevel::Interval);
    EXPECT_EQ(config.sync_interval_bytes, 4096u);
    EXPECT_FALSE(config.catalog_sync);
    EXPECT_EQ(config.threading_mode, archive::ThreadingMode::Shared);
    EXPECT_EQ(config.replay_stall_timeout.count(), 250);
    EXPECT_EQ(config.log_level, util::LogLevel::Debug);
    EXPECT_EQ(archive::validate(config), "");
}

TEST(ArchiveConfigTest, RejectsUnknownKeysAndBadValues) {
    ArchiveConfig config{};
    std::string error;
    EXPECT_FALSE(archive::apply_option(config, "--no-such-option", "1", error));
    EXPECT_NE(error.find("unknown option"), std::string::npos);
    EXPECT_FALSE(archive::apply_option(config, "--control-stream", "ten", error));
    EXPECT_FALSE(archive::apply_option(config, "--file-sync", "sometimes", error));
    EXPECT_FALSE(archive::apply_option(config, "--log-level", "loud", error));
}

TEST(ArchiveConfigTest, ValidationCatchesBadGeometry) {
    ArchiveConfig config{};
    config.segment_file_length = 3 * 1024 * 1024;
    EXPECT_NE(archive::validate(config), "");

    config = ArchiveConfig{};
    config.recording_block_length = 100;
    EXPECT_NE(archive::validate(config), "");

    config = ArchiveConfig{};
    config.control_channel = "udp://nope";
    EXPECT_NE(archive::validate(config), "");

    config = ArchiveConfig{};
    config.file_sync_level = persist::FileSyncLevel::Interval;
    config.sync_interval_bytes = 0;
    EXPECT_NE(archive::validate(config), "");
}

TEST(ArchiveConfigTest, ControlSessionLivenessTimeout) {
    ArchiveConfig config{};
    EXPECT_EQ(config.control_session_liveness_timeout.count(), 10000);
    std::string error;
    EXPECT_TRUE(archive::apply_option(config, "--control-liveness-timeout-ms", "2500", error));
    EXPECT_EQ(config.control_session_liveness_timeout.count(), 2500);
    EXPECT_EQ(archive::validate(config), "");

    EXPECT_TRUE(archive::apply_option(config, "--control-liveness-timeout-ms", "0", error));
    EXPECT_NE(archive::validate(config).find("control-liveness-timeout-ms"), std::string::npos);
}

} // namespace
