#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <vector>

#include "harness/fake_transport.hpp"
#include "persist/segment_store.hpp"

namespace {

using persist::SegmentGeometry;
using persist::SegmentHandle;
using persist::SegmentStore;
using persist::StoreStatus;

constexpr std::int32_t kTermLength = 64 * 1024;
constexpr std::int32_t kSegmentLength = 4 * kTermLength;
constexpr SegmentGeometry kGeometry{kSegmentLength, kTermLength};

std::vector<std::byte> frames_of(std::int32_t count, std::int32_t payload, std::int32_t start_offset = 0) {
    std::vector<std::byte> out;
    std::int32_t offset = start_offset;
    for (std::int32_t i = 0; i < count; ++i) {
        const std::int32_t length = archive::frame::header_length + payload;
        const auto aligned = static_cast<std::int32_t>(archive::frame::aligned_length(length));
        const std::size_t at = out.size();
        out.resize(at + static_cast<std::size_t>(aligned));
        test::write_frame_header(out.data() + at, length, archive::frame::type_data, offset % kTermLength, 7, 1001,
                                 100 + offset / kTermLength);
        offset += aligned;
    }
    return out;
}

TEST(SegmentStoreTest, WritesSequentiallyAndReadsBack) {
    test::TempDir dir("segment_rw");
    SegmentStore store(dir.path(), {});
    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(3, 0, kGeometry, handle).ok());
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "3-0.rec"));
    EXPECT_EQ(std::filesystem::file_size(dir.path() / "3-0.rec"), static_cast<std::uintmax_t>(kSegmentLength));

    const auto block = frames_of(4, 100);
    ASSERT_TRUE(store.write(*handle, 0, block).ok());
    EXPECT_EQ(handle->write_cursor(), static_cast<std::int64_t>(block.size()));

    std::vector<std::byte> back(block.size());
    ASSERT_TRUE(store.read(*handle, 0, back).ok());
    EXPECT_EQ(back, block);
    EXPECT_TRUE(store.close(*handle).ok());
}

TEST(SegmentStoreTest, RejectsGapsAndRewinds) {
    test::TempDir dir("segment_seq");
    SegmentStore store(dir.path(), {});
    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(1, 0, kGeometry, handle).ok());
    const auto block = frames_of(2, 32);
    ASSERT_TRUE(store.write(*handle, 0, block).ok());
    EXPECT_EQ(store.write(*handle, static_cast<std::int64_t>(block.size()) + 64, block).status,
              StoreStatus::NonSequential);
    EXPECT_EQ(store.write(*handle, 0, block).status, StoreStatus::NonSequential);
}

TEST(SegmentStoreTest, FirstWriteMayStartMidSegment) {
    test::TempDir dir("segment_join");
    SegmentStore store(dir.path(), {});
    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(1, 0, kGeometry, handle).ok());
    const auto block = frames_of(1, 64, 8192);
    EXPECT_TRUE(store.write(*handle, 8192, block).ok());
}

TEST(SegmentStoreTest, RejectsWritesSpanningTermOrSegment) {
    test::TempDir dir("segment_bounds");
    SegmentStore store(dir.path(), {});
    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(1, 0, kGeometry, handle).ok());
    const std::vector<std::byte> straddle(256);
    EXPECT_EQ(store.write(*handle, kTermLength - 128, straddle).status, StoreStatus::SpansTerm);
    EXPECT_EQ(store.write(*handle, kSegmentLength - 128, straddle).status, StoreStatus::OutOfBounds);
    EXPECT_EQ(store.write(*handle, -32, straddle).status, StoreStatus::OutOfBounds);
}

TEST(SegmentStoreTest, SealsWhenFullAndNeverReopensForWrite) {
    test::TempDir dir("segment_seal");
    SegmentStore store(dir.path(), {});
    SegmentGeometry small{kTermLength, kTermLength};
    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(2, 0, small, handle).ok());
    const std::vector<std::byte> term(kTermLength, std::byte{0x5A});
    ASSERT_TRUE(store.write(*handle, 0, term).ok());
    EXPECT_TRUE(handle->sealed());
    EXPECT_EQ(store.write(*handle, kTermLength, std::vector<std::byte>(32)).status, StoreStatus::Sealed);
    ASSERT_TRUE(store.close(*handle).ok());

    std::unique_ptr<SegmentHandle> again;
    EXPECT_EQ(store.open(2, 0, small, again).status, StoreStatus::AlreadyExists);
    EXPECT_FALSE(again);
}

TEST(SegmentStoreTest, OpenForReadOfMissingSegment) {
    test::TempDir dir("segment_missing");
    SegmentStore store(dir.path(), {});
    std::unique_ptr<SegmentHandle> handle;
    EXPECT_EQ(store.open_for_read(9, 0, kGeometry, handle).status, StoreStatus::NotFound);
}

TEST(SegmentStoreTest, WriteFailureSurfacesAsIoError) {
    test::TempDir dir("segment_fail");
    auto plan = std::make_shared<test::FaultPlan>();
    plan->fail_writes_after_bytes = 1024;
    plan->write_error = ENOSPC;
    SegmentStore store(dir.path(), {}, test::faulty_file_factory(plan));
    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(1, 0, kGeometry, handle).ok());
    const auto first = frames_of(1, 512);
    ASSERT_TRUE(store.write(*handle, 0, first).ok());
    const persist::StoreResult r = store.write(*handle, static_cast<std::int64_t>(first.size()), frames_of(1, 992));
    EXPECT_EQ(r.status, StoreStatus::IoError);
    EXPECT_EQ(r.error_code, ENOSPC);
    EXPECT_EQ(handle->write_cursor(), static_cast<std::int64_t>(first.size()));
}

TEST(SegmentStoreTest, SyncPolicies) {
    test::TempDir dir("segment_sync");
    auto plan = std::make_shared<test::FaultPlan>();
    {
        SegmentStore store(dir.path(), {persist::FileSyncLevel::EveryWrite, 0}, test::faulty_file_factory(plan));
        std::unique_ptr<SegmentHandle> handle;
        ASSERT_TRUE(store.open(1, 0, kGeometry, handle).ok());
        ASSERT_TRUE(store.write(*handle, 0, frames_of(1, 32)).ok());
        ASSERT_TRUE(store.write(*handle, 64, frames_of(1, 32, 64)).ok());
        EXPECT_EQ(plan->syncs, 2);
        ASSERT_TRUE(store.close(*handle).ok());
        EXPECT_EQ(plan->syncs, 2);
    }
    plan->syncs = 0;
    {
        SegmentStore store(dir.path(), {persist::FileSyncLevel::Interval, 256}, test::faulty_file_factory(plan));
        std::unique_ptr<SegmentHandle> handle;
        ASSERT_TRUE(store.open(2, 0, kGeometry, handle).ok());
        ASSERT_TRUE(store.write(*handle, 0, frames_of(2, 32)).ok());
        EXPECT_EQ(plan->syncs, 0);
        ASSERT_TRUE(store.write(*handle, 128, frames_of(2, 32, 128)).ok());
        EXPECT_EQ(plan->syncs, 1);
    }
    plan->syncs = 0;
    plan->fail_sync = true;
    {
        SegmentStore store(dir.path(), {persist::FileSyncLevel::EveryWrite, 0}, test::faulty_file_factory(plan));
        std::unique_ptr<SegmentHandle> handle;
        ASSERT_TRUE(store.open(3, 0, kGeometry, handle).ok());
        EXPECT_EQ(store.write(*handle, 0, frames_of(1, 32)).status, StoreStatus::IoError);
    }
}

TEST(SegmentStoreTest, ListsAndDeletesSegments) {
    test::TempDir dir("segment_delete");
    SegmentStore store(dir.path(), {});
    for (std::int64_t idx : {0, 1, 2}) {
        std::unique_ptr<SegmentHandle> handle;
        ASSERT_TRUE(store.open(5, idx, kGeometry, handle).ok());
        ASSERT_TRUE(store.close(*handle).ok());
    }
    std::unique_ptr<SegmentHandle> other;
    ASSERT_TRUE(store.open(6, 0, kGeometry, other).ok());
    ASSERT_TRUE(store.close(*other).ok());

    EXPECT_EQ(store.segment_indices(5), (std::vector<std::int64_t>{0, 1, 2}));
    ASSERT_TRUE(store.delete_recording(5).ok());
    EXPECT_TRUE(store.segment_indices(5).empty());
    EXPECT_EQ(store.segment_indices(6), (std::vector<std::int64_t>{0}));
}

TEST(SegmentStoreTest, ScanFindsEndOfLastCompleteFrame) {
    test::TempDir dir("segment_scan");
    SegmentStore store(dir.path(), {});
    archive::RecordingDescriptor d;
    d.recording_id = 4;
    d.segment_file_length = kSegmentLength;
    d.term_buffer_length = kTermLength;
    d.join_position = kSegmentLength + 1024;

    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(4, 1, kGeometry, handle).ok());
    const auto block = frames_of(5, 200, kSegmentLength + 1024);
    ASSERT_TRUE(store.write(*handle, 1024, block).ok());
    ASSERT_TRUE(store.close(*handle).ok());

    std::int64_t position = 0;
    ASSERT_TRUE(store.scan_recorded_position(d, position).ok());
    EXPECT_EQ(position, d.join_position + static_cast<std::int64_t>(block.size()));
}

TEST(SegmentStoreTest, ScanStopsAtCorruptFrameLength) {
    test::TempDir dir("segment_scan_corrupt");
    SegmentStore store(dir.path(), {});
    archive::RecordingDescriptor d;
    d.recording_id = 2;
    d.segment_file_length = kSegmentLength;
    d.term_buffer_length = kTermLength;
    d.join_position = 0;

    auto block = frames_of(5, 200);  // 256-byte aligned frames
    util::store_i32(0x7FFFFFF1, block.data() + 2 * 256);
    std::unique_ptr<SegmentHandle> handle;
    ASSERT_TRUE(store.open(2, 0, kGeometry, handle).ok());
    ASSERT_TRUE(store.write(*handle, 0, block).ok());
    ASSERT_TRUE(store.close(*handle).ok());

    std::int64_t position = 0;
    ASSERT_TRUE(store.scan_recorded_position(d, position).ok());
    EXPECT_EQ(position, 2 * 256);
}

TEST(SegmentStoreTest, ScanWithoutSegmentsReturnsJoinPosition) {
    test::TempDir dir("segment_scan_empty");
    SegmentStore store(dir.path(), {});
    archive::RecordingDescriptor d;
    d.recording_id = 8;
    d.segment_file_length = kSegmentLength;
    d.term_buffer_length = kTermLength;
    d.join_position = 4096;
    std::int64_t position = 0;
    ASSERT_TRUE(store.scan_recorded_position(d, position).ok());
    EXPECT_EQ(position, 4096);
}

} // namespace
