#include "ingest/upload/missing_parts.hpp"

#include <gtest/gtest.h>

using ingest::ErrorKind;
using ingest::upload::FileMissingParts;
using ingest::upload::reconcile;

namespace {

constexpr std::uint64_t kChunk = 100;
// Eight parts, the last one 50 bytes
constexpr std::uint64_t kSize = 7 * kChunk + 50;

FileMissingParts report(std::vector<std::uint64_t> missing, std::uint64_t total = 8) {
    return FileMissingParts{"a.bin", std::move(missing), total};
}

} // namespace

TEST(ReconcileTest, NoReportSendsEverything) {
    auto plan = reconcile(std::nullopt, kChunk, kSize);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().parts_to_send, (std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5, 6, 7}));
    EXPECT_EQ(plan.value().parts_already_sent, 0u);
    EXPECT_EQ(plan.value().bytes_already_sent, 0u);
    EXPECT_EQ(plan.value().expected_total_parts, 8u);
}

TEST(ReconcileTest, FinalPartMissingCountsFullParts) {
    auto plan = reconcile(report({6, 7}), kChunk, kSize);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().parts_to_send, (std::vector<std::uint64_t>{6, 7}));
    EXPECT_EQ(plan.value().parts_already_sent, 6u);
    EXPECT_EQ(plan.value().bytes_already_sent, 6 * kChunk);
}

TEST(ReconcileTest, FinalPartAlreadySentCountsItsLength) {
    auto plan = reconcile(report({0, 1}), kChunk, kSize);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().parts_already_sent, 6u);
    EXPECT_EQ(plan.value().bytes_already_sent, 5 * kChunk + 50);
}

TEST(ReconcileTest, GapsInTheMiddle) {
    auto plan = reconcile(report({3, 4, 5, 7}), kChunk, kSize);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().parts_to_send.size(), 4u);
    EXPECT_EQ(plan.value().parts_already_sent, 4u);
    EXPECT_EQ(plan.value().bytes_already_sent, 4 * kChunk);
}

TEST(ReconcileTest, UnsortedAndDuplicatedIndices) {
    auto plan = reconcile(report({7, 3, 3, 5}), kChunk, kSize);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().parts_to_send, (std::vector<std::uint64_t>{3, 5, 7}));
    EXPECT_EQ(plan.value().parts_already_sent, 5u);
}

TEST(ReconcileTest, EmptyReportMeansEverythingSent) {
    auto plan = reconcile(report({}), kChunk, kSize);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_TRUE(plan.value().nothing_to_send());
    EXPECT_EQ(plan.value().parts_already_sent, 8u);
    EXPECT_EQ(plan.value().bytes_already_sent, kSize);
}

TEST(ReconcileTest, IndexOutOfRangeIsRejected) {
    auto plan = reconcile(report({2, 8}), kChunk, kSize);
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().kind, ErrorKind::InvalidArgument);
}

TEST(ReconcileTest, EmptyFile) {
    auto fresh = reconcile(std::nullopt, kChunk, 0);
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_EQ(fresh.value().parts_to_send, (std::vector<std::uint64_t>{0}));

    auto resumed = reconcile(report({0}, 1), kChunk, 0);
    ASSERT_TRUE(resumed.is_ok());
    EXPECT_EQ(resumed.value().parts_already_sent, 0u);
    EXPECT_EQ(resumed.value().bytes_already_sent, 0u);
}

TEST(ReconcileTest, TrailingIndexOfExactMultipleIsDropped) {
    // 8 bytes in 4-byte chunks is two parts, but the service counts three
    auto plan = reconcile(report({0, 1, 2}, 3), 4, 8);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().parts_to_send, (std::vector<std::uint64_t>{0, 1}));
    EXPECT_EQ(plan.value().expected_total_parts, 2u);
    EXPECT_EQ(plan.value().parts_already_sent, 0u);
    EXPECT_EQ(plan.value().bytes_already_sent, 0u);
}

TEST(ReconcileTest, OnlyTrailingIndexMissingMeansEverythingSent) {
    auto plan = reconcile(report({2}, 3), 4, 8);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_TRUE(plan.value().nothing_to_send());
    EXPECT_EQ(plan.value().parts_already_sent, 2u);
    EXPECT_EQ(plan.value().bytes_already_sent, 8u);
}

TEST(ReconcileTest, TrailingIndexDroppedAlongsideRealGap) {
    auto plan = reconcile(report({1, 2}, 3), 4, 8);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().parts_to_send, (std::vector<std::uint64_t>{1}));
    EXPECT_EQ(plan.value().parts_already_sent, 1u);
    EXPECT_EQ(plan.value().bytes_already_sent, 4u);
}
