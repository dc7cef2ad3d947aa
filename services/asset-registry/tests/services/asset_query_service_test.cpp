/**
 * @file asset_query_service_test.cpp
 * @brief Paged reads and the lazy asset stream
 */

#include <gtest/gtest.h>
#include "exceptions.h"
#include "fakes/registry_fixture.h"

using namespace test_fakes;
using domain::models::OrderType;
using domain::models::AssetSortField;

class AssetQueryServiceTest : public RegistryFixture {};

// ============================================================================
// Paging validation
// ============================================================================

TEST_F(AssetQueryServiceTest, Page_LimitZero_RejectedBeforeStorage) {
    EXPECT_THROW(queries_.page(0, 0, OrderType::Ascending), common::ValidationException);
    EXPECT_EQ(store_.storageCalls, 0);
}

TEST_F(AssetQueryServiceTest, Page_LimitAboveMaximum_RejectedBeforeStorage) {
    EXPECT_THROW(queries_.page(0, 101, OrderType::Ascending), common::ValidationException);
    EXPECT_EQ(store_.storageCalls, 0);
}

TEST_F(AssetQueryServiceTest, Page_NegativeOffset_Rejected) {
    EXPECT_THROW(queries_.page(-1, 10, OrderType::Ascending), common::ValidationException);
    EXPECT_EQ(store_.storageCalls, 0);
}

TEST_F(AssetQueryServiceTest, Page_LimitBoundaries_Accepted) {
    seedAssets(3);
    EXPECT_EQ(queries_.page(0, 1, OrderType::Ascending).size(), 1u);
    EXPECT_EQ(queries_.page(0, 100, OrderType::Ascending).size(), 3u);
}

TEST_F(AssetQueryServiceTest, Page_DescendingOrder) {
    seedAssets(5);
    auto page = queries_.page(0, 2, OrderType::Descending);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].name, "asset-004");
    EXPECT_EQ(page[1].name, "asset-003");
}

TEST_F(AssetQueryServiceTest, Search_BlankTerm_Rejected) {
    EXPECT_THROW(queries_.search(repositories::AssetSearchField::Name, "   ", 0, 10,
                                 OrderType::Ascending),
                 common::ValidationException);
    EXPECT_EQ(store_.storageCalls, 0);
}

TEST_F(AssetQueryServiceTest, FindByOwner_EmptyOwner_Rejected) {
    EXPECT_THROW(queries_.findByOwner("", 0, 10, OrderType::Ascending),
                 common::ValidationException);
    EXPECT_EQ(store_.storageCalls, 0);
}

TEST_F(AssetQueryServiceTest, FindByOwner_ReturnsOnlyThatOwnersAssets) {
    seedAssets(4);
    store_.state.assets.at("id-asset-002").ownerFingerprint = "someone-else";

    auto owned = queries_.findByOwner(OWNER_1, 0, 10, OrderType::Ascending);

    ASSERT_EQ(owned.size(), 3u);
    EXPECT_EQ(owned[0].name, "asset-000");
    EXPECT_EQ(owned[2].name, "asset-003");
}

TEST_F(AssetQueryServiceTest, Count_ReflectsStoredAssets) {
    EXPECT_EQ(queries_.count(), 0);
    seedAssets(7);
    EXPECT_EQ(queries_.count(), 7);
}

TEST_F(AssetQueryServiceTest, BatchSize_TenTimesLimitCappedAtThousand) {
    EXPECT_EQ(services::AssetQueryService::batchSizeFor(1), 10);
    EXPECT_EQ(services::AssetQueryService::batchSizeFor(10), 100);
    EXPECT_EQ(services::AssetQueryService::batchSizeFor(100), 1000);
}

// ============================================================================
// Stream
// ============================================================================

TEST_F(AssetQueryServiceTest, Stream_InvalidLimit_RejectedBeforeStorage) {
    EXPECT_THROW(queries_.stream(0, 0, OrderType::Ascending), common::ValidationException);
    EXPECT_THROW(queries_.stream(0, 101, OrderType::Ascending), common::ValidationException);
    EXPECT_EQ(store_.storageCalls, 0);
}

TEST_F(AssetQueryServiceTest, Stream_TwentyFiveAssetsLimitTen_YieldsTenTenFive) {
    seedAssets(25);

    auto stream = queries_.stream(0, 10, OrderType::Ascending);

    auto first = stream.next();
    auto second = stream.next();
    auto third = stream.next();
    auto end = stream.next();

    ASSERT_TRUE(first && second && third);
    EXPECT_EQ(first->total(), 10);
    EXPECT_EQ(second->total(), 10);
    EXPECT_EQ(third->total(), 5);
    EXPECT_EQ(first->offset, 0);
    EXPECT_EQ(second->offset, 10);
    EXPECT_EQ(third->offset, 20);
    EXPECT_EQ(first->assets.front().name, "asset-000");
    EXPECT_EQ(third->assets.back().name, "asset-024");
    EXPECT_FALSE(end.has_value());
    EXPECT_TRUE(stream.finished());
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(AssetQueryServiceTest, Stream_ReadsStorageInWindows) {
    seedAssets(25);

    auto stream = queries_.stream(0, 2, OrderType::Ascending);
    int items = 0;
    while (stream.next()) ++items;

    // Windows of 20: offsets 0 and 20 return rows, offset 25 returns none
    EXPECT_EQ(items, 13);
    EXPECT_EQ(assets_.findAllCalls, 3);
}

TEST_F(AssetQueryServiceTest, Stream_StartsAtRequestedOffset) {
    seedAssets(25);

    auto stream = queries_.stream(20, 10, OrderType::Ascending);
    auto item = stream.next();

    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->offset, 20);
    EXPECT_EQ(item->total(), 5);
    EXPECT_EQ(item->assets.front().name, "asset-020");
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(AssetQueryServiceTest, Stream_Empty_EndsImmediately) {
    auto stream = queries_.stream(0, 10, OrderType::Ascending);
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(assets_.findAllCalls, 1);
}

TEST_F(AssetQueryServiceTest, Stream_StorageFailureMidStream_ErrorThenEnd) {
    seedAssets(25);
    store_.beforeFindAll = [](int64_t offset) {
        if (offset > 0) throw common::StorageUnavailableException("connection lost");
    };

    auto stream = queries_.stream(0, 10, OrderType::Ascending, AssetSortField::Name);
    int delivered = 0;
    while (auto item = stream.next()) {
        delivered += static_cast<int>(item->total());
        if (delivered == 25) break;
    }
    EXPECT_EQ(delivered, 25);

    EXPECT_THROW(stream.next(), common::StorageUnavailableException);
    EXPECT_TRUE(stream.finished());
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(AssetQueryServiceTest, Stream_StopsAtOffsetCeiling) {
    seedAssets(25);
    services::AssetQueryService limited(&assets_, 10);

    auto stream = limited.stream(0, 10, OrderType::Ascending);
    auto first = stream.next();
    auto second = stream.next();

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->total(), 10);
    // The first window held all 25 rows, so the ceiling only stops the next read
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->offset, 10);
    EXPECT_TRUE(stream.next().has_value());
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(assets_.findAllCalls, 1);
}
