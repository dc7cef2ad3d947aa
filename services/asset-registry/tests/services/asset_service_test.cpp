/**
 * @file asset_service_test.cpp
 * @brief Caller-facing asset operations
 */

#include <gtest/gtest.h>
#include "exceptions.h"
#include "fakes/registry_fixture.h"

using namespace test_fakes;
using domain::models::OrderType;

class AssetServiceTest : public RegistryFixture {};

// ============================================================================
// CreateAsset
// ============================================================================

TEST_F(AssetServiceTest, CreateAsset_ReturnsIdOfStoredAsset) {
    std::string assetId = service_.createAsset(assetInput());

    auto asset = service_.getAssetById(assetId);
    EXPECT_EQ(asset.name, "Gold Bar");
    EXPECT_EQ(asset.symbol, "GOLD");
    EXPECT_EQ(asset.ownerFingerprint, OWNER_1);
}

TEST_F(AssetServiceTest, CreateAsset_IssuesCertificateWithTrail) {
    std::string assetId = service_.createAsset(assetInput());

    auto cert = service_.findCertificateByAsset(assetId);
    EXPECT_EQ(cert.assetId, assetId);
    EXPECT_EQ(cert.payload.size(), 86u);

    auto trail = service_.getCertificateTrail(cert.id);
    ASSERT_EQ(trail.size(), 1u);
    EXPECT_EQ(trail[0].newOwnerFingerprint, OWNER_1);
}

TEST_F(AssetServiceTest, CreateAsset_InsertAffectsNothing_TransactionStepError) {
    store_.assetInsertAffectsNothing = true;
    EXPECT_THROW(service_.createAsset(assetInput()), common::TransactionStepException);
}

TEST_F(AssetServiceTest, CreateAsset_EmptyOwner_Rejected) {
    auto input = assetInput();
    input.ownerFingerprint.clear();
    EXPECT_THROW(service_.createAsset(input), common::ValidationException);
    EXPECT_EQ(store_.storageCalls, 0);
}

// ============================================================================
// UpdateAsset / DeleteAsset
// ============================================================================

TEST_F(AssetServiceTest, UpdateAsset_AppliesFieldsWithoutTrailEntry) {
    std::string assetId = service_.createAsset(assetInput());
    domain::models::AssetUpdate fields;
    fields.description = "two kilograms";
    fields.tradable = true;

    EXPECT_TRUE(service_.updateAsset(assetId, ORG_A, OWNER_2, fields));

    auto asset = service_.getAssetById(assetId);
    EXPECT_EQ(asset.description, "two kilograms");
    EXPECT_TRUE(asset.tradable);
    EXPECT_EQ(asset.updatedBy.value_or(""), OWNER_2);
    EXPECT_EQ(asset.ownerFingerprint, OWNER_1);
    EXPECT_EQ(store_.state.trail.size(), 1u);
}

TEST_F(AssetServiceTest, UpdateAsset_NoFields_Rejected) {
    std::string assetId = service_.createAsset(assetInput());
    EXPECT_THROW(service_.updateAsset(assetId, ORG_A, OWNER_1, {}), common::ValidationException);
}

TEST_F(AssetServiceTest, UpdateAsset_OrganizationChange_Rejected) {
    std::string assetId = service_.createAsset(assetInput());
    domain::models::AssetUpdate fields;
    fields.organization = ORG_B;
    EXPECT_THROW(service_.updateAsset(assetId, ORG_A, OWNER_1, fields), common::ValidationException);
}

TEST_F(AssetServiceTest, UpdateAsset_OutsideOrganization_NotFound) {
    std::string assetId = service_.createAsset(assetInput());
    domain::models::AssetUpdate fields;
    fields.name = "Silver Bar";
    EXPECT_THROW(service_.updateAsset(assetId, ORG_B, OWNER_1, fields), common::NotFoundException);
    EXPECT_EQ(service_.getAssetById(assetId).name, "Gold Bar");
}

TEST_F(AssetServiceTest, UpdateAsset_EmptyUpdatedBy_Rejected) {
    std::string assetId = service_.createAsset(assetInput());
    domain::models::AssetUpdate fields;
    fields.name = "Silver Bar";
    EXPECT_THROW(service_.updateAsset(assetId, ORG_A, "", fields), common::ValidationException);
}

TEST_F(AssetServiceTest, DeleteAsset_KeepsCertificateHistory) {
    std::string assetId = service_.createAsset(assetInput());
    auto cert = service_.findCertificateByAsset(assetId);

    EXPECT_TRUE(service_.deleteAsset(assetId, ORG_A));

    EXPECT_THROW(service_.getAssetById(assetId), common::NotFoundException);
    EXPECT_EQ(service_.getCertificateTrail(cert.id).size(), 1u);
}

TEST_F(AssetServiceTest, DeleteAsset_OutsideOrganization_NotFound) {
    std::string assetId = service_.createAsset(assetInput());
    EXPECT_THROW(service_.deleteAsset(assetId, ORG_B), common::NotFoundException);
    EXPECT_NO_THROW(service_.getAssetById(assetId));
}

// ============================================================================
// Reads
// ============================================================================

TEST_F(AssetServiceTest, GetPaginatedAssets_ReportsRequestOffsetAndPageSize) {
    seedAssets(12);

    auto page = service_.getPaginatedAssets(10, 5, OrderType::Ascending);

    EXPECT_EQ(page.offset, 10);
    EXPECT_EQ(page.total, 2);
    ASSERT_EQ(page.assets.size(), 2u);
    EXPECT_EQ(page.assets[0].name, "asset-010");
}

TEST_F(AssetServiceTest, SearchAssets_MatchesCaseInsensitively) {
    service_.createAsset(assetInput("Gold Bar", "GOLD"));
    service_.createAsset(assetInput("Silver Coin", "SILV"));

    auto page = service_.searchAssets(repositories::AssetSearchField::Name, "gOlD", 0, 10,
                                      OrderType::Ascending);

    ASSERT_EQ(page.assets.size(), 1u);
    EXPECT_EQ(page.assets[0].symbol, "GOLD");
}

TEST_F(AssetServiceTest, TransferAsset_ReturnsCertificateId) {
    std::string assetId = createTransferableAsset();
    auto cert = service_.findCertificateByAsset(assetId);

    EXPECT_EQ(service_.transferAsset({assetId, ORG_A, ORG_B, OWNER_2}), cert.id);

    auto trail = service_.getCertificateTrail(cert.id);
    ASSERT_EQ(trail.size(), 2u);
    EXPECT_EQ(trail[0].newOwnerFingerprint, OWNER_1);
    EXPECT_EQ(trail[1].newOwnerFingerprint, OWNER_2);
}

TEST_F(AssetServiceTest, FindCertificateByAsset_Missing_NotFound) {
    EXPECT_THROW(service_.findCertificateByAsset("missing"), common::NotFoundException);
}

TEST_F(AssetServiceTest, GetCertificateTrail_UnknownCertificate_NotFound) {
    EXPECT_THROW(service_.getCertificateTrail("missing"), common::NotFoundException);
}
