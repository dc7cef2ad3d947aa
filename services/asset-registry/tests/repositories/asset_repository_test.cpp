/**
 * @file asset_repository_test.cpp
 * @brief SQL and parameters AssetRepository sends to the executor
 */

#include <gtest/gtest.h>
#include "repositories/asset_repository.h"
#include "fakes/recording_query_executor.h"
#include "exceptions.h"

using namespace domain::models;
using repositories::AssetRepository;
using repositories::AssetSearchField;
using test_fakes::RecordingQueryExecutor;

namespace {

Json::Value assetRow(const std::string& id, const std::string& name) {
    Json::Value row;
    row["id"] = id;
    row["name"] = name;
    row["symbol"] = "GOLD";
    row["description"] = Json::Value::null;
    row["organization"] = "0f8fad5b-d9cb-469f-a165-70867728950e";
    row["owner_fp"] = "fp-owner";
    row["listable"] = "t";
    row["tradable"] = "f";
    row["created_at"] = "2024-03-05T07:08:09.000000Z";
    row["updated_at"] = "2024-03-05T07:08:09.000000Z";
    row["updated_by"] = Json::Value::null;
    return row;
}

Json::Value rows(std::initializer_list<Json::Value> items) {
    Json::Value result(Json::arrayValue);
    for (const auto& item : items) result.append(item);
    return result;
}

} // anonymous namespace

class AssetRepositoryTest : public ::testing::Test {
protected:
    RecordingQueryExecutor executor_;
    AssetRepository repository_{&executor_};
};

// ============================================================================
// Constructor Validation
// ============================================================================

TEST_F(AssetRepositoryTest, Constructor_NullExecutorThrows) {
    EXPECT_THROW(AssetRepository(nullptr), std::invalid_argument);
}

// ============================================================================
// insert()
// ============================================================================

TEST_F(AssetRepositoryTest, Insert_BindsAllColumnsInsideTransaction) {
    Asset asset;
    asset.id = "id-1";
    asset.name = "Gold Bar";
    asset.symbol = "GOLD";
    asset.organization = "org";
    asset.ownerFingerprint = "fp";
    asset.createdAt = "c";
    asset.updatedAt = "u";
    asset.updatedBy = "fp";

    auto tx = executor_.beginTransaction();
    EXPECT_TRUE(repository_.insert(*tx, asset));

    const auto& call = executor_.log().last("command");
    EXPECT_NE(call.sql.find("INSERT INTO assets"), std::string::npos);
    EXPECT_NE(call.sql.find("ON CONFLICT (id) DO NOTHING"), std::string::npos);
    std::vector<std::string> expected = {
        "id-1", "Gold Bar", "GOLD", "", "org", "fp", "true", "false", "c", "u", "fp"
    };
    EXPECT_EQ(call.params, expected);
}

TEST_F(AssetRepositoryTest, Insert_ConflictingIdReportsFalse) {
    executor_.log().commandResults.push_back(0);

    Asset asset;
    asset.id = "id-1";
    auto tx = executor_.beginTransaction();
    EXPECT_FALSE(repository_.insert(*tx, asset));
}

// ============================================================================
// update()
// ============================================================================

TEST_F(AssetRepositoryTest, Update_OnlySuppliedColumnsAreSet) {
    AssetUpdate fields;
    fields.symbol = "SILV";
    fields.tradable = true;

    EXPECT_TRUE(repository_.update("id-1", "fp-editor", fields));

    const auto& call = executor_.log().last("command");
    EXPECT_EQ(call.sql,
              "UPDATE assets SET symbol = $1, tradable = $2, updated_by = $3, "
              "updated_at = NOW() WHERE id = $4");
    std::vector<std::string> expected = {"SILV", "true", "fp-editor", "id-1"};
    EXPECT_EQ(call.params, expected);
}

TEST_F(AssetRepositoryTest, Update_NoFieldsIsNoopSuccess) {
    EXPECT_TRUE(repository_.update("id-1", "fp-editor", AssetUpdate{}));
    EXPECT_TRUE(executor_.log().calls.empty());
}

TEST_F(AssetRepositoryTest, Update_UnknownIdReportsFalse) {
    executor_.log().commandResults.push_back(0);
    AssetUpdate fields;
    fields.name = "Renamed";
    EXPECT_FALSE(repository_.update("missing", "fp", fields));
}

// ============================================================================
// transferOwnership()
// ============================================================================

TEST_F(AssetRepositoryTest, Transfer_ComparesExpectedHolderBeforeWriting) {
    auto tx = executor_.beginTransaction();
    EXPECT_EQ(repository_.transferOwnership(*tx, "id-1", "org-old", "fp-old",
                                            "org-new", "fp-new", "fp-new"), 1);

    const auto& call = executor_.log().last("command");
    EXPECT_NE(call.sql.find("WHERE id = $4 AND organization = $5 AND owner_fp = $6"),
              std::string::npos);
    std::vector<std::string> expected = {"org-new", "fp-new", "fp-new", "id-1", "org-old", "fp-old"};
    EXPECT_EQ(call.params, expected);
}

TEST_F(AssetRepositoryTest, Transfer_StaleHolderAffectsNothing) {
    executor_.log().commandResults.push_back(0);
    auto tx = executor_.beginTransaction();
    EXPECT_EQ(repository_.transferOwnership(*tx, "id-1", "org-old", "fp-old",
                                            "org-new", "fp-new", "fp-new"), 0);
}

// ============================================================================
// Reads
// ============================================================================

TEST_F(AssetRepositoryTest, FindById_MapsRow) {
    executor_.log().queryResults.push_back(rows({assetRow("id-1", "Gold Bar")}));

    auto asset = repository_.findById("id-1");
    ASSERT_TRUE(asset.has_value());
    EXPECT_EQ(asset->id, "id-1");
    EXPECT_EQ(asset->name, "Gold Bar");
    EXPECT_EQ(asset->description, "");
    EXPECT_EQ(asset->ownerFingerprint, "fp-owner");
    EXPECT_TRUE(asset->listable);
    EXPECT_FALSE(asset->tradable);
    EXPECT_FALSE(asset->updatedBy.has_value());

    const auto& call = executor_.log().last("query");
    EXPECT_NE(call.sql.find("WHERE id = $1"), std::string::npos);
    EXPECT_NE(call.sql.find("AT TIME ZONE 'UTC'"), std::string::npos);
}

TEST_F(AssetRepositoryTest, FindByIdAndOrg_NoRowIsNullopt) {
    EXPECT_FALSE(repository_.findByIdAndOrg("id-1", "org").has_value());

    const auto& call = executor_.log().last("query");
    EXPECT_NE(call.sql.find("WHERE id = $1 AND organization = $2"), std::string::npos);
    std::vector<std::string> expected = {"id-1", "org"};
    EXPECT_EQ(call.params, expected);
}

TEST_F(AssetRepositoryTest, FindAll_OrdersWithIdTiebreakAndWindows) {
    executor_.log().queryResults.push_back(rows({assetRow("a", "Alpha"), assetRow("b", "Beta")}));

    auto assets = repository_.findAll(20, 10, OrderType::Descending, AssetSortField::CreatedAt);
    ASSERT_EQ(assets.size(), 2u);
    EXPECT_EQ(assets[1].id, "b");

    const auto& sql = executor_.log().last("query").sql;
    EXPECT_NE(sql.find(" ORDER BY created_at DESC, id DESC LIMIT 10 OFFSET 20"), std::string::npos);
}

TEST_F(AssetRepositoryTest, Search_EscapesWildcardsInTerm) {
    repository_.search(AssetSearchField::Symbol, "50%_off", 0, 5, OrderType::Ascending);

    const auto& call = executor_.log().last("query");
    EXPECT_NE(call.sql.find("WHERE symbol ILIKE $1 ESCAPE '\\'"), std::string::npos);
    EXPECT_NE(call.sql.find("ORDER BY symbol ASC, id ASC"), std::string::npos);
    ASSERT_EQ(call.params.size(), 1u);
    EXPECT_EQ(call.params[0], "%50\\%\\_off%");
}

TEST_F(AssetRepositoryTest, FindByOwner_FiltersOnFingerprint) {
    repository_.findByOwner("fp-owner", 0, 25, OrderType::Ascending);

    const auto& call = executor_.log().last("query");
    EXPECT_NE(call.sql.find("WHERE owner_fp = $1"), std::string::npos);
    EXPECT_NE(call.sql.find("LIMIT 25 OFFSET 0"), std::string::npos);
    EXPECT_EQ(call.params, std::vector<std::string>{"fp-owner"});
}

TEST_F(AssetRepositoryTest, Count_ParsesScalar) {
    executor_.log().scalarResults.push_back(Json::Value("42"));
    EXPECT_EQ(repository_.count(), 42);
}

TEST_F(AssetRepositoryTest, StorageErrorPropagates) {
    executor_.log().onStatement = [](const test_fakes::RecordedCall&) {
        throw common::StorageUnavailableException("connection lost");
    };
    EXPECT_THROW(repository_.findById("id-1"), common::StorageUnavailableException);
    EXPECT_THROW(repository_.remove("id-1"), common::StorageUnavailableException);
}
