#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/CheckRegistry.h"
#include "../src/core/Errors.h"

namespace cloud_audit {

using ::testing::ElementsAre;
using ::testing::Contains;

TEST(CheckCatalogTest, ParsesServiceMap) {
    auto cat = CheckCatalog::parse(R"({"services":{"backup":["backup_plans_exist","backup_vaults_exist"],"s3":["s3_bucket_public_access"]}})");
    EXPECT_THAT(cat.list_checks_for_service("s3"), ElementsAre("s3_bucket_public_access"));
    EXPECT_THAT(cat.list_checks_for_service("backup"), ElementsAre("backup_plans_exist", "backup_vaults_exist"));
}

TEST(CheckCatalogTest, UnknownServiceThrowsCheckNotFound) {
    CheckCatalog cat(std::map<std::string, std::vector<std::string>>{{"s3", {"s3_bucket_public_access"}}});
    EXPECT_THROW(cat.list_checks_for_service("dynamodb"), CheckNotFound);
}

TEST(CheckCatalogTest, ChecksForServicesSkipsUnknown) {
    CheckCatalog cat({{"s3", {"s3_a", "s3_b"}}, {"kms", {"kms_a"}}});
    auto out = cat.checks_for_services({"s3", "nope"});
    EXPECT_THAT(out, ElementsAre("s3_a", "s3_b"));
}

TEST(CheckCatalogTest, RejectsMalformedDocuments) {
    EXPECT_THROW(CheckCatalog::parse("{"), CatalogError);
    EXPECT_THROW(CheckCatalog::parse(R"({"checks":{}})"), CatalogError);
    EXPECT_THROW(CheckCatalog::parse(R"({"services":{"s3":"s3_a"}})"), CatalogError);
    EXPECT_THROW(CheckCatalog::parse(R"({"services":{"s3":[1]}})"), CatalogError);
}

TEST(CheckCatalogTest, MissingFileThrows) {
    EXPECT_THROW(CheckCatalog::load("/nonexistent/checks.json"), CatalogError);
}

TEST(CheckCatalogTest, PackagedCatalogLoads) {
    auto cat = CheckCatalog::load(std::string(CLOUD_AUDIT_TEST_DATA_DIR) + "/checks.json");
    EXPECT_THAT(cat.list_checks_for_service("backup"), Contains("backup_vaults_exist"));
    EXPECT_THAT(cat.list_checks_for_service("iam"), Contains("iam_policy_no_administrative_privileges"));
    EXPECT_THROW(cat.list_checks_for_service("lambda"), CheckNotFound); // catalog uses awslambda
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
