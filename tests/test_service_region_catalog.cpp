#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ServiceRegionCatalog.h"
#include "../src/core/Errors.h"
#include <algorithm>

namespace cloud_audit {

using ::testing::ElementsAre;
using ::testing::Contains;
using ::testing::Not;

static const char* kSmallCatalog = R"({
  "services": {
    "backup": {"regions": {"aws": ["eu-west-1", "us-east-1"], "aws-cn": ["cn-north-1"]}},
    "iam":    {"regions": {"aws": ["us-east-1"]}}
  }
})";

TEST(ServiceRegionCatalogTest, LookupByServiceAndPartition) {
    auto cat = ServiceRegionCatalog::parse(kSmallCatalog);
    const auto* r = cat.regions("backup", "aws");
    ASSERT_NE(r, nullptr);
    EXPECT_THAT(*r, ElementsAre("eu-west-1", "us-east-1"));
    EXPECT_TRUE(cat.has_service("iam"));
}

TEST(ServiceRegionCatalogTest, MissesReturnNull) {
    auto cat = ServiceRegionCatalog::parse(kSmallCatalog);
    EXPECT_EQ(cat.regions("dynamodb", "aws"), nullptr);
    EXPECT_EQ(cat.regions("iam", "aws-us-gov"), nullptr);
    EXPECT_FALSE(cat.has_service("dynamodb"));
}

TEST(ServiceRegionCatalogTest, AllRegionsSortedAndUnique) {
    auto cat = ServiceRegionCatalog::parse(kSmallCatalog);
    EXPECT_THAT(cat.all_regions(), ElementsAre("cn-north-1", "eu-west-1", "us-east-1"));
}

TEST(ServiceRegionCatalogTest, ParsedCatalogHasNoDigest) {
    auto cat = ServiceRegionCatalog::parse(kSmallCatalog);
    EXPECT_TRUE(cat.digest().empty());
    EXPECT_TRUE(cat.source().empty());
}

TEST(ServiceRegionCatalogTest, RejectsMalformedDocuments) {
    EXPECT_THROW(ServiceRegionCatalog::parse("not json"), CatalogError);
    EXPECT_THROW(ServiceRegionCatalog::parse(R"({"services":[]})"), CatalogError);
    EXPECT_THROW(ServiceRegionCatalog::parse(R"({"services":{"s3":{}}})"), CatalogError);
    EXPECT_THROW(ServiceRegionCatalog::parse(R"({"services":{"s3":{"regions":{"aws":"us-east-1"}}}})"), CatalogError);
    EXPECT_THROW(ServiceRegionCatalog::parse(R"({"services":{"s3":{"regions":{"aws":[7]}}}})"), CatalogError);
}

TEST(ServiceRegionCatalogTest, MissingFileThrows) {
    EXPECT_THROW(ServiceRegionCatalog::load("/nonexistent/regions.json"), CatalogError);
}

TEST(ServiceRegionCatalogTest, PackagedCatalog) {
    auto cat = ServiceRegionCatalog::load(std::string(CLOUD_AUDIT_TEST_DATA_DIR) + "/aws_regions_by_service.json");
    EXPECT_EQ(cat.digest().size(), 64u);
    const auto* backup = cat.regions("backup", "aws");
    ASSERT_NE(backup, nullptr);
    EXPECT_THAT(*backup, Contains("eu-west-1"));
    EXPECT_THAT(*backup, Not(Contains("cn-north-1")));
    const auto* iam = cat.regions("iam", "aws");
    ASSERT_NE(iam, nullptr);
    EXPECT_THAT(*iam, ElementsAre("us-east-1"));
    auto all = cat.all_regions();
    EXPECT_TRUE(std::is_sorted(all.begin(), all.end()));
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
}

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
