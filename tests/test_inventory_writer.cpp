#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/InventoryWriter.h"
#include <nlohmann/json.hpp>

namespace cloud_audit {

class StubCollector : public Collector {
public:
    std::string name() const override { return "backup"; }
    std::string description() const override { return "stub"; }
    void collect(Report&) override {}
    std::size_t resource_count() const override { return 1; }
    nlohmann::json inventory() const override {
        nlohmann::json vault = {{"arn", "arn:aws:backup:us-east-1:123456789012:backup-vault:main"}};
        return {{"backup_vaults", nlohmann::json::array({vault})}};
    }
};

class InventoryWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        audit.audited_account = "123456789012";
        audit.audited_regions = {"us-east-1"};
        meta.tool_version = "0.3.0";
        meta.catalog_digest = "abc123";
    }

    nlohmann::json render(bool pretty = false) {
        std::vector<const Collector*> collectors = {&collector};
        std::string out = writer.write(report, collectors, audit, meta, pretty);
        EXPECT_FALSE(out.empty());
        EXPECT_EQ(out.back(), '\n');
        return nlohmann::json::parse(out);
    }

    InventoryWriter writer;
    StubCollector collector;
    Report report;
    AuditInfo audit;
    InventoryMeta meta;
};

TEST_F(InventoryWriterTest, MetaDescribesTheAudit) {
    auto doc = render();
    const auto& m = doc["meta"];
    EXPECT_EQ(m["tool_version"], "0.3.0");
    EXPECT_EQ(m["account"], "123456789012");
    EXPECT_EQ(m["partition"], "aws");
    EXPECT_EQ(m["regions"], nlohmann::json::array({"us-east-1"}));
    EXPECT_EQ(m["catalog_sha256"], "abc123");
    EXPECT_TRUE(m["assumed_role"].is_null());
    EXPECT_FALSE(m.contains("selected_checks"));
    EXPECT_EQ(m["generated_at"].get<std::string>().back(), 'Z');
}

TEST_F(InventoryWriterTest, AssumedRoleAndSelectedChecks) {
    AssumedRoleInfo role;
    role.role_arn = "arn:aws:iam::123456789012:role/Audit";
    audit.assumed_role_info = role;
    meta.selected_checks = {"backup_vaults_exist"};
    auto doc = render();
    EXPECT_EQ(doc["meta"]["assumed_role"], "arn:aws:iam::123456789012:role/Audit");
    EXPECT_EQ(doc["meta"]["selected_checks"], nlohmann::json::array({"backup_vaults_exist"}));
}

TEST_F(InventoryWriterTest, CollectorRunsCarryInventory) {
    report.start_collector("backup");
    report.end_collector("backup", 1);
    auto doc = render();
    ASSERT_EQ(doc["collectors"].size(), 1u);
    const auto& run = doc["collectors"][0];
    EXPECT_EQ(run["collector"], "backup");
    EXPECT_EQ(run["resources"], 1);
    EXPECT_EQ(run["inventory"]["backup_vaults"][0]["arn"], "arn:aws:backup:us-east-1:123456789012:backup-vault:main");
}

TEST_F(InventoryWriterTest, FailuresAreListed) {
    report.add_failure(CollectionFailure{"backup", "eu-west-1", "list_backup_vaults", "AccessDeniedException", "denied"});
    auto doc = render();
    ASSERT_EQ(doc["errors"].size(), 1u);
    EXPECT_EQ(doc["errors"][0]["region"], "eu-west-1");
    EXPECT_EQ(doc["errors"][0]["operation"], "list_backup_vaults");
    EXPECT_EQ(doc["errors"][0]["error_class"], "AccessDeniedException");
    EXPECT_EQ(doc["errors"][0]["message"], "denied");
}

TEST_F(InventoryWriterTest, EmptyReportHasEmptyArrays) {
    auto doc = render();
    EXPECT_TRUE(doc["collectors"].is_array());
    EXPECT_TRUE(doc["collectors"].empty());
    EXPECT_TRUE(doc["errors"].empty());
}

TEST_F(InventoryWriterTest, TopLevelSections) {
    auto doc = render();
    std::vector<std::string> keys;
    for(auto it = doc.begin(); it != doc.end(); ++it) keys.push_back(it.key());
    EXPECT_THAT(keys, ::testing::ElementsAre("collectors", "errors", "meta"));
}

TEST_F(InventoryWriterTest, PrettyOutputIsIndented) {
    std::vector<const Collector*> collectors;
    std::string compact = writer.write(report, collectors, audit, meta, false);
    std::string pretty = writer.write(report, collectors, audit, meta, true);
    EXPECT_EQ(compact.find("\n  "), std::string::npos);
    EXPECT_NE(pretty.find("\n  \""), std::string::npos);
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
