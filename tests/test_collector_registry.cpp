#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/CollectorRegistry.h"
#include "../src/core/Config.h"
#include "../src/core/Report.h"
#include "../src/collectors/BackupCollector.h"
#include <sstream>
#include <memory>
#include <string>
#include <vector>

namespace cloud_audit {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockCollector : public Collector {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, description, (), (const, override));
    MOCK_METHOD(void, collect, (Report& report), (override));
    MOCK_METHOD(std::size_t, resource_count, (), (const, override));
    MOCK_METHOD(nlohmann::json, inventory, (), (const, override));
};

class EmptyBackupApi : public BackupApi {
public:
    Page<BackupVaultSummary> list_backup_vaults(const std::optional<std::string>&) override { return {}; }
    Page<BackupPlanSummary> list_backup_plans(const std::optional<std::string>&) override { return {}; }
    Page<ReportPlanSummary> list_report_plans(const std::optional<std::string>&) override { return {}; }
};

class CollectorRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config cfg;
        cfg.parallel = false;
        set_config(cfg);
        Logger::instance().set_sink(&log);
        catalog = ServiceRegionCatalog::parse(R"({"services":{"backup":{"regions":{"aws":["eu-west-1","us-east-1"]}}}})");
        session.credentials = std::make_shared<StaticCredentialProvider>(Credentials{});
    }
    void TearDown() override {
        set_config(Config{});
        Logger::instance().set_sink(nullptr);
    }

    std::unique_ptr<MockCollector> mock(const std::string& name, std::size_t count = 0) {
        auto c = std::make_unique<NiceMock<MockCollector>>();
        ON_CALL(*c, name()).WillByDefault(Return(name));
        ON_CALL(*c, description()).WillByDefault(Return("Mock " + name));
        ON_CALL(*c, resource_count()).WillByDefault(Return(count));
        ON_CALL(*c, inventory()).WillByDefault(Return(nlohmann::json::object()));
        return c;
    }

    ProviderClients backup_clients() {
        ProviderClients pc;
        pc.backup = [](const Session&, const std::string&) { return std::make_unique<EmptyBackupApi>(); };
        return pc;
    }

    Report report;
    ServiceRegionCatalog catalog;
    Session session;
    AuditInfo audit;
    std::ostringstream log;
};

TEST_F(CollectorRegistryTest, RunsEveryRegisteredCollector) {
    CollectorRegistry registry;
    for(int i = 0; i < 3; ++i) {
        auto c = mock("svc" + std::to_string(i), i);
        EXPECT_CALL(*c, collect(_)).Times(1);
        registry.register_collector(std::move(c));
    }
    registry.run_all(report);

    auto runs = report.results();
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].collector_name, "svc0");
    EXPECT_EQ(runs[2].resources, 2u);
    EXPECT_LE(runs[1].start_time, runs[1].end_time);
}

TEST_F(CollectorRegistryTest, RunsInParallel) {
    Config cfg;
    cfg.parallel = true;
    set_config(cfg);

    CollectorRegistry registry;
    for(const char* n : {"a", "b", "c", "d"}) {
        auto c = mock(n);
        EXPECT_CALL(*c, collect(_)).Times(1);
        registry.register_collector(std::move(c));
    }
    registry.run_all(report);
    EXPECT_EQ(report.results().size(), 4u);
}

TEST_F(CollectorRegistryTest, HonoursServiceSelection) {
    Config cfg;
    cfg.parallel = false;
    cfg.services = {"a", "b"};
    cfg.excluded_services = {"b"};
    set_config(cfg);

    CollectorRegistry registry;
    auto a = mock("a");
    auto b = mock("b");
    auto c = mock("c");
    EXPECT_CALL(*a, collect(_)).Times(1);
    EXPECT_CALL(*b, collect(_)).Times(0);
    EXPECT_CALL(*c, collect(_)).Times(0);
    registry.register_collector(std::move(a));
    registry.register_collector(std::move(b));
    registry.register_collector(std::move(c));
    registry.run_all(report);

    ASSERT_EQ(report.results().size(), 1u);
    EXPECT_EQ(report.results()[0].collector_name, "a");
}

TEST_F(CollectorRegistryTest, CollectorExceptionBecomesFailure) {
    CollectorRegistry registry;
    auto bad = mock("bad");
    auto good = mock("good", 4);
    EXPECT_CALL(*bad, collect(_)).WillOnce(Throw(ProviderError("ThrottlingException", "rate exceeded")));
    EXPECT_CALL(*good, collect(_)).Times(1);
    registry.register_collector(std::move(bad));
    registry.register_collector(std::move(good));
    registry.run_all(report);

    auto failures = report.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].collector, "bad");
    EXPECT_EQ(failures[0].operation, "collect");
    EXPECT_EQ(failures[0].error_class, "ThrottlingException");
    ASSERT_EQ(report.results().size(), 2u);
    EXPECT_EQ(report.results()[1].resources, 4u);
}

TEST_F(CollectorRegistryTest, DefaultRegistrationBuildsBackupCollector) {
    audit.profile_region = "us-east-1";
    RegionalClientFactory factory(catalog, session, audit);
    CollectorRegistry registry;
    registry.register_all_default(factory, backup_clients());

    auto collectors = registry.collectors();
    ASSERT_EQ(collectors.size(), 1u);
    EXPECT_EQ(collectors[0]->name(), "backup");
    auto* backup = dynamic_cast<const BackupCollector*>(collectors[0]);
    ASSERT_NE(backup, nullptr);
    EXPECT_EQ(backup->regional_clients().size(), 2u);
    EXPECT_EQ(backup->region(), "us-east-1");

    registry.run_all(report);
    EXPECT_TRUE(report.failures().empty());
    ASSERT_EQ(report.results().size(), 1u);
    EXPECT_EQ(report.results()[0].resources, 0u);
}

TEST_F(CollectorRegistryTest, ScopedRegistrationSkipsUnlistedServices) {
    RegionalClientFactory factory(catalog, session, audit);
    CollectorRegistry registry;
    registry.register_all_default(factory, backup_clients(), std::set<std::string>{"awslambda"});
    EXPECT_TRUE(registry.collectors().empty());

    CollectorRegistry scoped;
    scoped.register_all_default(factory, backup_clients(), std::set<std::string>{"backup"});
    EXPECT_EQ(scoped.collectors().size(), 1u);
}

TEST_F(CollectorRegistryTest, MissingClientMakerSkipsService) {
    RegionalClientFactory factory(catalog, session, audit);
    CollectorRegistry registry;
    registry.register_all_default(factory, ProviderClients{});
    EXPECT_TRUE(registry.collectors().empty());
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
