#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockCommandRunner.h"
#include "../src/core/Config.h"
#include "../src/core/Logging.h"
#include "../src/collectors/ActiveUsersCollector.h"
#include "../src/collectors/LastLoginsCollector.h"
#include "../src/collectors/ListeningPortsCollector.h"
#include "../src/collectors/CloudMetadataCollector.h"
#include <memory>
#include <stdexcept>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

namespace host_audit {

class CollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        context = std::make_unique<AuditContext>(cfg, runner);
    }

    Config cfg;
    ::testing::StrictMock<MockCommandRunner> runner;
    std::unique_ptr<AuditContext> context;
};

TEST_F(CollectorTest, ActiveUsersReportsOutputVerbatim) {
    EXPECT_CALL(runner, execute(ElementsAre("who"), _))
        .WillOnce(Return(CommandResult::success("alice    pts/0        2024-03-05 07:08 (10.0.0.2)")));
    ActiveUsersCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->header, "--- Active Users ---");
    EXPECT_EQ(s->body, "alice    pts/0        2024-03-05 07:08 (10.0.0.2)");
}

TEST_F(CollectorTest, ActiveUsersEmptyIsPositiveFinding) {
    EXPECT_CALL(runner, execute(ElementsAre("who"), _)).WillOnce(Return(CommandResult::success("")));
    ActiveUsersCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->body, "No active users found.");
}

TEST_F(CollectorTest, ActiveUsersFailureIsAbsentAndLogged) {
    EXPECT_CALL(runner, execute(ElementsAre("who"), _)).WillOnce(Return(CommandResult::failed(make_not_found({"who"}))));
    ActiveUsersCollector c;
    testing::internal::CaptureStderr();
    auto s = c.collect(*context);
    std::string diag = testing::internal::GetCapturedStderr();
    EXPECT_FALSE(s.has_value());
    EXPECT_NE(diag.find("Command not found: 'who'"), std::string::npos);
}

TEST_F(CollectorTest, LastLoginsUsesConfiguredCount) {
    EXPECT_CALL(runner, execute(ElementsAre("last", "-n", "10"), _))
        .WillOnce(Return(CommandResult::success("root pts/0 10.0.0.1 Mon Mar  4 10:00 still logged in")));
    LastLoginsCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->header, "--- Last 10 Logins ---");
    EXPECT_EQ(s->body, "root pts/0 10.0.0.1 Mon Mar  4 10:00 still logged in");
}

TEST_F(CollectorTest, LastLoginsEmptyAndFailureDiffer) {
    EXPECT_CALL(runner, execute(_, _))
        .WillOnce(Return(CommandResult::success("")))
        .WillOnce(Return(CommandResult::failed(make_non_zero_exit({"last", "-n", "10"}, "last: cannot open /var/log/wtmp", 1))));
    LastLoginsCollector c;
    auto empty = c.collect(*context);
    testing::internal::CaptureStderr();
    auto failed = c.collect(*context);
    testing::internal::GetCapturedStderr();
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->body, "No login history found.");
    EXPECT_FALSE(failed.has_value());
}

TEST_F(CollectorTest, LastLoginsCommandFollowsConfig) {
    cfg.last_login_count = 25;
    EXPECT_THAT(LastLoginsCollector::command(cfg), ElementsAre("last", "-n", "25"));
    EXPECT_EQ(LastLoginsCollector::header(cfg), "--- Last 25 Logins ---");
}

TEST_F(CollectorTest, ListeningPortsRendersParsedRecords) {
    EXPECT_CALL(runner, execute(ElementsAre("ss", "-tulnp"), _))
        .WillOnce(Return(CommandResult::success(
            "Netid State  Recv-Q Send-Q Local Address:Port Peer Address:Port Process\n"
            "tcp   LISTEN 0      128    0.0.0.0:22         0.0.0.0:*         users:((\"sshd\",pid=1,fd=3))\n"
            "udp   UNCONN 0      0      127.0.0.1:323      0.0.0.0:*")));
    ListeningPortsCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->header, "--- Listening Ports ---");
    EXPECT_EQ(s->body, "0.0.0.0:22 (sshd)\n127.0.0.1:323 (N/A)");
}

TEST_F(CollectorTest, ListeningPortsHeaderOnlyIsNoneFound) {
    EXPECT_CALL(runner, execute(_, _))
        .WillOnce(Return(CommandResult::success("Netid State Recv-Q Send-Q Local Address:Port Peer Address:Port Process")));
    ListeningPortsCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->body, "No listening ports found.");
}

TEST_F(CollectorTest, ListeningPortsEmptyIsNoneFound) {
    EXPECT_CALL(runner, execute(_, _)).WillOnce(Return(CommandResult::success("")));
    ListeningPortsCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->body, "No listening ports found.");
}

TEST_F(CollectorTest, ListeningPortsFailureIsAbsent) {
    EXPECT_CALL(runner, execute(_, _)).WillOnce(Return(CommandResult::failed(make_timeout({"ss", "-tulnp"}))));
    ListeningPortsCollector c;
    testing::internal::CaptureStderr();
    auto s = c.collect(*context);
    std::string diag = testing::internal::GetCapturedStderr();
    EXPECT_FALSE(s.has_value());
    EXPECT_NE(diag.find("Command timed out: 'ss -tulnp'"), std::string::npos);
}

TEST_F(CollectorTest, CloudMetadataCommandLine) {
    auto cmd = CloudMetadataCollector::command(cfg);
    EXPECT_THAT(cmd, ElementsAre("curl", "-s", "--connect-timeout", "1", "--max-time", "2",
                                 "http://169.254.169.254/latest/meta-data/"));
}

TEST_F(CollectorTest, CloudMetadataReachable) {
    EXPECT_CALL(runner, execute(_, _)).WillOnce(Return(CommandResult::success("ami-id\nhostname\ninstance-id")));
    CloudMetadataCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->header, "--- Cloud Metadata Check ---");
    EXPECT_EQ(s->body, "Metadata service reachable: likely a cloud instance.");
}

TEST_F(CollectorTest, CloudMetadataEmptyResponseIsNegative) {
    EXPECT_CALL(runner, execute(_, _)).WillOnce(Return(CommandResult::success("")));
    CloudMetadataCollector c;
    auto s = c.collect(*context);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->body, "Metadata service not reachable: likely not a cloud instance.");
}

TEST_F(CollectorTest, CloudMetadataFailureIsSilentNegative) {
    EXPECT_CALL(runner, execute(_, _))
        .WillOnce(Return(CommandResult::failed(make_non_zero_exit(CloudMetadataCollector::command(cfg), "", 28))));
    CloudMetadataCollector c;
    testing::internal::CaptureStderr();
    auto s = c.collect(*context);
    std::string diag = testing::internal::GetCapturedStderr();
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->body, "Metadata service not reachable: likely not a cloud instance.");
    EXPECT_EQ(diag.find("[ERROR]"), std::string::npos);
}

TEST_F(CollectorTest, CloudMetadataFailureKindGoesToDebugLog) {
    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_CALL(runner, execute(_, _))
        .WillOnce(Return(CommandResult::failed(make_timeout(CloudMetadataCollector::command(cfg)))));
    CloudMetadataCollector c;
    testing::internal::CaptureStderr();
    auto s = c.collect(*context);
    std::string diag = testing::internal::GetCapturedStderr();
    Logger::instance().set_level(LogLevel::Info);
    ASSERT_TRUE(s.has_value());
    EXPECT_NE(diag.find("[DEBUG] metadata probe failed (timeout)"), std::string::npos);
    EXPECT_EQ(diag.find("[ERROR]"), std::string::npos);
}

TEST_F(CollectorTest, RunnerDefaultTimeoutReachesExecute) {
    EXPECT_CALL(runner, execute(ElementsAre("who"), std::chrono::milliseconds(std::chrono::seconds(10))))
        .WillOnce(Return(CommandResult::success("")));
    ActiveUsersCollector c;
    c.collect(*context);
}

TEST_F(CollectorTest, RunCatchesExceptionsFromExecute) {
    EXPECT_CALL(runner, execute(_, _)).WillOnce(::testing::Throw(std::runtime_error("spawn exploded")));
    testing::internal::CaptureStderr();
    auto r = runner.run({"who"});
    testing::internal::GetCapturedStderr();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure().kind, FailureKind::NotFound);
}

TEST(TextSectionTest, MapsResultToSection) {
    EXPECT_FALSE(text_section(CommandResult::failed(make_not_found({"x"})), "h", "none").has_value());
    auto empty = text_section(CommandResult::success(""), "h", "none");
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->body, "none");
    auto full = text_section(CommandResult::success("data"), "h", "none");
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->header, "h");
    EXPECT_EQ(full->body, "data");
}

} // namespace host_audit
