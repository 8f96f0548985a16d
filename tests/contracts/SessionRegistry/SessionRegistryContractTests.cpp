#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>
#include <vector>

#include "BaseContractTest.h"
#include "fixtures/RecordingResponder.h"
#include "mirrorcast/common/Identifiers.h"
#include "mirrorcast/control/SessionRegistry.h"
#include "../ContractRegistryEnvironment.h"

namespace mirrorcast::tests::contracts {

using mirrorcast::tests::RegisterExpectedDomainCoverage;
using control::HandshakeDisposition;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("SessionRegistry",
                                 {"SESS_001", "SESS_002", "SESS_003", "SESS_004", "SESS_005"});
  return true;
}();

namespace {

constexpr int64_t kNow = 1'700'000'000'000'000LL;

}  // namespace

class SessionRegistryContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "SessionRegistry"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"SESS_001", "SESS_002", "SESS_003", "SESS_004", "SESS_005"};
  }

  fixtures::RecordingResponder responder_;
};

TEST_F(SessionRegistryContractTest, SESS_001_AutoAcceptCreatesOneSessionPerConnection) {
  control::SessionRegistry registry(&responder_, /*auto_accept=*/true);

  const auto outcome = registry.OnHandshake(1, "1234", "10.0.0.5:40000", kNow);
  EXPECT_EQ(outcome.disposition, HandshakeDisposition::kAccepted);
  ASSERT_EQ(registry.Sessions().size(), 1u);
  EXPECT_TRUE(registry.PendingPairs().empty());
  EXPECT_EQ(registry.Sessions()[0].id, outcome.id);
  EXPECT_EQ(registry.Sessions()[0].remote_description, "10.0.0.5:40000");
  EXPECT_EQ(registry.Sessions()[0].started_utc_us, kNow);

  // A second handshake on the paired connection is re-acknowledged.
  const auto again = registry.OnHandshake(1, "1234", "10.0.0.5:40000", kNow + 1);
  EXPECT_EQ(again.disposition, HandshakeDisposition::kAlreadyPaired);
  EXPECT_EQ(again.id, outcome.id);
  EXPECT_EQ(registry.Sessions().size(), 1u);

  const auto replies = responder_.replies();
  ASSERT_EQ(replies.size(), 2u);
  EXPECT_TRUE(replies[0].accepted);
  EXPECT_EQ(replies[0].session_id, outcome.id);
  EXPECT_TRUE(replies[1].accepted);
  EXPECT_EQ(replies[1].message, "Already paired");

  // Multiple viewers may pair concurrently.
  registry.OnHandshake(2, "5678", "10.0.0.6:40000", kNow);
  EXPECT_EQ(registry.Sessions().size(), 2u);
}

TEST_F(SessionRegistryContractTest, SESS_002_ManualModeQueuesAndAccepts) {
  control::SessionRegistry registry(&responder_);

  const auto outcome = registry.OnHandshake(7, "0420", "10.0.0.9:1234", kNow);
  EXPECT_EQ(outcome.disposition, HandshakeDisposition::kPending);
  EXPECT_TRUE(registry.Sessions().empty());
  ASSERT_EQ(registry.PendingPairs().size(), 1u);
  const auto pending = registry.PendingPairs()[0];
  EXPECT_EQ(pending.id, outcome.id);
  EXPECT_EQ(pending.code, "0420");
  EXPECT_EQ(pending.connection_id, 7u);
  EXPECT_TRUE(responder_.replies().empty());

  // A repeated handshake replaces the earlier row.
  const auto replaced = registry.OnHandshake(7, "0421", "10.0.0.9:1234", kNow + 5);
  ASSERT_EQ(registry.PendingPairs().size(), 1u);
  EXPECT_EQ(registry.PendingPairs()[0].code, "0421");
  EXPECT_FALSE(registry.Accept(outcome.id, kNow + 10).has_value());

  const auto session = registry.Accept(replaced.id, kNow + 10);
  ASSERT_TRUE(session.has_value());
  EXPECT_EQ(session->connection_id, 7u);
  EXPECT_TRUE(registry.PendingPairs().empty());
  EXPECT_TRUE(registry.HasSession(7));

  const auto replies = responder_.replies();
  ASSERT_EQ(replies.size(), 1u);
  EXPECT_TRUE(replies[0].accepted);
  EXPECT_EQ(replies[0].session_id, session->id);
}

TEST_F(SessionRegistryContractTest, SESS_003_DeclineRemovesPendingAndReplies) {
  control::SessionRegistry registry(&responder_);
  const auto outcome = registry.OnHandshake(3, "9999", "peer", kNow);

  EXPECT_FALSE(registry.Decline("no-such-id"));
  EXPECT_TRUE(registry.Decline(outcome.id));
  EXPECT_FALSE(registry.Decline(outcome.id));
  EXPECT_TRUE(registry.PendingPairs().empty());
  EXPECT_TRUE(registry.Sessions().empty());

  const auto replies = responder_.replies();
  ASSERT_EQ(replies.size(), 1u);
  EXPECT_FALSE(replies[0].accepted);
  EXPECT_EQ(replies[0].connection_id, 3u);
  EXPECT_EQ(replies[0].message, "Declined");
}

TEST_F(SessionRegistryContractTest, SESS_004_ClosingConnectionRemovesWhatItOwns) {
  control::SessionRegistry registry(&responder_);
  const auto pending = registry.OnHandshake(1, "1111", "a", kNow);
  registry.SetAutoAccept(true);
  EXPECT_TRUE(registry.auto_accept());
  const auto paired = registry.OnHandshake(2, "2222", "b", kNow);

  const auto closed_pending = registry.OnConnectionClosed(1);
  EXPECT_EQ(closed_pending.removed_pending_id.value_or(""), pending.id);
  EXPECT_FALSE(closed_pending.removed_session_id.has_value());

  const auto closed_session = registry.OnConnectionClosed(2);
  EXPECT_EQ(closed_session.removed_session_id.value_or(""), paired.id);
  EXPECT_FALSE(registry.SessionForConnection(2).has_value());

  const auto closed_unknown = registry.OnConnectionClosed(99);
  EXPECT_FALSE(closed_unknown.removed_pending_id.has_value());
  EXPECT_FALSE(closed_unknown.removed_session_id.has_value());

  EXPECT_TRUE(registry.PendingPairs().empty());
  EXPECT_TRUE(registry.Sessions().empty());
}

TEST_F(SessionRegistryContractTest, SESS_005_IdentifiersAreUuidsAndDigitCodes) {
  const std::regex uuid_v4(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const std::string id = GenerateUuidV4();
    EXPECT_TRUE(std::regex_match(id, uuid_v4)) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 64u);

  for (int i = 0; i < 64; ++i) {
    const std::string code = GeneratePairingCode();
    EXPECT_EQ(code.size(), kDefaultPairingCodeLength);
    EXPECT_TRUE(IsValidPairingCode(code)) << code;
  }
  EXPECT_TRUE(IsValidPairingCode("0042"));
  EXPECT_FALSE(IsValidPairingCode("042"));
  EXPECT_FALSE(IsValidPairingCode("00420"));
  EXPECT_FALSE(IsValidPairingCode("12a4"));
  EXPECT_TRUE(IsValidPairingCode("123456", 6));
}

}  // namespace mirrorcast::tests::contracts
