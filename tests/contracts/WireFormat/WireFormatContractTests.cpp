#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "BaseContractTest.h"
#include "mirrorcast/wire/WireHeader.h"
#include "../ContractRegistryEnvironment.h"

namespace mirrorcast::tests::contracts {

using mirrorcast::tests::RegisterExpectedDomainCoverage;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("WireFormat",
                                 {"WIRE_001", "WIRE_002", "WIRE_003", "WIRE_004", "WIRE_005"});
  return true;
}();

namespace {

wire::WireHeader SampleHeader() {
  wire::WireHeader header;
  header.seq = 0xA1B2C3D4u;
  header.part_index = 0;
  header.part_count = 3;
  header.flags = wire::kFlagKeyframe | wire::kFlagHasParamSet;
  header.width = 1920;
  header.height = 1080;
  header.config_bytes = 4;
  return header;
}

}  // namespace

class WireFormatContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "WireFormat"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"WIRE_001", "WIRE_002", "WIRE_003", "WIRE_004", "WIRE_005"};
  }
};

TEST_F(WireFormatContractTest, WIRE_001_HeaderLayoutIsBigEndianTwentyBytes) {
  std::vector<uint8_t> out;
  wire::EncodeHeader(SampleHeader(), out);

  ASSERT_EQ(out.size(), wire::kWireHeaderBytes);
  const std::vector<uint8_t> expected = {
      0x4D, 0x43, 0x52, 0x56,  // 'MCRV'
      0xA1, 0xB2, 0xC3, 0xD4,  // seq
      0x00, 0x00,              // part index
      0x00, 0x03,              // part count
      0x00, 0x03,              // flags
      0x07, 0x80,              // width
      0x04, 0x38,              // height
      0x00, 0x04,              // config bytes
  };
  EXPECT_EQ(out, expected);

  // Room for the declared config blob.
  out.insert(out.end(), {0, 0, 0, 0});
  const auto decoded = wire::DecodeHeader(out.data(), out.size());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, SampleHeader());
  EXPECT_TRUE(decoded->is_keyframe());
  EXPECT_TRUE(decoded->has_param_set());
}

TEST_F(WireFormatContractTest, WIRE_002_MalformedHeadersAreRejected) {
  std::vector<uint8_t> good;
  wire::WireHeader header = SampleHeader();
  header.flags = 0;
  header.config_bytes = 0;
  wire::EncodeHeader(header, good);
  ASSERT_TRUE(wire::DecodeHeader(good.data(), good.size()).has_value());

  // Shorter than the header.
  EXPECT_FALSE(wire::DecodeHeader(good.data(), good.size() - 1).has_value());
  EXPECT_FALSE(wire::DecodeHeader(nullptr, 0).has_value());

  // Wrong magic.
  std::vector<uint8_t> bad_magic = good;
  bad_magic[3] = 0x57;
  EXPECT_FALSE(wire::DecodeHeader(bad_magic.data(), bad_magic.size()).has_value());

  // Keepalive text is never a header.
  const std::vector<uint8_t> hello = {'M', 'C', 'H', 'I', '!'};
  EXPECT_FALSE(wire::DecodeHeader(hello.data(), hello.size()).has_value());
}

TEST_F(WireFormatContractTest, WIRE_003_PartAndConfigFieldsMustBeConsistent) {
  auto encode = [](const wire::WireHeader& h) {
    std::vector<uint8_t> out;
    wire::EncodeHeader(h, out);
    out.resize(out.size() + 64, 0);
    return out;
  };

  wire::WireHeader zero_parts = SampleHeader();
  zero_parts.part_count = 0;
  auto bytes = encode(zero_parts);
  EXPECT_FALSE(wire::DecodeHeader(bytes.data(), bytes.size()).has_value());

  wire::WireHeader index_past_count = SampleHeader();
  index_past_count.part_index = 3;
  index_past_count.config_bytes = 0;
  bytes = encode(index_past_count);
  EXPECT_FALSE(wire::DecodeHeader(bytes.data(), bytes.size()).has_value());

  // Config bytes on a later part.
  wire::WireHeader config_on_later_part = SampleHeader();
  config_on_later_part.part_index = 1;
  bytes = encode(config_on_later_part);
  EXPECT_FALSE(wire::DecodeHeader(bytes.data(), bytes.size()).has_value());

  // Config bytes without the hasParamSet flag.
  wire::WireHeader config_without_flag = SampleHeader();
  config_without_flag.flags = wire::kFlagKeyframe;
  bytes = encode(config_without_flag);
  EXPECT_FALSE(wire::DecodeHeader(bytes.data(), bytes.size()).has_value());

  // Declared config blob longer than the datagram.
  std::vector<uint8_t> short_blob;
  wire::EncodeHeader(SampleHeader(), short_blob);
  short_blob.push_back(0);
  EXPECT_FALSE(wire::DecodeHeader(short_blob.data(), short_blob.size()).has_value());
}

TEST_F(WireFormatContractTest, WIRE_004_ParamSetBlobLayoutAndTruncation) {
  media::ParamSets param_sets;
  param_sets.sps.push_back({0x67, 0x42, 0xC0, 0x1F});
  param_sets.pps.push_back({0x68, 0xCE});

  const auto blob = wire::EncodeParamSets(param_sets);
  const std::vector<uint8_t> expected = {
      0x01, 0x01,                          // counts
      0x00, 0x04, 0x67, 0x42, 0xC0, 0x1F,  // sps
      0x00, 0x02, 0x68, 0xCE,              // pps
  };
  EXPECT_EQ(blob, expected);

  const auto decoded = wire::DecodeParamSets(blob.data(), blob.size());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, param_sets);

  for (std::size_t cut = 0; cut < blob.size(); ++cut) {
    EXPECT_FALSE(wire::DecodeParamSets(blob.data(), cut).has_value()) << "cut=" << cut;
  }
}

TEST_F(WireFormatContractTest, WIRE_005_SequenceOrderSurvivesWraparound) {
  EXPECT_TRUE(wire::IsSequenceNewer(2, 1));
  EXPECT_FALSE(wire::IsSequenceNewer(1, 2));
  EXPECT_FALSE(wire::IsSequenceNewer(7, 7));
  EXPECT_TRUE(wire::IsSequenceNewer(2, 0xFFFFFFFFu));
  EXPECT_FALSE(wire::IsSequenceNewer(0xFFFFFFFFu, 2));
  EXPECT_TRUE(wire::IsSequenceNewer(0, 0xFFFFFFFFu));
}

}  // namespace mirrorcast::tests::contracts
