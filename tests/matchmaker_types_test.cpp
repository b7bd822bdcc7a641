#include <gtest/gtest.h>
#include "constants/mainnet.hpp"
#include "matchmaker/types.hpp"

using json = nlohmann::json;

namespace {
const std::string kHash = "0x" + std::string(62, '0') + "ab";
}

TEST(PrivacyHint, TagsFollowFixedOrder) {
  PrivacyHint hint;
  hint.WithTxHash().WithCalldata();
  EXPECT_EQ(json(hint), json::parse(R"(["calldata","tx_hash"])"));
  EXPECT_TRUE(hint.HasCalldata());
  EXPECT_FALSE(hint.HasLogs());

  PrivacyHint all;
  all.WithHash().WithLogs().WithFunctionSelector().WithContractAddress().WithCalldata().WithTxHash();
  EXPECT_EQ(all.ToTags(), (std::vector<std::string>{"calldata", "contract_address", "logs",
                                                    "function_selector", "hash", "tx_hash"}));
  EXPECT_EQ(PrivacyHint::FromTags(all.ToTags()), all);
}

TEST(PrivacyHint, CalldataAndTxHashRoundTrip) {
  PrivacyHint hint;
  hint.WithCalldata().WithTxHash();
  json j = hint;
  ASSERT_EQ(j.dump(), R"(["calldata","tx_hash"])");

  auto decoded = j.get<PrivacyHint>();
  EXPECT_TRUE(decoded == hint);
  EXPECT_TRUE(decoded.HasCalldata());
  EXPECT_TRUE(decoded.HasTxHash());
  EXPECT_FALSE(decoded.HasContractAddress());
  EXPECT_FALSE(decoded.HasLogs());
  EXPECT_FALSE(decoded.HasFunctionSelector());
  EXPECT_FALSE(decoded.HasHash());

  // Tag order on the wire does not matter when decoding.
  EXPECT_TRUE(json::parse(R"(["tx_hash","calldata"])").get<PrivacyHint>() == hint);
  EXPECT_TRUE(json::array().get<PrivacyHint>() == PrivacyHint{});
}

TEST(PrivacyHint, UnknownTagIsRejected) {
  EXPECT_THROW(json::parse(R"(["calldata","everything"])").get<PrivacyHint>(), std::invalid_argument);
}

TEST(BundleRequest, SimpleBundleWireFormat) {
  auto bundle = BundleRequest::MakeSimple(
    100, {BundleTx::FromHash(kHash), BundleTx::FromSigned(Bytes{0x02, 0x01}, false)});

  json j = bundle;
  EXPECT_EQ(j.at("version"), "beta-1");
  EXPECT_EQ(j.at("inclusion"), json::parse(R"({"block":"0x64","maxBlock":"0x82"})"));
  EXPECT_EQ(j.at("body")[0], json({{"hash", kHash}}));
  EXPECT_EQ(j.at("body")[1], json::parse(R"({"tx":"0x0201","canRevert":false})"));
  EXPECT_FALSE(j.contains("validity"));
  EXPECT_EQ(j.at("privacy").at("hints"), json::array());
  EXPECT_EQ(j.at("privacy").at("builders").size(), MainnetConstants::TRUSTED_BUILDERS.size());
}

TEST(BundleRequest, RefundConfigGoesIntoValidity) {
  BundleOptions opts;
  opts.refund_config = std::vector<RefundConfig>{{"0x1111111111111111111111111111111111111111", 30}};
  auto bundle = BundleRequest::Make(10, std::nullopt, ProtocolVersion::kV0_1, {BundleTx::FromHash(kHash)}, opts);

  json j = bundle;
  EXPECT_EQ(j.at("version"), "v0.1");
  EXPECT_FALSE(j.at("inclusion").contains("maxBlock"));
  EXPECT_FALSE(j.contains("privacy"));
  EXPECT_EQ(j.at("validity"), json::parse(
    R"({"refundConfig":[{"address":"0x1111111111111111111111111111111111111111","percent":30}]})"));
}

TEST(BundleRequest, DecodesRelayPayload) {
  const char* text = R"({
    "version": "v0.1",
    "inclusion": {"block": "0x8b8da8", "maxBlock": "0x8b8dab"},
    "body": [
      {"hash": "0xF5E8A7C5A6A4B1E44E2EC6D4B3F8A8E1C3D2B1A0F9E8D7C6B5A4938271605F4E"},
      {"tx": "0x02f8", "canRevert": true}
    ],
    "validity": {"refund": [{"bodyIdx": 0, "percent": 90}]},
    "privacy": {"hints": ["calldata", "logs"], "builders": ["flashbots"]}
  })";
  auto bundle = json::parse(text).get<BundleRequest>();
  EXPECT_EQ(bundle.version, ProtocolVersion::kV0_1);
  EXPECT_EQ(bundle.inclusion.block, 0x8b8da8u);
  EXPECT_EQ(bundle.inclusion.max_block, 0x8b8dabu);
  ASSERT_EQ(bundle.body.size(), 2u);
  ASSERT_NE(bundle.body[0].AsHash(), nullptr);
  EXPECT_EQ(bundle.body[0].AsHash()->hash, "0xf5e8a7c5a6a4b1e44e2ec6d4b3f8a8e1c3d2b1a0f9e8d7c6b5a4938271605f4e");
  ASSERT_NE(bundle.body[1].AsTx(), nullptr);
  EXPECT_EQ(bundle.body[1].AsTx()->tx, (Bytes{0x02, 0xf8}));
  EXPECT_TRUE(bundle.body[1].AsTx()->can_revert);
  ASSERT_TRUE(bundle.validity && bundle.validity->refund);
  EXPECT_EQ((*bundle.validity->refund)[0].percent, 90u);
  EXPECT_FALSE(bundle.validity->refund_config.has_value());
  ASSERT_TRUE(bundle.privacy && bundle.privacy->hints);
  EXPECT_TRUE(bundle.privacy->hints->HasLogs());
  EXPECT_FALSE(bundle.privacy->hints->HasTxHash());
}

TEST(BundleRequest, VersionDefaultsToBeta1) {
  auto bundle = json::parse(R"({"inclusion":{"block":"0x1"},"body":[]})").get<BundleRequest>();
  EXPECT_EQ(bundle.version, ProtocolVersion::kBeta1);
  EXPECT_FALSE(bundle.inclusion.max_block.has_value());
  EXPECT_FALSE(bundle.privacy.has_value());
}

TEST(BundleRequest, SurvivesEncodeDecode) {
  BundleOptions opts = BundleOptions::Default();
  opts.privacy->hints->WithHash();
  opts.refund_config = std::vector<RefundConfig>{{"0x2222222222222222222222222222222222222222", 50}};
  auto bundle = BundleRequest::MakeSimple(
    17'000'000, {BundleTx::FromHash(kHash), BundleTx::FromSigned(Bytes{0x02, 0xaa, 0xbb}, true)}, opts);
  EXPECT_EQ(json(bundle).get<BundleRequest>(), bundle);
}

TEST(BundleRequest, MalformedBodyElementIsRejected) {
  EXPECT_THROW(json::parse(R"({"inclusion":{"block":"0x1"},"body":[{"nothing":1}]})").get<BundleRequest>(),
               std::invalid_argument);
  EXPECT_THROW(json::parse(R"({"inclusion":{"block":"0x1"},"body":[{"hash":"0x12"}]})").get<BundleRequest>(),
               std::invalid_argument);
}

TEST(SendBundleResponse, DecodesBundleHash) {
  auto resp = json::parse(R"({"bundleHash":"0xabc"})").get<SendBundleResponse>();
  EXPECT_EQ(resp.bundle_hash, "0xabc");
  EXPECT_THROW(json::parse(R"({"hash":"0xabc"})").get<SendBundleResponse>(), json::exception);
}
