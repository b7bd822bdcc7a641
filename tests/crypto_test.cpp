#include <gtest/gtest.h>
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "matchmaker/flashbots_signer.hpp"
#include "test_support.hpp"
#include "wallet/signer.hpp"

using namespace testing_support;

namespace {
TransactionFields FilledTx() {
  TransactionFields tx;
  tx.chain_id = 1;
  tx.nonce = 7;
  tx.gas_limit = 400000;
  tx.SetGasPrice(30'000'000'000ULL);
  tx.to = "0x1111111111111111111111111111111111111111";
  tx.data = Bytes{0xde, 0xad, 0xbe, 0xef};
  return tx;
}
}

TEST(Keccak, KnownDigests) {
  EXPECT_EQ(Crypto::Keccak256Hex(""), "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  EXPECT_EQ(BytesToHex0x(Crypto::Keccak256(Bytes{})), Crypto::Keccak256Hex(""));
  EXPECT_EQ(BytesToHex0x(Crypto::FunctionSelector("transfer(address,uint256)")), "0xa9059cbb");
  EXPECT_EQ(BytesToHex0x(Crypto::FunctionSelector("approve(address,uint256)")), "0x095ea7b3");
}

TEST(Keccak, PersonalMessageDigestAddsPrefix) {
  const std::string message = "hello";
  EXPECT_EQ(Crypto::PersonalMessageDigest(message),
            Crypto::Keccak256(HexToBytes("0x19457468657265756d205369676e6564204d6573736167653a0a3568656c6c6f")));
}

TEST(Keccak, AddressNeedsUncompressedKey) {
  EXPECT_EQ(Crypto::AddressFromPublicKey(Crypto::PublicKeyFromPrivate(HexToBytes(kKeyOne))), kKeyOneAddress);
  EXPECT_THROW(Crypto::AddressFromPublicKey(Bytes(33, 0x02)), std::invalid_argument);
}

TEST(Secp256k1, SignaturesAreDeterministic) {
  Bytes priv = HexToBytes(kKeyOne);
  Bytes digest = Crypto::Keccak256(Bytes{1, 2, 3});
  auto a = Crypto::SignDigest(priv, digest);
  auto b = Crypto::SignDigest(priv, digest);
  EXPECT_EQ(a.r, b.r);
  EXPECT_EQ(a.s, b.s);
  EXPECT_EQ(a.r.size(), 32u);
  EXPECT_EQ(a.s.size(), 32u);
  EXPECT_TRUE(a.recovery_id == 0 || a.recovery_id == 1);
  auto rsv = a.ToRsv();
  ASSERT_EQ(rsv.size(), 65u);
  EXPECT_EQ(rsv[64], 27 + a.recovery_id);
  EXPECT_FALSE(Crypto::IsValidPrivateKey(Bytes(32, 0)));
  EXPECT_THROW(Crypto::SignDigest(Bytes(32, 0), digest), std::invalid_argument);
}

TEST(Signer, DerivesAddressFromKey) {
  Signer signer(kKeyOne);
  EXPECT_EQ(signer.Address(), kKeyOneAddress);
  EXPECT_THROW(Signer("0x1234"), std::invalid_argument);
  EXPECT_THROW(Signer(""), std::invalid_argument);
}

TEST(Signer, SignsTypedTransactions) {
  Signer signer(kKeyOne);
  Bytes raw = signer.SignTransaction(FilledTx());
  ASSERT_FALSE(raw.empty());
  EXPECT_EQ(raw[0], 0x02);
  EXPECT_EQ(raw, signer.SignTransaction(FilledTx()));
  EXPECT_EQ(signer.SignEip1559(FilledTx()), BytesToHex0x(raw));

  TransactionFields other = FilledTx();
  other.nonce = 8;
  EXPECT_NE(raw, signer.SignTransaction(other));
}

TEST(Signer, RejectsUnfilledTransactions) {
  Signer signer(kKeyOne);
  TransactionFields no_chain = FilledTx();
  no_chain.chain_id.reset();
  EXPECT_THROW(signer.SignTransaction(no_chain), std::invalid_argument);
  TransactionFields no_nonce = FilledTx();
  no_nonce.nonce.reset();
  EXPECT_THROW(signer.SignTransaction(no_nonce), std::invalid_argument);
  TransactionFields no_gas = FilledTx();
  no_gas.gas_limit = 0;
  EXPECT_THROW(signer.SignTransaction(no_gas), std::invalid_argument);
  TransactionFields no_to = FilledTx();
  no_to.to.clear();
  EXPECT_THROW(signer.SignTransaction(no_to), std::invalid_argument);
}

TEST(Signer, PersonalMessageSignature) {
  Signer signer(kKeyOne);
  Bytes sig = signer.SignPersonalMessage("hello");
  ASSERT_EQ(sig.size(), 65u);
  EXPECT_TRUE(sig[64] == 27 || sig[64] == 28);
  EXPECT_EQ(sig, signer.SignPersonalMessage("hello"));
  EXPECT_NE(sig, signer.SignPersonalMessage("hello!"));
}

TEST(FlashbotsSigner, HeaderCarriesAddressAndBodySignature) {
  auto signer = std::make_shared<const Signer>(kKeyOne);
  FlashbotsSigner fb(signer);
  const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"mev_sendBundle","params":[]})";
  std::string header = fb.HeaderValue(body);
  auto colon = header.find(':');
  ASSERT_NE(colon, std::string::npos);
  EXPECT_EQ(header.substr(0, colon), kKeyOneAddress);
  EXPECT_EQ(header.substr(colon + 1), BytesToHex0x(signer->SignPersonalMessage(Crypto::Keccak256Hex(body))));

  std::unordered_map<std::string, std::string> headers;
  fb.Apply(body, headers);
  EXPECT_EQ(headers.at("X-Flashbots-Signature"), header);
  EXPECT_THROW(FlashbotsSigner(nullptr), std::invalid_argument);
}
