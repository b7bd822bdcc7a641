#include "strategy/blind_arb.hpp"
#include <algorithm>
#include "constants/mainnet.hpp"
#include "crypto/keccak.hpp"

namespace {
  void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  Bytes pad32(const Bytes& in) {
    Bytes out(32, 0);
    std::copy(in.begin(), in.end(), out.begin() + (32 - in.size()));
    return out;
  }

  Bytes encodeUint256(uint64_t v) {
    Bytes tmp(8);
    for (int i = 7; i >= 0; --i) { tmp[7 - i] = static_cast<unsigned char>((v >> (i * 8)) & 0xFFULL); }
    return pad32(tmp);
  }

  Bytes encodeBool(bool b) { return encodeUint256(b ? 1 : 0); }

  // Throws std::invalid_argument for anything but a 20-byte address.
  Bytes encodeAddress(const std::string& addr) {
    return pad32(HexToBytes(NormalizeAddress(addr)));
  }

  Bytes encodeBytesDynamic(const Bytes& data) {
    Bytes out = encodeUint256(static_cast<uint64_t>(data.size()));
    Bytes padded = data;
    size_t pad = (32 - (padded.size() % 32)) % 32;
    padded.insert(padded.end(), pad, 0);
    append(out, padded);
    return out;
  }
}

namespace BlindArbABI {
  const Bytes& MakeFlashLoanSelector() {
    static const Bytes selector = Crypto::FunctionSelector("makeFlashLoan(address[],uint256[],bytes)");
    return selector;
  }

  Bytes EncodeUserData(const ArbParams& p) {
    // A static tuple is encoded in place: five head words, no tail.
    Bytes out;
    append(out, encodeBool(p.weth_token0));
    append(out, encodeAddress(p.v2_pool));
    append(out, encodeAddress(p.v3_pool));
    append(out, encodeUint256(p.size));
    append(out, encodeUint256(p.payout_percentage));
    return out;
  }

  Bytes BuildMakeFlashLoanCalldata(const std::string& token, uint64_t amount, const Bytes& user_data) {
    // head: three offsets; tail: tokens[], amounts[], userData
    Bytes tokens_enc = encodeUint256(1);
    append(tokens_enc, encodeAddress(token));
    Bytes amounts_enc = encodeUint256(1);
    append(amounts_enc, encodeUint256(amount));
    Bytes data_enc = encodeBytesDynamic(user_data);

    const uint64_t head_size = 32ULL * 3ULL;
    uint64_t tokens_offset = head_size;
    uint64_t amounts_offset = tokens_offset + tokens_enc.size();
    uint64_t data_offset = amounts_offset + amounts_enc.size();

    Bytes out = MakeFlashLoanSelector();
    append(out, encodeUint256(tokens_offset));
    append(out, encodeUint256(amounts_offset));
    append(out, encodeUint256(data_offset));
    append(out, tokens_enc);
    append(out, amounts_enc);
    append(out, data_enc);
    return out;
  }
}

BlindArbContract::BlindArbContract(const std::string& contract_address)
  : address_(NormalizeAddress(contract_address)) {}

TransactionFields BlindArbContract::BuildArbitrageCall(const std::string& v2_pool,
                                                       const std::string& v3_pool,
                                                       uint64_t size,
                                                       uint64_t payout_percentage,
                                                       bool weth_token0) const {
  BlindArbABI::ArbParams params;
  params.weth_token0 = weth_token0;
  params.v2_pool = v2_pool;
  params.v3_pool = v3_pool;
  params.size = size;
  params.payout_percentage = payout_percentage;

  TransactionFields tx;
  tx.to = address_;
  tx.data = BlindArbABI::BuildMakeFlashLoanCalldata(MainnetConstants::WETH, size, BlindArbABI::EncodeUserData(params));
  return tx;
}
