#pragma once
#include <string>
#include <vector>

namespace MainnetConstants {
  inline constexpr int CHAIN_ID = 1;
  inline constexpr int GOERLI_CHAIN_ID = 5;
  // Wrapped ether, the base asset every arbitrage is denominated in
  inline const std::string WETH = "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2";
  inline const std::string MEV_SHARE_SSE_URL = "https://mev-share.flashbots.net";
  inline const std::string GOERLI_RELAY_URL = "https://relay-goerli.flashbots.net:443";
  // Builders allowed to see bundle contents (privacy.builders). Maintained
  // separately from the relay endpoints bundles are submitted to.
  inline const std::vector<std::string> TRUSTED_BUILDERS = {
    "0x1f9090aaE28b8a3dCeaDf281B0F12828e676c326", // rsync-builder
    "0x690B9A9E9aa1C9dB991C7721a92d351Db4FaC990", // builder0x69
    "0x95222290DD7278Aa3Ddd389Cc1E1d165CC4BAfe5", // beaverbuild
    "0xDAFEA492D9c6733ae3d56b7Ed1ADB60692c98Bc5", // flashbots builder
    "0x4838B106FCe9647Bdf1E7877BF73cE8B0BAD5f97", // titan builder
  };
}
