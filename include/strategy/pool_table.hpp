#pragma once
#include <string>
#include <unordered_map>

// Uniswap v2 pool paired with a v3 pool on the same WETH market.
struct V2PoolInfo {
  std::string v2_pool;
  bool weth_token0 = false;
};

// v3 pool address -> v2 counterpart. Addresses are normalized on the way in
// and on lookup, so callers may pass any hex case.
class PoolTable {
public:
  // Later inserts for the same v3 pool replace earlier ones.
  void Insert(const std::string& v3_pool, const V2PoolInfo& info);
  const V2PoolInfo* Find(const std::string& v3_pool) const;
  size_t Size() const { return pools_.size(); }
  bool Empty() const { return pools_.empty(); }
private:
  std::unordered_map<std::string, V2PoolInfo> pools_;
};

// Reads `v3_pool,v2_pool,weth_token0` rows (header line required). Throws
// std::runtime_error naming the file and line on any problem.
PoolTable LoadPoolTableCsv(const std::string& path);
