#include "strategy/pool_table.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "utils/hex.hpp"

namespace {
std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> cols;
  std::stringstream ss(line);
  std::string col;
  while (std::getline(ss, col, ',')) cols.push_back(Trim(col));
  return cols;
}

bool ParseBool(const std::string& raw, bool& out) {
  std::string v = ToLowerHex(raw);
  if (v == "true" || v == "1") { out = true; return true; }
  if (v == "false" || v == "0") { out = false; return true; }
  return false;
}
}

void PoolTable::Insert(const std::string& v3_pool, const V2PoolInfo& info) {
  V2PoolInfo stored = info;
  stored.v2_pool = NormalizeAddress(info.v2_pool);
  pools_[NormalizeAddress(v3_pool)] = stored;
}

const V2PoolInfo* PoolTable::Find(const std::string& v3_pool) const {
  if (!IsHexOfLength(v3_pool, 20)) return nullptr;
  auto it = pools_.find("0x" + ToLowerHex(Strip0x(v3_pool)));
  return it == pools_.end() ? nullptr : &it->second;
}

PoolTable LoadPoolTableCsv(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) throw std::runtime_error("cannot open pool table " + path);

  std::string line;
  size_t line_no = 0;
  bool header_seen = false;
  size_t col_v3 = 0, col_v2 = 1, col_weth = 2;
  PoolTable table;

  while (std::getline(file, line)) {
    ++line_no;
    if (Trim(line).empty()) continue;
    auto cols = SplitCsvLine(line);
    if (!header_seen) {
      // Columns are located by name so their order in the file does not matter.
      bool found_v3 = false, found_v2 = false, found_weth = false;
      for (size_t i = 0; i < cols.size(); ++i) {
        if (cols[i] == "v3_pool") { col_v3 = i; found_v3 = true; }
        else if (cols[i] == "v2_pool") { col_v2 = i; found_v2 = true; }
        else if (cols[i] == "weth_token0") { col_weth = i; found_weth = true; }
      }
      if (!found_v3 || !found_v2 || !found_weth)
        throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected header v3_pool,v2_pool,weth_token0");
      header_seen = true;
      continue;
    }
    std::string where = path + ":" + std::to_string(line_no) + ": ";
    size_t needed = std::max(col_v3, std::max(col_v2, col_weth)) + 1;
    if (cols.size() < needed) throw std::runtime_error(where + "expected " + std::to_string(needed) + " columns");

    V2PoolInfo info;
    if (!ParseBool(cols[col_weth], info.weth_token0))
      throw std::runtime_error(where + "weth_token0 must be true/false, got '" + cols[col_weth] + "'");
    info.v2_pool = cols[col_v2];
    try {
      table.Insert(cols[col_v3], info);
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(where + e.what());
    }
  }
  if (!header_seen) throw std::runtime_error("pool table " + path + " is empty");
  return table;
}
