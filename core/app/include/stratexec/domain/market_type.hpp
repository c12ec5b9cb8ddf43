#pragma once

#include <optional>
#include <string>

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// MarketType — which session calendar an instrument trades on
// -----------------------------------------------------------------------------
enum class MarketType {
  AStock,
  UsStock,
  HkStock,
  Crypto,
};

inline const char* marketTypeName(MarketType type) {
  switch (type) {
    case MarketType::AStock:  return "a_stock";
    case MarketType::UsStock: return "us_stock";
    case MarketType::HkStock: return "hk_stock";
    case MarketType::Crypto:  return "crypto";
  }
  return "crypto";
}

inline std::optional<MarketType> parseMarketType(const std::string& name) {
  if (name == "a_stock") return MarketType::AStock;
  if (name == "us_stock") return MarketType::UsStock;
  if (name == "hk_stock") return MarketType::HkStock;
  if (name == "crypto") return MarketType::Crypto;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// detectMarketType(symbol)
// -----------------------------------------------------------------------------
// @brief  Classifies a symbol by its exchange suffix.
//
// @details
//   "000001.XSHE", "600000.XSHG" → AStock
//   "AAPL.US"                    → UsStock
//   "00700.HK"                   → HkStock
//   anything else                → Crypto ("BTCUSDT")
// -----------------------------------------------------------------------------
inline MarketType detectMarketType(const std::string& symbol) {
  auto dot = symbol.rfind('.');
  if (dot == std::string::npos) {
    return MarketType::Crypto;
  }
  const std::string suffix = symbol.substr(dot + 1);
  if (suffix == "XSHE" || suffix == "XSHG") {
    return MarketType::AStock;
  }
  if (suffix == "US") {
    return MarketType::UsStock;
  }
  if (suffix == "HK") {
    return MarketType::HkStock;
  }
  return MarketType::Crypto;
}

// Stock markets trade whole shares; crypto allows fractional quantities.
inline bool isStockMarket(MarketType type) {
  return type != MarketType::Crypto;
}

}  // namespace domain
}  // namespace stratexec
