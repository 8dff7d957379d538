#ifndef WITS_TELEMETRY_SYMBOLS_CATALOG_HPP
#define WITS_TELEMETRY_SYMBOLS_CATALOG_HPP

#include <map>
#include <optional>
#include <set>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wits/symbols/symbol.hpp"

namespace wits::symbols {

/// @brief 內建 WITS Level 0 符號表 (依代碼排序)
[[nodiscard]] std::span<const Symbol> wits_level0_symbols() noexcept;

/// @brief 符號查詢服務
///
/// 特性：
/// - 建構後不可變，查詢無副作用，可多執行緒同時讀取
/// - get() 為 hash 查表
/// - 不擁有符號資料，資料來源必須比 catalog 活得久 (內建表為靜態資料)
///
class SymbolCatalog {
 private:
  std::span<const Symbol> symbols_;
  std::unordered_map<std::string_view, size_t> index_;

 public:
  /// @brief 從符號資料建立索引
  /// @param symbols 符號資料，代碼重複時以第一筆為準
  explicit SymbolCatalog(std::span<const Symbol> symbols);

  /// @brief 內建 WITS Level 0 catalog (第一次呼叫時建立)
  [[nodiscard]] static const SymbolCatalog& instance();

  // ----------------------------------------------------------------------------
  // Lookup
  // ----------------------------------------------------------------------------

  /// @brief 以 4 字元代碼查詢
  [[nodiscard]] std::optional<Symbol> get(std::string_view code) const noexcept;

  [[nodiscard]] bool contains(std::string_view code) const noexcept {
    return index_.contains(code);
  }

  /// @brief 某個 record type 的所有符號 (依資料順序)
  [[nodiscard]] std::vector<Symbol> by_record_type(int record_type) const;

  /// @brief 搜尋名稱、說明或代碼中包含 text 的符號 (不分大小寫)
  /// @return code -> Symbol
  [[nodiscard]] std::map<std::string_view, Symbol> search(
      std::string_view text) const;

  /// @brief 所有出現過的 record type
  [[nodiscard]] std::set<int> record_types() const;

  // ----------------------------------------------------------------------------
  // Accessor
  // ----------------------------------------------------------------------------

  [[nodiscard]] std::span<const Symbol> symbols() const noexcept {
    return symbols_;
  }

  [[nodiscard]] size_t size() const noexcept { return index_.size(); }

  // ----------------------------------------------------------------------------
  // Record Type Labels
  // ----------------------------------------------------------------------------

  /// @brief record type 說明，例如 1 -> "General Time-Based"
  /// @return 未定義時返回 "Unknown"
  [[nodiscard]] static std::string_view record_description(
      int record_type) noexcept;

  /// @brief record type 分組，例如 7 -> "Surveying"
  /// @return 未分組時返回 "Other"
  [[nodiscard]] static std::string_view record_category(
      int record_type) noexcept;
};

}  // namespace wits::symbols

#endif
