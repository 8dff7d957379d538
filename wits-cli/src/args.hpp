#ifndef WITS_TELEMETRY_CLI_ARGS_HPP
#define WITS_TELEMETRY_CLI_ARGS_HPP

#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "wits/error.hpp"

namespace wits::cli {

/// @brief 子命令的參數
///
/// - 旗標 (flags) 與 "--name value" 形式的選項 (value_options) 需事先宣告
/// - 單字母別名 (-n, -f) 由 aliases 對應到長名稱
/// - 未宣告的選項視為錯誤
///
class Args {
 private:
  std::vector<std::string> positional_;
  std::map<std::string, std::string, std::less<>> options_;
  std::set<std::string, std::less<>> flags_;

 public:
  /// @brief 解析 argv (不含程式名稱與子命令)
  /// @return Args，或遇到未知選項、選項缺少值時返回
  ///         std::errc::invalid_argument
  ///
  [[nodiscard]] static Result<Args> parse(
      std::span<char* const> argv,
      std::initializer_list<std::string_view> flags,
      std::initializer_list<std::string_view> value_options,
      std::initializer_list<std::pair<std::string_view, std::string_view>>
          aliases = {});

  [[nodiscard]] const std::vector<std::string>& positional() const noexcept {
    return positional_;
  }

  [[nodiscard]] bool flag(std::string_view name) const {
    return flags_.contains(name);
  }

  [[nodiscard]] std::optional<std::string> option(std::string_view name) const;

  /// @brief 整數選項
  /// @return 未指定時返回 fallback，非法數字返回 std::errc::invalid_argument
  [[nodiscard]] Result<long> integer(std::string_view name,
                                     long fallback) const;
};

}  // namespace wits::cli

#endif
