#include "wits/error.hpp"

#include <fmt/format.h>

namespace wits {

std::error_code make_error_code(int ev) noexcept {
  return {ev, std::generic_category()};
}

std::string ErrorRegistry::describe_last_error() {
  if (!last_.is_active) {
    return {};
  }

  const auto& where = last_.location;
  const auto& ec = last_.ec;
  if (last_.context.empty()) {
    return fmt::format("{}:{}: [{}:{}] {}", where.file_name(), where.line(),
                       ec.category().name(), ec.value(), ec.message());
  }
  return fmt::format("{}:{}: {} ([{}:{}] {})", where.file_name(),
                     where.line(), last_.context, ec.category().name(),
                     ec.value(), ec.message());
}

}  // namespace wits
