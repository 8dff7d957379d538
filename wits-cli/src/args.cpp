#include "args.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace wits::cli {

namespace {

// "-12.5" 是數值不是旗標
bool is_negative(std::string_view token) noexcept {
  return token.size() > 1 &&
         (token[1] == '.' || std::isdigit(static_cast<unsigned char>(token[1])));
}

}  // namespace

Result<Args> Args::parse(
    std::span<char* const> argv,
    std::initializer_list<std::string_view> flags,
    std::initializer_list<std::string_view> value_options,
    std::initializer_list<std::pair<std::string_view, std::string_view>>
        aliases) {
  Args args;

  for (size_t i = 0; i < argv.size(); ++i) {
    std::string_view token = argv[i];

    if (!token.starts_with('-') || token.size() == 1 || is_negative(token)) {
      args.positional_.emplace_back(token);
      continue;
    }

    auto alias = std::ranges::find(aliases, token,
                                   &std::pair<std::string_view,
                                              std::string_view>::first);
    std::string_view name = alias != aliases.end() ? alias->second : token;

    if (std::ranges::find(value_options, name) != value_options.end()) {
      if (i + 1 >= argv.size()) {
        return wits::fail(std::errc::invalid_argument, "Option needs a value");
      }
      args.options_.insert_or_assign(std::string(name), argv[++i]);
    } else if (std::ranges::find(flags, name) != flags.end()) {
      args.flags_.emplace(name);
    } else {
      return wits::fail(std::errc::invalid_argument, "Unknown option");
    }
  }
  return args;
}

std::optional<std::string> Args::option(std::string_view name) const {
  auto it = options_.find(name);
  if (it == options_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result<long> Args::integer(std::string_view name, long fallback) const {
  auto text = option(name);
  if (!text) {
    return fallback;
  }

  long value = 0;
  auto [ptr, ec] =
      std::from_chars(text->data(), text->data() + text->size(), value);
  if (ec != std::errc{} || ptr != text->data() + text->size()) {
    return wits::fail(std::errc::invalid_argument, "Expected an integer");
  }
  return value;
}

}  // namespace wits::cli
