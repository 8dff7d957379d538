#ifndef WITS_TELEMETRY_CLI_COMMANDS_HPP
#define WITS_TELEMETRY_CLI_COMMANDS_HPP

#include <span>

namespace wits::cli {

/// @brief 子命令，argv 不含程式名稱與子命令本身
/// @return process exit code
int run_decode(std::span<char* const> argv);
int run_convert(std::span<char* const> argv);
int run_symbols(std::span<char* const> argv);
int run_stream(std::span<char* const> argv);
int run_validate(std::span<char* const> argv);

}  // namespace wits::cli

#endif
