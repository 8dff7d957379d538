#include <fmt/format.h>

#include <span>
#include <string_view>

#include "commands.hpp"
#include "console.hpp"

namespace {

constexpr std::string_view kVersion = WITS_VERSION;

void print_help() {
  fmt::print("witskit {} - WITS Level 0 drilling telemetry toolkit\n\n",
             kVersion);
  fmt::print("Usage:\n");
  fmt::print("  witskit <command> [options]\n\n");
  fmt::print("Commands:\n");
  fmt::print("  decode <frame-or-file>    Decode one or more WITS frames\n");
  fmt::print("      --metric | --fps      Unit system for labels (default fps)\n");
  fmt::print("      --strict              Exit non-zero on unknown symbols\n");
  fmt::print("      -f, --format FMT      table (default), raw or json\n");
  fmt::print("      -o, --output FILE     Write JSON results to FILE\n");
  fmt::print("      --convert-to-metric | --convert-to-fps\n");
  fmt::print("  convert <value> <from> <to>\n");
  fmt::print("      --precision N         Decimal places (default 4)\n");
  fmt::print("      --formula             Show the conversion formula\n");
  fmt::print("      --list-units          List all known units\n");
  fmt::print("  symbols                   List record types\n");
  fmt::print("      --search TEXT         Search code, name or description\n");
  fmt::print("      --record N            List symbols of a record type\n");
  fmt::print("      --list-records        List record types\n");
  fmt::print("  stream <url>              Decode frames from a live source\n");
  fmt::print("      tcp://host:port | file://path | serial:///dev/ttyUSB0\n");
  fmt::print("      --metric | --fps      Unit system for labels (default fps)\n");
  fmt::print("      --max-frames N        Stop after N frames\n");
  fmt::print("      -f, --format FMT      table (default), raw or json\n");
  fmt::print("      -o, --output FILE     Write JSON results to FILE\n");
  fmt::print("      --baud N              Serial baud rate (default 9600)\n");
  fmt::print("      --request             Send '&&' after connecting (TCP)\n");
  fmt::print("  validate <frame-or-file>  Check frame markers only\n\n");
  fmt::print("Options:\n");
  fmt::print("  -h, --help                Show this help message\n");
  fmt::print("  -V, --version             Show version information\n\n");
  fmt::print("Examples:\n");
  fmt::print("  witskit decode \"&&\\n01083650.40\\n011323.38\\n!!\"\n");
  fmt::print("  witskit convert 3650.4 M F\n");
  fmt::print("  witskit stream tcp://192.168.1.100:12345 --max-frames 10\n");
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_help();
    return 2;
  }

  std::string_view command = argv[1];
  std::span<char* const> rest(argv + 2, static_cast<size_t>(argc - 2));

  if (command == "-h" || command == "--help" || command == "help") {
    print_help();
    return 0;
  }
  if (command == "-V" || command == "--version") {
    fmt::print("witskit {}\n", kVersion);
    return 0;
  }

  if (command == "decode") {
    return wits::cli::run_decode(rest);
  }
  if (command == "convert") {
    return wits::cli::run_convert(rest);
  }
  if (command == "symbols") {
    return wits::cli::run_symbols(rest);
  }
  if (command == "stream") {
    return wits::cli::run_stream(rest);
  }
  if (command == "validate") {
    return wits::cli::run_validate(rest);
  }

  wits::cli::error("unknown command '{}', see 'witskit --help'", command);
  return 2;
}
