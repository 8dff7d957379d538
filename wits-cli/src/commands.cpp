#include "commands.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <sys/stat.h>

#include <charconv>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "args.hpp"
#include "console.hpp"
#include "wits/decoder/batch.hpp"
#include "wits/decoder/json.hpp"
#include "wits/decoder/record_parser.hpp"
#include "wits/io/file.hpp"
#include "wits/protocol/frame.hpp"
#include "wits/symbols/catalog.hpp"
#include "wits/transport/frame_stream.hpp"
#include "wits/transport/source.hpp"
#include "wits/units/converter.hpp"

namespace wits::cli {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

bool is_regular_file(const std::string& path) noexcept {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

/// @brief 讀取整個檔案
Result<std::string> read_file(std::string path) {
  auto file = WITS_TRY(io::File::open(std::move(path), O_RDONLY | O_CLOEXEC));
  return file.read_to_string();
}

/// @brief 參數是檔案就讀檔，否則視為 frame 文字 (允許字面上的 "\n")
Result<std::string> load_input(const std::string& arg) {
  if (is_regular_file(arg)) {
    return read_file(arg);
  }

  std::string text;
  text.reserve(arg.size());
  for (size_t i = 0; i < arg.size(); ++i) {
    if (arg[i] == '\\' && i + 1 < arg.size() && arg[i + 1] == 'n') {
      text.push_back('\n');
      ++i;
    } else {
      text.push_back(arg[i]);
    }
  }
  return text;
}

std::optional<Format> parse_format(const Args& args) {
  auto text = args.option("--format");
  if (!text || *text == "table") {
    return Format::Table;
  }
  if (*text == "raw") {
    return Format::Raw;
  }
  if (*text == "json") {
    return Format::Json;
  }
  return std::nullopt;
}

/// @brief JSON 寫入 --output 指定的檔案，未指定時印到 stdout
Result<> emit_json(const nlohmann::json& doc,
                   const std::optional<std::string>& output) {
  std::string text = doc.dump(2);
  text.push_back('\n');

  if (!output) {
    fmt::print("{}", text);
    return {};
  }

  auto file = WITS_TRY(io::File::create(*output));
  WITS_CHECK(file.write_all(text));
  info("results saved to {}", *output);
  return {};
}

units::UnitSystem unit_system(const Args& args) {
  return args.flag("--metric") ? units::UnitSystem::Metric
                               : units::UnitSystem::Field;
}

void print_symbol_table(std::span<const symbols::Symbol> list) {
  fmt::print("{:<6} {:<6} {:<4} {:<10} {:<10} {}\n", "Code", "Name", "Type",
             "Metric", "FPS", "Description");
  fmt::print("{:-<72}\n", "");
  for (const auto& symbol : list) {
    fmt::print("{:<6} {:<6} {:<4} {:<10} {:<10} {}\n", symbol.code,
               symbol.name, symbols::code(symbol.type),
               units::label(symbol.metric_unit),
               units::label(symbol.field_unit), symbol.description);
  }
}

}  // namespace

// ----------------------------------------------------------------------------
// decode
// ----------------------------------------------------------------------------

int run_decode(std::span<char* const> argv) {
  auto args = Args::parse(argv,
                          {"--metric", "--fps", "--strict",
                           "--convert-to-metric", "--convert-to-fps"},
                          {"--format", "--output"},
                          {{"-f", "--format"}, {"-o", "--output"}});
  if (!args) {
    report("decode", args.error());
    return kExitUsage;
  }
  if (args->positional().empty()) {
    error("usage: witskit decode <frame-or-file> [--metric|--fps] [--strict] "
          "[--format table|raw|json] [--output FILE] "
          "[--convert-to-metric|--convert-to-fps]");
    return kExitUsage;
  }

  auto format = parse_format(*args);
  if (!format) {
    error("unknown format, expected table, raw or json");
    return kExitUsage;
  }
  if (args->flag("--convert-to-metric") && args->flag("--convert-to-fps")) {
    error("Cannot convert to both metric and FPS units");
    return kExitFailure;
  }

  const std::string& input = args->positional().front();
  auto text = load_input(input);
  if (!text) {
    report(input, text.error());
    return kExitFailure;
  }

  decoder::DecodeOptions options;
  options.units = unit_system(*args);
  options.strict = args->flag("--strict");
  options.source = is_regular_file(input) ? input : "cli";
  if (args->flag("--convert-to-metric")) {
    options.convert_to = units::UnitSystem::Metric;
  } else if (args->flag("--convert-to-fps")) {
    options.convert_to = units::UnitSystem::Field;
  }

  auto frames = decoder::decode_batch(*text, options);
  if (!frames) {
    report("decode", frames.error());
    return kExitFailure;
  }

  auto output = args->option("--output");
  size_t unknown = 0;
  if (*format == Format::Json || output) {
    nlohmann::json doc;
    if (frames->size() == 1) {
      doc = decoder::to_json(frames->front());
      unknown = frames->front().unknown_symbols;
    } else {
      auto view = decoder::combine(*frames);
      doc = decoder::to_json(view);
      unknown = view.unknown_symbols;
    }
    if (auto written = emit_json(doc, output); !written) {
      report(output.value_or("stdout"), written.error());
      return kExitFailure;
    }
  } else if (frames->size() == 1) {
    print_frame(frames->front(), *format);
    unknown = frames->front().unknown_symbols;
  } else {
    auto view = decoder::combine(*frames);
    if (*format == Format::Table) {
      fmt::print("Source: {}  Frames: {}  Points: {}\n", options.source,
                 view.frame_count, view.data_points.size());
    }
    print_points(view.data_points, *format);
    for (const auto& message : view.errors) {
      error("{}", message);
    }
    for (const auto& message : view.warnings) {
      warning("{}", message);
    }
    unknown = view.unknown_symbols;
  }

  if (options.strict && unknown > 0) {
    error("{} unknown symbol(s) in strict mode", unknown);
    return kExitFailure;
  }
  return kExitOk;
}

// ----------------------------------------------------------------------------
// convert
// ----------------------------------------------------------------------------

int run_convert(std::span<char* const> argv) {
  auto args = Args::parse(argv, {"--formula", "--list-units"},
                          {"--precision"}, {{"-p", "--precision"}});
  if (!args) {
    report("convert", args.error());
    return kExitUsage;
  }

  if (args->flag("--list-units")) {
    fmt::print("{:<10} {:<10} {}\n", "Code", "Label", "Category");
    fmt::print("{:-<36}\n", "");
    for (auto unit : units::all_units()) {
      fmt::print("{:<10} {:<10} {}\n", units::code(unit), units::label(unit),
                 units::name(units::UnitConverter::category(unit)));
    }
    return kExitOk;
  }

  const auto& pos = args->positional();
  if (pos.size() < 3) {
    error("usage: witskit convert <value> <from> <to> [--precision N] "
          "[--formula] [--list-units]");
    return kExitUsage;
  }

  double value = 0.0;
  auto [ptr, ec] =
      std::from_chars(pos[0].data(), pos[0].data() + pos[0].size(), value);
  if (ec != std::errc{} || ptr != pos[0].data() + pos[0].size()) {
    error("'{}' is not a number", pos[0]);
    return kExitUsage;
  }

  auto precision = args->integer("--precision", 4);
  if (!precision || *precision < 0 || *precision > 15) {
    error("--precision must be an integer between 0 and 15");
    return kExitUsage;
  }

  auto from = units::parse_unit(pos[1]);
  auto to = units::parse_unit(pos[2]);
  auto result = units::UnitConverter::convert(value, pos[1], pos[2]);
  if (!result) {
    report(fmt::format("{} -> {}", pos[1], pos[2]), result.error());
    return kExitFailure;
  }

  fmt::print("{} {} = {:.{}f} {}\n", pos[0], units::label(*from), *result,
             *precision, units::label(*to));

  if (args->flag("--formula")) {
    if (auto factor = units::UnitConverter::factor(*from, *to)) {
      fmt::print("Formula: {} = value x {}\n", units::label(*to), *factor);
    } else if (*to == units::Unit::DegreesFahrenheit) {
      fmt::print("Formula: DEGF = DEGC x 9/5 + 32\n");
    } else {
      fmt::print("Formula: DEGC = (DEGF - 32) x 5/9\n");
    }
  }
  return kExitOk;
}

// ----------------------------------------------------------------------------
// symbols
// ----------------------------------------------------------------------------

int run_symbols(std::span<char* const> argv) {
  auto args = Args::parse(argv, {"--list-records"}, {"--search", "--record"},
                          {{"-s", "--search"}, {"-r", "--record"}});
  if (!args) {
    report("symbols", args.error());
    return kExitUsage;
  }

  const auto& catalog = symbols::SymbolCatalog::instance();

  if (auto text = args->option("--search")) {
    auto found = catalog.search(*text);
    if (found.empty()) {
      warning("no symbols match '{}'", *text);
      return kExitFailure;
    }

    std::vector<symbols::Symbol> list;
    list.reserve(found.size());
    for (const auto& [code, symbol] : found) {
      list.push_back(symbol);
    }
    print_symbol_table(list);
    fmt::print("{} symbol(s)\n", list.size());
    return kExitOk;
  }

  if (args->option("--record")) {
    auto record = args->integer("--record", 0);
    if (!record) {
      error("--record expects a record type number");
      return kExitUsage;
    }

    auto list = catalog.by_record_type(static_cast<int>(*record));
    if (list.empty()) {
      error("no symbols for record type {}", *record);
      return kExitFailure;
    }
    fmt::print("Record {:02}: {} ({})\n", *record,
               symbols::SymbolCatalog::record_description(
                   static_cast<int>(*record)),
               symbols::SymbolCatalog::record_category(
                   static_cast<int>(*record)));
    print_symbol_table(list);
    return kExitOk;
  }

  // 預設與 --list-records 相同
  fmt::print("{:>4}  {:<34} {:<14} {}\n", "Rec", "Description", "Category",
             "Symbols");
  fmt::print("{:-<64}\n", "");
  for (int record : catalog.record_types()) {
    fmt::print("{:>4}  {:<34} {:<14} {}\n", record,
               symbols::SymbolCatalog::record_description(record),
               symbols::SymbolCatalog::record_category(record),
               catalog.by_record_type(record).size());
  }
  fmt::print("{} symbols in {} record types\n", catalog.size(),
             catalog.record_types().size());
  return kExitOk;
}

// ----------------------------------------------------------------------------
// stream
// ----------------------------------------------------------------------------

int run_stream(std::span<char* const> argv) {
  auto args = Args::parse(
      argv, {"--metric", "--fps", "--request"},
      {"--max-frames", "--format", "--baud", "--output"},
      {{"-n", "--max-frames"}, {"-f", "--format"}, {"-o", "--output"}});
  if (!args) {
    report("stream", args.error());
    return kExitUsage;
  }
  if (args->positional().empty()) {
    error("usage: witskit stream <tcp://host:port|file://path|serial://dev> "
          "[--metric|--fps] [--max-frames N] [--format table|raw|json] "
          "[--output FILE] [--baud N] [--request]");
    return kExitUsage;
  }

  auto format = parse_format(*args);
  auto max_frames = args->integer("--max-frames", 0);
  auto baud = args->integer("--baud", transport::SerialSource::kDefaultBaudRate);
  if (!format || !max_frames || !baud || *baud <= 0) {
    error("invalid --format, --max-frames or --baud value");
    return kExitUsage;
  }

  transport::SourceConfig config;
  config.url = args->positional().front();
  config.baud_rate = static_cast<unsigned>(*baud);
  config.request = args->flag("--request");

  auto source = transport::open_source(config);
  if (!source) {
    report(config.url, source.error());
    return kExitFailure;
  }
  info("streaming from {}", source->describe());

  transport::FrameStream stream(std::move(*source), config.chunk_size);

  decoder::DecodeOptions options;
  options.units = unit_system(*args);
  options.source = config.url;

  auto output = args->option("--output");
  const bool collect = *format == Format::Json || output.has_value();
  std::vector<decoder::DecodedFrame> decoded_frames;

  long count = 0;
  while (*max_frames <= 0 || count < *max_frames) {
    auto frame = stream.next();
    if (!frame) {
      report("read", frame.error());
      stream.finish();
      return kExitFailure;
    }
    if (!*frame) {
      break;
    }

    auto decoded = decoder::decode_frame(**frame, options);
    if (!decoded) {
      report("decode", decoded.error());
      continue;
    }

    ++count;
    if (*format == Format::Table) {
      fmt::print("\nFrame #{}\n", count);
    }
    if (*format != Format::Json) {
      print_frame(*decoded, *format);
    }
    if (collect) {
      decoded_frames.push_back(std::move(*decoded));
    }
  }

  stream.finish();
  info("{} frame(s) processed", count);

  if (collect) {
    auto doc = decoder::to_json(decoded_frames, config.url);
    if (auto written = emit_json(doc, output); !written) {
      report(output.value_or("stdout"), written.error());
      return kExitFailure;
    }
  }
  return kExitOk;
}

// ----------------------------------------------------------------------------
// validate
// ----------------------------------------------------------------------------

int run_validate(std::span<char* const> argv) {
  auto args = Args::parse(argv, {}, {});
  if (!args || args->positional().empty()) {
    error("usage: witskit validate <frame-or-file>");
    return kExitUsage;
  }

  const std::string& input = args->positional().front();
  auto text = load_input(input);
  if (!text) {
    report(input, text.error());
    return kExitFailure;
  }

  if (!protocol::validate_frame(*text)) {
    error("Invalid WITS frame format");
    return kExitFailure;
  }
  fmt::print("Valid WITS frame format\n");
  return kExitOk;
}

}  // namespace wits::cli
