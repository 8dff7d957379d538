#include "wits/symbols/catalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace wits::symbols {

namespace {

std::string to_lower(std::string_view text) {
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool icontains(std::string_view haystack, std::string_view lowered_needle) {
  return to_lower(haystack).find(lowered_needle) != std::string::npos;
}

struct RecordLabel {
  int record_type;
  std::string_view description;
  std::string_view category;
};

constexpr std::array kRecordLabels = {
    RecordLabel{1, "General Time-Based", "Drilling"},
    RecordLabel{2, "Drilling - Depth Based", "Drilling"},
    RecordLabel{3, "Drilling - Connections", "Drilling"},
    RecordLabel{4, "Drilling - Hydraulics", "Drilling"},
    RecordLabel{5, "Tripping - Time Based", "Tripping"},
    RecordLabel{6, "Tripping - Connections", "Tripping"},
    RecordLabel{7, "Survey/Directional", "Surveying"},
    RecordLabel{8, "MWD Formation Evaluation", "MWD/LWD"},
    RecordLabel{9, "MWD Mechanical", "MWD/LWD"},
    RecordLabel{10, "Pressure Evaluation", "Evaluation"},
    RecordLabel{11, "Mud Tank Volumes", "Operations"},
    RecordLabel{12, "Chromatograph Cycle-Based", "Evaluation"},
    RecordLabel{13, "Chromatograph Depth-Based", "Evaluation"},
    RecordLabel{14, "Lagged Continuous Mud Properties", "Evaluation"},
    RecordLabel{15, "Cuttings/Lithology", "Evaluation"},
    RecordLabel{16, "Hydrocarbon Show", "Evaluation"},
    RecordLabel{17, "Cementing", "Operations"},
    RecordLabel{18, "Drill Stem Testing", "Operations"},
    RecordLabel{19, "Configuration", "Configuration"},
    RecordLabel{20, "Mud Report", "Configuration"},
    RecordLabel{21, "Bit Report", "Configuration"},
    RecordLabel{22, "Remarks", "Reporting"},
    RecordLabel{23, "Well Identification", "Reporting"},
    RecordLabel{24, "Vessel Motion/Mooring Status", "Marine"},
    RecordLabel{25, "Weather/Sea State", "Marine"},
};

const RecordLabel* find_label(int record_type) noexcept {
  auto it = std::ranges::find(kRecordLabels, record_type,
                              &RecordLabel::record_type);
  return it == kRecordLabels.end() ? nullptr : &*it;
}

}  // namespace

SymbolCatalog::SymbolCatalog(std::span<const Symbol> symbols)
    : symbols_(symbols) {
  index_.reserve(symbols.size());
  for (size_t i = 0; i < symbols.size(); ++i) {
    index_.try_emplace(symbols[i].code, i);
  }
}

const SymbolCatalog& SymbolCatalog::instance() {
  static const SymbolCatalog catalog(wits_level0_symbols());
  return catalog;
}

std::optional<Symbol> SymbolCatalog::get(std::string_view code) const noexcept {
  auto it = index_.find(code);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return symbols_[it->second];
}

std::vector<Symbol> SymbolCatalog::by_record_type(int record_type) const {
  std::vector<Symbol> result;
  for (const auto& symbol : symbols_) {
    if (symbol.record_type == record_type) {
      result.push_back(symbol);
    }
  }
  return result;
}

std::map<std::string_view, Symbol> SymbolCatalog::search(
    std::string_view text) const {
  std::map<std::string_view, Symbol> result;
  const std::string needle = to_lower(text);

  for (const auto& symbol : symbols_) {
    if (icontains(symbol.name, needle) ||
        icontains(symbol.description, needle) ||
        icontains(symbol.code, needle)) {
      result.try_emplace(symbol.code, symbol);
    }
  }
  return result;
}

std::set<int> SymbolCatalog::record_types() const {
  std::set<int> result;
  for (const auto& symbol : symbols_) {
    result.insert(symbol.record_type);
  }
  return result;
}

std::string_view SymbolCatalog::record_description(int record_type) noexcept {
  const auto* label = find_label(record_type);
  return label ? label->description : "Unknown";
}

std::string_view SymbolCatalog::record_category(int record_type) noexcept {
  const auto* label = find_label(record_type);
  return label ? label->category : "Other";
}

}  // namespace wits::symbols
