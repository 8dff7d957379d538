#ifndef WITS_TELEMETRY_UNITS_UNIT_HPP
#define WITS_TELEMETRY_UNITS_UNIT_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace wits::units {

/// @brief 單位制
enum class UnitSystem : uint8_t {
  Metric,  ///< 公制
  Field,   ///< 英制 (FPS)
};

/// @brief 單位類別，同類別的單位之間才能互相轉換
enum class Category : uint8_t {
  Length,
  DrillingRate,
  Pressure,
  FlowRate,
  Density,
  Temperature,
  Force,
  Torque,
  Volume,
  Angle,
  DoglegSeverity,
  RotarySpeed,
  StrokeRate,
  Time,
  Resistivity,
  Conductivity,
  Radioactivity,
  Concentration,
  Dimensionless,
};

/// @brief 鑽井資料使用的單位
/// @details 每個類別的第一個單位為該類別的基準單位
enum class Unit : uint8_t {
  // Length
  Meters,
  Feet,
  Millimeters,
  Inches,
  // DrillingRate
  MetersPerHour,
  FeetPerHour,
  // Pressure
  Kilopascals,
  Psi,
  Bar,
  Megapascals,
  // FlowRate
  LitersPerMinute,
  GallonsPerMinute,
  CubicMetersPerMinute,
  BarrelsPerMinute,
  // Density
  KilogramsPerCubicMeter,
  PoundsPerGallon,
  SpecificGravity,
  // Temperature
  DegreesCelsius,
  DegreesFahrenheit,
  // Force
  KiloDecanewtons,
  Kilonewtons,
  KiloPounds,
  // Torque
  KilonewtonMeters,
  KiloFootPounds,
  // Volume
  CubicMeters,
  Barrels,
  Liters,
  Gallons,
  // Angle
  Degrees,
  Radians,
  // DoglegSeverity
  DegreesPer30Meters,
  DegreesPer100Feet,
  // RotarySpeed
  RevolutionsPerMinute,
  // StrokeRate
  StrokesPerMinute,
  // Time
  Seconds,
  Minutes,
  Hours,
  // Resistivity
  OhmMeters,
  // Conductivity
  MillimhosPerMeter,
  // Radioactivity
  ApiUnits,
  // Concentration
  Percent,
  PartsPerMillion,
  // Dimensionless
  Unitless,
};

/// @brief 單位代碼，例如 "METERS"、"FHR"
[[nodiscard]] std::string_view code(Unit unit) noexcept;

/// @brief 單位標籤 (WITS 顯示用)，例如 "M"、"F/HR"
[[nodiscard]] std::string_view label(Unit unit) noexcept;

/// @brief 類別名稱，例如 "length"
[[nodiscard]] std::string_view name(Category category) noexcept;

/// @brief 單位制名稱，"metric" 或 "fps"
[[nodiscard]] std::string_view name(UnitSystem system) noexcept;

/// @brief 從代碼或標籤解析單位 (不分大小寫)
/// @return 無法識別時返回 std::nullopt
[[nodiscard]] std::optional<Unit> parse_unit(std::string_view text) noexcept;

/// @brief 所有已知單位 (依類別排序)
[[nodiscard]] std::span<const Unit> all_units() noexcept;

}  // namespace wits::units

#endif
