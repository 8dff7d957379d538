#ifndef WITS_TELEMETRY_SRC_UNITS_UNIT_TABLE_HPP
#define WITS_TELEMETRY_SRC_UNITS_UNIT_TABLE_HPP

#include <array>
#include <string_view>

#include "wits/units/unit.hpp"

namespace wits::units::detail {

/// @brief 單位靜態資料
struct UnitInfo {
  Unit unit;
  std::string_view code;
  std::string_view label;
  Category category;
  double to_base;  ///< 1 個此單位等於多少基準單位 (溫度不使用)
};

// 順序必須與 enum Unit 相同
inline constexpr std::array kUnitTable = {
    UnitInfo{Unit::Meters, "METERS", "M", Category::Length, 1.0},
    UnitInfo{Unit::Feet, "FEET", "F", Category::Length, 0.3048},
    UnitInfo{Unit::Millimeters, "MILLIMETERS", "MM", Category::Length, 0.001},
    UnitInfo{Unit::Inches, "INCHES", "IN", Category::Length, 0.0254},

    UnitInfo{Unit::MetersPerHour, "MHR", "M/HR", Category::DrillingRate, 1.0},
    UnitInfo{Unit::FeetPerHour, "FHR", "F/HR", Category::DrillingRate, 0.3048},

    UnitInfo{Unit::Kilopascals, "KPA", "KPA", Category::Pressure, 1.0},
    UnitInfo{Unit::Psi, "PSI", "PSI", Category::Pressure, 6.894757293168361},
    UnitInfo{Unit::Bar, "BAR", "BAR", Category::Pressure, 100.0},
    UnitInfo{Unit::Megapascals, "MPA", "MPA", Category::Pressure, 1000.0},

    UnitInfo{Unit::LitersPerMinute, "LPM", "L/M", Category::FlowRate, 1.0},
    UnitInfo{Unit::GallonsPerMinute, "GPM", "GPM", Category::FlowRate,
             3.785411784},
    UnitInfo{Unit::CubicMetersPerMinute, "M3PM", "M3/M", Category::FlowRate,
             1000.0},
    UnitInfo{Unit::BarrelsPerMinute, "BPM", "BPM", Category::FlowRate,
             158.987294928},

    UnitInfo{Unit::KilogramsPerCubicMeter, "KGM3", "KG/M3", Category::Density,
             1.0},
    UnitInfo{Unit::PoundsPerGallon, "PPG", "PPG", Category::Density,
             119.82642731689663},
    UnitInfo{Unit::SpecificGravity, "SG", "SG", Category::Density, 1000.0},

    UnitInfo{Unit::DegreesCelsius, "DEGC", "DEGC", Category::Temperature, 1.0},
    UnitInfo{Unit::DegreesFahrenheit, "DEGF", "DEGF", Category::Temperature,
             1.0},

    UnitInfo{Unit::KiloDecanewtons, "KDN", "KDN", Category::Force, 1.0},
    UnitInfo{Unit::Kilonewtons, "KN", "KN", Category::Force, 0.1},
    UnitInfo{Unit::KiloPounds, "KLB", "KLB", Category::Force,
             0.44482216152605},

    UnitInfo{Unit::KilonewtonMeters, "KNM", "KNM", Category::Torque, 1.0},
    UnitInfo{Unit::KiloFootPounds, "KFLB", "KFLB", Category::Torque,
             1.3558179483314004},

    UnitInfo{Unit::CubicMeters, "M3", "M3", Category::Volume, 1.0},
    UnitInfo{Unit::Barrels, "BBL", "BBL", Category::Volume, 0.158987294928},
    UnitInfo{Unit::Liters, "LITERS", "L", Category::Volume, 0.001},
    UnitInfo{Unit::Gallons, "GALLONS", "GAL", Category::Volume, 0.003785411784},

    UnitInfo{Unit::Degrees, "DEG", "DEG", Category::Angle, 1.0},
    UnitInfo{Unit::Radians, "RAD", "RAD", Category::Angle, 57.29577951308232},

    UnitInfo{Unit::DegreesPer30Meters, "DEG30M", "DEG/30M",
             Category::DoglegSeverity, 1.0},
    // 100 ft = 30.48 m
    UnitInfo{Unit::DegreesPer100Feet, "DEG100F", "DEG/100F",
             Category::DoglegSeverity, 30.0 / 30.48},

    UnitInfo{Unit::RevolutionsPerMinute, "RPM", "RPM", Category::RotarySpeed,
             1.0},
    UnitInfo{Unit::StrokesPerMinute, "SPM", "SPM", Category::StrokeRate, 1.0},

    UnitInfo{Unit::Seconds, "SEC", "SEC", Category::Time, 1.0},
    UnitInfo{Unit::Minutes, "MIN", "MIN", Category::Time, 60.0},
    UnitInfo{Unit::Hours, "HR", "HR", Category::Time, 3600.0},

    UnitInfo{Unit::OhmMeters, "OHMM", "OHMM", Category::Resistivity, 1.0},
    UnitInfo{Unit::MillimhosPerMeter, "MMHOM", "MMHO/M", Category::Conductivity,
             1.0},
    UnitInfo{Unit::ApiUnits, "API", "API", Category::Radioactivity, 1.0},

    UnitInfo{Unit::Percent, "PERCENT", "%", Category::Concentration, 1.0},
    UnitInfo{Unit::PartsPerMillion, "PPM", "PPM", Category::Concentration,
             0.0001},

    UnitInfo{Unit::Unitless, "UNITLESS", "UNITLESS", Category::Dimensionless,
             1.0},
};

static_assert(
    [] {
      for (size_t i = 0; i < kUnitTable.size(); ++i) {
        if (static_cast<size_t>(kUnitTable[i].unit) != i) {
          return false;
        }
      }
      return true;
    }(),
    "kUnitTable must follow the declaration order of enum Unit");

[[nodiscard]] constexpr const UnitInfo& info(Unit unit) noexcept {
  return kUnitTable[static_cast<size_t>(unit)];
}

}  // namespace wits::units::detail

#endif
