// thingtalk/basic/units.cpp - Unit table
#include "thingtalk/basic/units.hpp"

namespace thingtalk
{

namespace
{

enum class Conversion { Scale, Fahrenheit, Kelvin };

struct UnitInfo
{
  std::string_view unit;
  std::string_view base;
  double factor;
  Conversion conversion = Conversion::Scale;
};

// clang-format off
constexpr UnitInfo k_units[] = {
  // time: business month is 30 days, business year is 365 days
  {"ms", "ms", 1},
  {"s", "ms", 1000},
  {"min", "ms", 60.0 * 1000},
  {"h", "ms", 3600.0 * 1000},
  {"day", "ms", 86400.0 * 1000},
  {"week", "ms", 86400.0 * 7 * 1000},
  {"mon", "ms", 86400.0 * 30 * 1000},
  {"year", "ms", 86400.0 * 365 * 1000},
  // length
  {"m", "m", 1},
  {"km", "m", 1000},
  {"mm", "m", 1.0 / 1000},
  {"cm", "m", 1.0 / 100},
  {"mi", "m", 1609.344},
  {"in", "m", 0.0254},
  {"ft", "m", 0.3048},
  // speed
  {"mps", "mps", 1},
  {"kmph", "mps", 0.27777778},
  {"mph", "mps", 0.44704},
  // weight
  {"kg", "kg", 1},
  {"g", "kg", 1.0 / 1000},
  {"lb", "kg", 0.45359237},
  {"oz", "kg", 0.028349523},
  // pressure
  {"Pa", "Pa", 1},
  {"bar", "Pa", 100000},
  {"psi", "Pa", 6894.7573},
  {"mmHg", "Pa", 133.32239},
  {"inHg", "Pa", 3386.3886},
  {"atm", "Pa", 101325},
  // temperature
  {"C", "C", 1},
  {"F", "C", 1, Conversion::Fahrenheit},
  {"K", "C", 1, Conversion::Kelvin},
  // energy
  {"kcal", "kcal", 1},
  {"kJ", "kcal", 0.239006},
  // file and memory sizes
  {"byte", "byte", 1},
  {"KB", "byte", 1000.0},
  {"KiB", "byte", 1024.0},
  {"MB", "byte", 1000.0 * 1000},
  {"MiB", "byte", 1024.0 * 1024},
  {"GB", "byte", 1000.0 * 1000 * 1000},
  {"GiB", "byte", 1024.0 * 1024 * 1024},
  {"TB", "byte", 1000.0 * 1000 * 1000 * 1000},
  {"TiB", "byte", 1024.0 * 1024 * 1024 * 1024},
};
// clang-format on

const UnitInfo * find_unit(std::string_view unit) noexcept
{
  for (const auto & info : k_units) {
    if (info.unit == unit) {
      return &info;
    }
  }
  return nullptr;
}

}  // namespace

std::optional<std::string_view> base_unit(std::string_view unit) noexcept
{
  const UnitInfo * info = find_unit(unit);
  if (info == nullptr) {
    return std::nullopt;
  }
  return info->base;
}

double transform_to_base_unit(double value, std::string_view unit) noexcept
{
  const UnitInfo * info = find_unit(unit);
  if (info == nullptr) {
    return value;
  }
  switch (info->conversion) {
    case Conversion::Fahrenheit:
      return (value - 32) / 1.8;
    case Conversion::Kelvin:
      return value - 273.15;
    case Conversion::Scale:
      break;
  }
  return value * info->factor;
}

double transform_from_base_unit(double value, std::string_view unit) noexcept
{
  const UnitInfo * info = find_unit(unit);
  if (info == nullptr) {
    return value;
  }
  switch (info->conversion) {
    case Conversion::Fahrenheit:
      return value * 1.8 + 32;
    case Conversion::Kelvin:
      return value + 273.15;
    case Conversion::Scale:
      break;
  }
  return value / info->factor;
}

std::vector<std::string> units_with_base(std::string_view base)
{
  std::vector<std::string> out;
  for (const auto & info : k_units) {
    if (info.base == base) {
      out.emplace_back(info.unit);
    }
  }
  return out;
}

const std::vector<std::string> & time_units()
{
  static const std::vector<std::string> units = {"ms",  "s",    "min", "h",
                                                 "day", "week", "mon", "year"};
  return units;
}

}  // namespace thingtalk
