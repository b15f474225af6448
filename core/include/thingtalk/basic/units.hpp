// thingtalk/basic/units.hpp - Measurement units and base-unit conversion
//
// Every Measure type is normalized to the base unit of its dimension
// (milliseconds for time, meters for length, ...). Values keep the unit
// they were written in and are converted when they are made concrete.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thingtalk
{

/// Base unit of `unit`, or std::nullopt if the unit is unknown.
[[nodiscard]] std::optional<std::string_view> base_unit(std::string_view unit) noexcept;

[[nodiscard]] inline bool is_known_unit(std::string_view unit) noexcept
{
  return base_unit(unit).has_value();
}

/// Convert `value` from `unit` to its base unit. Unknown units pass through.
[[nodiscard]] double transform_to_base_unit(double value, std::string_view unit) noexcept;

/// Convert a base-unit quantity back to `unit`. Unknown units pass through.
[[nodiscard]] double transform_from_base_unit(double value, std::string_view unit) noexcept;

/// All units sharing the base unit `base`, in table order.
[[nodiscard]] std::vector<std::string> units_with_base(std::string_view base);

/// Time units from the smallest to the largest, as used by date edges.
[[nodiscard]] const std::vector<std::string> & time_units();

}  // namespace thingtalk
