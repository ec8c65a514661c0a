#pragma once

#include <optional>

#include "mtc_string.hpp"
#include "weather-code.hpp"

namespace mtc {

/// Temperature rounded to the nearest integer, such as "-3°". "-" if absent.
string FormatTemperature(std::optional<double> temperature);

/// Precipitation in mm, with one decimal below 5 mm ("0.4mm", "12mm").
/// Empty for no precipitation, "-" if absent.
string FormatPrecipitation(std::optional<double> precipitation);

/// Weather emoji of given code at given local hour, always 2 columns wide in a terminal. "-" if absent.
string FormatWeatherSymbol(std::optional<WeatherCode> weatherCode, int hour);

}  // namespace mtc
