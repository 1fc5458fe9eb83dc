/*==============================================================================
Forecast reader

This reads a forecast from a CSV file with a header line naming the columns
Time, Import, Export, Solar and Load. The time stamps are POSIX seconds and
need not follow the half hour slots: the samples are aligned to the slots of
the planning horizon by the forecast alignment. Columns in other orders are
accepted, and extra columns are ignored. The CSV parser is Ben Strasser's
fast C++ CSV Reader class [1].

If the start of the horizon is not given, it is the first time stamp of the
file, and if the number of slots is not given, the horizon covers all time
stamps of the file.

References:
[1] https://github.com/ben-strasser/fast-cpp-csv-parser

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_CONSOLE_FORECAST_READER
#define SOLAR_PLANNER_CONSOLE_FORECAST_READER

#include <string>                             // File names
#include <optional>                           // Optional horizon
#include <cstddef>                            // Slot count

#include "Forecast.hpp"                       // The forecast series

namespace Console
{
  extern SolarPlanner::ForecastSeries
  ReadForecast( const std::string & FileName,
                std::optional< SolarPlanner::Time > Start = std::nullopt,
                std::optional< std::size_t > Slots = std::nullopt );
}      // name space Console
#endif // SOLAR_PLANNER_CONSOLE_FORECAST_READER
