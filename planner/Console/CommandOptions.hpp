/*==============================================================================
Options

The command line options are processed using Boost::Program Options. The
parsing is done in a class that is constructed on the command line argument
count and argument vector. The same options can also be given in a
configuration file with lines of the form "<option> = <value>", and values
given on the command line take precedence over values in the file.

-h [ --help ]                     = help message
-f [ --Forecast <CSV> ]           = forecast file (required)
-c [ --Configuration <file> ]     = configuration file
Horizon:
-t [ --Start <POSIX seconds> ]    = start of the first slot. Default: the
                                    first time stamp in the forecast file
-n [ --Slots <count> ]            = number of slots. Default: the slots
                                    covering the forecast file
--Planner <name>                  = Cycle, MathOptimal or RuleBased.
                                    Default: Cycle, i.e. the mathematical
                                    planner with the rule based fallback
--Compare                         = run both planners and compare the plans
--LogLevel <level>                = debug, information, warning, error or
                                    silent. Default: information
Battery:
--SOC, --Capacity, --ChargePower, --DischargePower, --ChargeEfficiency,
--DischargeEfficiency
Configuration:
--SelfUseExportLimit, --GridFirstExportLimit, --ImportLimit, --MinimumSOC,
--MaximumSOC, --ArbitrageMargin, --ClippingPenalty, --GridFirstPenalty,
--ClippingRiskThreshold, --FeedInTriggerMargin, --PresunriseMargin,
--DeficitThreshold, --DaylightThreshold, --SolverTimeLimit <ms>,
--OptimalityGap

The forecast file is a CSV file with a header line naming the columns
Time, Import, Export, Solar, Load where the time is in POSIX seconds, the
prices in pence per kWh and the solar production and load in kW.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_CONSOLE_OPTIONS
#define SOLAR_PLANNER_CONSOLE_OPTIONS

#include <string>                             // Names
#include <optional>                           // Optional horizon
#include <cstddef>                            // Slot count
#include <filesystem>                         // Portable file paths

#include "TimeInterval.hpp"                   // Time stamps
#include "Battery.hpp"                        // The battery state
#include "Configuration.hpp"                  // The planner configuration
#include "Log.hpp"                            // Log levels

namespace Console
{

class CommandLineOptions
{
public:

  enum class PlannerChoice
  {
    Cycle,
    MathOptimal,
    RuleBased
  };

private:

  std::filesystem::path                  ForecastProfile;
  std::optional< SolarPlanner::Time >    HorizonStart;
  std::optional< std::size_t >           HorizonSlots;
  PlannerChoice                          Selected;
  bool                                   ComparePlanners;
  SolarPlanner::Log::Level               Verbosity;
  SolarPlanner::BatteryState             Battery;
  SolarPlanner::PlannerConfiguration     Configuration;

public:

  inline std::filesystem::path ForecastFile( void ) const
  { return ForecastProfile; }

  inline std::optional< SolarPlanner::Time > Start( void ) const
  { return HorizonStart; }

  inline std::optional< std::size_t > Slots( void ) const
  { return HorizonSlots; }

  inline PlannerChoice Planner( void ) const
  { return Selected; }

  inline bool Compare( void ) const
  { return ComparePlanners; }

  inline SolarPlanner::Log::Level LogLevel( void ) const
  { return Verbosity; }

  inline const SolarPlanner::BatteryState & InitialBattery( void ) const
  { return Battery; }

  inline const SolarPlanner::PlannerConfiguration & Settings( void ) const
  { return Configuration; }

  // The constructor does all the parsing and exits the program if the help
  // is requested or if the options cannot be parsed.

  CommandLineOptions( int argc, char **argv );
  CommandLineOptions( void ) = delete;
  CommandLineOptions( const CommandLineOptions & Other ) = delete;
};

}      // End name space Console
#endif // SOLAR_PLANNER_CONSOLE_OPTIONS
