/*==============================================================================
Solar planner

The solar planner decides how a home battery and a hybrid inverter should be
operated over the next hours, given forecasts of the grid prices, the solar
production and the household load. The horizon is divided into half hour
slots, and for each slot the plan gives the operating mode of the inverter
together with the expected grid import and export, the battery flow, the
state of charge (SOC) before and after the slot, the cost and the clipped
solar energy.

By default a planning cycle is run: The mathematical planner solves a mixed
integer linear program for the whole horizon, and if the program cannot be
solved within the time limit, the rule based planner produces the plan. The
planner can also be selected explicitly, and the two planners can be compared
on the same inputs.

The Command Options header documents the supported command line options, or
a summary can be obtained from using 'SolarPlanner --help'. An example could
be

SolarPlanner --Forecast Tomorrow.csv --SOC 35 --Capacity 9.5
             --ChargePower 3.6 --DischargePower 3.6 --LogLevel debug

where the forecast file has a header line and rows of the format
<POSIX seconds>, <import p/kWh>, <export p/kWh>, <solar kW>, <load kW>

License: LGPL 3.0
==============================================================================*/

#include <iostream>                           // Printing plans
#include <iomanip>                            // Formatting the comparison
#include <cstdlib>                            // Exit status

#include "CommandOptions.hpp"                 // The command line options
#include "ForecastReader.hpp"                 // Reading the forecast

#include "PlanningCycle.hpp"                  // The planners
#include "Errors.hpp"                         // Error types
#include "Log.hpp"                            // Log threshold

int main( int argc, char **argv )
{
  Console::CommandLineOptions Options( argc, argv );

  SolarPlanner::Log::SetThreshold( Options.LogLevel() );

  try
  {
    const SolarPlanner::ForecastSeries Forecast
      = Console::ReadForecast( Options.ForecastFile().string(),
                               Options.Start(), Options.Slots() );

    const SolarPlanner::BatteryState         & Battery  = Options.InitialBattery();
    const SolarPlanner::PlannerConfiguration & Settings = Options.Settings();

    {
      SolarPlanner::Log::Message Note( SolarPlanner::Log::Level::Debug,
                                       "Console" );
      Note << "Battery " << Battery << " with configuration " << Settings;
    }

    if ( Options.Compare() )
    {
      SolarPlanner::MathOptimalPlanner Optimizer;
      SolarPlanner::RuleBasedPlanner   Rules;

      SolarPlanner::Plan
      Optimal   = Optimizer.CreatePlan( Forecast, Battery, Settings ),
      RuleBased = Rules.CreatePlan( Forecast, Battery, Settings );

      SolarPlanner::PlanComparison Difference
        = SolarPlanner::ComparePlans( Optimal, RuleBased );

      Optimal.Summary( std::cout );
      RuleBased.Summary( std::cout );

      std::cout << std::fixed << std::setprecision(2)
                << Optimal.Planner << " - " << RuleBased.Planner << ":"
                << std::endl
                << "Cost:      " << Difference.CostDifference     << " p"
                << std::endl
                << "Clipped:   " << Difference.ClippedDifference  << " kWh"
                << std::endl
                << "Import:    " << Difference.ImportDifference   << " kWh"
                << std::endl
                << "Export:    " << Difference.ExportDifference   << " kWh"
                << std::endl
                << "Final SOC: " << Difference.FinalSOCDifference << " %"
                << std::endl
                << "Valued cost: "
                << SolarPlanner::ValuedCost( Optimal, Forecast, Battery,
                                             Settings ) << " p against "
                << SolarPlanner::ValuedCost( RuleBased, Forecast, Battery,
                                             Settings ) << " p" << std::endl
                << "Modes differ in " << Difference.ModeDisagreements.size()
                << " of " << Optimal.Size() << " slots" << std::endl;

      return EXIT_SUCCESS;
    }

    SolarPlanner::Plan Result;

    switch ( Options.Planner() )
    {
      case Console::CommandLineOptions::PlannerChoice::MathOptimal:
        Result = SolarPlanner::MathOptimalPlanner().CreatePlan( Forecast,
                                                    Battery, Settings );
        break;
      case Console::CommandLineOptions::PlannerChoice::RuleBased:
        Result = SolarPlanner::RuleBasedPlanner().CreatePlan( Forecast,
                                                  Battery, Settings );
        break;
      default:
        Result = SolarPlanner::PlanningCycle().Run( Forecast, Battery,
                                                    Settings );
        break;
    }

    Result.Summary( std::cout );
    std::cout << Result << std::endl;
  }
  catch ( const SolarPlanner::InputError & Error )
  {
    std::cerr << "Invalid input: " << Error.what() << std::endl;
    return EXIT_FAILURE;
  }
  catch ( const SolarPlanner::OptimizationFailure & Error )
  {
    std::cerr << "Optimisation failed: " << Error.what() << std::endl;
    return EXIT_FAILURE;
  }
  catch ( const SolarPlanner::StateInvariantViolation & Error )
  {
    std::cerr << "Invariant violated: " << Error.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
