/*==============================================================================
Configuration

All tunable constants of the planners are collected in one structure that is
given explicitly to every planning invocation. There is no global
configuration, and a planner is therefore a pure function of its forecast,
battery state and configuration.

The export limits are the grid operator's limits on the power fed into the
grid. The self-use limit applies in all modes except grid-first, where the
inverter is permitted the higher grid-first limit. The import limit caps the
grid power used for charging the battery.

The rule thresholds are energies in kWh. Their defaults are validated by the
scenario tests, but they are configuration values since the right values
depend on the installation.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_CONFIGURATION
#define SOLAR_PLANNER_CONFIGURATION

#include <chrono>                             // Solver time limit
#include <iostream>                           // Printing the configuration

namespace SolarPlanner
{

class PlannerConfiguration
{
public:

  // Grid limits in kW

  double SelfUseExportLimit   = 3.68,
         GridFirstExportLimit = 5.0,
         ImportLimit          = 15.0;

  // State of charge limits in percent

  double MinimumSOC = 10.0,
         MaximumSOC = 100.0;

  // Arbitrage requires a clear profit in pence per kWh after the round trip
  // losses.

  double ArbitrageMargin = 2.0;

  // Penalties of the linear program. Clipping costs pence per kWh, and using
  // grid-first costs pence per slot so that the mode is only chosen when it
  // gives a higher export.

  double ClippingPenalty  = 50.0,
         GridFirstPenalty = 0.01;

  // Rule thresholds in kWh, except the daylight threshold which is the solar
  // power in kW taken as sunrise.

  double ClippingRiskThreshold = 0.1,
         FeedInTriggerMargin   = 0.5,
         FeedInMinimumSaving   = 2.0,
         PresunriseMargin      = 1.0,
         PresunriseBuffer      = 2.0,
         DeficitThreshold      = 0.5,
         DaylightThreshold     = 0.5;

  // The solver budget and the absolute optimality gap in pence

  std::chrono::milliseconds SolverTimeLimit = std::chrono::milliseconds( 10000 );
  double                    OptimalityGap   = 0.5;

  // The validation throws an input error for the first inconsistent value

  void Validate( void ) const;
};

std::ostream & operator << ( std::ostream & Output,
                             const PlannerConfiguration & Configuration );

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_CONFIGURATION
