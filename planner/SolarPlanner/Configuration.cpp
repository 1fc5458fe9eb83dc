/*==============================================================================
Configuration

Validation and printing of the planner configuration.

License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // Finite values
#include <sstream>                            // Error messages
#include <string>                             // Parameter names

#include "Configuration.hpp"
#include "Errors.hpp"

namespace SolarPlanner
{

// A small helper throwing if a value is not finite or below a lower limit

static void RequireAtLeast( const std::string & Name, double Value,
                            double Lower )
{
  if ( !std::isfinite( Value ) || Value < Lower )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Configuration value " << Name << " = " << Value
                 << " must be finite and at least " << Lower;

    throw InputError( ErrorMessage.str() );
  }
}

void PlannerConfiguration::Validate( void ) const
{
  RequireAtLeast( "SelfUseExportLimit",    SelfUseExportLimit,    0.0 );
  RequireAtLeast( "GridFirstExportLimit",  GridFirstExportLimit,  0.0 );
  RequireAtLeast( "ImportLimit",           ImportLimit,           0.0 );
  RequireAtLeast( "MinimumSOC",            MinimumSOC,            0.0 );
  RequireAtLeast( "MaximumSOC",            MaximumSOC,            0.0 );
  RequireAtLeast( "ArbitrageMargin",       ArbitrageMargin,       0.0 );
  RequireAtLeast( "ClippingPenalty",       ClippingPenalty,       0.0 );
  RequireAtLeast( "GridFirstPenalty",      GridFirstPenalty,      0.0 );
  RequireAtLeast( "ClippingRiskThreshold", ClippingRiskThreshold, 0.0 );
  RequireAtLeast( "FeedInTriggerMargin",   FeedInTriggerMargin,   0.0 );
  RequireAtLeast( "FeedInMinimumSaving",   FeedInMinimumSaving,   0.0 );
  RequireAtLeast( "PresunriseMargin",      PresunriseMargin,      0.0 );
  RequireAtLeast( "PresunriseBuffer",      PresunriseBuffer,      0.0 );
  RequireAtLeast( "DeficitThreshold",      DeficitThreshold,      0.0 );
  RequireAtLeast( "DaylightThreshold",     DaylightThreshold,     0.0 );
  RequireAtLeast( "OptimalityGap",         OptimalityGap,         0.0 );

  if ( GridFirstExportLimit < SelfUseExportLimit )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The grid-first export limit " << GridFirstExportLimit
                 << " kW is below the self-use export limit "
                 << SelfUseExportLimit << " kW";

    throw InputError( ErrorMessage.str() );
  }

  if ( !( MinimumSOC < MaximumSOC ) || MaximumSOC > 100.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The state of charge limits [" << MinimumSOC << ","
                 << MaximumSOC << "] must satisfy 0 <= min < max <= 100";

    throw InputError( ErrorMessage.str() );
  }

  if ( SolverTimeLimit.count() < 0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The solver time limit cannot be negative";

    throw InputError( ErrorMessage.str() );
  }
}

std::ostream & operator << ( std::ostream & Output,
                             const PlannerConfiguration & Configuration )
{
  Output << "Export limits: self-use " << Configuration.SelfUseExportLimit
         << " kW, grid-first " << Configuration.GridFirstExportLimit
         << " kW; import limit " << Configuration.ImportLimit << " kW" << std::endl
         << "SOC limits: [" << Configuration.MinimumSOC << ","
         << Configuration.MaximumSOC << "] %" << std::endl
         << "Arbitrage margin: " << Configuration.ArbitrageMargin
         << " p/kWh" << std::endl
         << "Penalties: clipping " << Configuration.ClippingPenalty
         << " p/kWh, grid-first " << Configuration.GridFirstPenalty
         << " p/slot" << std::endl
         << "Feed-in: trigger margin " << Configuration.FeedInTriggerMargin
         << " kWh, minimum saving " << Configuration.FeedInMinimumSaving
         << " kWh" << std::endl
         << "Pre-sunrise: margin " << Configuration.PresunriseMargin
         << " kWh, buffer " << Configuration.PresunriseBuffer << " kWh"
         << std::endl
         << "Solver: " << Configuration.SolverTimeLimit.count()
         << " ms, gap " << Configuration.OptimalityGap << " p" << std::endl;

  return Output;
}

}      // End name space SolarPlanner
