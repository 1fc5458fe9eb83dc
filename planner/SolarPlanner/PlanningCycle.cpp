/*==============================================================================
Planning cycle

License: LGPL 3.0
==============================================================================*/

#include "PlanningCycle.hpp"
#include "Errors.hpp"
#include "Log.hpp"

namespace SolarPlanner
{

Plan PlanningCycle::Run( const ForecastSeries & Forecast,
                         const BatteryState & Battery,
                         const PlannerConfiguration & Configuration ) const
{
  try
  {
    return Optimizer.CreatePlan( Forecast, Battery, Configuration );
  }
  catch ( const OptimizationFailure & Error )
  {
    {
      Log::Message Warning( Log::Level::Warning, "PlanningCycle" );
      Warning << Optimizer.Name() << " failed, using " << Rules.Name()
              << " plan: " << Error.what();
    }

    Plan Fallback = Rules.CreatePlan( Forecast, Battery, Configuration );
    Fallback.FallbackReason = Error.what();

    return Fallback;
  }
}

}      // End name space SolarPlanner
