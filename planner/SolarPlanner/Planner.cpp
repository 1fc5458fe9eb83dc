/*==============================================================================
Planner

Input validation and result checking common to all planners.

License: LGPL 3.0
==============================================================================*/

#include <chrono>                             // Planning time

#include "Planner.hpp"
#include "Log.hpp"

namespace SolarPlanner
{

Plan Planner::CreatePlan( const ForecastSeries & Forecast,
                          const BatteryState & Battery,
                          const PlannerConfiguration & Configuration ) const
{
  Configuration.Validate();
  Forecast.Validate();
  Battery.Validate( Configuration.MaximumSOC );

  if ( Forecast.Size() == 0 )
    return Plan( Name(), Battery.SOC );

  auto Started = std::chrono::steady_clock::now();

  Plan Result = Build( Forecast, Battery, Configuration );

  Result.CheckInvariants( Configuration.MinimumSOC, Configuration.MaximumSOC );

  auto Elapsed = std::chrono::duration_cast< std::chrono::milliseconds >(
                 std::chrono::steady_clock::now() - Started );

  Log::Message Note( Log::Level::Information, Name() );
  Note << "Planned " << Result.Size() << " slots in " << Elapsed.count()
       << " ms: cost " << Result.Metrics().TotalCost << " p, SOC "
       << Result.InitialSOC << " % -> " << Result.FinalSOC() << " %";

  return Result;
}

}      // End name space SolarPlanner
