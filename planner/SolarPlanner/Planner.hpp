/*==============================================================================
Planner

The planner interface is common for the rule based planner and the
mathematical planner. A planner is a pure function of the forecast, the
battery state at the start of the horizon, and the configuration: It has no
state carried from one planning cycle to the next, and identical inputs
produce identical plans.

The public function validates the inputs, returns an empty plan for an empty
forecast, and checks the invariants of the plan produced by the derived
planner before it is returned. The derived planners only implement the
construction of a plan for a valid and non-empty forecast.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_PLANNER
#define SOLAR_PLANNER_PLANNER

#include <string>                             // Planner names

#include "Forecast.hpp"                       // The forecast
#include "Battery.hpp"                        // The battery state
#include "Configuration.hpp"                  // The configuration
#include "Plan.hpp"                           // The resulting plan

namespace SolarPlanner
{

class Planner
{
protected:

  virtual Plan Build( const ForecastSeries & Forecast,
                      const BatteryState & Battery,
                      const PlannerConfiguration & Configuration ) const = 0;

public:

  virtual std::string Name( void ) const = 0;

  Plan CreatePlan( const ForecastSeries & Forecast,
                   const BatteryState & Battery,
                   const PlannerConfiguration & Configuration ) const;

  Planner( void )
  {}

  virtual ~Planner( void )
  {}
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_PLANNER
