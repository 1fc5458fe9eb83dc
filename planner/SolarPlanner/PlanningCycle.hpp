/*==============================================================================
Planning cycle

A planning cycle produces the plan for one horizon. The mathematical planner
is tried first, and if it fails to find an optimal plan within its time
budget, or if the program is infeasible, the rule based planner produces the
plan instead. The returned plan records which planner produced it, and for a
fallback plan the reason why the optimisation failed.

Only optimisation failures lead to the fallback. Invalid inputs will fail
equally for both planners, and a broken invariant is a defect that must not
be hidden by another planner, so these errors are passed on to the caller.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_PLANNING_CYCLE
#define SOLAR_PLANNER_PLANNING_CYCLE

#include "MathOptimalPlanner.hpp"             // First choice
#include "RuleBasedPlanner.hpp"               // Fallback

namespace SolarPlanner
{

class PlanningCycle
{
private:

  MathOptimalPlanner Optimizer;
  RuleBasedPlanner   Rules;

public:

  Plan Run( const ForecastSeries & Forecast, const BatteryState & Battery,
            const PlannerConfiguration & Configuration ) const;

  PlanningCycle( MathOptimalPlanner::StopFlag Cancellation
                   = MathOptimalPlanner::StopFlag() )
  : Optimizer( Cancellation ), Rules()
  {}
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_PLANNING_CYCLE
