/*==============================================================================
Plan

A plan is the common output of all planners: An ordered sequence of slots
where each slot gives the operating mode of the inverter and the energy flows
and cost the planner expects from this mode. The plan is created fresh for
each planning cycle, handed to the executor, and never patched afterwards.

The state of charge of the battery carries over from one slot to the next,
and a plan is continuous if the SOC after each slot equals the SOC before the
next slot. The plan also remembers the SOC at the start of the horizon so that
the final SOC and the change of stored energy are defined even for an empty
plan.

The metrics are the aggregates of the plan used by the executor and the
dashboards, and the valued cost is the cost of the plan as seen by the
mathematical planner: The net cost of the grid exchange, the penalties for
clipping and for grid-first operation, and the value of the stored energy
used over the horizon at the export price of the last slot. The valued cost
allows plans from different planners to be compared on equal terms since a
planner ending with an empty battery has sold energy that another planner
still holds.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_PLAN
#define SOLAR_PLANNER_PLAN

#include <map>                                // Mode counts
#include <string>                             // Reasons and names
#include <vector>                             // Slots
#include <cstddef>                            // Sizes
#include <iostream>                           // Printing plans

#include "TimeInterval.hpp"                   // Time
#include "Inverter.hpp"                       // Operating modes
#include "Battery.hpp"                        // Battery state
#include "Forecast.hpp"                       // Forecast prices
#include "Configuration.hpp"                  // Penalties

namespace SolarPlanner
{

class PlanSlot
{
public:

  Time          Start;
  OperatingMode Mode;
  double        Import,                       // kWh
                Export,                       // kWh
                BatteryFlow,                  // kWh, positive when charging
                SOCBefore,                    // %
                SOCAfter,                     // %
                Cost,                         // pence
                Clipped;                      // kWh
  std::string   Reason;
};

class PlanMetrics
{
public:

  double TotalCost,
         TotalClipped,
         TotalImport,
         TotalExport,
         FinalSOC;

  std::map< OperatingMode, std::size_t > ModeCounts;
};

class Plan
{
public:

  std::string             Planner,
                          FallbackReason;
  double                  InitialSOC;
  std::vector< PlanSlot > Slots;

  inline std::size_t Size( void ) const
  { return Slots.size(); }

  inline double FinalSOC( void ) const
  { return Slots.empty() ? InitialSOC : Slots.back().SOCAfter; }

  PlanMetrics Metrics( void ) const;

  // The invariant check throws a state invariant violation if the plan is
  // not continuous or if a SOC leaves the limits. A battery below the minimum
  // at entry may stay below the minimum as long as it does not discharge.

  void CheckInvariants( double MinimumSOC, double MaximumSOC ) const;

  // A short summary of the metrics

  void Summary( std::ostream & Output ) const;

  Plan( const std::string & PlannerName = std::string(), double StartSOC = 0.0 )
  : Planner( PlannerName ), FallbackReason(), InitialSOC( StartSOC ), Slots()
  {}
};

// The plan is printed as a table with one row per slot

std::ostream & operator << ( std::ostream & Output, const Plan & ThePlan );

// -----------------------------------------------------------------------------
// Valued cost
// -----------------------------------------------------------------------------

double ValuedCost( const Plan & ThePlan, const ForecastSeries & Forecast,
                   const BatteryState & Battery,
                   const PlannerConfiguration & Configuration );

// -----------------------------------------------------------------------------
// Comparison
// -----------------------------------------------------------------------------
//
// The differences are the values of the first plan minus the values of the
// second plan, and the disagreements are the indices of the slots where the
// two plans use different modes. Plans of different lengths cannot be
// compared and an input error is thrown.

class PlanComparison
{
public:

  double CostDifference,
         ClippedDifference,
         ImportDifference,
         ExportDifference,
         FinalSOCDifference;

  std::vector< std::size_t > ModeDisagreements;
};

PlanComparison ComparePlans( const Plan & First, const Plan & Second );

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_PLAN
