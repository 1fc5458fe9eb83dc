/*==============================================================================
Mathematical optimal planner

The whole horizon is planned by one mixed integer linear program. The
variables of slot t are energies in kWh over the slot: the grid import and
export, the battery charge and discharge measured at the AC bus, the clipped
solar energy, a binary indicator for the grid-first mode, a binary indicator
z for charging, and the state of charge at the end of the slot.

The constraints are for each slot t with duration h

  Balance:  import - export - charge + discharge - clipped = (load - solar) h
  Export:   export <= SelfUseLimit h + (GridFirstLimit - SelfUseLimit) h y
  Charge:   charge <= MaxChargePower h z
            discharge <= MaxDischargePower h (1 - z)
  SOC:      soc[t+1] = soc[t] + ( charge * ChargeEfficiency
                                - discharge / DischargeEfficiency )
                                / Capacity * 100

where soc[0] is the current reading and soc[t+1] is bounded by the minimum
and maximum SOC. The rate limits, the import limit and the available solar
energy are bounds on the variables.

The objective is the import cost minus the export revenue, plus a penalty
for clipped energy and a small penalty per grid-first slot, plus the value of
the energy taken out of the battery over the horizon priced at the export
price of the last slot. Without the last term the optimum would always empty
the battery at the end of the horizon.

The solution is decoded into a plan with the same structure as the rule based
plan: A slot is grid-first if the indicator is set, force-charge if the
battery takes more than the solar surplus, force-discharge if the battery
delivers more than the load deficit, and self-use otherwise.

The program is solved by CBC through the linear optimisation library. The
planner never returns an approximate answer. An infeasible program, a
solver exceeding its time budget, or a search stopped by the stop flag is
reported as an optimisation failure, and it is for the caller to fall back
to the rule based planner.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_MATH_OPTIMAL_PLANNER
#define SOLAR_PLANNER_MATH_OPTIMAL_PLANNER

#include <string>                             // Planner name

#include "Planner.hpp"                        // The planner interface
#include "Linear/Status.hpp"                  // The stop flag

namespace SolarPlanner
{

class MathOptimalPlanner : public Planner
{
public:

  using StopFlag = Optimization::Linear::Limits::StopFlag;

private:

  // Setting the stop flag from another thread aborts a running search. The
  // flag is optional and the search cannot be stopped if it is not given.

  StopFlag StopRequest;

protected:

  virtual Plan Build( const ForecastSeries & Forecast,
                      const BatteryState & Battery,
                      const PlannerConfiguration & Configuration )
                      const override;

public:

  virtual std::string Name( void ) const override
  { return "MathOptimal"; }

  MathOptimalPlanner( StopFlag Cancellation = StopFlag() )
  : Planner(), StopRequest( Cancellation )
  {}

  virtual ~MathOptimalPlanner( void )
  {}
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_MATH_OPTIMAL_PLANNER
