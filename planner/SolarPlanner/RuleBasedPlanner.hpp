/*==============================================================================
Rule based planner

The rule based planner decides the operating mode of each slot by a fixed
sequence of rules where the first rule that fires determines the mode. The
inverter and battery models then compute the energy flows of the slot from
this mode, and the resulting battery state is the start state of the next
slot. The rules are in order of precedence:

0. Recovery: A battery below the minimum SOC is charged from the grid until
   it reaches the minimum. This is unconditional for the first slot.

1. Feed-in priority: In a slot with a solar surplus, grid-first is chosen if
   the surplus will be clipped even with the battery absorbing at full rate,
   OR if the battery will be full before the surplus ends. Both signals look
   ahead to the end of the current surplus run, which is where the battery
   regains headroom. The rule is only enabled if it pays: the horizon is
   simulated once in self-use and once with the feed-in rule, and grid-first
   is used only if it reduces the clipped energy by at least the configured
   minimum saving.

2. Pre-sunrise discharge: If the horizon will still clip solar energy with
   the better of the two strategies above, the battery is discharged in the
   slots just before sunrise to make room for the energy it will absorb
   during the day. The absorption is summed over the daylight slots as the
   surplus the battery takes at its charge rate, and in a grid-first slot
   only the surplus above the grid-first export limit. If the absorption
   exceeds the current headroom by more than the margin, the target SOC
   leaves room for the absorption plus a buffer, but never goes below the
   minimum SOC. Once the target is reached, the remaining slots of the
   window are held in self-use. As the discharge changes the state at
   sunrise, the feed-in rule is evaluated again from sunrise with the
   battery at the target.

3. Arbitrage: The battery is charged if a later export price exceeds the
   current import price after the round trip losses by more than the
   arbitrage margin, and it is discharged if the current export price exceeds
   a later import price in the same way and the slot has a deficit or export
   room to take the energy.

4. Deficit prevention: If the deficit until the next slot with an import
   price no higher than the current price cannot be covered by the battery
   reserve and the derated surplus, the battery is charged now with the
   minimal energy covering the shortfall, regardless of the price.

5. Self-use is the default.

The look-ahead quantities needed by the rules are computed in one backward
sweep over the horizon before the forward pass deciding the slots. The feed-in
evaluation adds at most four simulated passes over the horizon, so the
planning time remains linear in the number of slots.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_RULE_BASED_PLANNER
#define SOLAR_PLANNER_RULE_BASED_PLANNER

#include <vector>                             // Look-ahead values
#include <string>                             // Planner name
#include <cstddef>                            // Indices

#include "Planner.hpp"                        // The planner interface
#include "Inverter.hpp"                       // Simulated passes

namespace SolarPlanner
{

class RuleBasedPlanner : public Planner
{
private:

  // The look-ahead values per slot computed by the backward sweep. The prefix
  // sums have one more element than the number of slots so that the sum over
  // slots [i,j) is Prefix[j] - Prefix[i].

  class LookAhead
  {
  public:

    std::vector< double >      SurplusDemand,      // kWh to end of surplus run
                               OverflowRisk,       // kWh clipped at full rate
                               MaxFutureExport,    // p/kWh after the slot
                               MinFutureImport,    // p/kWh after the slot
                               DeficitPrefix,      // kWh
                               SurplusPrefix;      // kWh
    std::vector< std::size_t > NextCheapSlot;      // Index or number of slots
    std::size_t                Sunrise;            // Index or number of slots
  };

  LookAhead Sweep( const ForecastSeries & Forecast,
                   const BatteryState & Battery,
                   const PlannerConfiguration & Configuration ) const;

  // The feed-in signal of a slot for the battery headroom at the start of
  // the slot

  bool FeedInSignal( const LookAhead & Ahead, std::size_t Slot, double Surplus,
                     double Headroom,
                     const PlannerConfiguration & Configuration ) const;

  // The outcome of simulating the horizon from a start slot with only the
  // self-use and feed-in rules.

  class Projection
  {
  public:

    double              Clipped;                    // kWh
    std::vector< bool > GridFirst;                  // Per slot of the horizon
  };

  Projection Project( const ForecastSeries & Forecast, const LookAhead & Ahead,
                      std::size_t Start, const BatteryState & State,
                      bool FeedIn, const Inverter & TheInverter,
                      const BatteryModel & Model,
                      const PlannerConfiguration & Configuration ) const;

  // The feed-in rule is enabled if grid-first reduces the clipping enough.
  // The projection kept is the one of the strategy chosen.

  class FeedInDecision
  {
  public:

    bool       Enabled;
    double     Saving;                              // kWh
    Projection Strategy;
  };

  FeedInDecision EvaluateFeedIn( const ForecastSeries & Forecast,
                                 const LookAhead & Ahead, std::size_t Start,
                                 const BatteryState & State,
                                 const Inverter & TheInverter,
                                 const BatteryModel & Model,
                                 const PlannerConfiguration & Configuration )
                                 const;

protected:

  virtual Plan Build( const ForecastSeries & Forecast,
                      const BatteryState & Battery,
                      const PlannerConfiguration & Configuration )
                      const override;

public:

  virtual std::string Name( void ) const override
  { return "RuleBased"; }

  RuleBasedPlanner( void )
  : Planner()
  {}

  virtual ~RuleBasedPlanner( void )
  {}
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_RULE_BASED_PLANNER
