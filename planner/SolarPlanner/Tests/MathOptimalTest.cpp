/*==============================================================================
Mathematical optimal test

The mathematical planner is tested on scenarios where the optimal decisions
are known: A battery at 80% of 32 kWh should only be exported down to its 70%
minimum if the export price of the slot exceeds the 15p value of the stored
energy at the end of the horizon, and a full battery facing more solar than
the self-use export limit should use grid-first to reduce the clipping. With
conversion losses the battery must never charge and discharge in the same
slot, so every SOC change follows from a flow in one direction.

On the volatile price day the optimal plan must be at least as good as the
rule based plan within the optimality gap, as the rule based plan is a
feasible solution of the same linear program. On this day the optimal plan
also has the lower total cost without the terminal value. The failures of infeasible
programs, exhausted time budgets and stopped searches are also tested.

The program returns a non-zero exit status if any of the checks fails.

License: LGPL 3.0
==============================================================================*/

#include <chrono>            // Time limits
#include <cmath>             // Absolute values
#include <cstdlib>           // Exit status
#include <iostream>          // Status messages
#include <memory>            // Stop flag
#include <atomic>            // Stop flag
#include <string>            // Test names

#include "MathOptimalPlanner.hpp"
#include "RuleBasedPlanner.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "Scenarios.hpp"

using namespace SolarPlanner;

static unsigned int Failures = 0;

void Check( bool Condition, const std::string & Description )
{
  if ( Condition )
    std::cout << "[PASS] " << Description << std::endl;
  else
  {
    std::cout << "[FAIL] " << Description << std::endl;
    ++Failures;
  }
}

bool Near( double Value, double Expected )
{
  return std::abs( Value - Expected ) < 1e-6;
}

// -----------------------------------------------------------------------------
// Terminal value of the stored energy
// -----------------------------------------------------------------------------
//
// 32 kWh at 80% with the minimum SOC at 70% leaves 3.2 kWh that can be
// exported in one slot at 6.4 kW. Kept in the battery it is worth 48p at the
// 15p export price of the last slot.

void TerminalValue( void )
{
  MathOptimalPlanner   Planner;
  PlannerConfiguration Configuration;

  Configuration.MinimumSOC           = 70.0;
  Configuration.SelfUseExportLimit   = 8.0;
  Configuration.GridFirstExportLimit = 10.0;

  BatteryState Battery{ 80.0, 32.0, 6.4, 6.4, 1.0, 1.0 };

  ForecastSeries Profitable = Scenario::Constant( 2, 30.0, 15.0, 0.0, 0.0 );
  Profitable.ExportPrice[0] = 16.0;

  Plan Sold = Planner.CreatePlan( Profitable, Battery, Configuration );

  Check( Sold.Slots[0].Mode == OperatingMode::ForceDischarge &&
         Near( Sold.Slots[0].SOCAfter, 70.0 ) &&
         Near( Sold.Slots[0].Export, 3.2 ),
         "The battery is exported when 3.2 kWh earn more than 48p" );

  Check( Near( ValuedCost( Sold, Profitable, Battery, Configuration ),
               -3.2 * 16.0 + 3.2 * 15.0 ),
         "The valued cost includes the terminal value of the battery" );

  ForecastSeries Unprofitable = Scenario::Constant( 2, 30.0, 15.0, 0.0, 0.0 );
  Unprofitable.ExportPrice[0] = 14.0;

  Plan Kept = Planner.CreatePlan( Unprofitable, Battery, Configuration );

  Check( Kept.Slots[0].Mode != OperatingMode::ForceDischarge &&
         Near( Kept.Slots[0].SOCAfter, 80.0 ),
         "The battery is kept when 3.2 kWh earn less than 48p" );
}

// -----------------------------------------------------------------------------
// Decoding the modes
// -----------------------------------------------------------------------------

void Modes( void )
{
  MathOptimalPlanner   Planner;
  PlannerConfiguration Configuration;

  // A full battery and 10 kW of solar: self-use clips 3.16 kWh, grid-first
  // clips 2.5 kWh

  ForecastSeries Sunny = Scenario::Constant( 1, 20.0, 10.0, 10.0, 0.0 );
  BatteryState   Full  = Scenario::Battery( 100.0, 10.0, 5.0, 1.0 );

  Plan Exported = Planner.CreatePlan( Sunny, Full, Configuration );

  Check( Exported.Slots[0].Mode == OperatingMode::GridFirst &&
         Near( Exported.Slots[0].Export,  2.5 ) &&
         Near( Exported.Slots[0].Clipped, 2.5 ),
         "Grid-first is chosen to reduce clipping of a full battery" );

  // Cheap import before expensive import charges the battery from the grid

  ForecastSeries Spread = Scenario::Constant( 2, 40.0, 0.0, 0.0, 2.0 );
  Spread.ImportPrice[0] = 5.0;

  Plan Charged = Planner.CreatePlan( Spread,
                                     Scenario::Battery( 10.0, 10.0, 5.0, 1.0 ),
                                     Configuration );

  Check( Charged.Slots[0].Mode == OperatingMode::ForceCharge &&
         Near( Charged.Slots[0].BatteryFlow, 1.0 ) &&
         Charged.Slots[1].Mode == OperatingMode::SelfUse &&
         Near( Charged.Slots[1].Import, 0.0 ),
         "The battery is charged at the cheap price for the expensive slot" );
}

// -----------------------------------------------------------------------------
// Conversion losses
// -----------------------------------------------------------------------------
//
// With 95% efficiency in each direction the SOC change of every slot must be
// explained by a flow in one direction only.

void Losses( void )
{
  MathOptimalPlanner   Planner;
  PlannerConfiguration Configuration;

  ForecastSeries Day     = Scenario::VolatilePricing();
  BatteryState   Battery = Scenario::Battery( 50.0 );

  Plan Lossy = Planner.CreatePlan( Day, Battery, Configuration );
  bool OneWay = true;

  for ( const PlanSlot & Slot : Lossy.Slots )
  {
    const double Stored = ( Slot.BatteryFlow > 0.0 ?
                            Slot.BatteryFlow * Battery.ChargeEfficiency :
                            Slot.BatteryFlow / Battery.DischargeEfficiency ),
                 Change = Stored / Battery.Capacity * 100.0;

    OneWay = OneWay && std::abs( Slot.SOCAfter - Slot.SOCBefore - Change ) < 1e-4;
  }

  Check( OneWay, "The battery never charges and discharges in the same slot" );

  // A full battery cannot turn surplus into heat by cycling

  ForecastSeries Sunny = Scenario::Constant( 1, 20.0, 10.0, 10.0, 0.0 );
  Plan Full = Planner.CreatePlan( Sunny, Scenario::Battery( 100.0 ),
                                  Configuration );

  Check( std::abs( Full.Slots[0].BatteryFlow ) < 1e-6 &&
         Near( Full.Slots[0].SOCAfter, 100.0 ) &&
         Near( Full.Slots[0].Clipped, 2.5 ),
         "A full lossy battery clips the surplus it cannot store" );
}

// -----------------------------------------------------------------------------
// Comparison with the rule based planner
// -----------------------------------------------------------------------------

void Comparison( void )
{
  MathOptimalPlanner   Optimizer;
  RuleBasedPlanner     Rules;
  PlannerConfiguration Configuration;

  // Without solar or price spread both planners import the load

  ForecastSeries Flat    = Scenario::Constant( 8, 20.0, 5.0, 0.0, 1.0 );
  BatteryState   Minimum = Scenario::Battery( 10.0 );

  Plan FlatOptimal = Optimizer.CreatePlan( Flat, Minimum, Configuration ),
       FlatRules   = Rules.CreatePlan( Flat, Minimum, Configuration );

  bool AllSelfUse = true;

  for ( const PlanSlot & Slot : FlatOptimal.Slots )
    AllSelfUse = AllSelfUse && Slot.Mode == OperatingMode::SelfUse;

  Check( AllSelfUse && Near( FlatOptimal.Metrics().TotalCost, 80.0 ) &&
         Near( FlatRules.Metrics().TotalCost, 80.0 ),
         "Without arbitrage both planners import the load in self-use" );

  PlanComparison FlatDifference = ComparePlans( FlatOptimal, FlatRules );

  Check( FlatDifference.ModeDisagreements.empty() &&
         Near( FlatDifference.CostDifference, 0.0 ),
         "The planners agree when there is nothing to optimise" );

  // The volatile price day

  ForecastSeries Day     = Scenario::VolatilePricing();
  BatteryState   Battery = Scenario::Battery( 50.0 );

  Plan Optimal = Optimizer.CreatePlan( Day, Battery, Configuration ),
       Again   = Optimizer.CreatePlan( Day, Battery, Configuration ),
       RuleBased = Rules.CreatePlan( Day, Battery, Configuration );

  Check( Scenario::Consistent( Optimal, Day, Configuration ),
         "The optimal plan covers the horizon with continuous SOC" );

  Check( Scenario::Identical( Optimal, Again ),
         "Identical inputs give identical optimal plans" );

  double OptimalValue = ValuedCost( Optimal,   Day, Battery, Configuration ),
         RuleValue    = ValuedCost( RuleBased, Day, Battery, Configuration );

  std::cout << "Valued cost: optimal " << OptimalValue << " p, rule based "
            << RuleValue << " p" << std::endl;

  Check( OptimalValue <= RuleValue + Configuration.OptimalityGap + 1e-6,
         "The optimal plan is at least as good as the rule based plan" );

  const double OptimalCost = Optimal.Metrics().TotalCost,
               RuleCost    = RuleBased.Metrics().TotalCost;

  std::cout << "Total cost: optimal " << OptimalCost << " p, rule based "
            << RuleCost << " p" << std::endl;

  Check( OptimalCost <= RuleCost + Configuration.OptimalityGap + 1e-6,
         "The optimal plan costs no more than the rule based plan" );
}

// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------

void Failing( void )
{
  PlannerConfiguration Configuration;

  // A battery at 0% charging at most 5% per slot cannot reach 10%

  ForecastSeries Night = Scenario::Constant( 4, 20.0, 5.0, 0.0, 0.5 );
  BatteryState   Empty = Scenario::Battery( 0.0, 10.0, 1.0, 1.0 );
  bool Thrown = false;

  try
  {
    MathOptimalPlanner().CreatePlan( Night, Empty, Configuration );
  }
  catch ( const InfeasibleOptimizationError & )
  {
    Thrown = true;
  }

  Check( Thrown, "An unrecoverable SOC below the minimum is infeasible" );

  PlannerConfiguration NoTime;
  NoTime.SolverTimeLimit = std::chrono::milliseconds( 0 );
  Thrown = false;

  try
  {
    MathOptimalPlanner().CreatePlan( Night, Scenario::Battery( 50.0 ), NoTime );
  }
  catch ( const SolverTimeoutError & )
  {
    Thrown = true;
  }

  Check( Thrown, "An exhausted time budget is a solver timeout" );

  MathOptimalPlanner::StopFlag Stop
    = std::make_shared< std::atomic< bool > >( true );
  Thrown = false;

  try
  {
    MathOptimalPlanner( Stop ).CreatePlan( Night, Scenario::Battery( 50.0 ),
                                           Configuration );
  }
  catch ( const SolverTimeoutError & )
  {
    Thrown = true;
  }

  Check( Thrown, "A stopped search is a solver timeout" );

  Plan Nothing = MathOptimalPlanner().CreatePlan(
                   Scenario::Constant( 0, 20.0, 5.0, 0.0, 0.0 ),
                   Scenario::Battery( 50.0 ), Configuration );

  Check( Nothing.Size() == 0 && Nothing.FinalSOC() == 50.0,
         "An empty forecast gives an empty optimal plan" );
}

int main( void )
{
  Log::SetThreshold( Log::Level::Warning );

  TerminalValue();
  Modes();
  Losses();
  Comparison();
  Failing();

  std::cout << Failures << " checks failed" << std::endl;

  return ( Failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE );
}
