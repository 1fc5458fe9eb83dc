/*==============================================================================
Rule based test

Each rule of the rule based planner is triggered by a small scenario built
so that the rule is the first one to fire in a known slot. The feed-in rule
is also checked against its minimum saving and against its second evaluation
after a pre-sunrise discharge. The pre-sunrise window is checked for its
target SOC and for the hold once the target is reached. The general plan
properties of slot coverage, SOC continuity and limits, idempotence, and the
absence of clipping where the battery can still absorb energy are checked on
a volatile price day.

The program returns a non-zero exit status if any of the checks fails.

License: LGPL 3.0
==============================================================================*/

#include <cmath>             // Absolute values
#include <cstdlib>           // Exit status
#include <iostream>          // Status messages
#include <string>            // Test names

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

bool StartsWith( const std::string & Text, const std::string & Prefix )
{
  return Text.compare( 0, Prefix.size(), Prefix ) == 0;
}

// -----------------------------------------------------------------------------
// Degenerate inputs
// -----------------------------------------------------------------------------

void Degenerate( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  ForecastSeries Empty = Scenario::Constant( 0, 20.0, 5.0, 0.0, 1.0 );
  Plan Nothing = Planner.CreatePlan( Empty, Scenario::Battery( 40.0 ),
                                     Configuration );

  Check( Nothing.Size() == 0 && Nothing.InitialSOC == 40.0 &&
         Nothing.FinalSOC() == 40.0 && Nothing.Planner == "RuleBased",
         "An empty forecast gives an empty plan" );

  // No solar, no price spread and an empty battery

  ForecastSeries Flat = Scenario::Constant( 8, 20.0, 5.0, 0.0, 1.0 );
  Plan Idle = Planner.CreatePlan( Flat, Scenario::Battery( 10.0 ),
                                  Configuration );

  bool AllSelfUse = true;

  for ( const PlanSlot & Slot : Idle.Slots )
    AllSelfUse = AllSelfUse && Slot.Mode == OperatingMode::SelfUse;

  Check( AllSelfUse, "Without arbitrage or solar every slot is self-use" );
  Check( Near( Idle.Metrics().TotalCost, 8 * 1.0 * SlotHours * 20.0 ),
         "The cost is the load energy at the import price" );

  // Invalid inputs

  bool Thrown = false;

  try
  {
    ForecastSeries Broken( Flat );
    Broken.Load.pop_back();
    Planner.CreatePlan( Broken, Scenario::Battery( 50.0 ), Configuration );
  }
  catch ( const InputError & )
  {
    Thrown = true;
  }

  Check( Thrown, "A forecast with series of different lengths is rejected" );

  Thrown = false;

  try
  {
    PlannerConfiguration Inverted;
    Inverted.MinimumSOC = 95.0;
    Inverted.MaximumSOC = 90.0;
    Planner.CreatePlan( Flat, Scenario::Battery( 50.0 ), Inverted );
  }
  catch ( const InputError & )
  {
    Thrown = true;
  }

  Check( Thrown, "A minimum SOC above the maximum SOC is rejected" );
}

// -----------------------------------------------------------------------------
// Rules
// -----------------------------------------------------------------------------

void Recovery( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  ForecastSeries Flat = Scenario::Constant( 4, 20.0, 5.0, 0.0, 1.0 );
  Plan Recovered = Planner.CreatePlan( Flat, Scenario::Battery( 5.0 ),
                                       Configuration );

  Check( Recovered.Slots[0].Mode == OperatingMode::ForceCharge &&
         StartsWith( Recovered.Slots[0].Reason, "Recovery" ) &&
         Near( Recovered.Slots[0].SOCAfter, 10.0 ),
         "A battery below the minimum is charged back to the minimum" );

  // A slow charger needs two slots to recover

  ForecastSeries Night = Scenario::Constant( 4, 20.0, 5.0, 0.0, 0.0 );
  Plan Slow = Planner.CreatePlan( Night,
                                  Scenario::Battery( 0.0, 10.0, 1.0, 1.0 ),
                                  Configuration );

  Check( Slow.Slots[0].Mode == OperatingMode::ForceCharge &&
         Slow.Slots[1].Mode == OperatingMode::ForceCharge &&
         Near( Slow.Slots[0].SOCAfter, 5.0 ) &&
         Near( Slow.Slots[1].SOCAfter, 10.0 ),
         "Recovery continues until the minimum is reached" );
}

void FeedInPriority( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  // A 2 kW charger and the 3.68 kW export limit cannot absorb 8 kW of solar

  ForecastSeries Sunny = Scenario::Constant( 4, 20.0, 5.0, 8.0, 0.0 );
  Plan Sunshine = Planner.CreatePlan( Sunny,
                                      Scenario::Battery( 50.0, 10.0, 2.0, 1.0 ),
                                      Configuration );

  Check( Sunshine.Slots[0].Mode == OperatingMode::GridFirst &&
         StartsWith( Sunshine.Slots[0].Reason, "Feed-in priority" ),
         "Grid-first is chosen when the surplus would be clipped" );

  Check( Sunshine.Metrics().TotalClipped < 4 * ( 4.0 - 1.0 - 1.84 ),
         "Grid-first clips less than self-use would" );

  // The same surplus run fits into the headroom of an empty battery

  ForecastSeries Mild = Scenario::Constant( 2, 20.0, 5.0, 3.0, 1.0 );
  Plan Absorbed = Planner.CreatePlan( Mild,
                                      Scenario::Battery( 10.0, 10.0, 5.0, 1.0 ),
                                      Configuration );

  Check( Absorbed.Slots[0].Mode == OperatingMode::SelfUse &&
         Absorbed.Slots[1].Mode == OperatingMode::SelfUse &&
         Near( Absorbed.FinalSOC(), 30.0 ),
         "A surplus fitting into the battery is stored in self-use" );
}

void FeedInValidation( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  // Grid-first clips 2 kWh where self-use clips 4.64 kWh

  ForecastSeries Sunny = Scenario::Constant( 4, 20.0, 5.0, 8.0, 0.0 );
  BatteryState   Small = Scenario::Battery( 50.0, 10.0, 2.0, 1.0 );

  Plan Default = Planner.CreatePlan( Sunny, Small, Configuration );

  Check( Default.Slots[3].Mode == OperatingMode::GridFirst &&
         Near( Default.Metrics().TotalClipped, 2.0 ),
         "Feed-in is used when it saves at least the minimum" );

  Configuration.FeedInMinimumSaving = 3.0;

  Plan Demanding = Planner.CreatePlan( Sunny, Small, Configuration );
  bool SelfUse   = true;

  for ( const PlanSlot & Slot : Demanding.Slots )
    SelfUse = SelfUse && Slot.Mode == OperatingMode::SelfUse &&
              Near( Slot.Export, 1.84 );

  Check( SelfUse && Near( Demanding.Metrics().TotalClipped, 4.64 ),
         "Feed-in is not used when it saves less than the minimum" );
}

void Presunrise( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  // Four slots of night followed by ten slots of 8 kW solar and two slots of
  // night. The battery would absorb 25 kWh even with grid-first export.

  ForecastSeries Day = Scenario::Constant( 16, 20.0, 5.0, 0.0, 0.4 );

  for ( std::size_t t = 4; t < 14; ++t )
    Day.Solar[t] = 8.0;

  Plan Prepared = Planner.CreatePlan( Day,
                                      Scenario::Battery( 90.0, 10.0, 5.0, 1.0 ),
                                      Configuration );

  bool Discharged = true;

  for ( std::size_t t = 0; t < 4; ++t )
    Discharged = Discharged &&
                 Prepared.Slots[t].Mode == OperatingMode::ForceDischarge &&
                 StartsWith( Prepared.Slots[t].Reason, "Pre-sunrise discharge" );

  Check( Discharged, "The battery is discharged in the slots before sunrise" );
  Check( Near( Prepared.Slots[3].SOCAfter, Configuration.MinimumSOC ),
         "The pre-sunrise target is bounded by the minimum SOC" );
  Check( Near( Prepared.Slots[0].Export, 1.84 ) &&
         Near( Prepared.Slots[0].BatteryFlow, -2.04 ),
         "The pre-sunrise export respects the self-use export limit" );
  Check( Prepared.Slots[4].Mode == OperatingMode::GridFirst &&
         Near( Prepared.Metrics().TotalClipped, 4.0 ),
         "The day after the discharge is exported grid-first" );

  // Two slots of solar leave 5 kWh to absorb, and the target leaves room
  // for it and the 2 kWh buffer

  ForecastSeries Short = Scenario::Constant( 8, 20.0, 5.0, 0.0, 0.4 );

  Short.Solar[4] = 8.0;
  Short.Solar[5] = 8.0;

  Plan Room = Planner.CreatePlan( Short,
                                  Scenario::Battery( 90.0, 10.0, 5.0, 1.0 ),
                                  Configuration );

  Check( Room.Slots[0].Mode == OperatingMode::SelfUse &&
         Room.Slots[1].Mode == OperatingMode::ForceDischarge &&
         Room.Slots[3].Mode == OperatingMode::ForceDischarge,
         "The discharge window starts as late as the energy allows" );
  Check( Near( Room.Slots[3].SOCAfter, 30.0 ),
         "The target leaves room for the absorbed energy and the buffer" );
  Check( Room.Slots[4].Mode == OperatingMode::SelfUse &&
         Near( Room.Slots[5].SOCAfter, 80.0 ) &&
         Near( Room.Metrics().TotalClipped, 0.0 ),
         "The absorbed surplus is not clipped" );

  // Less solar fits into the battery and there is no discharge

  ForecastSeries Dull( Day );

  for ( std::size_t t = 4; t < 14; ++t )
    Dull.Solar[t] = 0.8;

  Plan Kept = Planner.CreatePlan( Dull,
                                  Scenario::Battery( 90.0, 10.0, 5.0, 1.0 ),
                                  Configuration );

  Check( Kept.Slots[0].Mode == OperatingMode::SelfUse,
         "There is no pre-sunrise discharge when the solar fits" );
}

void PresunriseHold( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  // Expensive import except for three cheap slots just before sunrise, and
  // export paid only after sunrise

  ForecastSeries Day = Scenario::Constant( 19, 30.0, 0.0, 0.0, 1.0 );

  for ( std::size_t t = 8; t < 11; ++t )
    Day.ImportPrice[t] = 5.0;

  for ( std::size_t t = 11; t < 19; ++t )
    Day.ExportPrice[t] = 10.0;

  for ( std::size_t t = 11; t < 17; ++t )
    Day.Solar[t] = 8.0;

  Plan Held = Planner.CreatePlan( Day,
                                  Scenario::Battery( 100.0, 10.0, 5.0, 1.0 ),
                                  Configuration );

  Check( Held.Slots[7].Mode == OperatingMode::ForceDischarge &&
         Held.Slots[8].Mode == OperatingMode::ForceDischarge &&
         Near( Held.Slots[8].SOCAfter, 20.0 ),
         "The battery is discharged to the target before sunrise" );

  bool Holding = true;

  for ( std::size_t t = 9; t < 11; ++t )
    Holding = Holding && Held.Slots[t].Mode == OperatingMode::SelfUse &&
              StartsWith( Held.Slots[t].Reason, "Pre-sunrise hold" );

  Check( Holding, "The rest of the window is held in self-use" );

  bool Charged = false;

  for ( std::size_t t = 0; t < 11; ++t )
    Charged = Charged || Held.Slots[t].Mode == OperatingMode::ForceCharge;

  Check( !Charged, "Cheap import does not refill the battery before sunrise" );
  Check( Near( Held.Metrics().TotalClipped, 0.0 ),
         "The day surplus fits into the room made" );
}

void FeedInRecomputed( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  // From 90% grid-first saves 2.64 kWh, but after the pre-sunrise discharge
  // to 28% it saves only 1.96 kWh

  ForecastSeries Day = Scenario::Constant( 10, 20.0, 5.0, 0.0, 0.4 );

  for ( std::size_t t = 4; t < 8; ++t )
    Day.Solar[t] = 8.0;

  Plan Recomputed = Planner.CreatePlan( Day,
                      Scenario::Battery( 90.0, 10.0, 5.0, 1.0 ), Configuration );

  Check( Recomputed.Slots[3].Mode == OperatingMode::ForceDischarge &&
         Near( Recomputed.Slots[3].SOCAfter, 28.0 ),
         "The target is based on the first feed-in decision" );

  bool SelfUse = true;

  for ( std::size_t t = 4; t < 8; ++t )
    SelfUse = SelfUse && Recomputed.Slots[t].Mode == OperatingMode::SelfUse;

  Check( SelfUse && Near( Recomputed.Metrics().TotalClipped, 1.96 ),
         "Feed-in is decided again from the state at sunrise" );
}

void Arbitrage( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  ForecastSeries Spread = Scenario::Constant( 4, 30.0, 2.0, 0.0, 0.0 );

  Spread.ImportPrice = {  5.0, 30.0, 30.0, 10.0 };
  Spread.ExportPrice = {  2.0,  2.0, 25.0,  2.0 };

  Plan Traded = Planner.CreatePlan( Spread,
                                    Scenario::Battery( 50.0, 10.0, 5.0, 1.0 ),
                                    Configuration );

  Check( Traded.Slots[0].Mode == OperatingMode::ForceCharge &&
         StartsWith( Traded.Slots[0].Reason, "Arbitrage charge" ) &&
         Near( Traded.Slots[0].Import, 2.5 ) &&
         Near( Traded.Slots[0].SOCAfter, 75.0 ),
         "Cheap import is stored for a later high export price" );

  Check( Traded.Slots[1].Mode == OperatingMode::SelfUse,
         "No trade without a profitable spread" );

  Check( Traded.Slots[2].Mode == OperatingMode::ForceDischarge &&
         StartsWith( Traded.Slots[2].Reason, "Arbitrage discharge" ) &&
         Near( Traded.Slots[2].Export, 1.84 ),
         "The battery is exported at a high price before cheap import" );

  // Round trip losses remove the profit of a small spread

  ForecastSeries Narrow = Scenario::Constant( 2, 20.0, 2.0, 0.0, 0.0 );
  Narrow.ExportPrice[1] = 23.0;

  Plan Lossy = Planner.CreatePlan( Narrow,
                                   Scenario::Battery( 50.0, 10.0, 5.0, 0.9 ),
                                   Configuration );

  Check( Lossy.Slots[0].Mode == OperatingMode::SelfUse,
         "Round trip losses are included in the arbitrage margin" );
}

void DeficitPrevention( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;

  ForecastSeries Evening = Scenario::Constant( 6, 30.0, 0.0, 0.0, 2.0 );

  Evening.ImportPrice.front() = 10.0;
  Evening.ImportPrice.back()  = 10.0;

  Plan Prepared = Planner.CreatePlan( Evening,
                                      Scenario::Battery( 20.0, 10.0, 5.0, 1.0 ),
                                      Configuration );

  Check( Prepared.Slots[0].Mode == OperatingMode::ForceCharge &&
         StartsWith( Prepared.Slots[0].Reason, "Deficit prevention" ),
         "The battery is charged before an expensive deficit" );

  Check( Prepared.Slots[1].Mode == OperatingMode::SelfUse &&
         Prepared.Slots[1].BatteryFlow < 0.0,
         "The stored energy covers the deficit in the expensive slots" );
}

// -----------------------------------------------------------------------------
// Plan properties
// -----------------------------------------------------------------------------

void Properties( void )
{
  RuleBasedPlanner     Planner;
  PlannerConfiguration Configuration;
  ForecastSeries       Day     = Scenario::VolatilePricing();
  BatteryState         Battery = Scenario::Battery( 50.0 );

  Plan First  = Planner.CreatePlan( Day, Battery, Configuration ),
       Second = Planner.CreatePlan( Day, Battery, Configuration );

  Check( Scenario::Consistent( First, Day, Configuration ),
         "The plan covers the horizon with continuous SOC within limits" );

  Check( Scenario::Identical( First, Second ),
         "Identical inputs give identical plans" );

  BatteryModel Model( Configuration.MinimumSOC, Configuration.MaximumSOC );
  bool         Unclipped = true;

  for ( const PlanSlot & Slot : First.Slots )
    if ( Slot.Mode == OperatingMode::GridFirst &&
         Slot.SOCAfter < Configuration.MaximumSOC - 1e-6 &&
         Slot.BatteryFlow < Battery.MaxChargePower * SlotHours - 1e-6 )
      Unclipped = Unclipped && Slot.Clipped < 1e-9;

  Check( Unclipped, "Grid-first does not clip while the battery can absorb" );

  // A full battery must not force export beyond the limit while solar is
  // clipped

  Plan Full = Planner.CreatePlan( Day, Scenario::Battery( 90.0 ),
                                  Configuration );
  bool Stored = true;

  for ( const PlanSlot & Slot : Full.Slots )
    if ( Slot.SOCAfter < Configuration.MaximumSOC - 1e-6 )
      Stored = Stored && Slot.Clipped < 1e-9;

  Check( Stored, "Solar is only clipped when the battery is full" );

  PlanMetrics Totals = First.Metrics();
  std::size_t Counted = 0;

  for ( const auto & Mode : Totals.ModeCounts )
    Counted += Mode.second;

  Check( Counted == First.Size() && Near( Totals.FinalSOC, First.FinalSOC() ),
         "The metrics count every slot" );
}

int main( void )
{
  Log::SetThreshold( Log::Level::Warning );

  Degenerate();
  Recovery();
  FeedInPriority();
  FeedInValidation();
  Presunrise();
  PresunriseHold();
  FeedInRecomputed();
  Arbitrage();
  DeficitPrevention();
  Properties();

  std::cout << Failures << " checks failed" << std::endl;

  return ( Failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE );
}
