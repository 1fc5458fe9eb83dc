/*==============================================================================
Plan

Metrics, invariant checks, printing and comparison of plans.

License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Error messages
#include <iomanip>                            // Table formatting

#include "Plan.hpp"
#include "Errors.hpp"

namespace SolarPlanner
{

PlanMetrics Plan::Metrics( void ) const
{
  PlanMetrics Totals{ 0.0, 0.0, 0.0, 0.0, FinalSOC(), {} };

  for ( OperatingMode Mode : { OperatingMode::SelfUse, OperatingMode::GridFirst,
                               OperatingMode::ForceCharge,
                               OperatingMode::ForceDischarge } )
    Totals.ModeCounts[ Mode ] = 0;

  for ( const PlanSlot & Slot : Slots )
  {
    Totals.TotalCost    += Slot.Cost;
    Totals.TotalClipped += Slot.Clipped;
    Totals.TotalImport  += Slot.Import;
    Totals.TotalExport  += Slot.Export;
    Totals.ModeCounts[ Slot.Mode ]++;
  }

  return Totals;
}

void Plan::CheckInvariants( double MinimumSOC, double MaximumSOC ) const
{
  double Previous = InitialSOC;

  for ( std::size_t i = 0; i < Slots.size(); ++i )
  {
    const PlanSlot & Slot = Slots[i];
    std::ostringstream Problem;

    if ( Slot.SOCBefore != Previous )
      Problem << "SOC before slot " << i << " is " << Slot.SOCBefore
              << " % but the previous SOC was " << Previous << " %";
    else if ( Slot.SOCAfter > MaximumSOC + BatteryModel::Tolerance )
      Problem << "SOC after slot " << i << " is " << Slot.SOCAfter
              << " % above the maximum " << MaximumSOC << " %";
    else if ( Slot.SOCAfter < MinimumSOC - BatteryModel::Tolerance &&
              Slot.SOCAfter < Slot.SOCBefore )
      Problem << "SOC after slot " << i << " is " << Slot.SOCAfter
              << " % below the minimum " << MinimumSOC << " % and falling";

    if ( !Problem.str().empty() )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << Planner << " plan: " << Problem.str();

      throw StateInvariantViolation( ErrorMessage.str() );
    }

    Previous = Slot.SOCAfter;
  }
}

void Plan::Summary( std::ostream & Output ) const
{
  PlanMetrics Totals = Metrics();

  Output << Planner << " plan with " << Slots.size() << " slots";

  if ( !FallbackReason.empty() )
    Output << " (fallback: " << FallbackReason << ")";

  Output << std::endl << std::fixed << std::setprecision(2)
         << "Total cost:   " << Totals.TotalCost    << " p"   << std::endl
         << "Import:       " << Totals.TotalImport  << " kWh" << std::endl
         << "Export:       " << Totals.TotalExport  << " kWh" << std::endl
         << "Clipped:      " << Totals.TotalClipped << " kWh" << std::endl
         << "SOC:          " << InitialSOC << " % -> " << Totals.FinalSOC
         << " %" << std::endl;

  for ( const auto & Count : Totals.ModeCounts )
    Output << std::setw(16) << std::left << ToString( Count.first )
           << Count.second << std::endl;

  Output << std::right << std::defaultfloat;
}

std::ostream & operator << ( std::ostream & Output, const Plan & ThePlan )
{
  Output << std::setw(12) << "Start"  << std::setw(16) << "Mode"
         << std::setw(9)  << "Import" << std::setw(9)  << "Export"
         << std::setw(9)  << "Battery"<< std::setw(8)  << "SOC"
         << std::setw(9)  << "Cost"   << std::setw(9)  << "Clipped"
         << "  Reason" << std::endl;

  Output << std::fixed << std::setprecision(2);

  for ( const PlanSlot & Slot : ThePlan.Slots )
    Output << std::setw(12) << Slot.Start
           << std::setw(16) << ToString( Slot.Mode )
           << std::setw(9)  << Slot.Import
           << std::setw(9)  << Slot.Export
           << std::setw(9)  << Slot.BatteryFlow
           << std::setw(8)  << Slot.SOCAfter
           << std::setw(9)  << Slot.Cost
           << std::setw(9)  << Slot.Clipped
           << "  " << Slot.Reason << std::endl;

  Output << std::defaultfloat;

  return Output;
}

// -----------------------------------------------------------------------------
// Valued cost
// -----------------------------------------------------------------------------

double ValuedCost( const Plan & ThePlan, const ForecastSeries & Forecast,
                   const BatteryState & Battery,
                   const PlannerConfiguration & Configuration )
{
  if ( ThePlan.Size() != Forecast.Size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The plan has " << ThePlan.Size() << " slots but the "
                 << "forecast has " << Forecast.Size();

    throw InputError( ErrorMessage.str() );
  }

  if ( ThePlan.Slots.empty() ) return 0.0;

  double Value = 0.0;

  for ( const PlanSlot & Slot : ThePlan.Slots )
  {
    Value += Slot.Cost + Configuration.ClippingPenalty * Slot.Clipped;

    if ( Slot.Mode == OperatingMode::GridFirst )
      Value += Configuration.GridFirstPenalty;
  }

  Value += Battery.StoredEnergy( ThePlan.InitialSOC - ThePlan.FinalSOC() )
           * Forecast.ExportPrice.back();

  return Value;
}

// -----------------------------------------------------------------------------
// Comparison
// -----------------------------------------------------------------------------

PlanComparison ComparePlans( const Plan & First, const Plan & Second )
{
  if ( First.Size() != Second.Size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Cannot compare the " << First.Planner << " plan of "
                 << First.Size() << " slots with the " << Second.Planner
                 << " plan of " << Second.Size() << " slots";

    throw InputError( ErrorMessage.str() );
  }

  PlanMetrics A = First.Metrics(),
              B = Second.Metrics();

  PlanComparison Result{ A.TotalCost    - B.TotalCost,
                         A.TotalClipped - B.TotalClipped,
                         A.TotalImport  - B.TotalImport,
                         A.TotalExport  - B.TotalExport,
                         A.FinalSOC     - B.FinalSOC, {} };

  for ( std::size_t i = 0; i < First.Size(); ++i )
    if ( First.Slots[i].Mode != Second.Slots[i].Mode )
      Result.ModeDisagreements.push_back( i );

  return Result;
}

}      // End name space SolarPlanner
