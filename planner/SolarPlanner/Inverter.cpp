/*==============================================================================
Inverter

Implementation of the energy routing for the four operating modes.

License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Error messages
#include <algorithm>                          // Min and max

#include "Inverter.hpp"
#include "Errors.hpp"

namespace SolarPlanner
{

std::string ToString( OperatingMode Mode )
{
  switch ( Mode )
  {
    case OperatingMode::SelfUse:
      return "SelfUse";
    case OperatingMode::GridFirst:
      return "GridFirst";
    case OperatingMode::ForceCharge:
      return "ForceCharge";
    default:
      return "ForceDischarge";
  }
}

std::ostream & operator << ( std::ostream & Output, OperatingMode Mode )
{
  Output << ToString( Mode );
  return Output;
}

SlotFlows Inverter::Simulate( OperatingMode Mode, double SolarPower,
                              double LoadPower, const BatteryState & State,
                              double ImportPrice, double ExportPrice,
                              double Hours, double RequestedPower,
                              std::optional< double > TargetSOC ) const
{
  if ( SolarPower < 0.0 || LoadPower < 0.0 || RequestedPower < 0.0 ||
       !( Hours > 0.0 ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Invalid slot: solar " << SolarPower << " kW, load "
                 << LoadPower << " kW, requested " << RequestedPower
                 << " kW over " << Hours << " h";

    throw InputError( ErrorMessage.str() );
  }

  const double Surplus = std::max( 0.0, SolarPower - LoadPower ) * Hours,
               Deficit = std::max( 0.0, LoadPower - SolarPower ) * Hours;

  SlotFlows Flows{ 0.0, 0.0, 0.0, 0.0, 0.0, State, false };
  BatteryTransition Step{ State, 0.0, 0.0, false };

  switch ( Mode )
  {
    case OperatingMode::SelfUse:
    case OperatingMode::GridFirst:
    {
      // The export before the battery is zero in self-use mode

      const double FirstExport = ( Mode == OperatingMode::GridFirst ?
                                   std::min( Surplus, GridFirstLimit * Hours )
                                   : 0.0 );

      if ( Surplus > 0.0 )
      {
        const double Remaining = Surplus - FirstExport;

        Step = Battery.Transition( State, Remaining / Hours, Hours );

        const double Overflow = Remaining - Step.EnergyMoved,
                     ExportLimit = ( Mode == OperatingMode::GridFirst ?
                                     GridFirstLimit : SelfUseLimit ) * Hours,
                     LaterExport = std::min( Overflow,
                                   std::max( 0.0, ExportLimit - FirstExport ) );

        Flows.Export  = FirstExport + LaterExport;
        Flows.Clipped = Overflow - LaterExport;
      }
      else
      {
        Step = Battery.Transition( State, -Deficit / Hours, Hours );
        Flows.Import = Deficit + Step.EnergyMoved;
      }
      break;
    }
    case OperatingMode::ForceCharge:
    {
      const double GridRoom   = std::max( 0.0, ImportLimit * Hours - Deficit ),
                   GridCharge = std::min( RequestedPower * Hours, GridRoom );

      Step = Battery.Transition( State, ( Surplus + GridCharge ) / Hours, Hours );

      const double FromSolar = std::min( Surplus, Step.EnergyMoved ),
                   FromGrid  = Step.EnergyMoved - FromSolar,
                   Leftover  = Surplus - FromSolar;

      Flows.Import  = Deficit + FromGrid;
      Flows.Export  = std::min( Leftover, SelfUseLimit * Hours );
      Flows.Clipped = Leftover - Flows.Export;
      break;
    }
    case OperatingMode::ForceDischarge:
    {
      const double SolarExport = std::min( Surplus, SelfUseLimit * Hours ),
                   ExportRoom  = SelfUseLimit * Hours - SolarExport,
                   Leftover    = Surplus - SolarExport;

      if ( Leftover > 0.0 )
      {
        Step = Battery.Transition( State, Leftover / Hours, Hours );

        Flows.Export  = SolarExport;
        Flows.Clipped = Leftover - Step.EnergyMoved;
        break;
      }

      double Delivery = std::min( RequestedPower * Hours, Deficit + ExportRoom );

      if ( TargetSOC )
        Delivery = std::min( Delivery,
                             Battery.DischargeToReach( State, *TargetSOC ) );

      Step = Battery.Transition( State, -Delivery / Hours, Hours );

      const double Delivered   = -Step.EnergyMoved,
                   ToLoad      = std::min( Delivered, Deficit );

      Flows.Import  = Deficit - ToLoad;
      Flows.Export  = SolarExport + Delivered - ToLoad;
      break;
    }
  }

  Flows.BatteryFlow    = Step.EnergyMoved;
  Flows.State          = Step.State;
  Flows.BatteryLimited = Step.Limited;
  Flows.Cost           = Flows.Import * ImportPrice - Flows.Export * ExportPrice;

  return Flows;
}

}      // End name space SolarPlanner
