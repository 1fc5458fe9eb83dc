/*==============================================================================
Rule based planner

The backward sweep computing the look-ahead values, the simulated passes
deciding the feed-in and pre-sunrise strategies, and the forward pass
applying the rules slot by slot.

License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // Rounding up
#include <limits>                             // Infinite prices
#include <algorithm>                          // Min and max
#include <optional>                           // Target SOC
#include <sstream>                            // Reasons
#include <iomanip>                            // Formatting reasons

#include "RuleBasedPlanner.hpp"
#include "Log.hpp"

namespace SolarPlanner
{

// -----------------------------------------------------------------------------
// Look-ahead
// -----------------------------------------------------------------------------

RuleBasedPlanner::LookAhead
RuleBasedPlanner::Sweep( const ForecastSeries & Forecast,
                         const BatteryState & Battery,
                         const PlannerConfiguration & Configuration ) const
{
  const std::size_t N = Forecast.Size();
  const double      Infinity = std::numeric_limits< double >::infinity();

  LookAhead Ahead;

  Ahead.SurplusDemand.assign  ( N, 0.0 );
  Ahead.OverflowRisk.assign   ( N, 0.0 );
  Ahead.MaxFutureExport.assign( N, -Infinity );
  Ahead.MinFutureImport.assign( N,  Infinity );
  Ahead.NextCheapSlot.assign  ( N, N );
  Ahead.DeficitPrefix.assign  ( N + 1, 0.0 );
  Ahead.SurplusPrefix.assign  ( N + 1, 0.0 );
  Ahead.Sunrise = N;

  const double ChargeLimit   = Battery.MaxChargePower * SlotHours,
               AbsorbLimit   = ( Battery.MaxChargePower
                                 + Configuration.SelfUseExportLimit ) * SlotHours;

  // The cheaper slots are found with a stack of indices whose import prices
  // increase from the top.

  std::vector< std::size_t > Cheaper;

  for ( std::size_t t = N; t-- > 0; )
  {
    const double Surplus = std::max( 0.0, Forecast.Solar[t] - Forecast.Load[t] )
                           * SlotHours;

    if ( Surplus > 0.0 )
    {
      const double LaterDemand = ( t + 1 < N ? Ahead.SurplusDemand[ t + 1 ] : 0.0 ),
                   LaterRisk   = ( t + 1 < N ? Ahead.OverflowRisk[ t + 1 ]  : 0.0 );

      Ahead.SurplusDemand[t] = std::min( Surplus, ChargeLimit ) + LaterDemand;
      Ahead.OverflowRisk[t]  = std::max( 0.0, Surplus - AbsorbLimit ) + LaterRisk;
    }

    if ( t + 1 < N )
    {
      Ahead.MaxFutureExport[t] = std::max( Forecast.ExportPrice[ t + 1 ],
                                           Ahead.MaxFutureExport[ t + 1 ] );
      Ahead.MinFutureImport[t] = std::min( Forecast.ImportPrice[ t + 1 ],
                                           Ahead.MinFutureImport[ t + 1 ] );
    }

    while ( !Cheaper.empty() &&
            Forecast.ImportPrice[ Cheaper.back() ] > Forecast.ImportPrice[t] )
      Cheaper.pop_back();

    if ( !Cheaper.empty() )
      Ahead.NextCheapSlot[t] = Cheaper.back();

    Cheaper.push_back( t );
  }

  for ( std::size_t t = 0; t < N; ++t )
  {
    const double Solar = Forecast.Solar[t] * SlotHours,
                 Load  = Forecast.Load[t]  * SlotHours;

    Ahead.DeficitPrefix[ t + 1 ] = Ahead.DeficitPrefix[t]
                                   + std::max( 0.0, Load - Solar );
    Ahead.SurplusPrefix[ t + 1 ] = Ahead.SurplusPrefix[t]
                                   + std::max( 0.0, Solar - Load );

    if ( Ahead.Sunrise == N &&
         Forecast.Solar[t] > Configuration.DaylightThreshold )
      Ahead.Sunrise = t;
  }

  return Ahead;
}

bool RuleBasedPlanner::FeedInSignal( const LookAhead & Ahead, std::size_t Slot,
                                     double Surplus, double Headroom,
                                     const PlannerConfiguration & Configuration )
                                     const
{
  return Surplus > 0.0 &&
         ( Ahead.OverflowRisk[ Slot ] > Configuration.ClippingRiskThreshold ||
           Ahead.SurplusDemand[ Slot ] - Headroom
             > Configuration.FeedInTriggerMargin );
}

// -----------------------------------------------------------------------------
// Strategy evaluation
// -----------------------------------------------------------------------------

RuleBasedPlanner::Projection
RuleBasedPlanner::Project( const ForecastSeries & Forecast,
                           const LookAhead & Ahead, std::size_t Start,
                           const BatteryState & State, bool FeedIn,
                           const Inverter & TheInverter,
                           const BatteryModel & Model,
                           const PlannerConfiguration & Configuration ) const
{
  const std::size_t N = Forecast.Size();

  Projection   Result{ 0.0, std::vector< bool >( N, false ) };
  BatteryState Current( State );

  for ( std::size_t t = Start; t < N; ++t )
  {
    const double Surplus = std::max( 0.0, Forecast.Solar[t] - Forecast.Load[t] )
                           * SlotHours;

    OperatingMode Mode = OperatingMode::SelfUse;

    if ( FeedIn && FeedInSignal( Ahead, t, Surplus, Model.Headroom( Current ),
                                 Configuration ) )
    {
      Mode                = OperatingMode::GridFirst;
      Result.GridFirst[t] = true;
    }

    SlotFlows Flows = TheInverter.Simulate( Mode, Forecast.Solar[t],
                        Forecast.Load[t], Current, Forecast.ImportPrice[t],
                        Forecast.ExportPrice[t], SlotHours );

    Result.Clipped += Flows.Clipped;
    Current         = Flows.State;
  }

  return Result;
}

RuleBasedPlanner::FeedInDecision
RuleBasedPlanner::EvaluateFeedIn( const ForecastSeries & Forecast,
                                  const LookAhead & Ahead, std::size_t Start,
                                  const BatteryState & State,
                                  const Inverter & TheInverter,
                                  const BatteryModel & Model,
                                  const PlannerConfiguration & Configuration )
                                  const
{
  const double Tolerance = 1e-6;

  Projection SelfUse = Project( Forecast, Ahead, Start, State, false,
                                TheInverter, Model, Configuration ),
             FeedIn  = Project( Forecast, Ahead, Start, State, true,
                                TheInverter, Model, Configuration );

  FeedInDecision Decision;

  Decision.Saving  = SelfUse.Clipped - FeedIn.Clipped;
  Decision.Enabled = Decision.Saving > Tolerance &&
                     Decision.Saving >= Configuration.FeedInMinimumSaving;
  Decision.Strategy = ( Decision.Enabled ? FeedIn : SelfUse );

  Log::Message Note( Log::Level::Debug, Name() );
  Note << "Feed-in from slot " << Start << " at " << State.SOC << " %: "
       << "self-use clips " << SelfUse.Clipped << " kWh, feed-in clips "
       << FeedIn.Clipped << " kWh, "
       << ( Decision.Enabled ? "enabled" : "disabled" );

  return Decision;
}

// -----------------------------------------------------------------------------
// Forward pass
// -----------------------------------------------------------------------------

Plan RuleBasedPlanner::Build( const ForecastSeries & Forecast,
                              const BatteryState & Battery,
                              const PlannerConfiguration & Configuration ) const
{
  const std::size_t N = Forecast.Size();

  BatteryModel Model( Configuration.MinimumSOC, Configuration.MaximumSOC );
  Inverter     TheInverter( Model, Configuration.SelfUseExportLimit,
                            Configuration.GridFirstExportLimit,
                            Configuration.ImportLimit );

  const LookAhead Ahead         = Sweep( Forecast, Battery, Configuration );
  const double    RoundTrip     = Battery.RoundTripEfficiency(),
                  Tolerance     = 1e-6;

  FeedInDecision FeedIn = EvaluateFeedIn( Forecast, Ahead, 0, Battery,
                                          TheInverter, Model, Configuration );

  // The pre-sunrise discharge window ends at sunrise and starts early enough
  // for the battery to reach the target at full discharge rate. It is only
  // needed if the chosen strategy still clips.

  bool        Presunrise       = false;
  double      PresunriseTarget = Configuration.MinimumSOC;
  std::size_t WindowStart      = N;

  if ( Ahead.Sunrise > 0 && Ahead.Sunrise < N &&
       Battery.MaxDischargePower > 0.0 &&
       FeedIn.Strategy.Clipped > Configuration.ClippingRiskThreshold )
  {
    const double ChargeLimit = Battery.MaxChargePower * SlotHours;
    double       Absorption  = 0.0;

    for ( std::size_t t = 0; t < N; ++t )
      if ( Forecast.Solar[t] > Configuration.DaylightThreshold )
      {
        double Surplus = std::max( 0.0, Forecast.Solar[t] - Forecast.Load[t] )
                         * SlotHours;

        if ( FeedIn.Strategy.GridFirst[t] )
          Surplus = std::max( 0.0, Surplus - Configuration.GridFirstExportLimit
                                             * SlotHours );

        Absorption += std::min( ChargeLimit, Surplus );
      }

    if ( Absorption - Model.Headroom( Battery ) > Configuration.PresunriseMargin )
    {
      PresunriseTarget = std::max( Configuration.MinimumSOC,
                                   Configuration.MaximumSOC
                                   - ( Absorption * Battery.ChargeEfficiency
                                       + Configuration.PresunriseBuffer )
                                     / Battery.Capacity * 100.0 );

      const double Energy = Model.DischargeToReach( Battery, PresunriseTarget );

      if ( Energy > Tolerance )
      {
        const std::size_t Slots = static_cast< std::size_t >(
          std::ceil( Energy / ( Battery.MaxDischargePower * SlotHours ) ) );

        Presunrise  = true;
        WindowStart = ( Slots < Ahead.Sunrise ? Ahead.Sunrise - Slots : 0 );

        // The day starts from the target, which may change whether
        // grid-first pays

        BatteryState AtSunrise( Battery );
        AtSunrise.SOC = PresunriseTarget;

        FeedIn = EvaluateFeedIn( Forecast, Ahead, Ahead.Sunrise, AtSunrise,
                                 TheInverter, Model, Configuration );
      }

      Log::Message Note( Log::Level::Debug, Name() );
      Note << "Pre-sunrise: " << Absorption << " kWh absorbed for "
           << Model.Headroom( Battery ) << " kWh headroom, target "
           << PresunriseTarget << " % from slot " << WindowStart;
    }
  }

  Plan Result( Name(), Battery.SOC );
  Result.Slots.reserve( N );

  BatteryState State( Battery );

  for ( std::size_t t = 0; t < N; ++t )
  {
    const double Surplus  = std::max( 0.0, Forecast.Solar[t] - Forecast.Load[t] )
                            * SlotHours,
                 Deficit  = std::max( 0.0, Forecast.Load[t] - Forecast.Solar[t] )
                            * SlotHours,
                 Headroom = Model.Headroom( State ),
                 Reserve  = Model.Reserve( State ),
                 Delivery = std::min( Battery.MaxDischargePower * SlotHours,
                                      Deficit + std::max( 0.0,
                                        Configuration.SelfUseExportLimit
                                        * SlotHours - Surplus ) );

    OperatingMode           Mode      = OperatingMode::SelfUse;
    double                  Requested = 0.0;
    std::optional< double > Target;
    std::ostringstream      Reason;

    Reason << std::fixed << std::setprecision(2);

    if ( State.SOC < Model.MinSOC() - Tolerance )
    {
      Mode      = OperatingMode::ForceCharge;
      Requested = Model.ChargeToReach( State, Model.MinSOC() ) / SlotHours;
      Reason << "Recovery: SOC " << State.SOC << " % below minimum "
             << Model.MinSOC() << " %";
    }
    else if ( FeedIn.Enabled &&
              FeedInSignal( Ahead, t, Surplus, Headroom, Configuration ) )
    {
      Mode = OperatingMode::GridFirst;
      Reason << "Feed-in priority: " << Ahead.OverflowRisk[t]
             << " kWh clipping risk, " << Ahead.SurplusDemand[t]
             << " kWh surplus for " << Headroom << " kWh headroom";
    }
    else if ( Presunrise && t >= WindowStart && t < Ahead.Sunrise )
    {
      if ( State.SOC > PresunriseTarget + Tolerance )
      {
        Mode      = OperatingMode::ForceDischarge;
        Requested = Battery.MaxDischargePower;
        Target    = PresunriseTarget;
        Reason << "Pre-sunrise discharge to " << PresunriseTarget
               << " % before sunrise in slot " << Ahead.Sunrise;
      }
      else
        Reason << "Pre-sunrise hold at " << State.SOC << " % until sunrise "
               << "in slot " << Ahead.Sunrise;
    }
    else if ( Ahead.MaxFutureExport[t] * RoundTrip - Forecast.ImportPrice[t]
                > Configuration.ArbitrageMargin && Headroom > Tolerance )
    {
      Mode      = OperatingMode::ForceCharge;
      Requested = Battery.MaxChargePower;
      Reason << "Arbitrage charge: import " << Forecast.ImportPrice[t]
             << " p/kWh for later export at " << Ahead.MaxFutureExport[t]
             << " p/kWh";
    }
    else if ( Forecast.ExportPrice[t] * RoundTrip - Ahead.MinFutureImport[t]
                > Configuration.ArbitrageMargin && Reserve > Tolerance &&
              Delivery > Tolerance )
    {
      Mode      = OperatingMode::ForceDischarge;
      Requested = Battery.MaxDischargePower;
      Reason << "Arbitrage discharge: export " << Forecast.ExportPrice[t]
             << " p/kWh for later import at " << Ahead.MinFutureImport[t]
             << " p/kWh";
    }
    else
    {
      // The deficit until the next slot at most as expensive as this slot

      const std::size_t Cheap = Ahead.NextCheapSlot[t];
      const double FutureDeficit = Ahead.DeficitPrefix[ Cheap ]
                                   - Ahead.DeficitPrefix[ t + 1 ],
                   FutureSurplus = Ahead.SurplusPrefix[ Cheap ]
                                   - Ahead.SurplusPrefix[ t + 1 ],
                   Shortfall     = FutureDeficit - RoundTrip * FutureSurplus
                                   - Reserve;

      if ( Shortfall > Configuration.DeficitThreshold && Headroom > Tolerance )
      {
        Mode      = OperatingMode::ForceCharge;
        Requested = Shortfall / RoundTrip / SlotHours;
        Reason << "Deficit prevention: " << Shortfall
               << " kWh short before slot " << Cheap;
      }
      else
        Reason << "Self-use";
    }

    SlotFlows Flows = TheInverter.Simulate( Mode, Forecast.Solar[t],
                        Forecast.Load[t], State, Forecast.ImportPrice[t],
                        Forecast.ExportPrice[t], SlotHours, Requested, Target );

    Result.Slots.push_back( PlanSlot{ Forecast.SlotInterval(t).lower(), Mode,
                            Flows.Import, Flows.Export, Flows.BatteryFlow,
                            State.SOC, Flows.State.SOC, Flows.Cost,
                            Flows.Clipped, Reason.str() } );

    Log::Message Decision( Log::Level::Debug, Name() );
    Decision << "Slot " << t << " " << Mode << ": " << Reason.str();

    State = Flows.State;
  }

  return Result;
}

}      // End name space SolarPlanner
