/*==============================================================================
Battery

Implementation of the battery state transition.

License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // Finite values
#include <sstream>                            // Error messages
#include <algorithm>                          // Min and max

#include "Battery.hpp"
#include "Errors.hpp"

namespace SolarPlanner
{
// -----------------------------------------------------------------------------
// Battery state
// -----------------------------------------------------------------------------

void BatteryState::Validate( double MaximumSOC ) const
{
  std::ostringstream Problem;

  if ( !std::isfinite( Capacity ) || Capacity <= 0.0 )
    Problem << "capacity " << Capacity << " kWh must be positive";
  else if ( !std::isfinite( MaxChargePower ) || MaxChargePower < 0.0 ||
            !std::isfinite( MaxDischargePower ) || MaxDischargePower < 0.0 )
    Problem << "charge and discharge rates must be non-negative";
  else if ( !( ChargeEfficiency > 0.0 && ChargeEfficiency <= 1.0 ) ||
            !( DischargeEfficiency > 0.0 && DischargeEfficiency <= 1.0 ) )
    Problem << "efficiencies must be in (0,1]";
  else if ( !( SOC >= 0.0 && SOC <= MaximumSOC ) )
    Problem << "SOC " << SOC << " % is outside [0," << MaximumSOC << "]";

  if ( !Problem.str().empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Invalid battery state: " << Problem.str();

    throw InputError( ErrorMessage.str() );
  }
}

std::ostream & operator << ( std::ostream & Output, const BatteryState & State )
{
  Output << State.SOC << " % of " << State.Capacity << " kWh (charge "
         << State.MaxChargePower << " kW at " << State.ChargeEfficiency
         << ", discharge " << State.MaxDischargePower << " kW at "
         << State.DischargeEfficiency << ")";

  return Output;
}

// -----------------------------------------------------------------------------
// Battery model
// -----------------------------------------------------------------------------

BatteryModel::BatteryModel( double LowerSOC, double UpperSOC )
: MinimumSOC( LowerSOC ), MaximumSOC( UpperSOC )
{
  if ( !( 0.0 <= MinimumSOC && MinimumSOC < MaximumSOC && MaximumSOC <= 100.0 ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The SOC limits [" << LowerSOC << "," << UpperSOC
                 << "] must satisfy 0 <= min < max <= 100";

    throw InputError( ErrorMessage.str() );
  }
}

double BatteryModel::Headroom( const BatteryState & State ) const
{
  return std::max( 0.0, State.StoredEnergy( MaximumSOC - State.SOC )
                        / State.ChargeEfficiency );
}

double BatteryModel::Reserve( const BatteryState & State ) const
{
  return std::max( 0.0, State.StoredEnergy( State.SOC - MinimumSOC )
                        * State.DischargeEfficiency );
}

double BatteryModel::ChargeToReach( const BatteryState & State,
                                    double TargetSOC ) const
{
  return std::max( 0.0, State.StoredEnergy( TargetSOC - State.SOC )
                        / State.ChargeEfficiency );
}

double BatteryModel::DischargeToReach( const BatteryState & State,
                                       double TargetSOC ) const
{
  return std::max( 0.0, State.StoredEnergy( State.SOC - TargetSOC )
                        * State.DischargeEfficiency );
}

// The transition clamps the request to the rate first and to the SOC limits
// second. When the SOC limit cuts the request, the new SOC is set to the
// limit itself rather than computed, which avoids round off drift of the SOC
// away from the limit.

BatteryTransition BatteryModel::Transition( const BatteryState & State,
                                            double RequestedPower,
                                            double Hours ) const
{
  BatteryTransition Result{ State, 0.0, 0.0, false };

  if ( !std::isfinite( RequestedPower ) || !( Hours >= 0.0 ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Invalid battery request of " << RequestedPower
                 << " kW over " << Hours << " h";

    throw InputError( ErrorMessage.str() );
  }

  const double Requested = std::abs( RequestedPower ) * Hours;

  if ( RequestedPower > 0.0 )
  {
    double Energy     = std::min( RequestedPower, State.MaxChargePower ) * Hours,
           Available  = Headroom( State );

    if ( Energy >= Available )
    {
      Energy           = Available;
      Result.State.SOC = std::max( State.SOC, MaximumSOC );
    }
    else
      Result.State.SOC = State.SOC
        + Energy * State.ChargeEfficiency / State.Capacity * 100.0;

    Result.EnergyMoved = Energy;
  }
  else if ( RequestedPower < 0.0 )
  {
    double Energy    = std::min( -RequestedPower, State.MaxDischargePower ) * Hours,
           Available = Reserve( State );

    if ( Energy >= Available )
    {
      Energy           = Available;
      Result.State.SOC = std::min( State.SOC, MinimumSOC );
    }
    else
      Result.State.SOC = State.SOC
        - Energy / State.DischargeEfficiency / State.Capacity * 100.0;

    Result.EnergyMoved = -Energy;
  }

  Result.EnergyClipped = std::max( 0.0, Requested
                                        - std::abs( Result.EnergyMoved ) );
  Result.Limited       = ( Result.EnergyClipped > Tolerance );

  // The new SOC must be within the limits, unless the battery started below
  // the minimum and did not discharge.

  const bool BelowMinimumAtEntry = ( State.SOC < MinimumSOC )
                                   && ( Result.EnergyMoved >= 0.0 );

  if ( Result.State.SOC > MaximumSOC + Tolerance ||
       ( Result.State.SOC < MinimumSOC - Tolerance && !BelowMinimumAtEntry ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The battery transition from " << State.SOC
                 << " % with request " << RequestedPower << " kW gave the SOC "
                 << Result.State.SOC << " % outside [" << MinimumSOC << ","
                 << MaximumSOC << "]";

    throw StateInvariantViolation( ErrorMessage.str() );
  }

  Result.State.SOC = std::min( Result.State.SOC, MaximumSOC );

  if ( !BelowMinimumAtEntry )
    Result.State.SOC = std::max( Result.State.SOC, MinimumSOC );

  return Result;
}

}      // End name space SolarPlanner
