/*==============================================================================
Battery

The battery model is the physics shared by all planners. A battery state is
a snapshot of the state of charge (SOC) in percent of the capacity together
with the constant characteristics of the battery: The capacity in kWh, the
maximal charge and discharge powers in kW, and the efficiencies of charging
and discharging.

All energies and powers at the interface of the battery model are measured
at the AC bus of the inverter, which is where the grid, the solar panels and
the household load meet. Charging an energy E at the AC bus stores
E * ChargeEfficiency in the battery, and delivering an energy E to the AC bus
removes E / DischargeEfficiency from the battery. Hence, the efficiency losses
are always charged against the stored energy.

The transition is a pure function: Given a state, a requested power and a
duration it returns the new state and the energy actually moved. The request
is first limited by the rate of the battery and then by the state of charge
limits, and the SOC is set exactly to the limit if the request is cut by it.
The difference between the requested and the moved energy is reported as
clipped so that the caller knows that the battery could not follow the
request.

A battery may be below the minimum SOC on entry to a planning cycle, for
instance after a long period of deficit. It cannot discharge in this state,
but it can be charged back towards the minimum.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_BATTERY
#define SOLAR_PLANNER_BATTERY

#include <iostream>                           // Printing states

namespace SolarPlanner
{

class BatteryState
{
public:

  double SOC,                                 // Percent of capacity
         Capacity,                            // kWh
         MaxChargePower,                      // kW
         MaxDischargePower,                   // kW
         ChargeEfficiency,                    // (0,1]
         DischargeEfficiency;                 // (0,1]

  // The state is valid if the capacity is positive, the rates non-negative,
  // the efficiencies in (0,1] and the SOC in [0, MaximumSOC]. An input error
  // is thrown otherwise.

  void Validate( double MaximumSOC = 100.0 ) const;

  // Stored energy in kWh corresponding to a SOC value

  inline double StoredEnergy( double Percent ) const
  { return Percent / 100.0 * Capacity; }

  inline double RoundTripEfficiency( void ) const
  { return ChargeEfficiency * DischargeEfficiency; }
};

std::ostream & operator << ( std::ostream & Output, const BatteryState & State );

// -----------------------------------------------------------------------------
// Transition
// -----------------------------------------------------------------------------
//
// The result of a transition. The energy moved is positive for charging and
// negative for discharging.

class BatteryTransition
{
public:

  BatteryState State;
  double       EnergyMoved,
               EnergyClipped;
  bool         Limited;
};

class BatteryModel
{
public:

  // SOC values closer than this to a limit are taken to be at the limit

  static constexpr double Tolerance = 1e-9;

private:

  double MinimumSOC, MaximumSOC;

public:

  // The transition for a signed power request where positive power charges
  // and negative power discharges. The duration is in hours.

  BatteryTransition Transition( const BatteryState & State,
                                double RequestedPower, double Hours ) const;

  // The AC energy that can still be absorbed before the maximum SOC, and the
  // AC energy that can be delivered before the minimum SOC.

  double Headroom( const BatteryState & State ) const;
  double Reserve ( const BatteryState & State ) const;

  // The AC energy to charge to reach a target SOC from below, and the AC
  // energy delivered when discharging to a target SOC from above. Both are
  // zero if the battery is already at the other side of the target.

  double ChargeToReach   ( const BatteryState & State, double TargetSOC ) const;
  double DischargeToReach( const BatteryState & State, double TargetSOC ) const;

  inline double MinSOC( void ) const
  { return MinimumSOC; }

  inline double MaxSOC( void ) const
  { return MaximumSOC; }

  BatteryModel( double LowerSOC = 10.0, double UpperSOC = 100.0 );
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_BATTERY
