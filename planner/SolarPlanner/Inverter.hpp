/*==============================================================================
Inverter

The inverter routes the energy of one slot between the solar panels, the
household load, the battery and the grid according to its operating mode:

SelfUse:        Solar serves the load first. A surplus charges the battery,
                the remainder is exported up to the self-use export limit,
                and anything more is clipped. A deficit is covered by the
                battery and the rest is imported.

GridFirst:      Solar serves the load first. A surplus is exported up to the
                higher grid-first export limit, the remainder charges the
                battery, and anything more is clipped. A deficit is handled
                as in self-use.

ForceCharge:    The battery charges at the requested power plus any solar
                surplus, and the grid supplies what the solar does not,
                within the import limit. Surplus the battery cannot take is
                exported up to the self-use limit and then clipped.

ForceDischarge: The battery delivers up to the requested power, optionally
                stopping at a target SOC, first to the load and then to the
                grid. Solar surplus and battery export share the self-use
                export limit, and the battery only delivers what can be
                used or exported. A solar surplus above the export limit
                leaves no room for the battery, and the battery then takes
                the part of the surplus that cannot be exported instead of
                letting it be clipped.

Every mode conserves energy at the AC bus:

  Solar + Import + Discharge = Load + Export + Charge + Clipped

where the battery flow is the AC side energy computed by the battery model.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_INVERTER
#define SOLAR_PLANNER_INVERTER

#include <string>                             // Mode names
#include <optional>                           // Target SOC
#include <iostream>                           // Printing modes

#include "Battery.hpp"                        // The battery model

namespace SolarPlanner
{

enum class OperatingMode
{
  SelfUse,
  GridFirst,
  ForceCharge,
  ForceDischarge
};

std::string    ToString( OperatingMode Mode );
std::ostream & operator << ( std::ostream & Output, OperatingMode Mode );

// The energies of a slot in kWh and the cost in pence

class SlotFlows
{
public:

  double       Import,
               Export,
               BatteryFlow,                   // Positive when charging
               Clipped,
               Cost;
  BatteryState State;                         // After the slot
  bool         BatteryLimited;
};

class Inverter
{
private:

  const BatteryModel & Battery;
  double SelfUseLimit, GridFirstLimit, ImportLimit;

public:

  // Simulating one slot of the given duration in hours. The requested power
  // is only used by the forced modes, and the target SOC only by the forced
  // discharge.

  SlotFlows Simulate( OperatingMode Mode, double SolarPower, double LoadPower,
                      const BatteryState & State, double ImportPrice,
                      double ExportPrice, double Hours,
                      double RequestedPower = 0.0,
                      std::optional< double > TargetSOC = std::nullopt ) const;

  Inverter( const BatteryModel & TheBattery, double SelfUseExportLimit,
            double GridFirstExportLimit, double GridImportLimit )
  : Battery( TheBattery ), SelfUseLimit( SelfUseExportLimit ),
    GridFirstLimit( GridFirstExportLimit ), ImportLimit( GridImportLimit )
  {}
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_INVERTER
