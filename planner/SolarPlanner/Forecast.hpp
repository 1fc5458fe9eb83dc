/*==============================================================================
Forecast

The forecast is the input of every planning cycle: For each slot of the
horizon it gives the price of importing energy from the grid, the price paid
for energy exported to the grid, the forecast solar production and the
forecast household load. The prices are in pence per kWh and may be negative,
whereas the powers are average powers over the slot in kW and cannot be
negative. The horizon starts at an explicit time, and the slots follow each
other without gaps.

The forecasts are normally produced by external services that sample the
quantities at their own times, and the alignment function builds a forecast
series from such irregular samples: A price is a step function holding the
last announced price until a new price is announced. The powers are
interpolated between the samples, and the average over a slot is the integral
of the interpolated power over the slot divided by the slot duration. Before
the first sample and after the last sample the power is taken to be constant.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_FORECAST
#define SOLAR_PLANNER_FORECAST

#include <map>                                // Time series
#include <vector>                             // The slot values
#include <cstddef>                            // Sizes

#include "TimeInterval.hpp"                   // Time and slots

namespace SolarPlanner
{

using TimeSeries = std::map< Time, double >;

class ForecastSeries
{
public:

  Time                  StartTime;
  std::vector< double > ImportPrice,
                        ExportPrice,
                        Solar,
                        Load;

  // The number of slots. It is only meaningful for a validated forecast.

  inline std::size_t Size( void ) const
  { return ImportPrice.size(); }

  inline TimeInterval SlotInterval( std::size_t Index ) const
  { return Slot( StartTime, Index ); }

  // The validation throws an input error if the four series have different
  // lengths, if a value is not finite, or if a power is negative.

  void Validate( void ) const;

  // Building the forecast for a given number of slots from irregular samples

  static ForecastSeries Align( Time Start, std::size_t Slots,
                               const TimeSeries & ImportPrices,
                               const TimeSeries & ExportPrices,
                               const TimeSeries & SolarPower,
                               const TimeSeries & LoadPower );

  ForecastSeries( void )
  : StartTime( 0 ), ImportPrice(), ExportPrice(), Solar(), Load()
  {}
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_FORECAST
