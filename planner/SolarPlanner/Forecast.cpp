/*==============================================================================
Forecast

Validation of a forecast series and the alignment of irregularly sampled
forecasts to the slots of the planning horizon.

License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // Finite values
#include <memory>                             // Interpolation objects
#include <iterator>                           // Previous sample
#include <sstream>                            // Error messages
#include <string>                             // Series names
#include <algorithm>                          // Min and max

#include "Forecast.hpp"
#include "Interpolation.hpp"
#include "Errors.hpp"

namespace SolarPlanner
{
// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------

static void CheckSeries( const std::string & Name,
                         const std::vector< double > & Values,
                         bool NonNegative )
{
  for ( std::size_t i = 0; i < Values.size(); ++i )
    if ( !std::isfinite( Values[i] ) || ( NonNegative && Values[i] < 0.0 ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "Forecast " << Name << " has the invalid value "
                   << Values[i] << " in slot " << i;

      throw InputError( ErrorMessage.str() );
    }
}

void ForecastSeries::Validate( void ) const
{
  if ( ExportPrice.size() != ImportPrice.size() ||
       Solar.size()       != ImportPrice.size() ||
       Load.size()        != ImportPrice.size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Forecast series have different lengths: import price "
                 << ImportPrice.size() << ", export price "
                 << ExportPrice.size() << ", solar " << Solar.size()
                 << ", load " << Load.size();

    throw InputError( ErrorMessage.str() );
  }

  CheckSeries( "import price", ImportPrice, false );
  CheckSeries( "export price", ExportPrice, false );
  CheckSeries( "solar",        Solar,       true  );
  CheckSeries( "load",         Load,        true  );
}

// -----------------------------------------------------------------------------
// Alignment
// -----------------------------------------------------------------------------
//
// A price is the last price announced at or before the start of the slot. If
// the first announcement is after the start of the slot, the first price is
// used.

static double HeldValue( const TimeSeries & Samples, Time At )
{
  auto Next = Samples.upper_bound( At );

  if ( Next == Samples.begin() )
    return Next->second;
  else
    return std::prev( Next )->second;
}

// The average power over a slot from the samples. A single sample is a
// constant power. Otherwise the samples are interpolated and the parts of the
// slot outside of the sampled domain are taken at the value of the nearest
// sample.

static double AveragePower( const TimeSeries & Samples,
                            const Interpolation * Interpolated,
                            const TimeInterval & SlotTime )
{
  if ( Interpolated == nullptr )
    return Samples.begin()->second;

  const double Lower  = static_cast< double >( SlotTime.lower() ),
               Upper  = static_cast< double >( SlotTime.upper() ),
               First  = Interpolated->DomainLower(),
               Last   = Interpolated->DomainUpper();

  double Energy = 0.0;

  if ( Lower < First )
    Energy += ( std::min( Upper, First ) - Lower ) * Samples.begin()->second;

  if ( Upper > Last )
    Energy += ( Upper - std::max( Lower, Last ) ) * Samples.rbegin()->second;

  const double From = std::max( Lower, First ),
               To   = std::min( Upper, Last  );

  if ( From < To )
    Energy += Interpolated->Integral( From, To );

  return std::max( 0.0, Energy / ( Upper - Lower ) );
}

// The interpolation method is Steffen's method if there are enough samples,
// and otherwise linear interpolation between two samples.

static std::unique_ptr< Interpolation > Interpolate( const TimeSeries & Samples )
{
  if ( Samples.size() >=
       Interpolation::MinimumPoints( Interpolation::Type::SteffenMethod ) )
    return std::make_unique< Interpolation >( Samples,
                                      Interpolation::Type::SteffenMethod );
  else if ( Samples.size() >=
            Interpolation::MinimumPoints( Interpolation::Type::Linear ) )
    return std::make_unique< Interpolation >( Samples,
                                      Interpolation::Type::Linear );
  else
    return nullptr;
}

ForecastSeries ForecastSeries::Align( Time Start, std::size_t Slots,
                                      const TimeSeries & ImportPrices,
                                      const TimeSeries & ExportPrices,
                                      const TimeSeries & SolarPower,
                                      const TimeSeries & LoadPower )
{
  if ( ImportPrices.empty() || ExportPrices.empty() ||
       SolarPower.empty()   || LoadPower.empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "All forecast series must have at least one sample to be "
                 << "aligned to the planning slots";

    throw InputError( ErrorMessage.str() );
  }

  std::unique_ptr< Interpolation > SolarFunction = Interpolate( SolarPower ),
                                   LoadFunction  = Interpolate( LoadPower  );

  ForecastSeries Aligned;

  Aligned.StartTime = Start;

  for ( std::size_t i = 0; i < Slots; ++i )
  {
    TimeInterval SlotTime = Aligned.SlotInterval( i );

    Aligned.ImportPrice.push_back( HeldValue( ImportPrices, SlotTime.lower() ) );
    Aligned.ExportPrice.push_back( HeldValue( ExportPrices, SlotTime.lower() ) );
    Aligned.Solar.push_back( AveragePower( SolarPower, SolarFunction.get(),
                                           SlotTime ) );
    Aligned.Load.push_back( AveragePower( LoadPower, LoadFunction.get(),
                                          SlotTime ) );
  }

  Aligned.Validate();

  return Aligned;
}

}      // End name space SolarPlanner
