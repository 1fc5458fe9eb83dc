/*==============================================================================
Forecast reader

License: LGPL 3.0
==============================================================================*/

#include <sstream>                 // For error messages

#include "ForecastReader.hpp"      // Function signature
#include "Errors.hpp"              // Input errors
#include "csv.h"                   // The CSV parser

SolarPlanner::ForecastSeries
Console::ReadForecast( const std::string & FileName,
                       std::optional< SolarPlanner::Time > Start,
                       std::optional< std::size_t > Slots )
{
  SolarPlanner::TimeSeries ImportPrices, ExportPrices, SolarPower, LoadPower;
  SolarPlanner::Time       TimeStamp;
  double                   Import, Export, Solar, Load;

  // Comma separated columns where spaces and tabs around values are ignored.
  // The parser errors are reported as input errors.

  try
  {
    io::CSVReader< 5, io::trim_chars< ' ', '\t' >, io::no_quote_escape< ',' > >
        CSVParser( FileName );

    CSVParser.read_header( io::ignore_extra_column,
                           "Time", "Import", "Export", "Solar", "Load" );

    while ( CSVParser.read_row( TimeStamp, Import, Export, Solar, Load ) )
    {
      ImportPrices[ TimeStamp ] = Import;
      ExportPrices[ TimeStamp ] = Export;
      SolarPower  [ TimeStamp ] = Solar;
      LoadPower   [ TimeStamp ] = Load;
    }
  }
  catch ( const io::error::base & Error )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "CSV Read error: " << Error.what();

    throw SolarPlanner::InputError( ErrorMessage.str() );
  }

  if ( ImportPrices.empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "CSV Read error: File \"" << FileName
                 << "\" does not contain any data";

    throw SolarPlanner::InputError( ErrorMessage.str() );
  }

  // The default horizon covers the file from the first time stamp, and the
  // last sample is inside the last slot.

  const SolarPlanner::Time First = Start.value_or( ImportPrices.begin()->first ),
                           Last  = ImportPrices.rbegin()->first;

  std::size_t Horizon = 0;

  if ( Slots )
    Horizon = *Slots;
  else if ( Last >= First )
    Horizon = static_cast< std::size_t >( ( Last - First )
                                          / SolarPlanner::SlotDuration ) + 1;

  return SolarPlanner::ForecastSeries::Align( First, Horizon, ImportPrices,
                                              ExportPrices, SolarPower,
                                              LoadPower );
}
