/*==============================================================================
Options

This implements the options class, i.e. the constructor implementing the
parsing of the command line options and the optional configuration file.

License: LGPL 3.0
==============================================================================*/

#include <string>                    // Standard strings
#include <iostream>                  // Printing errors
#include <fstream>                   // The configuration file
#include <cstdlib>                   // Exit status
#include <chrono>                    // Solver time limit
#include <boost/program_options.hpp> // Option parser

#include "CommandOptions.hpp"

namespace cmd = boost::program_options;

Console::CommandLineOptions::CommandLineOptions( int argc, char **argv )
: ForecastProfile(), HorizonStart(), HorizonSlots(),
  Selected( PlannerChoice::Cycle ), ComparePlanners( false ),
  Verbosity( SolarPlanner::Log::Level::Information ),
  Battery{ 50.0, 10.0, 5.0, 5.0, 0.95, 0.95 }, Configuration()
{
  // The options are grouped for the help message. The battery and the
  // configuration values are stored directly in the data members, and
  // their defaults are the values already set.

  cmd::options_description General("General options"),
                           BatteryOptions("Battery"),
                           PlannerOptions("Planner configuration");

  std::string PlannerName("Cycle"), LevelName("information");
  long        TimeLimit = Configuration.SolverTimeLimit.count();

  General.add_options()
    ( "help,h", "Produce this help message" )
    ( "Forecast,f", cmd::value< std::string >()->required(),
                    "Forecast CSV file with columns Time, Import, Export, "
                    "Solar and Load" )
    ( "Configuration,c", cmd::value< std::string >(),
                    "Configuration file with option = value lines" )
    ( "Start,t", cmd::value< SolarPlanner::Time >(),
                    "Start of the horizon in POSIX seconds" )
    ( "Slots,n", cmd::value< std::size_t >(),
                    "Number of half hour slots" )
    ( "Planner", cmd::value< std::string >( &PlannerName ),
                    "Cycle, MathOptimal or RuleBased" )
    ( "Compare", cmd::bool_switch( &ComparePlanners ),
                    "Run both planners and compare the plans" )
    ( "LogLevel", cmd::value< std::string >( &LevelName ),
                    "debug, information, warning, error or silent" );

  BatteryOptions.add_options()
    ( "SOC", cmd::value< double >( &Battery.SOC )
               ->default_value( Battery.SOC ), "State of charge [%]" )
    ( "Capacity", cmd::value< double >( &Battery.Capacity )
               ->default_value( Battery.Capacity ), "Capacity [kWh]" )
    ( "ChargePower", cmd::value< double >( &Battery.MaxChargePower )
               ->default_value( Battery.MaxChargePower ),
               "Maximum charge power [kW]" )
    ( "DischargePower", cmd::value< double >( &Battery.MaxDischargePower )
               ->default_value( Battery.MaxDischargePower ),
               "Maximum discharge power [kW]" )
    ( "ChargeEfficiency", cmd::value< double >( &Battery.ChargeEfficiency )
               ->default_value( Battery.ChargeEfficiency ),
               "Charge efficiency (0,1]" )
    ( "DischargeEfficiency",
               cmd::value< double >( &Battery.DischargeEfficiency )
               ->default_value( Battery.DischargeEfficiency ),
               "Discharge efficiency (0,1]" );

  PlannerOptions.add_options()
    ( "SelfUseExportLimit",
      cmd::value< double >( &Configuration.SelfUseExportLimit )
        ->default_value( Configuration.SelfUseExportLimit ),
      "Export limit in self-use [kW]" )
    ( "GridFirstExportLimit",
      cmd::value< double >( &Configuration.GridFirstExportLimit )
        ->default_value( Configuration.GridFirstExportLimit ),
      "Export limit in grid-first [kW]" )
    ( "ImportLimit",
      cmd::value< double >( &Configuration.ImportLimit )
        ->default_value( Configuration.ImportLimit ),
      "Import limit [kW]" )
    ( "MinimumSOC",
      cmd::value< double >( &Configuration.MinimumSOC )
        ->default_value( Configuration.MinimumSOC ),
      "Minimum state of charge [%]" )
    ( "MaximumSOC",
      cmd::value< double >( &Configuration.MaximumSOC )
        ->default_value( Configuration.MaximumSOC ),
      "Maximum state of charge [%]" )
    ( "ArbitrageMargin",
      cmd::value< double >( &Configuration.ArbitrageMargin )
        ->default_value( Configuration.ArbitrageMargin ),
      "Required arbitrage profit [p/kWh]" )
    ( "ClippingPenalty",
      cmd::value< double >( &Configuration.ClippingPenalty )
        ->default_value( Configuration.ClippingPenalty ),
      "Penalty for clipped solar energy [p/kWh]" )
    ( "GridFirstPenalty",
      cmd::value< double >( &Configuration.GridFirstPenalty )
        ->default_value( Configuration.GridFirstPenalty ),
      "Penalty per grid-first slot [p]" )
    ( "ClippingRiskThreshold",
      cmd::value< double >( &Configuration.ClippingRiskThreshold )
        ->default_value( Configuration.ClippingRiskThreshold ),
      "Clipping risk triggering grid-first [kWh]" )
    ( "FeedInTriggerMargin",
      cmd::value< double >( &Configuration.FeedInTriggerMargin )
        ->default_value( Configuration.FeedInTriggerMargin ),
      "Surplus beyond headroom triggering grid-first [kWh]" )
    ( "FeedInMinimumSaving",
      cmd::value< double >( &Configuration.FeedInMinimumSaving )
        ->default_value( Configuration.FeedInMinimumSaving ),
      "Clipping reduction required to enable grid-first [kWh]" )
    ( "PresunriseMargin",
      cmd::value< double >( &Configuration.PresunriseMargin )
        ->default_value( Configuration.PresunriseMargin ),
      "Absorption beyond headroom required for pre-sunrise discharge [kWh]" )
    ( "PresunriseBuffer",
      cmd::value< double >( &Configuration.PresunriseBuffer )
        ->default_value( Configuration.PresunriseBuffer ),
      "Extra room left by the pre-sunrise discharge [kWh]" )
    ( "DeficitThreshold",
      cmd::value< double >( &Configuration.DeficitThreshold )
        ->default_value( Configuration.DeficitThreshold ),
      "Shortfall triggering deficit prevention [kWh]" )
    ( "DaylightThreshold",
      cmd::value< double >( &Configuration.DaylightThreshold )
        ->default_value( Configuration.DaylightThreshold ),
      "Solar power taken as sunrise [kW]" )
    ( "SolverTimeLimit",
      cmd::value< long >( &TimeLimit )->default_value( TimeLimit ),
      "Solver time limit [ms]" )
    ( "OptimalityGap",
      cmd::value< double >( &Configuration.OptimalityGap )
        ->default_value( Configuration.OptimalityGap ),
      "Absolute optimality gap [p]" );

  cmd::options_description Description("Allowed options");
  Description.add( General ).add( BatteryOptions ).add( PlannerOptions );

  cmd::variables_map Values;

  // The command line is stored first so that its values take precedence
  // over the values from the configuration file.

  try
  {
    cmd::store( cmd::parse_command_line( argc, argv, Description ), Values );

    if ( Values.count("help") > 0 )
    {
      std::cout << Description << std::endl;
      exit( EXIT_SUCCESS );
    }

    if ( Values.count("Configuration") > 0 )
    {
      std::string   FileName = Values["Configuration"].as< std::string >();
      std::ifstream ConfigurationFile( FileName );

      if ( !ConfigurationFile )
      {
        std::cout << "The configuration file " << FileName
                  << " cannot be opened!" << std::endl;
        exit( EXIT_FAILURE );
      }

      cmd::store( cmd::parse_config_file( ConfigurationFile, Description ),
                  Values );
    }

    cmd::notify( Values );
  }
  catch ( const cmd::error & Error )
  {
    std::cout << Error.what() << std::endl << Description << std::endl;
    exit( EXIT_FAILURE );
  }

  ForecastProfile = Values["Forecast"].as< std::string >();

  if ( !std::filesystem::exists( ForecastProfile ) )
  {
    std::cout << "The forecast file " << ForecastProfile
              << " does not exist!" << std::endl;
    exit( EXIT_FAILURE );
  }

  if ( Values.count("Start") > 0 )
    HorizonStart = Values["Start"].as< SolarPlanner::Time >();

  if ( Values.count("Slots") > 0 )
    HorizonSlots = Values["Slots"].as< std::size_t >();

  if ( PlannerName == "Cycle" )
    Selected = PlannerChoice::Cycle;
  else if ( PlannerName == "MathOptimal" )
    Selected = PlannerChoice::MathOptimal;
  else if ( PlannerName == "RuleBased" )
    Selected = PlannerChoice::RuleBased;
  else
  {
    std::cout << "Unknown planner " << PlannerName << ". Use Cycle, "
              << "MathOptimal or RuleBased" << std::endl;
    exit( EXIT_FAILURE );
  }

  Verbosity = SolarPlanner::Log::ToLevel( LevelName );
  Configuration.SolverTimeLimit = std::chrono::milliseconds( TimeLimit );
}
