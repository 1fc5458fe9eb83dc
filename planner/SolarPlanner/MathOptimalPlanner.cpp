/*==============================================================================
Mathematical optimal planner

Construction of the linear program, the mapping of the solver exceptions to
optimisation failures, and the decoding of the solution into a plan.

License: LGPL 3.0
==============================================================================*/

#include <vector>                             // Variable indices
#include <algorithm>                          // Min and max
#include <sstream>                            // Messages
#include <iomanip>                            // Formatting reasons

#include "MathOptimalPlanner.hpp"
#include "Inverter.hpp"                       // Operating modes
#include "Errors.hpp"
#include "Log.hpp"

#include "Linear.hpp"                         // The solver

namespace SolarPlanner
{

// The indices of the variables of one slot

class SlotVariables
{
public:

  Optimization::Dimension Import, Export, Charge, Discharge, Clipped,
                          GridFirst, Charging, SOC;
};

Plan MathOptimalPlanner::Build( const ForecastSeries & Forecast,
                                const BatteryState & Battery,
                                const PlannerConfiguration & Configuration )
                                const
{
  using namespace Optimization;

  const std::size_t N = Forecast.Size();
  const double      h = SlotHours,
                    ChargeFactor    = Battery.ChargeEfficiency
                                      / Battery.Capacity * 100.0,
                    DischargeFactor = 1.0 / ( Battery.DischargeEfficiency
                                              * Battery.Capacity ) * 100.0,
                    TerminalValue   = Battery.Capacity / 100.0
                                      * Forecast.ExportPrice.back();

  Linear::Problem LP;
  std::vector< SlotVariables > Columns( N );

  for ( std::size_t t = 0; t < N; ++t )
  {
    const std::string Suffix = "[" + std::to_string( t ) + "]";
    SlotVariables & V = Columns[t];

    V.Import    = LP.AddVariable( "Import"    + Suffix, Forecast.ImportPrice[t],
                    Interval( 0.0, Configuration.ImportLimit * h ) );
    V.Export    = LP.AddVariable( "Export"    + Suffix, -Forecast.ExportPrice[t],
                    Interval( 0.0, Configuration.GridFirstExportLimit * h ) );
    V.Charge    = LP.AddVariable( "Charge"    + Suffix, 0.0,
                    Interval( 0.0, Battery.MaxChargePower * h ) );
    V.Discharge = LP.AddVariable( "Discharge" + Suffix, 0.0,
                    Interval( 0.0, Battery.MaxDischargePower * h ) );
    V.Clipped   = LP.AddVariable( "Clipped"   + Suffix,
                    Configuration.ClippingPenalty,
                    Interval( 0.0, Forecast.Solar[t] * h ) );
    V.GridFirst = LP.AddBinaryVariable( "GridFirst" + Suffix,
                    Configuration.GridFirstPenalty );
    V.Charging  = LP.AddBinaryVariable( "Charging"  + Suffix, 0.0 );
    V.SOC       = LP.AddVariable( "SOC[" + std::to_string( t + 1 ) + "]",
                    ( t + 1 == N ? -TerminalValue : 0.0 ),
                    Interval( Configuration.MinimumSOC,
                              Configuration.MaximumSOC ) );

    LP.AddConstraint( "Balance" + Suffix,
      { { V.Import, 1.0 }, { V.Export, -1.0 }, { V.Charge, -1.0 },
        { V.Discharge, 1.0 }, { V.Clipped, -1.0 } },
      Relation::Equal, ( Forecast.Load[t] - Forecast.Solar[t] ) * h );

    LP.AddConstraint( "ExportCap" + Suffix,
      { { V.Export, 1.0 },
        { V.GridFirst, -( Configuration.GridFirstExportLimit
                          - Configuration.SelfUseExportLimit ) * h } },
      Relation::LessEqual, Configuration.SelfUseExportLimit * h );

    // The battery either charges or discharges in a slot. With losses, doing
    // both at once would turn surplus energy into heat.

    LP.AddConstraint( "ChargeOnly" + Suffix,
      { { V.Charge, 1.0 }, { V.Charging, -Battery.MaxChargePower * h } },
      Relation::LessEqual, 0.0 );

    LP.AddConstraint( "DischargeOnly" + Suffix,
      { { V.Discharge, 1.0 }, { V.Charging, Battery.MaxDischargePower * h } },
      Relation::LessEqual, Battery.MaxDischargePower * h );

    // The SOC at the start of the first slot is a constant and moves to the
    // right hand side.

    Terms Recursion{ { V.SOC, 1.0 }, { V.Charge, -ChargeFactor },
                     { V.Discharge, DischargeFactor } };

    if ( t > 0 )
      Recursion.push_back( { Columns[ t - 1 ].SOC, -1.0 } );

    LP.AddConstraint( "SOC" + Suffix, Recursion, Relation::Equal,
                      ( t == 0 ? Battery.SOC : 0.0 ) );
  }

  LP.SetConstant( Battery.SOC * TerminalValue );

  // Solving the program and translating the solver errors

  Linear::Limits SolverLimits( Configuration.SolverTimeLimit );

  if ( StopRequest )
    SolverLimits.Stop = StopRequest;

  Linear::Solver   Solver( LP, SolverLimits, Configuration.OptimalityGap );
  Linear::Solution Optimum;

  std::ostringstream Failure;

  Failure << __FILE__ << " at line " << __LINE__ << ": " << Name()
          << " program with " << LP.NumberOfVariables() << " variables and "
          << LP.NumberOfConstraints() << " constraints: ";

  try
  {
    Optimum = Solver.Solve();
  }
  catch ( const Linear::Infeasible & Error )
  {
    throw InfeasibleOptimizationError( Failure.str() + Error.what() );
  }
  catch ( const Linear::Unbounded & Error )
  {
    throw OptimizationFailure( Failure.str() + Error.what() );
  }
  catch ( const Linear::TimeLimitReached & Error )
  {
    throw SolverTimeoutError( Failure.str() + Error.what() );
  }
  catch ( const Linear::ForcedStop & Error )
  {
    throw SolverTimeoutError( Failure.str() + Error.what() );
  }
  catch ( const Linear::NodeLimitReached & Error )
  {
    throw SolverTimeoutError( Failure.str() + Error.what() );
  }
  catch ( const Linear::SolverFailure & Error )
  {
    throw OptimizationFailure( Failure.str() + Error.what() );
  }

  {
    Log::Message Note( Log::Level::Debug, Name() );
    Note << "Objective " << Optimum.ObjectiveValue << " p after "
         << Optimum.Nodes << " nodes and " << Optimum.Iterations
         << " iterations";
  }

  // Decoding the solution

  const double Tolerance = 1e-6;
  const auto & Values    = Optimum.Values;

  Plan   Result( Name(), Battery.SOC );
  double SOC = Battery.SOC;

  Result.Slots.reserve( N );

  for ( std::size_t t = 0; t < N; ++t )
  {
    const SlotVariables & V = Columns[t];

    const double Surplus   = std::max( 0.0, Forecast.Solar[t] - Forecast.Load[t] )
                             * h,
                 Deficit   = std::max( 0.0, Forecast.Load[t] - Forecast.Solar[t] )
                             * h,
                 Import    = Values[ V.Import ],
                 Export    = Values[ V.Export ],
                 Flow      = Values[ V.Charge ] - Values[ V.Discharge ],
                 NewSOC    = Values[ V.SOC ];

    if ( NewSOC < Configuration.MinimumSOC - Tolerance ||
         NewSOC > Configuration.MaximumSOC + Tolerance )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The solution has SOC " << NewSOC << " % after slot "
                   << t << " outside [" << Configuration.MinimumSOC << ","
                   << Configuration.MaximumSOC << "]";

      throw StateInvariantViolation( ErrorMessage.str() );
    }

    OperatingMode      Mode;
    std::ostringstream Reason;

    Reason << std::fixed << std::setprecision(2);

    if ( Values[ V.GridFirst ] >= 0.5 )
    {
      Mode = OperatingMode::GridFirst;
      Reason << "Optimal: grid-first export of " << Export << " kWh";
    }
    else if ( Flow > Surplus + Tolerance )
    {
      Mode = OperatingMode::ForceCharge;
      Reason << "Optimal: grid charge of " << Flow - Surplus << " kWh at "
             << Forecast.ImportPrice[t] << " p/kWh";
    }
    else if ( -Flow > Deficit + Tolerance )
    {
      Mode = OperatingMode::ForceDischarge;
      Reason << "Optimal: battery export of " << -Flow - Deficit
             << " kWh at " << Forecast.ExportPrice[t] << " p/kWh";
    }
    else
    {
      Mode = OperatingMode::SelfUse;
      Reason << "Optimal: self-use";
    }

    const double SOCAfter = std::clamp( NewSOC, Configuration.MinimumSOC,
                                        Configuration.MaximumSOC );

    Result.Slots.push_back( PlanSlot{ Forecast.SlotInterval(t).lower(), Mode,
                            Import, Export, Flow, SOC, SOCAfter,
                            Import * Forecast.ImportPrice[t]
                            - Export * Forecast.ExportPrice[t],
                            Values[ V.Clipped ], Reason.str() } );

    SOC = SOCAfter;
  }

  return Result;
}

}      // End name space SolarPlanner
