/*==============================================================================
Errors

The planners report errors by throwing exceptions. There are three classes of
errors, and they are derived from different standard exceptions so that a
caller can catch them as a group if needed:

1. Input errors are invalid arguments: A forecast with series of different
   lengths or values that are not finite, a battery state that is not
   physically meaningful, or a configuration that is not consistent. There is
   no partial plan for invalid input.

2. Optimisation failures are runtime errors: The linear program has no
   feasible solution, or the solver could not find the optimum within its time
   budget. The caller should fall back to the rule based planner, and there
   is a planning cycle class doing exactly this.

3. State invariant violations are logic errors: The state of charge left its
   bounds because of a defect in the battery transition, or a plan is not
   continuous. They are fatal and should never be caught for recovery.

No function of the planners retries after an error. A new planning cycle with
new data is the retry mechanism.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_ERRORS
#define SOLAR_PLANNER_ERRORS

#include <string>                             // Error messages
#include <stdexcept>                          // Standard exceptions

namespace SolarPlanner
{

class InputError : public std::invalid_argument
{
public:

  InputError( const std::string & ErrorMessage )
  : std::invalid_argument( ErrorMessage )
  {}

  InputError( void ) = delete;
};

// -----------------------------------------------------------------------------
// Optimisation failures
// -----------------------------------------------------------------------------

class OptimizationFailure : public std::runtime_error
{
public:

  OptimizationFailure( const std::string & ErrorMessage )
  : std::runtime_error( ErrorMessage )
  {}

  OptimizationFailure( void ) = delete;
};

class InfeasibleOptimizationError : public OptimizationFailure
{
public:

  InfeasibleOptimizationError( const std::string & ErrorMessage )
  : OptimizationFailure( ErrorMessage )
  {}

  InfeasibleOptimizationError( void ) = delete;
};

// A timeout also covers a search stopped on request or by the iteration limit

class SolverTimeoutError : public OptimizationFailure
{
public:

  SolverTimeoutError( const std::string & ErrorMessage )
  : OptimizationFailure( ErrorMessage )
  {}

  SolverTimeoutError( void ) = delete;
};

// -----------------------------------------------------------------------------
// Invariant violations
// -----------------------------------------------------------------------------

class StateInvariantViolation : public std::logic_error
{
public:

  StateInvariantViolation( const std::string & ErrorMessage )
  : std::logic_error( ErrorMessage )
  {}

  StateInvariantViolation( void ) = delete;
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_ERRORS
