/*==============================================================================
Solver

The mixed integer linear problems are solved by the COIN-OR branch and cut
solver CBC [1] with CLP [2] solving the continuous relaxations. The solver
class is a thin adapter: it copies the problem definition into the Open
Solver Interface of CLP, passes the search limits to the CBC model, runs the
search, and converts the outcome reported by CBC into either a solution or
one of the exceptions of the status definitions.

The search is bounded by the limits given. The deadline is converted to the
number of seconds remaining when the search starts, and the stop flag is
polled by an event handler at every event raised by CBC, which is at least
once per node. The flag and the deadline are also checked before the solver
is set up, so a search that is stopped or out of time before it starts will
never call CBC.

A search is complete if CBC proves that the best solution found is within the
absolute optimality gap of the optimum. Any other outcome throws, including
a limit reached after an integer solution was found, since the application
should not act on a solution of unknown quality.

References:

[1] John Forrest and Robin Lougee-Heimer: CBC User Guide, INFORMS Tutorials
    in Operations Research, pp. 257-277, 2005
[2] https://github.com/coin-or/Clp

License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_SOLVER
#define OPTIMIZATION_LINEAR_SOLVER

#include "Variables.hpp"                      // Basic definitions
#include "Linear/Problem.hpp"                 // The problem definition
#include "Linear/Status.hpp"                  // Limits and exceptions

namespace Optimization::Linear
{
/*==============================================================================

 Solution

==============================================================================*/
//
// A solution is the variable values of the problem, with the integer
// variables rounded to their integral values, and the objective value
// including the constant term. The counters are the simplex iterations and
// the branch and bound nodes reported by CBC.

class Solution
{
public:

	Variables     Values;
	VariableType  ObjectiveValue;
	unsigned long Iterations,
	              Nodes;

	Solution( void )
	: Values(), ObjectiveValue( 0.0 ), Iterations( 0 ), Nodes( 0 )
	{}
};

/*==============================================================================

 Solver

==============================================================================*/

class Solver
{
private:

	const Problem & LP;
	const Limits  & SearchLimits;
	VariableType    OptimalityGap;

public:

	// The search throws the exception of the status definitions that
	// corresponds to the outcome if it does not prove an optimal solution.

	Solution Solve( void ) const;

	Solver( const Problem & TheProblem, const Limits & TheLimits,
	        VariableType AbsoluteGap = 0.0 );

	Solver( void ) = delete;
};

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_SOLVER
