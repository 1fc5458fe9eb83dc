/*==============================================================================
Linear problem

This test solves a set of small linear problems with known solutions to show
how the linear optimisation interface is used. The problems cover the basic
cases of a maximisation with inequality constraints, a minimisation with
equality and greater-than constraints, variables with negative lower bounds,
a constraint repeating a variable, a binary knapsack problem whose relaxation
is fractional, and the failure cases of infeasible and unbounded problems, of
reached search limits and of an invalid optimality gap.

The program returns a non-zero exit status if any of the checks fails.

License: LGPL 3.0
==============================================================================*/

#include <chrono>            // Time limits
#include <cmath>             // Absolute values
#include <cstdlib>           // Exit status
#include <iostream>          // Status messages
#include <string>            // Test names
#include <stdexcept>         // Invalid arguments

#include "Linear.hpp"

using namespace Optimization;

static unsigned int Failures = 0;

void Check( bool Condition, const std::string & Description )
{
	if ( Condition )
		std::cout << "[PASS] " << Description << std::endl;
	else
	{
		std::cout << "[FAIL] " << Description << std::endl;
		++Failures;
	}
}

bool Near( VariableType Value, VariableType Expected )
{
	return std::abs( Value - Expected ) < 1e-6;
}

// -----------------------------------------------------------------------------
// Maximise 3x + 2y subject to x + y <= 4, x + 3y <= 6 and x <= 3
// -----------------------------------------------------------------------------

void Production( void )
{
	Linear::Problem LP( Linear::Problem::Goal::Maximize );

	Dimension x = LP.AddVariable( "x", 3.0, Interval( 0.0, 3.0 ) ),
	          y = LP.AddVariable( "y", 2.0, Interval( 0.0, Infinity ) );

	LP.AddConstraint( "Capacity", { {x, 1.0}, {y, 1.0} },
	                  Relation::LessEqual, 4.0 );
	LP.AddConstraint( "Labour",   { {x, 1.0}, {y, 3.0} },
	                  Relation::LessEqual, 6.0 );

	Linear::Limits   Unlimited;
	Linear::Solver   Solver( LP, Unlimited );
	Linear::Solution Optimum = Solver.Solve();

	Check( Near( Optimum.Values[x], 3.0 ) && Near( Optimum.Values[y], 1.0 ),
	       "Maximisation finds the vertex x = 3, y = 1" );
	Check( Near( Optimum.ObjectiveValue, 11.0 ),
	       "Maximisation objective value is 11" );
	Check( LP.MaxViolation( Optimum.Values ) < 1e-7,
	       "Maximisation solution is feasible" );
}

// -----------------------------------------------------------------------------
// Minimise x + y + 10 subject to x + 2y >= 4 and x - y = 1
// -----------------------------------------------------------------------------

void Covering( void )
{
	Linear::Problem LP;

	Dimension x = LP.AddVariable( "x", 1.0, Interval( 0.0, Infinity ) ),
	          y = LP.AddVariable( "y", 1.0, Interval( 0.0, Infinity ) );

	LP.AddConstraint( "Cover",      { {x, 1.0}, {y,  2.0} },
	                  Relation::GreaterEqual, 4.0 );
	LP.AddConstraint( "Difference", { {x, 1.0}, {y, -1.0} },
	                  Relation::Equal, 1.0 );
	LP.SetConstant( 10.0 );

	Linear::Limits   Unlimited;
	Linear::Solver   Solver( LP, Unlimited );
	Linear::Solution Optimum = Solver.Solve();

	Check( Near( Optimum.Values[x], 2.0 ) && Near( Optimum.Values[y], 1.0 ),
	       "Minimisation with equality finds x = 2, y = 1" );
	Check( Near( Optimum.ObjectiveValue, 13.0 ),
	       "The objective includes the constant term" );
}

// -----------------------------------------------------------------------------
// Minimise x subject to x + y >= -2 with x in [-5,10] and y in [0,1]
// -----------------------------------------------------------------------------

void ShiftedBounds( void )
{
	Linear::Problem LP;

	Dimension x = LP.AddVariable( "x", 1.0, Interval( -5.0, 10.0 ) ),
	          y = LP.AddVariable( "y", 0.0, Interval(  0.0,  1.0 ) );

	LP.AddConstraint( "Floor", { {x, 1.0}, {y, 1.0} },
	                  Relation::GreaterEqual, -2.0 );

	Linear::Limits   Unlimited;
	Linear::Solver   Solver( LP, Unlimited );
	Linear::Solution Optimum = Solver.Solve();

	Check( Near( Optimum.Values[x], -3.0 ) && Near( Optimum.Values[y], 1.0 ),
	       "Negative lower bounds give x = -3 with y at its upper bound" );
}

// -----------------------------------------------------------------------------
// Binary knapsack: maximise 8a + 11b + 6c + 4d with 5a + 7b + 4c + 3d <= 14
// -----------------------------------------------------------------------------

void Knapsack( void )
{
	Linear::Problem LP( Linear::Problem::Goal::Maximize );

	Dimension a = LP.AddBinaryVariable( "a",  8.0 ),
	          b = LP.AddBinaryVariable( "b", 11.0 ),
	          c = LP.AddBinaryVariable( "c",  6.0 ),
	          d = LP.AddBinaryVariable( "d",  4.0 );

	LP.AddConstraint( "Weight", { {a, 5.0}, {b, 7.0}, {c, 4.0}, {d, 3.0} },
	                  Relation::LessEqual, 14.0 );

	Linear::Limits   Unlimited;
	Linear::Solver   Solver( LP, Unlimited );
	Linear::Solution Optimum = Solver.Solve();

	Check( Near( Optimum.ObjectiveValue, 21.0 ),
	       "Knapsack optimum is 21" );
	Check( Near( Optimum.Values[a], 0.0 ) && Near( Optimum.Values[b], 1.0 ) &&
	       Near( Optimum.Values[c], 1.0 ) && Near( Optimum.Values[d], 1.0 ),
	       "Knapsack selects items b, c and d" );
	Check( Optimum.Values[b] == 1.0 && Optimum.Values[a] == 0.0,
	       "Knapsack binaries are returned as exact integers" );
	Check( LP.MaxViolation( Optimum.Values ) < 1e-7,
	       "Knapsack solution is feasible" );
}

// -----------------------------------------------------------------------------
// Maximise x + y where the capacity row lists x twice: 2x + y <= 4, y <= 1
// -----------------------------------------------------------------------------

void RepeatedTerms( void )
{
	Linear::Problem LP( Linear::Problem::Goal::Maximize );

	Dimension x = LP.AddVariable( "x", 1.0, Interval( 0.0, Infinity ) ),
	          y = LP.AddVariable( "y", 1.0, Interval( 0.0, 1.0 ) );

	LP.AddConstraint( "Capacity", { {x, 1.0}, {y, 1.0}, {x, 1.0} },
	                  Relation::LessEqual, 4.0 );

	Linear::Limits   Unlimited;
	Linear::Solver   Solver( LP, Unlimited );
	Linear::Solution Optimum = Solver.Solve();

	Check( Near( Optimum.Values[x], 1.5 ) && Near( Optimum.Values[y], 1.0 ),
	       "Repeated terms of a constraint are added" );
}

// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------

void Failing( void )
{
	Linear::Limits Unlimited;

	{
		Linear::Problem LP;

		Dimension x = LP.AddVariable( "x", 1.0, Interval( 0.0, Infinity ) ),
		          y = LP.AddVariable( "y", 1.0, Interval( 0.0, Infinity ) );

		LP.AddConstraint( "Upper", { {x, 1.0}, {y, 1.0} },
		                  Relation::LessEqual, 1.0 );
		LP.AddConstraint( "Lower", { {x, 1.0}, {y, 1.0} },
		                  Relation::GreaterEqual, 2.0 );

		bool Thrown = false;

		try
		{
			Linear::Solver Solver( LP, Unlimited );
			Solver.Solve();
		}
		catch ( const Linear::Infeasible & )
		{
			Thrown = true;
		}

		Check( Thrown, "Contradicting constraints are infeasible" );
	}

	{
		Linear::Problem LP( Linear::Problem::Goal::Maximize );

		Dimension x = LP.AddVariable( "x", 1.0, Interval( 0.0, Infinity ) ),
		          y = LP.AddVariable( "y", 0.0, Interval( 0.0, Infinity ) );

		LP.AddConstraint( "Difference", { {x, 1.0}, {y, -1.0} },
		                  Relation::LessEqual, 1.0 );

		bool Thrown = false;

		try
		{
			Linear::Solver Solver( LP, Unlimited );
			Solver.Solve();
		}
		catch ( const Linear::Unbounded & )
		{
			Thrown = true;
		}

		Check( Thrown, "A ray of improving solutions is unbounded" );
	}

	{
		Linear::Problem LP;

		LP.AddBinaryVariable( "z", -1.0 );

		Linear::Limits NoTime( std::chrono::milliseconds( 0 ) );
		bool Thrown = false;

		try
		{
			Linear::Solver Solver( LP, NoTime );
			Solver.Solve();
		}
		catch ( const Linear::TimeLimitReached & )
		{
			Thrown = true;
		}

		Check( Thrown, "A passed deadline stops the search" );
	}

	{
		Linear::Problem LP;

		LP.AddBinaryVariable( "z", -1.0 );

		Linear::Limits Cancelled;
		Cancelled.Stop->store( true );
		bool Thrown = false;

		try
		{
			Linear::Solver Solver( LP, Cancelled );
			Solver.Solve();
		}
		catch ( const Linear::ForcedStop & )
		{
			Thrown = true;
		}

		Check( Thrown, "The stop flag cancels the search" );
	}

	{
		Linear::Problem LP;

		LP.AddBinaryVariable( "z", -1.0 );

		bool Thrown = false;

		try
		{
			Linear::Solver Solver( LP, Unlimited, -1.0 );
		}
		catch ( const std::invalid_argument & )
		{
			Thrown = true;
		}

		Check( Thrown, "A negative optimality gap is rejected" );
	}
}

int main( void )
{
	Production();
	Covering();
	ShiftedBounds();
	Knapsack();
	RepeatedTerms();
	Failing();

	std::cout << Failures << " checks failed" << std::endl;

	return ( Failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE );
}
