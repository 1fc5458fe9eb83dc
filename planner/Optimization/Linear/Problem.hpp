/*==============================================================================
Linear problem

A mixed integer linear problem is defined by a set of variables, each having
a cost coefficient in the objective function, a domain and a flag indicating
whether the variable must take integral values; and by a set of linear
constraints over these variables. The objective function is the inner product
of the cost vector and the variable values plus a constant term. The constant
term does not influence the optimal variable assignment, but it allows the
objective value to be reported in the units of the application.

The problem is built incrementally: Variables are added one by one and the
index returned is used to refer to the variable in the constraint terms.
A constraint can only refer to variables that are already defined. This makes
it impossible to build a problem with dangling variable references, and the
solvers can therefore assume that the problem is well formed.

The class is only a definition of the problem, and the same problem may be
given to several solvers. The problem can also evaluate the objective and the
feasibility of any variable assignment, which allows a solution returned by
the solver to be verified independently of the solver.

License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_PROBLEM
#define OPTIMIZATION_LINEAR_PROBLEM

#include <string>                             // Names of variables
#include <vector>                             // Containers

#include "Variables.hpp"                      // Basic definitions
#include "Constraints.hpp"                    // Linear constraints

namespace Optimization::Linear
{

class Problem
{
public:

	// Even though the standard optimization is to minimize, both minimization
	// and maximization are possible.

	enum class Goal
	{
		Minimize,
		Maximize
	};

private:

	// ---------------------------------------------------------------------------
	// Variables
	// ---------------------------------------------------------------------------

	std::vector< std::string > VariableNames;
	Variables                  Costs;
	Domains                    Bounds;
	std::vector< Domain >      VariableTypes;

	// ---------------------------------------------------------------------------
	// Objective and constraints
	// ---------------------------------------------------------------------------

	Goal                            Direction;
	VariableType                    ObjectiveConstant;
	std::vector< LinearConstraint > ConstraintSet;

public:

	// Adding a variable returns its index. The domain is a closed interval with
	// a finite lower bound. An integer variable must have finite bounds.

	Dimension AddVariable( const std::string & Name, VariableType Cost,
	                       const Interval & VariableDomain,
	                       Domain Type = Domain::Continuous );

	// Binary variables are common enough to deserve their own function

	inline Dimension AddBinaryVariable( const std::string & Name,
	                                    VariableType Cost )
	{
		return AddVariable( Name, Cost, Interval( 0.0, 1.0 ), Domain::Integer );
	}

	// Adding a constraint will check that all terms refer to defined variables
	// and that the right hand side is finite. The index of the constraint is
	// returned.

	Dimension AddConstraint( const std::string & Name, const Terms & Coefficients,
	                         Relation Comparison, VariableType RightHandSide );

	// The objective may have a constant term and a direction

	inline void SetConstant( VariableType Constant )
	{ ObjectiveConstant = Constant; }

	inline VariableType GetConstant( void ) const
	{ return ObjectiveConstant; }

	inline void SetGoal( Goal Optimum )
	{ Direction = Optimum; }

	inline Goal GetGoal( void ) const
	{ return Direction; }

	// ---------------------------------------------------------------------------
	// Access
	// ---------------------------------------------------------------------------

	inline Dimension NumberOfVariables( void ) const
	{ return Costs.size(); }

	inline Dimension NumberOfConstraints( void ) const
	{ return ConstraintSet.size(); }

	inline const Variables & CostVector( void ) const
	{ return Costs; }

	inline const Domains & VariableDomains( void ) const
	{ return Bounds; }

	inline const std::string & VariableName( Dimension Index ) const
	{ return VariableNames.at( Index ); }

	inline bool IsInteger( Dimension Index ) const
	{ return VariableTypes.at( Index ) == Domain::Integer; }

	inline const std::vector< LinearConstraint > & Constraints( void ) const
	{ return ConstraintSet; }

	// The indices of all integer variables in increasing order

	std::vector< Dimension > IntegerVariables( void ) const;

	// ---------------------------------------------------------------------------
	// Evaluation
	// ---------------------------------------------------------------------------
	//
	// The objective function value for a full variable assignment

	VariableType ObjectiveFunction( const Variables & VariableValues ) const;

	// The largest violation of any bound, constraint or integrality
	// requirement. A feasible assignment has a violation of zero up to the
	// numerical tolerance of the solver.

	VariableType MaxViolation( const Variables & VariableValues ) const;

	// ---------------------------------------------------------------------------
	// Constructor and destructor
	// ---------------------------------------------------------------------------

	Problem( Goal Optimum = Goal::Minimize )
	: VariableNames(), Costs(), Bounds(), VariableTypes(),
	  Direction( Optimum ), ObjectiveConstant( 0.0 ), ConstraintSet()
	{}

	Problem( const Problem & Other ) = default;

	~Problem( void )
	{}
};

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_PROBLEM
