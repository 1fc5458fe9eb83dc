/*==============================================================================
Constraints

Constraints are the most important aspect of any optimisation problem since
inequality constraints confine the search space and equality constraints
reduce the problem dimension.

A linear constraint is a weighted sum of some of the variables compared with
a right hand side value. Most constraints of practical problems involve only
a few variables, and the constraint is therefore stored as a sparse list of
terms, each term being the index of a variable and its coefficient. The
sparse rows handed to the solver are built from these terms when the problem
is solved.

A variable assignment is feasible if it satisfies all constraints.

License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_CONSTRAINTS
#define OPTIMIZATION_CONSTRAINTS

#include <vector>                             // For the terms
#include <cmath>                              // Absolute values
#include <string>                             // Constraint names
#include <utility>                            // Pairs
#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions
#include <algorithm>                          // Max of violations

#include "Variables.hpp"

namespace Optimization
{
/*==============================================================================

 Linear constraints

==============================================================================*/
//
// The relation between the left hand side and the right hand side of the
// constraint.

enum class Relation
{
	LessEqual,
	Equal,
	GreaterEqual
};

// A term is the index of a variable and its coefficient

using Term  = std::pair< Dimension, VariableType >;
using Terms = std::vector< Term >;

class LinearConstraint
{
public:

	const std::string  Name;
	const Terms        LeftHandSide;
	const Relation     Type;
	const VariableType RightHandSide;

	// The value of the left hand side for a given variable assignment. It will
	// throw if a term refers to a variable that is not in the assignment.

	VariableType Value( const Variables & VariableValues ) const
	{
		VariableType Sum = 0.0;

		for ( const Term & LinearTerm : LeftHandSide )
			if ( LinearTerm.first < VariableValues.size() )
				Sum += LinearTerm.second * VariableValues[ LinearTerm.first ];
			else
			{
				std::ostringstream ErrorMessage;

				ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
				             << "Constraint " << Name << " refers to variable "
				             << LinearTerm.first << " but only "
				             << VariableValues.size() << " values were given";

				throw std::invalid_argument( ErrorMessage.str() );
			}

		return Sum;
	}

	// The violation is the amount by which the constraint is not satisfied,
	// and it is zero for an assignment satisfying the constraint.

	VariableType Violation( const Variables & VariableValues ) const
	{
		VariableType Difference = Value( VariableValues ) - RightHandSide;

		switch ( Type )
		{
			case Relation::LessEqual:
				return std::max( 0.0, Difference );
			case Relation::GreaterEqual:
				return std::max( 0.0, -Difference );
			default:
				return std::abs( Difference );
		}
	}

	LinearConstraint( const std::string & ConstraintName,
	                  const Terms & Coefficients, Relation Comparison,
	                  VariableType Limit )
	: Name( ConstraintName ), LeftHandSide( Coefficients ), Type( Comparison ),
	  RightHandSide( Limit )
	{}
};

}      // End name space Optimization
#endif // OPTIMIZATION_CONSTRAINTS
