/*==============================================================================
Linear problem

The implementation of the problem definition functions that check their
arguments before they are added to the problem.

License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // Finite values
#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions
#include <algorithm>                          // Max element

#include "Linear/Problem.hpp"

namespace Optimization::Linear
{

// -----------------------------------------------------------------------------
// Defining the problem
// -----------------------------------------------------------------------------

Dimension Problem::AddVariable( const std::string & Name, VariableType Cost,
                                const Interval & VariableDomain, Domain Type )
{
	if ( !std::isfinite( Cost ) || !std::isfinite( VariableDomain.lower() ) )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "Variable " << Name << " must have a finite cost "
		             << "and a finite lower bound";

		throw std::invalid_argument( ErrorMessage.str() );
	}

	if ( Type == Domain::Integer && !std::isfinite( VariableDomain.upper() ) )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "Integer variable " << Name
		             << " must have a finite upper bound";

		throw std::invalid_argument( ErrorMessage.str() );
	}

	VariableNames.push_back( Name );
	Costs.push_back( Cost );
	Bounds.push_back( VariableDomain );
	VariableTypes.push_back( Type );

	return Costs.size() - 1;
}

Dimension Problem::AddConstraint( const std::string & Name,
                                  const Terms & Coefficients,
                                  Relation Comparison,
                                  VariableType RightHandSide )
{
	if ( !std::isfinite( RightHandSide ) )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "Constraint " << Name
		             << " must have a finite right hand side";

		throw std::invalid_argument( ErrorMessage.str() );
	}

	for ( const Term & LinearTerm : Coefficients )
		if ( LinearTerm.first >= Costs.size() ||
		     !std::isfinite( LinearTerm.second ) )
		{
			std::ostringstream ErrorMessage;

			ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
			             << "Constraint " << Name << " has an invalid term for "
			             << "variable " << LinearTerm.first << " of "
			             << Costs.size() << " defined variables";

			throw std::invalid_argument( ErrorMessage.str() );
		}

	ConstraintSet.emplace_back( Name, Coefficients, Comparison, RightHandSide );

	return ConstraintSet.size() - 1;
}

std::vector< Dimension > Problem::IntegerVariables( void ) const
{
	std::vector< Dimension > Indices;

	for ( Dimension i = 0; i < VariableTypes.size(); ++i )
		if ( VariableTypes[i] == Domain::Integer )
			Indices.push_back( i );

	return Indices;
}

// -----------------------------------------------------------------------------
// Evaluation
// -----------------------------------------------------------------------------

VariableType Problem::ObjectiveFunction( const Variables & VariableValues ) const
{
	if ( VariableValues.size() != Costs.size() )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "The problem has " << Costs.size() << " variables but "
		             << VariableValues.size() << " values were given";

		throw std::invalid_argument( ErrorMessage.str() );
	}

	VariableType Value = ObjectiveConstant;

	for ( Dimension i = 0; i < Costs.size(); ++i )
		Value += Costs[i] * VariableValues[i];

	return Value;
}

VariableType Problem::MaxViolation( const Variables & VariableValues ) const
{
	VariableType Violation = 0.0;

	// The objective function checks the size of the assignment and it is used
	// here only for that check.

	ObjectiveFunction( VariableValues );

	for ( Dimension i = 0; i < Costs.size(); ++i )
	{
		Violation = std::max( { Violation,
		                        Bounds[i].lower() - VariableValues[i],
		                        VariableValues[i] - Bounds[i].upper() } );

		if ( VariableTypes[i] == Domain::Integer )
			Violation = std::max( Violation, std::abs( VariableValues[i]
			                      - std::round( VariableValues[i] ) ) );
	}

	for ( const LinearConstraint & Constraint : ConstraintSet )
		Violation = std::max( Violation, Constraint.Violation( VariableValues ) );

	return Violation;
}

}      // End name space Optimization::Linear
