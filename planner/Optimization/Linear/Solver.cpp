/*==============================================================================
Solver

The translation of the problem definition to the CBC model and of the CBC
status to solutions and exceptions.

License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // Rounding and finite values
#include <chrono>                             // Remaining search time
#include <limits>                             // Node limit range
#include <map>                                // Merging terms
#include <vector>                             // Bounds and costs
#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions

#include <boost/numeric/conversion/cast.hpp> // Casting indices to int

#include <CoinPackedMatrix.hpp>               // Constraint rows
#include <CoinPackedVector.hpp>               // One constraint row
#include <OsiClpSolverInterface.hpp>          // The relaxation solver
#include <CbcModel.hpp>                       // The branch and cut search
#include <CbcEventHandler.hpp>                // Polling the stop flag

#include "Linear/Solver.hpp"

namespace Optimization::Linear
{

// The event handler asks CBC to stop when the stop flag is set. The model
// keeps its own clone of the handler, and the clone shares the flag.

class StopHandler : public CbcEventHandler
{
private:

	Limits::StopFlag Flag;

public:

	virtual CbcAction event( CbcEvent ) override
	{
		if ( Flag && Flag->load() )
			return stop;
		else
			return noAction;
	}

	virtual CbcEventHandler * clone( void ) const override
	{ return new StopHandler( *this ); }

	StopHandler( const Limits::StopFlag & TheFlag )
	: CbcEventHandler(), Flag( TheFlag )
	{}

	StopHandler( const StopHandler & Other ) = default;

	virtual ~StopHandler( void )
	{}
};

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------

Solver::Solver( const Problem & TheProblem, const Limits & TheLimits,
                VariableType AbsoluteGap )
: LP( TheProblem ), SearchLimits( TheLimits ), OptimalityGap( AbsoluteGap )
{
	if ( !( OptimalityGap >= 0.0 ) )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "The optimality gap must be non-negative, it was "
		             << AbsoluteGap;

		throw std::invalid_argument( ErrorMessage.str() );
	}
}

// -----------------------------------------------------------------------------
// Search
// -----------------------------------------------------------------------------

Solution Solver::Solve( void ) const
{
	SearchLimits.Check( 0 );

	const Dimension NumberOfVariables = LP.NumberOfVariables();

	// CBC always minimises, and the costs of a maximisation are negated

	const VariableType Sense
	      = ( LP.GetGoal() == Problem::Goal::Minimize ? 1.0 : -1.0 );

	OsiClpSolverInterface Relaxation;
	const double          Unlimited = Relaxation.getInfinity();

	std::vector< double > ColumnLower, ColumnUpper, Costs, RowLower, RowUpper;

	for ( Dimension i = 0; i < NumberOfVariables; ++i )
	{
		const Interval & Bounds = LP.VariableDomains()[i];

		ColumnLower.push_back( Bounds.lower() );
		ColumnUpper.push_back( std::isfinite( Bounds.upper() ) ?
		                       Bounds.upper() : Unlimited );
		Costs.push_back( Sense * LP.CostVector()[i] );
	}

	// CBC rejects a row with the same column twice, and repeated terms of a
	// constraint are therefore summed first.

	CoinPackedMatrix Rows( false, 0.0, 0.0 );
	Rows.setDimensions( 0, boost::numeric_cast< int >( NumberOfVariables ) );

	for ( const LinearConstraint & Constraint : LP.Constraints() )
	{
		std::map< Dimension, VariableType > Merged;

		for ( const Term & LinearTerm : Constraint.LeftHandSide )
			Merged[ LinearTerm.first ] += LinearTerm.second;

		CoinPackedVector Row;

		for ( const auto & Coefficient : Merged )
			Row.insert( boost::numeric_cast< int >( Coefficient.first ),
			            Coefficient.second );

		Rows.appendRow( Row );

		switch ( Constraint.Type )
		{
			case Relation::LessEqual:
				RowLower.push_back( -Unlimited );
				RowUpper.push_back( Constraint.RightHandSide );
				break;
			case Relation::GreaterEqual:
				RowLower.push_back( Constraint.RightHandSide );
				RowUpper.push_back( Unlimited );
				break;
			default:
				RowLower.push_back( Constraint.RightHandSide );
				RowUpper.push_back( Constraint.RightHandSide );
				break;
		}
	}

	Relaxation.loadProblem( Rows, ColumnLower.data(), ColumnUpper.data(),
	                        Costs.data(), RowLower.data(), RowUpper.data() );

	for ( Dimension Index : LP.IntegerVariables() )
		Relaxation.setInteger( boost::numeric_cast< int >( Index ) );

	Relaxation.setObjSense( 1.0 );
	Relaxation.messageHandler()->setLogLevel( 0 );

	// The model takes a copy of the relaxation solver

	CbcModel Search( Relaxation );

	Search.setLogLevel( 0 );
	Search.setAllowableGap( OptimalityGap );
	Search.setUseElapsedTime( true );

	if ( SearchLimits.Deadline != Limits::TimePoint::max() )
		Search.setMaximumSeconds( std::chrono::duration< double >(
		        SearchLimits.Deadline - Limits::Clock::now() ).count() );

	if ( SearchLimits.MaxNodes
	     < static_cast< unsigned long >( std::numeric_limits< int >::max() ) )
		Search.setMaximumNodes( boost::numeric_cast< int >( SearchLimits.MaxNodes ) );

	StopHandler Cancellation( SearchLimits.Stop );
	Search.passInEventHandler( &Cancellation );

	// The root relaxation tells if the problem has a solution at all

	Search.initialSolve();

	if ( Search.isInitialSolveProvenPrimalInfeasible() )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "The relaxation of the problem with "
		             << NumberOfVariables << " variables and "
		             << LP.NumberOfConstraints() << " constraints is infeasible";

		throw Infeasible( ErrorMessage.str() );
	}

	if ( Search.isInitialSolveProvenDualInfeasible() )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "The relaxation of the problem is unbounded";

		throw Unbounded( ErrorMessage.str() );
	}

	Search.branchAndBound();

	const unsigned long Nodes      = Search.getNodeCount(),
	                    Iterations = Search.getIterationCount();

	if ( !Search.isProvenOptimal() || Search.bestSolution() == nullptr )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": ";

		if ( SearchLimits.Stop && SearchLimits.Stop->load() )
		{
			ErrorMessage << "The search was stopped on request after " << Nodes
			             << " nodes";

			throw ForcedStop( ErrorMessage.str() );
		}
		else if ( Search.isProvenInfeasible() )
		{
			ErrorMessage << "No integer solution exists, proven after " << Nodes
			             << " nodes";

			throw Infeasible( ErrorMessage.str() );
		}
		else if ( Search.isContinuousUnbounded() )
		{
			ErrorMessage << "The relaxation of the problem is unbounded";

			throw Unbounded( ErrorMessage.str() );
		}
		else if ( Search.isSecondsLimitReached() )
		{
			ErrorMessage << "The time limit was reached after " << Nodes
			             << " nodes and " << Iterations << " iterations";

			throw TimeLimitReached( ErrorMessage.str() );
		}
		else if ( Search.isNodeLimitReached() )
		{
			ErrorMessage << "The node limit of " << SearchLimits.MaxNodes
			             << " was reached";

			throw NodeLimitReached( ErrorMessage.str() );
		}
		else
		{
			ErrorMessage << "CBC ended with status " << Search.status()
			             << " and secondary status " << Search.secondaryStatus()
			             << " without proving an optimal solution";

			throw SolverFailure( ErrorMessage.str() );
		}
	}

	Solution Optimum;
	const double * Values = Search.bestSolution();

	Optimum.Values.assign( Values, Values + NumberOfVariables );

	for ( Dimension Index : LP.IntegerVariables() )
		Optimum.Values[ Index ] = std::round( Optimum.Values[ Index ] );

	Optimum.ObjectiveValue = LP.ObjectiveFunction( Optimum.Values );
	Optimum.Iterations     = Iterations;
	Optimum.Nodes          = Nodes;

	return Optimum;
}

}      // End name space Optimization::Linear
