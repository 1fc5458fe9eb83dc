/*==============================================================================
Status

The linear solver reports the outcome of a search either by returning a
solution or by throwing one of the exceptions defined in this file. There is
no partial solution: If the search is stopped before an optimal solution has
been found, the caller will receive an exception telling why the search was
stopped, and it is up to the caller to decide what to do next.

The search is bounded by the limits defined here. The deadline is an absolute
point in time after which the search will stop; the node limit counts the
sub-problems explored by the branch and bound search; and the stop flag
can be set from another thread to cancel a running search. The flag is shared
so that the party requesting the stop does not need to know the lifetime of
the solver.

License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR_STATUS
#define OPTIMIZATION_LINEAR_STATUS

#include <atomic>                             // The stop flag
#include <chrono>                             // The deadline
#include <memory>                             // Shared stop flag
#include <limits>                             // Unlimited nodes
#include <string>                             // Error messages
#include <stdexcept>                          // Standard exceptions

namespace Optimization::Linear
{
/*==============================================================================

 Exceptions

==============================================================================*/
//
// There are several runtime errors, and it is therefore necessary to define
// derived classes to indicate which error that raised the exception. They are
// all derived from the standard runtime error, and one should be able to catch
// them as a group if needed.
//
// The first is thrown if there is no variable assignment satisfying all the
// constraints and bounds.

class Infeasible : public std::runtime_error
{
public:

	Infeasible( const std::string & ErrorMessage )
	: std::runtime_error( ErrorMessage )
	{}

	Infeasible( void ) = delete;
};

// The objective can be improved without limit along a feasible direction

class Unbounded : public std::runtime_error
{
public:

	Unbounded( const std::string & ErrorMessage )
	: std::runtime_error( ErrorMessage )
	{}

	Unbounded( void ) = delete;
};

// The deadline passed before the search completed.

class TimeLimitReached : public std::runtime_error
{
public:

	TimeLimitReached( const std::string & ErrorMessage )
	: std::runtime_error( ErrorMessage )
	{}

	TimeLimitReached( void ) = delete;
};

// The stop flag was set. In this case the user should know the reason for
// stopping the search.

class ForcedStop : public std::runtime_error
{
public:

	ForcedStop( const std::string & ErrorMessage )
	: std::runtime_error( ErrorMessage )
	{}

	ForcedStop( void ) = delete;
};

// The allowed number of nodes was used up

class NodeLimitReached : public std::runtime_error
{
public:

	NodeLimitReached( const std::string & ErrorMessage )
	: std::runtime_error( ErrorMessage )
	{}

	NodeLimitReached( void ) = delete;
};

// The solver ended for a reason not covered by the other exceptions, for
// instance numerical difficulties.

class SolverFailure : public std::runtime_error
{
public:

	SolverFailure( const std::string & ErrorMessage )
	: std::runtime_error( ErrorMessage )
	{}

	SolverFailure( void ) = delete;
};

/*==============================================================================

 Limits

==============================================================================*/

class Limits
{
public:

	using Clock     = std::chrono::steady_clock;
	using TimePoint = Clock::time_point;
	using StopFlag  = std::shared_ptr< std::atomic< bool > >;

	TimePoint     Deadline;
	unsigned long MaxNodes;
	StopFlag      Stop;

	// A time budget is converted to a deadline counted from now. A budget of
	// zero means that the deadline has already passed when the search starts.

	template< class Duration >
	static TimePoint DeadlineAfter( const Duration & Budget )
	{
		return Clock::now()
		       + std::chrono::duration_cast< Clock::duration >( Budget );
	}

	// The check throws if the search should not continue. The stop flag has
	// priority since a cancellation is an explicit request.

	void Check( unsigned long NodesDone ) const;

	Limits( void )
	: Deadline( TimePoint::max() ),
	  MaxNodes( std::numeric_limits< unsigned long >::max() ),
	  Stop( std::make_shared< std::atomic< bool > >( false ) )
	{}

	template< class Duration >
	Limits( const Duration & TimeBudget,
	        unsigned long NodeBudget
	          = std::numeric_limits< unsigned long >::max() )
	: Deadline( DeadlineAfter( TimeBudget ) ), MaxNodes( NodeBudget ),
	  Stop( std::make_shared< std::atomic< bool > >( false ) )
	{}

	Limits( const Limits & Other ) = default;
};

}      // End name space Optimization::Linear
#endif // OPTIMIZATION_LINEAR_STATUS
