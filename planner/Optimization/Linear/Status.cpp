/*==============================================================================
Status

The limit check is the only function of the status definitions that is not
trivial, and it is implemented here to avoid including the formatting
machinery in every file using the limits.

License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Formatted error messages

#include "Linear/Status.hpp"

void Optimization::Linear::Limits::Check( unsigned long NodesDone ) const
{
	if ( Stop && Stop->load() )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "The search was stopped on request after "
		             << NodesDone << " nodes";

		throw ForcedStop( ErrorMessage.str() );
	}

	if ( Clock::now() >= Deadline )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "The time limit was reached after "
		             << NodesDone << " nodes";

		throw TimeLimitReached( ErrorMessage.str() );
	}

	if ( NodesDone >= MaxNodes )
	{
		std::ostringstream ErrorMessage;

		ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
		             << "The node limit of " << MaxNodes
		             << " was reached";

		throw NodeLimitReached( ErrorMessage.str() );
	}
}
