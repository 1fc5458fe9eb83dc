/*==============================================================================
Variables

A variable in an optimization problem is generally defined over a domain that
can be numeric or non-numeric, and continuous or discrete. The linear
optimisation problems solved in this library are all numerical, and the
variables are real values with double precision. Variables that must take
integral values are still represented as reals, but they are flagged as
integer variables in the problem definition and the solver will make sure
that they end up on integral values.

Every variable has a domain given as an interval [lower, upper]. The lower
bound must be finite, whereas the upper bound may be infinite. The bounds are
represented as Boost intervals since the domains are fundamentally intervals
and the interval class ensures that the lower bound never exceeds the upper
bound.

License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_VARIABLES
#define OPTIMIZATION_VARIABLES

#include <vector>                         // For variable values
#include <limits>                         // For infinite bounds
#include <boost/numeric/interval.hpp>     // For variable domains

namespace Optimization
{
using VariableType   = double;
using Variables      = std::vector< VariableType >;
using Dimension      = typename Variables::size_type;

// The domain of a variable is an interval, and the infinite value is defined
// for convenience when a variable has no upper bound.

using Interval       = boost::numeric::interval< VariableType >;
using Domains        = std::vector< Interval >;

constexpr VariableType Infinity = std::numeric_limits< VariableType >::infinity();

// A variable is either continuous or restricted to the integers. A binary
// variable is an integer variable with domain [0,1].

enum class Domain
{
	Continuous,
	Integer
};

}      // End name space Optimization
#endif // OPTIMIZATION_VARIABLES
