/*==============================================================================
Linear optimization

Mixed integer linear problems are defined by the problem class and solved by
the solver class, which hands the problem to the COIN-OR branch and cut
solver. A problem without integer variables is solved as a continuous linear
program by the same solver.

The headers are included here, so one may include only this file and get all
the classes for linear optimisation.

License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_LINEAR
#define OPTIMIZATION_LINEAR

#include "Variables.hpp"
#include "Constraints.hpp"

#include "Linear/Status.hpp"
#include "Linear/Problem.hpp"
#include "Linear/Solver.hpp"

#endif // OPTIMIZATION_LINEAR
