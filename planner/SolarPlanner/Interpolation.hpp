/*=============================================================================
  Interpolation

  This class is a functor interpolating a univariate function given by a set
  of samples. It is fundamentally only an interface to the algorithms of the
  GNU Scientific Library [1], which is packaged with most Linux distributions
  and well tested after years of use.

  ALGORITHM:

  Interpolation can be done in a multitude of ways, from the very simple
  zero-order (flat sample and hold), via linear interpolation fitting a
  straight line between any two neighbouring points, to splines fitting cubic
  polynomials to each pair of points. Splines can oscillate near outliers,
  which is not acceptable for quantities that cannot become negative like the
  solar production and the household load. The default method is therefore
  Steffen's method [2], which guarantees that the interpolating function is
  monotonic between the data points, so that it never overshoots the samples.

  The main use of the interpolation in the planner is to compute the average
  power over a slot from power samples taken at irregular times, which is the
  integral of the interpolated function over the slot divided by the slot
  duration.

  REFERENCES:

  [1] https://www.gnu.org/software/gsl/doc/html/interp.html
  [2] M. Steffen: A Simple Method for Monotonic Interpolation in One
      Dimension, Astronomy and Astrophysics, Vol. 239, pp. 443-450, 1990

  License: LGPL 3.0
=============================================================================*/

#ifndef SOLAR_PLANNER_INTERPOLATION
#define SOLAR_PLANNER_INTERPOLATION

#include <map>                      // The data points
#include <vector>                   // Abscissa and ordinate
#include <type_traits>              // Checking numeric types

#include <gsl/gsl_interp.h>         // The GSL interpolation functions

namespace SolarPlanner
{

class Interpolation
{
public:

  enum class Type
  {
    Linear,
    CubicSpline,
    AkimaSpline,
    SteffenMethod
  };

private:

  Type                 InterpolationType;
  std::vector<double>  Abscissa, Ordinate;
  gsl_interp         * InterpolationObject;
  gsl_interp_accel   * AcceleratorObject;

  void ComputeCoefficients( void );

public:

  // The interpolated value at a point, and the integral over an interval.
  // Both will throw a range error if the argument is outside of the domain
  // of the sampled function.

  double operator() ( double x ) const;
  double Integral   ( double From, double To ) const;

  // The domain is the closed interval from the first to the last abscissa

  inline double DomainLower( void ) const
  { return Abscissa.front(); }

  inline double DomainUpper( void ) const
  { return Abscissa.back(); }

  inline bool DomainQ( double x ) const
  { return ( DomainLower() <= x ) && ( x <= DomainUpper() ); }

  // The minimal number of data points for an interpolation type

  static unsigned int MinimumPoints( Type InterpolationMethod );

  // The constructor takes the data points as a map to ensure that the
  // abscissa values are sorted and unique, which is required by the GSL.

  template< typename Key, typename Value >
  Interpolation( const std::map< Key, Value > & DataPoints,
                 Type DesiredInterpolationType = Type::SteffenMethod )
  : InterpolationType( DesiredInterpolationType ), Abscissa(), Ordinate(),
    InterpolationObject( nullptr ), AcceleratorObject( nullptr )
  {
    static_assert( std::is_arithmetic< Key >::value &&
                   std::is_arithmetic< Value >::value,
                   "Only numeric types supported for interpolation" );

    for ( const auto & DataPoint : DataPoints )
    {
      Abscissa.push_back( static_cast< double >( DataPoint.first  ) );
      Ordinate.push_back( static_cast< double >( DataPoint.second ) );
    }

    ComputeCoefficients();
  }

  Interpolation( const Interpolation & Other ) = delete;
  Interpolation & operator = ( const Interpolation & Other ) = delete;

  ~Interpolation( void );
};

}      // End name space SolarPlanner
#endif // SOLAR_PLANNER_INTERPOLATION
