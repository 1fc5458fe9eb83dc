/*=============================================================================
  Interpolation

  This file is the implementation of the methods of the Interpolation class
  that are not templated.

  License: LGPL 3.0
=============================================================================*/

#include <sstream>                  // Error messages
#include <stdexcept>                // Standard exceptions

#include <gsl/gsl_errno.h>          // Error codes

#include "Interpolation.hpp"

namespace SolarPlanner
{

// The GSL interpolation type for each of the supported types

static const gsl_interp_type * GSLType( Interpolation::Type Method )
{
  switch ( Method )
  {
    case Interpolation::Type::Linear:
      return gsl_interp_linear;
    case Interpolation::Type::CubicSpline:
      return gsl_interp_cspline;
    case Interpolation::Type::AkimaSpline:
      return gsl_interp_akima;
    default:
      return gsl_interp_steffen;
  }
}

unsigned int Interpolation::MinimumPoints( Type InterpolationMethod )
{
  return gsl_interp_type_min_size( GSLType( InterpolationMethod ) );
}

// The coefficients are computed once by the GSL when the object is
// initialised, and the accelerator caches the last interval found.

void Interpolation::ComputeCoefficients( void )
{
  if ( Abscissa.size() < MinimumPoints( InterpolationType ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Not enough points for the interpolation type "
                 << GSLType( InterpolationType )->name << ": "
                 << Abscissa.size() << " given and "
                 << MinimumPoints( InterpolationType ) << " required";

    throw std::length_error( ErrorMessage.str() );
  }

  AcceleratorObject   = gsl_interp_accel_alloc();
  InterpolationObject = gsl_interp_alloc( GSLType( InterpolationType ),
                                          Abscissa.size() );

  if ( AcceleratorObject == nullptr || InterpolationObject == nullptr )
  {
    if ( InterpolationObject != nullptr )
      gsl_interp_free( InterpolationObject );

    if ( AcceleratorObject != nullptr )
      gsl_interp_accel_free( AcceleratorObject );

    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Failed to allocate the GSL interpolation object";

    throw std::runtime_error( ErrorMessage.str() );
  }

  gsl_interp_init( InterpolationObject, Abscissa.data(), Ordinate.data(),
                   Abscissa.size() );
}

double Interpolation::operator() ( double x ) const
{
  double Value;

  int Status = gsl_interp_eval_e( InterpolationObject, Abscissa.data(),
                                  Ordinate.data(), x, AcceleratorObject,
                                  &Value );

  if ( Status != GSL_SUCCESS )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Interpolation: Requested argument " << x
                 << " is outside the interpolation range ["
                 << DomainLower() << "," << DomainUpper() << "]";

    throw std::range_error( ErrorMessage.str() );
  }

  return Value;
}

// The GSL integration calls the error handler for limits outside the domain,
// and the limits are therefore checked before the integral is computed.

double Interpolation::Integral( double From, double To ) const
{
  if ( !( From <= To ) || !DomainQ( From ) || !DomainQ( To ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Interpolation: The integration interval [" << From
                 << "," << To << "] is not within the interpolation range ["
                 << DomainLower() << "," << DomainUpper() << "]";

    throw std::range_error( ErrorMessage.str() );
  }

  double Value;

  int Status = gsl_interp_eval_integ_e( InterpolationObject, Abscissa.data(),
                                        Ordinate.data(), From, To,
                                        AcceleratorObject, &Value );

  if ( Status != GSL_SUCCESS )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << gsl_strerror( Status );

    throw std::runtime_error( ErrorMessage.str() );
  }

  return Value;
}

Interpolation::~Interpolation( void )
{
  if ( InterpolationObject != nullptr )
    gsl_interp_free( InterpolationObject );

  if ( AcceleratorObject != nullptr )
    gsl_interp_accel_free( AcceleratorObject );
}

}      // End name space SolarPlanner
