/*=============================================================================
  Time Interval

  The planning horizon is divided into slots of fixed duration, and every slot
  is an interval of absolute time. Interval arithmetic is a non-trivial
  subject. Fortunately, Boost has a good solution also for this, and therefore
  the interval defined here is simply a specialisation of the standard Boost
  interval. The time resolution is limited to seconds, and absolute time is
  measured in seconds since first January 1970 (POSIX time).

  A slot lasts half an hour, and since the powers are given in kW and the
  energies in kWh, the slot duration in hours is the factor converting a
  constant power over a slot to the energy of the slot.

  License: LGPL 3.0
=============================================================================*/

#ifndef SOLAR_PLANNER_TIME_INTERVAL
#define SOLAR_PLANNER_TIME_INTERVAL

#include <string>
#include <chrono>
#include <iostream>
#include <boost/numeric/interval.hpp>

// Time is defined as time_t in C which is not a unique and portable
// representation. The definition is therefore derived from the representation
// of the standard chrono library to make sure it matches the representation
// of seconds on the current platform.

namespace SolarPlanner
{
  using Time = std::chrono::seconds::rep;

  // Then the time interval can be defined as a simple application of the Boost
  // interval.

  using TimeInterval = boost::numeric::interval< Time >;

  // The slot duration in seconds and in hours

  constexpr Time   SlotDuration = 1800;
  constexpr double SlotHours    = 0.5;

  // The interval of a slot given the start of the horizon and the slot index

  inline TimeInterval Slot( Time HorizonStart, std::size_t Index )
  {
    Time Start = HorizonStart + static_cast< Time >( Index ) * SlotDuration;
    return TimeInterval( Start, Start + SlotDuration );
  }
}

// The boundaries are converted to strings before being streamed since the
// interval bounds cannot be streamed directly.

inline std::ostream & operator << ( std::ostream & OutStream,
                                    const SolarPlanner::TimeInterval & T )
{
  OutStream << "[" << std::to_string( T.lower() ) << ","
            << std::to_string( T.upper() ) << ")";

  return OutStream;
}

#endif // SOLAR_PLANNER_TIME_INTERVAL
