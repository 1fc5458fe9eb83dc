/*==============================================================================
Log

Log messages are written by creating a message object and streaming the
content to it. The message is written to the standard log stream when the
object is destroyed, i.e. when it goes out of scope, and the full message is
written at once under a lock so that messages from different threads are not
interleaved. Typical use:

  {
    Log::Message Note( Log::Level::Information, "RuleBasedPlanner" );
    Note << "Planned " << Slots << " slots";
  }

Each message is prefixed with the wall clock time and the component writing
it as "[HH:MM:SS] [Component] ". A message below the global threshold is
formatted but not written.

License: LGPL 3.0
==============================================================================*/

#ifndef SOLAR_PLANNER_LOG
#define SOLAR_PLANNER_LOG

#include <string>                             // Component names
#include <sstream>                            // The message stream

namespace SolarPlanner::Log
{

enum class Level
{
  Debug,
  Information,
  Warning,
  Error,
  Silent
};

// The global threshold for messages to be written. Only messages at or above
// this level will be written, and setting the threshold to Silent suppresses
// all messages.

void  SetThreshold( Level NewThreshold );
Level Threshold( void );

// The level names are used to parse the level from the command line

Level ToLevel( const std::string & Name );

class Message : public std::ostringstream
{
private:

  const Level       Severity;
  const std::string Component;

public:

  Message( Level MessageLevel, const std::string & Source )
  : std::ostringstream(), Severity( MessageLevel ), Component( Source )
  {}

  Message( void ) = delete;
  Message( const Message & Other ) = delete;

  virtual ~Message( void );
};

}      // End name space SolarPlanner::Log
#endif // SOLAR_PLANNER_LOG
