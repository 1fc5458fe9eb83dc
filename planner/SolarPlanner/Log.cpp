/*==============================================================================
Log

Implementation of the message output and the threshold management.

License: LGPL 3.0
==============================================================================*/

#include <atomic>                             // Global threshold
#include <mutex>                              // Serialising the output
#include <ctime>                              // Wall clock time
#include <iomanip>                            // Time formatting
#include <iostream>                           // The log stream
#include <map>                                // Level names
#include <sstream>                            // Error messages

#include "Log.hpp"
#include "Errors.hpp"

namespace SolarPlanner::Log
{

static std::atomic< Level > GlobalThreshold( Level::Information );
static std::mutex           OutputLock;

void SetThreshold( Level NewThreshold )
{
  GlobalThreshold.store( NewThreshold );
}

Level Threshold( void )
{
  return GlobalThreshold.load();
}

Level ToLevel( const std::string & Name )
{
  static const std::map< std::string, Level > Levels = {
    { "debug",       Level::Debug       },
    { "information", Level::Information },
    { "warning",     Level::Warning     },
    { "error",       Level::Error       },
    { "silent",      Level::Silent      }
  };

  auto TheLevel = Levels.find( Name );

  if ( TheLevel == Levels.end() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Unknown log level \"" << Name << "\". Use one of debug, "
                 << "information, warning, error or silent";

    throw InputError( ErrorMessage.str() );
  }

  return TheLevel->second;
}

// The message is only written if its level is at least the threshold. The
// Silent level is never written even if the threshold is Silent.

Message::~Message( void )
{
  if ( Severity == Level::Silent || Severity < GlobalThreshold.load() )
    return;

  std::time_t Now = std::time( nullptr );
  std::tm     LocalTime{};

  localtime_r( &Now, &LocalTime );

  std::lock_guard< std::mutex > Lock( OutputLock );

  std::clog << "[" << std::put_time( &LocalTime, "%H:%M:%S" ) << "] ["
            << Component << "] " << str() << std::endl;
}

}      // End name space SolarPlanner::Log
