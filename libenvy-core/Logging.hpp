/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <atomic>
#include <cstdio>
#include <utility>
#include <syslog.h>

namespace envy
{
  // Debug flag: when true, logDebug() forwards to syslog at LOG_DEBUG.
  inline std::atomic_bool g_debugLogging{false};

  inline void setDebugLogging( bool enabled ) { g_debugLogging.store( enabled ); }

  [[nodiscard]] inline bool debugLogging() noexcept { return g_debugLogging.load(); }

  template<typename... Args>
  inline void logDebug( const char *fmt, Args&&... args )
  {
    if ( not debugLogging() )
      return;

    // format into a stack buffer (truncate if necessary)
    char buf[1024];
#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
#endif
    int n = std::snprintf( buf, sizeof( buf ), fmt, std::forward<Args>( args )... );
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
    if ( n >= 0 )
      syslog( LOG_DEBUG, "%s", buf );
  }

  /**
   * @brief Open the syslog connection for the process
   *
   * Nothing is written to the terminal: the UI owns stdout while running.
   */
  inline void initLogging( const char *ident, bool debug )
  {
    setDebugLogging( debug );
    openlog( ident, LOG_PID, LOG_USER );
    setlogmask( debug ? LOG_UPTO( LOG_DEBUG ) : LOG_UPTO( LOG_INFO ) );
  }

  inline void shutdownLogging()
  {
    closelog();
  }
}
