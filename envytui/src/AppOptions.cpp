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

#include "AppOptions.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <utility>

namespace envy
{

namespace
{
ParseResult failed( std::string message )
{
  ParseResult result;
  result.status = ParseStatus::Error;
  result.error = std::move( message );
  return result;
}

// Strictly positive whole number of seconds
bool parseSeconds( const std::string &text, long &seconds )
{
  if ( text.empty() )
    return false;

  errno = 0;
  char *end = nullptr;
  const long value = std::strtol( text.c_str(), &end, 10 );
  if ( errno != 0 or end == nullptr or *end != '\0' or value <= 0 or value > INT_MAX / 1000 )
    return false;

  seconds = value;
  return true;
}
} // namespace

ParseResult parseArguments( const std::vector< std::string > &arguments )
{
  ParseResult result;

  for ( size_t i = 0; i < arguments.size(); ++i )
  {
    const auto &arg = arguments[ i ];
    const bool hasValue = i + 1 < arguments.size();

    if ( arg == "--help" or arg == "-h" )
    {
      result.status = ParseStatus::ShowHelp;
      return result;
    }
    else if ( arg == "--version" or arg == "-v" )
    {
      result.status = ParseStatus::ShowVersion;
      return result;
    }
    else if ( arg == "--debug" )
    {
      result.options.debug = true;
    }
    else if ( arg == "--tool" )
    {
      if ( not hasValue or arguments[ i + 1 ].empty() )
        return failed( "--tool requires a path" );
      result.options.client.toolPath = arguments[ ++i ];
    }
    else if ( arg == "--escalation" )
    {
      if ( not hasValue or arguments[ i + 1 ].empty() )
        return failed( "--escalation requires a command" );
      result.options.client.escalationCommand = arguments[ ++i ];
    }
    else if ( arg == "--no-escalation" )
    {
      result.options.client.escalationCommand.clear();
    }
    else if ( arg == "--timeout" )
    {
      long seconds = 0;
      if ( not hasValue or not parseSeconds( arguments[ i + 1 ], seconds ) )
        return failed( "--timeout requires a positive number of seconds" );
      result.options.timeout = std::chrono::seconds( seconds );
      ++i;
    }
    else if ( arg == "--quiet" )
    {
      result.options.client.verbose = false;
    }
    else if ( arg == "--no-color" )
    {
      result.options.color = false;
    }
    else
    {
      return failed( "unknown option: " + arg );
    }
  }

  return result;
}

void printUsage( std::ostream &out, std::string_view programName )
{
  out << "Usage: " << programName << " [OPTIONS]\n"
      << "Terminal dashboard for switching GPU modes with envycontrol.\n"
      << "Options:\n"
      << "  -h, --help              Show this help message\n"
      << "  -v, --version           Show version information\n"
      << "  --debug                 Log debug messages to syslog\n"
      << "  --tool PATH             envycontrol executable (default: envycontrol)\n"
      << "  --escalation CMD        Privilege escalation command (default: pkexec)\n"
      << "  --no-escalation         Run envycontrol without privilege escalation\n"
      << "  --timeout SECONDS       Kill envycontrol if it runs longer than this\n"
      << "  --quiet                 Do not pass --verbose to envycontrol\n"
      << "  --no-color              Disable colors\n"
      << "Keys:\n"
      << "  Up/Down, j/k   navigate       Tab    switch panel\n"
      << "  Left/Right     adjust value   Space  toggle option\n"
      << "  Enter          apply          r      reset\n"
      << "  q, Esc         quit\n";
}

void printVersion( std::ostream &out )
{
  out << APP_NAME << " version " << APP_VERSION << "\n"
      << "Terminal front end for envycontrol\n";
}

} // namespace envy
