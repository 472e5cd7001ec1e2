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

#include "EnvyControlClient.hpp"
#include "CommandBuilder.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace envy
{

namespace
{
// envycontrol asks for confirmation in a few places; answer all of them
constexpr const char *AUTO_CONFIRM_INPUT = "y\ny\ny\ny\ny\ny\ny\ny\n";

std::string trimmed( const std::string &text )
{
  const auto isSpace = []( unsigned char c ) { return std::isspace( c ) != 0; };
  auto first = std::find_if_not( text.begin(), text.end(), isSpace );
  auto last = std::find_if_not( text.rbegin(), text.rend(), isSpace ).base();
  if ( first >= last )
    return {};
  return std::string( first, last );
}

std::string toLower( std::string text )
{
  std::transform( text.begin(), text.end(), text.begin(),
                  []( unsigned char c ) { return static_cast< char >( std::tolower( c ) ); } );
  return text;
}

const char *actionName( GpuAction action )
{
  switch ( action )
  {
    case GpuAction::Switch: return "switch";
    case GpuAction::Reset:  return "reset";
    case GpuAction::Reboot: return "reboot";
    case GpuAction::Query:  return "query";
  }
  return "command";
}
} // namespace

EnvyControlClient::EnvyControlClient( ProcessRunner &runner, ClientOptions options )
  : m_runner( runner )
  , m_options( std::move( options ) )
{
}

ApplyResult EnvyControlClient::switchMode( GpuMode mode, const OptionStates &options )
{
  return execute( GpuAction::Switch, CommandBuilder::buildSwitchArgs( mode, options ), mode );
}

ApplyResult EnvyControlClient::reset()
{
  return execute( GpuAction::Reset, CommandBuilder::buildResetArgs() );
}

ApplyResult EnvyControlClient::execute( GpuAction action, const std::vector< std::string > &args,
                                        std::optional< GpuMode > mode )
{
  std::vector< std::string > toolArgs = args;
  if ( m_options.verbose )
    toolArgs.emplace_back( "--verbose" );

  ProcessRequest request = makeRequest( toolArgs, true );
  request.standardInput = AUTO_CONFIRM_INPUT;

  syslog( LOG_INFO, "Running %s: %s %s", actionName( action ), request.program.c_str(),
          CommandBuilder::joinArgs( request.arguments ).c_str() );

  const ProcessOutcome outcome = m_runner.run( request );
  if ( outcome.succeeded() )
  {
    syslog( LOG_INFO, "envycontrol %s succeeded", actionName( action ) );
    return ApplyResult::success( action, mode );
  }

  std::string message = failureMessage( outcome, request.program );
  syslog( LOG_WARNING, "envycontrol %s failed: %s", actionName( action ), message.c_str() );
  return ApplyResult::failure( action, std::move( message ) );
}

QueryResult EnvyControlClient::queryMode()
{
  QueryResult result;

  const ProcessRequest request = makeRequest( CommandBuilder::buildQueryArgs(), false );
  const ProcessOutcome outcome = m_runner.run( request );

  if ( not outcome.succeeded() )
  {
    result.error = failureMessage( outcome, request.program );
    syslog( LOG_WARNING, "envycontrol --query failed: %s", result.error->c_str() );
    return result;
  }

  result.mode = parseQueryOutput( outcome.standardOutput );
  if ( result.mode )
    logDebug( "[DEBUG] envycontrol reports %s mode", std::string( modeToken( *result.mode ) ).c_str() );
  else
    logDebug( "[DEBUG] envycontrol --query output names no mode: %s", trimmed( outcome.standardOutput ).c_str() );
  return result;
}

bool EnvyControlClient::isInstalled() const
{
  return m_runner.findExecutable( m_options.toolPath ).has_value();
}

ApplyResult EnvyControlClient::requestReboot()
{
  syslog( LOG_INFO, "Requesting system reboot" );
  if ( m_runner.startDetached( "systemctl", { "reboot" } ) )
    return ApplyResult::success( GpuAction::Reboot );
  return ApplyResult::failure( GpuAction::Reboot, "could not start systemctl reboot" );
}

std::optional< GpuMode > EnvyControlClient::parseQueryOutput( const std::string &output )
{
  const std::string lower = toLower( output );

  // kAllModes order matters: "nvidia" also appears in hybrid mode messages
  for ( GpuMode mode : kAllModes )
  {
    if ( lower.find( modeToken( mode ) ) != std::string::npos )
      return mode;
  }
  return std::nullopt;
}

std::string EnvyControlClient::failureMessage( const ProcessOutcome &outcome, const std::string &program )
{
  if ( not outcome.started )
  {
    std::string message = "failed to start " + program;
    if ( not outcome.errorString.empty() )
      message += ": " + outcome.errorString;
    return message;
  }

  if ( outcome.timedOut )
    return program + " " + outcome.errorString;

  if ( std::string err = trimmed( outcome.standardError ); not err.empty() )
    return err;

  if ( std::string out = trimmed( outcome.standardOutput ); not out.empty() )
    return out;

  if ( outcome.crashed )
    return program + " terminated abnormally";

  return program + " exited with code " + std::to_string( outcome.exitCode );
}

ProcessRequest EnvyControlClient::makeRequest( const std::vector< std::string > &args, bool escalate ) const
{
  ProcessRequest request;
  if ( escalate and not m_options.escalationCommand.empty() )
  {
    request.program = m_options.escalationCommand;
    request.arguments.push_back( m_options.toolPath );
  }
  else
  {
    request.program = m_options.toolPath;
  }
  request.arguments.insert( request.arguments.end(), args.begin(), args.end() );
  return request;
}

} // namespace envy
