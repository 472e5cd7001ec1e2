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

#include "ProcessRunner.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace envy::test
{

/**
 * @brief ProcessRunner that records requests and replays a canned outcome
 */
class StubProcessRunner final : public ProcessRunner
{
public:
  ProcessOutcome run( const ProcessRequest &request ) override
  {
    requests.push_back( request );
    return outcome;
  }

  bool startDetached( const std::string &program, const std::vector< std::string > &arguments ) override
  {
    std::vector< std::string > command = { program };
    command.insert( command.end(), arguments.begin(), arguments.end() );
    detached.push_back( std::move( command ) );
    return detachedResult;
  }

  std::optional< std::string > findExecutable( const std::string &name ) const override
  {
    if ( installed.count( name ) == 0 )
      return std::nullopt;
    return "/usr/bin/" + name;
  }

  // Outcome for a command that exited normally
  static ProcessOutcome exited( int code, std::string out = {}, std::string err = {} )
  {
    ProcessOutcome result;
    result.started = true;
    result.exitCode = code;
    result.standardOutput = std::move( out );
    result.standardError = std::move( err );
    return result;
  }

  ProcessOutcome outcome = exited( 0 );
  bool detachedResult = true;
  std::set< std::string > installed;

  std::vector< ProcessRequest > requests;
  std::vector< std::vector< std::string > > detached;
};

} // namespace envy::test
