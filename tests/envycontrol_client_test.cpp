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
#include "StubProcessRunner.hpp"

#include <cassert>
#include <iostream>

using namespace envy;
using envy::test::StubProcessRunner;
using Args = std::vector< std::string >;

static void test_switch_is_escalated_and_verbose()
{
  StubProcessRunner runner;
  EnvyControlClient client( runner );

  OptionStates options;
  options.rtd3 = true;
  const ApplyResult result = client.switchMode( GpuMode::Hybrid, options );

  assert( result == ApplyResult::success( GpuAction::Switch, GpuMode::Hybrid ) );
  assert( runner.requests.size() == 1 );
  const ProcessRequest &request = runner.requests.front();
  assert( request.program == "pkexec" );
  assert( request.arguments == ( Args{ "envycontrol", "-s", "hybrid", "--rtd3", "2", "--verbose" } ) );
  assert( request.standardInput.rfind( "y\n", 0 ) == 0 );
}

static void test_direct_invocation()
{
  StubProcessRunner runner;
  ClientOptions options;
  options.toolPath = "/opt/envycontrol";
  options.escalationCommand.clear();
  options.verbose = false;
  EnvyControlClient client( runner, options );
  assert( not client.options().verbose );

  assert( client.reset().ok() );
  assert( runner.requests.front().program == "/opt/envycontrol" );
  assert( runner.requests.front().arguments == Args{ "--reset" } );
}

static void test_query_is_never_escalated()
{
  StubProcessRunner runner;
  runner.outcome = StubProcessRunner::exited( 0, "Current graphics mode is: hybrid\n" );
  EnvyControlClient client( runner );

  const QueryResult query = client.queryMode();
  assert( query.mode == GpuMode::Hybrid );
  assert( not query.error );
  assert( runner.requests.front().program == "envycontrol" );
  assert( runner.requests.front().arguments == Args{ "--query" } );
}

static void test_query_failure()
{
  StubProcessRunner runner;
  runner.outcome = StubProcessRunner::exited( 2, "", "unrecognized arguments\n" );
  EnvyControlClient client( runner );

  const QueryResult query = client.queryMode();
  assert( not query.mode );
  assert( query.error == std::string( "unrecognized arguments" ) );
}

static void test_parse_query_output()
{
  assert( EnvyControlClient::parseQueryOutput( "integrated" ) == GpuMode::Integrated );
  assert( EnvyControlClient::parseQueryOutput( "Current mode: NVIDIA\n" ) == GpuMode::Nvidia );
  assert( EnvyControlClient::parseQueryOutput( "hybrid mode with nvidia offload" ) == GpuMode::Hybrid );
  assert( not EnvyControlClient::parseQueryOutput( "" ) );
  assert( not EnvyControlClient::parseQueryOutput( "unknown" ) );
}

static void test_failure_messages()
{
  ProcessOutcome notStarted;
  notStarted.errorString = "No such file or directory";
  assert( EnvyControlClient::failureMessage( notStarted, "pkexec" ) == "failed to start pkexec: No such file or directory" );

  ProcessOutcome timedOut = StubProcessRunner::exited( -1 );
  timedOut.timedOut = true;
  timedOut.errorString = "timed out after 5000 ms";
  assert( EnvyControlClient::failureMessage( timedOut, "pkexec" ) == "pkexec timed out after 5000 ms" );

  assert( EnvyControlClient::failureMessage( StubProcessRunner::exited( 1, "out", "  permission denied \n" ), "pkexec" )
          == "permission denied" );
  assert( EnvyControlClient::failureMessage( StubProcessRunner::exited( 1, "Error: not root\n" ), "pkexec" )
          == "Error: not root" );
  assert( EnvyControlClient::failureMessage( StubProcessRunner::exited( 126 ), "pkexec" )
          == "pkexec exited with code 126" );

  ProcessOutcome crashed = StubProcessRunner::exited( -1 );
  crashed.crashed = true;
  assert( EnvyControlClient::failureMessage( crashed, "pkexec" ) == "pkexec terminated abnormally" );
}

static void test_switch_failure()
{
  StubProcessRunner runner;
  runner.outcome = StubProcessRunner::exited( 1, "", "permission denied" );
  EnvyControlClient client( runner );

  const ApplyResult result = client.switchMode( GpuMode::Nvidia, OptionStates{} );
  assert( result == ApplyResult::failure( GpuAction::Switch, "permission denied" ) );
  assert( not result.mode );
}

static void test_installed_and_reboot()
{
  StubProcessRunner runner;
  EnvyControlClient client( runner );
  assert( not client.isInstalled() );

  runner.installed.insert( "envycontrol" );
  assert( client.isInstalled() );

  assert( client.requestReboot() == ApplyResult::success( GpuAction::Reboot ) );
  assert( runner.detached.size() == 1 );
  assert( runner.detached.front() == ( Args{ "systemctl", "reboot" } ) );

  runner.detachedResult = false;
  const ApplyResult failed = client.requestReboot();
  assert( not failed.ok() );
  assert( failed.action == GpuAction::Reboot );
  assert( failed.message == "could not start systemctl reboot" );
}

int main()
{
  test_switch_is_escalated_and_verbose();
  test_direct_invocation();
  test_query_is_never_escalated();
  test_query_failure();
  test_parse_query_output();
  test_failure_messages();
  test_switch_failure();
  test_installed_and_reboot();

  std::cout << "envycontrol_client_test passed\n";
  return 0;
}
