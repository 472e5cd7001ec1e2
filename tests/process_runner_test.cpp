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
#include "ProcessRunner.hpp"

#include <QCoreApplication>

#include <cassert>
#include <chrono>
#include <iostream>
#include <utility>

using namespace envy;
using namespace std::chrono_literals;

static ProcessRequest shell( const std::string &script, std::string input = {} )
{
  return ProcessRequest{ "/bin/sh", { "-c", script }, std::move( input ) };
}

static void test_exit_codes_and_output()
{
  QtProcessRunner runner;

  const ProcessOutcome ok = runner.run( shell( "echo hello" ) );
  assert( ok.started );
  assert( ok.succeeded() );
  assert( ok.standardOutput == "hello\n" );

  const ProcessOutcome failed = runner.run( shell( "echo 'permission denied' >&2; exit 3" ) );
  assert( failed.started );
  assert( not failed.succeeded() );
  assert( failed.exitCode == 3 );
  assert( failed.standardError == "permission denied\n" );
}

static void test_standard_input_is_delivered()
{
  QtProcessRunner runner;
  const ProcessOutcome outcome = runner.run( shell( "read answer; echo \"got $answer\"", "y\ny\n" ) );
  assert( outcome.succeeded() );
  assert( outcome.standardOutput == "got y\n" );
}

static void test_missing_program()
{
  QtProcessRunner runner;
  const ProcessOutcome outcome = runner.run( ProcessRequest{ "/nonexistent/envycontrol", { "--query" }, {} } );
  assert( not outcome.started );
  assert( not outcome.succeeded() );
  assert( not outcome.errorString.empty() );

  const std::string message = EnvyControlClient::failureMessage( outcome, "/nonexistent/envycontrol" );
  assert( message.rfind( "failed to start /nonexistent/envycontrol", 0 ) == 0 );
}

static void test_timeout_kills_the_child()
{
  QtProcessRunner runner( 200ms );
  assert( runner.timeout() == 200ms );

  const auto begin = std::chrono::steady_clock::now();
  const ProcessOutcome outcome = runner.run( shell( "sleep 10" ) );
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  assert( outcome.started );
  assert( outcome.timedOut );
  assert( not outcome.succeeded() );
  assert( outcome.errorString == "timed out after 200 ms" );
  assert( elapsed < 5s );
}

static void test_find_executable()
{
  QtProcessRunner runner;
  assert( runner.findExecutable( "sh" ).has_value() );
  assert( not runner.findExecutable( "envytui-no-such-tool" ).has_value() );
}

static void test_client_against_shell()
{
  QtProcessRunner runner;
  ClientOptions options;
  options.toolPath = "/bin/false";
  options.escalationCommand.clear();
  EnvyControlClient client( runner, options );

  const ApplyResult result = client.reset();
  assert( not result.ok() );
  assert( result.action == GpuAction::Reset );
  assert( result.message == "/bin/false exited with code 1" );
}

int main( int argc, char *argv[] )
{
  QCoreApplication app( argc, argv );

  test_exit_codes_and_output();
  test_standard_input_is_delivered();
  test_missing_program();
  test_timeout_kills_the_child();
  test_find_executable();
  test_client_against_shell();

  std::cout << "process_runner_test passed\n";
  return 0;
}
