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

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <clocale>
#include <cstring>
#include <cerrno>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>

#include <QCoreApplication>
#include <QSocketNotifier>

#include "AppOptions.hpp"
#include "EnvyControlClient.hpp"
#include "Logging.hpp"
#include "ProcessRunner.hpp"
#include "SelectionState.hpp"
#include "TerminalScreen.hpp"
#include "TuiController.hpp"

// Signal handlers write a byte into a pipe; the Qt event loop reads it and
// quits, so the terminal is restored by the normal destructors.
static int sig_pipe_fds[2] = { -1, -1 };

static void signal_fd_handler( int sig )
{
  char c = static_cast< char >( sig );
  if ( sig_pipe_fds[1] != -1 )
  {
    // write is async-signal-safe
    ssize_t r = write( sig_pipe_fds[1], &c, 1 );
    (void)r;
  }
}

static bool install_signal_pipe()
{
  if ( pipe( sig_pipe_fds ) == -1 )
  {
    syslog( LOG_ERR, "Failed to create signal pipe: %s", strerror( errno ) );
    return false;
  }

  fcntl( sig_pipe_fds[0], F_SETFD, FD_CLOEXEC );
  fcntl( sig_pipe_fds[1], F_SETFD, FD_CLOEXEC );
  fcntl( sig_pipe_fds[0], F_SETFL, O_NONBLOCK );

  struct sigaction sa;
  memset( &sa, 0, sizeof( sa ) );
  sa.sa_handler = signal_fd_handler;
  sigemptyset( &sa.sa_mask );
  sa.sa_flags = SA_RESTART;
  sigaction( SIGTERM, &sa, nullptr );
  sigaction( SIGINT, &sa, nullptr );
  sigaction( SIGHUP, &sa, nullptr );
  return true;
}

static int run_dashboard( int argc, char *argv[], const envy::AppOptions &options )
{
  QCoreApplication app( argc, argv );

  std::unique_ptr< QSocketNotifier > signalNotifier;
  if ( install_signal_pipe() )
  {
    signalNotifier = std::make_unique< QSocketNotifier >( sig_pipe_fds[0], QSocketNotifier::Read );
    QObject::connect( signalNotifier.get(), &QSocketNotifier::activated, [&app]() {
      char buf[64];
      while ( ::read( sig_pipe_fds[0], buf, sizeof( buf ) ) > 0 ) { }
      syslog( LOG_INFO, "Signal received, shutting down" );
      app.quit();
    } );
  }

  envy::QtProcessRunner runner( options.timeout );
  envy::EnvyControlClient client( runner, options.client );
  envy::SelectionState state;

  try
  {
    envy::TerminalScreen screen( options.color );
    envy::TuiController controller( screen, state, client );
    QObject::connect( &controller, &envy::TuiController::quitRequested, &app, &QCoreApplication::quit );

    controller.start();
    return app.exec();
  }
  catch ( const envy::TerminalError &e )
  {
    syslog( LOG_ERR, "Terminal setup failed: %s", e.what() );
    std::cerr << "Error: " << e.what() << std::endl;
  }

  return 1;
}

int main( int argc, char *argv[] )
{
  std::vector< std::string > arguments;
  for ( int i = 1; i < argc; ++i )
  {
    arguments.push_back( argv[ i ] );
  }

  const envy::ParseResult parsed = envy::parseArguments( arguments );
  switch ( parsed.status )
  {
    case envy::ParseStatus::ShowHelp:
      envy::printUsage( std::cout, argv[ 0 ] );
      return 0;
    case envy::ParseStatus::ShowVersion:
      envy::printVersion( std::cout );
      return 0;
    case envy::ParseStatus::Error:
      std::cerr << "Error: " << parsed.error << "\n";
      envy::printUsage( std::cerr, argv[ 0 ] );
      return 1;
    case envy::ParseStatus::Run:
      break;
  }

  // Needed for ncurses to emit UTF-8 box drawing and arrows
  setlocale( LC_ALL, "" );

  envy::initLogging( envy::APP_NAME.data(), parsed.options.debug );
  syslog( LOG_INFO, "envytui starting - version %s", envy::APP_VERSION.data() );

  const int result = run_dashboard( argc, argv, parsed.options );

  syslog( LOG_INFO, "envytui exiting with status %d", result );
  envy::shutdownLogging();
  return result;
}
