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

#include "ProcessRunner.hpp"
#include "Logging.hpp"

#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

#include <climits>

namespace envy
{

namespace
{
QStringList toQStringList( const std::vector< std::string > &values )
{
  QStringList list;
  list.reserve( static_cast< qsizetype >( values.size() ) );
  for ( const auto &value : values )
    list << QString::fromStdString( value );
  return list;
}

int toWaitMsecs( std::chrono::milliseconds timeout )
{
  if ( timeout.count() < 0 )
    return -1;
  if ( timeout.count() > INT_MAX )
    return INT_MAX;
  return static_cast< int >( timeout.count() );
}
} // namespace

QtProcessRunner::QtProcessRunner( std::chrono::milliseconds timeout )
  : m_timeout( timeout )
{
}

ProcessOutcome QtProcessRunner::run( const ProcessRequest &request )
{
  ProcessOutcome outcome;

  QProcess process;
  process.start( QString::fromStdString( request.program ), toQStringList( request.arguments ) );

  if ( not process.waitForStarted( -1 ) )
  {
    outcome.errorString = process.errorString().toStdString();
    syslog( LOG_WARNING, "Failed to start %s: %s", request.program.c_str(), outcome.errorString.c_str() );
    return outcome;
  }
  outcome.started = true;

  if ( not request.standardInput.empty() )
    process.write( QByteArray::fromStdString( request.standardInput ) );
  process.closeWriteChannel();

  if ( not process.waitForFinished( toWaitMsecs( m_timeout ) ) )
  {
    if ( process.state() != QProcess::NotRunning )
    {
      outcome.timedOut = true;
      outcome.errorString = "timed out after " + std::to_string( m_timeout.count() ) + " ms";
      syslog( LOG_WARNING, "%s %s, killing it", request.program.c_str(), outcome.errorString.c_str() );
      process.kill();
      process.waitForFinished( 1000 );
    }
  }

  outcome.standardOutput = process.readAllStandardOutput().toStdString();
  outcome.standardError = process.readAllStandardError().toStdString();

  if ( outcome.timedOut )
    return outcome;

  if ( process.exitStatus() == QProcess::CrashExit )
  {
    outcome.crashed = true;
    outcome.errorString = process.errorString().toStdString();
    syslog( LOG_WARNING, "%s terminated abnormally: %s", request.program.c_str(), outcome.errorString.c_str() );
    return outcome;
  }

  outcome.exitCode = process.exitCode();
  logDebug( "[DEBUG] %s exited with code %d", request.program.c_str(), outcome.exitCode );
  return outcome;
}

bool QtProcessRunner::startDetached( const std::string &program, const std::vector< std::string > &arguments )
{
  const bool started = QProcess::startDetached( QString::fromStdString( program ), toQStringList( arguments ) );
  if ( not started )
    syslog( LOG_WARNING, "Failed to start %s detached", program.c_str() );
  return started;
}

std::optional< std::string > QtProcessRunner::findExecutable( const std::string &name ) const
{
  const QString path = QStandardPaths::findExecutable( QString::fromStdString( name ) );
  if ( path.isEmpty() )
    return std::nullopt;
  return path.toStdString();
}

} // namespace envy
