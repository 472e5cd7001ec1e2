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

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace envy
{

/**
 * @brief A single external command to execute
 */
struct ProcessRequest
{
  std::string program;
  std::vector< std::string > arguments;
  std::string standardInput;  // written once, then the write channel is closed
};

/**
 * @brief Raw result of an external command
 */
struct ProcessOutcome
{
  bool started = false;    // false when the program could not be launched
  bool timedOut = false;   // killed after exceeding the runner timeout
  bool crashed = false;    // terminated by a signal
  int exitCode = -1;
  std::string standardOutput;
  std::string standardError;
  std::string errorString; // launcher diagnostic when not started, timed out or crashed

  [[nodiscard]] bool succeeded() const noexcept
  {
    return started and not timedOut and not crashed and exitCode == 0;
  }
};

/**
 * @brief Abstract subprocess execution
 *
 * Implementations never throw for a missing program or a failing command;
 * every problem is reported through ProcessOutcome.
 */
class ProcessRunner
{
public:
  virtual ~ProcessRunner() = default;

  /**
   * @brief Run a command and block until it finishes
   */
  virtual ProcessOutcome run( const ProcessRequest &request ) = 0;

  /**
   * @brief Start a command without waiting for it
   * @return True if the program was launched
   */
  virtual bool startDetached( const std::string &program, const std::vector< std::string > &arguments ) = 0;

  /**
   * @brief Resolve an executable name against PATH
   * @return Absolute path, or std::nullopt when not found
   */
  [[nodiscard]] virtual std::optional< std::string > findExecutable( const std::string &name ) const = 0;
};

/**
 * @brief ProcessRunner backed by QProcess
 *
 * Runs synchronously on the calling thread. A negative timeout waits
 * forever; otherwise the child is killed when the timeout expires.
 */
class QtProcessRunner final : public ProcessRunner
{
public:
  explicit QtProcessRunner( std::chrono::milliseconds timeout = std::chrono::milliseconds( -1 ) );
  ~QtProcessRunner() override = default;

  QtProcessRunner( const QtProcessRunner & ) = delete;
  QtProcessRunner &operator=( const QtProcessRunner & ) = delete;

  ProcessOutcome run( const ProcessRequest &request ) override;
  bool startDetached( const std::string &program, const std::vector< std::string > &arguments ) override;
  [[nodiscard]] std::optional< std::string > findExecutable( const std::string &name ) const override;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

private:
  std::chrono::milliseconds m_timeout;
};

} // namespace envy
