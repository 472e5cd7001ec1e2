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

#include "CommonTypes.hpp"
#include "ProcessRunner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace envy
{

/**
 * @brief How envycontrol is launched
 */
struct ClientOptions
{
  std::string toolPath = "envycontrol";
  std::string escalationCommand = "pkexec";  // empty runs the tool directly
  bool verbose = true;                       // append --verbose to switch/reset
};

/**
 * @brief Result of asking envycontrol for the current mode
 */
struct QueryResult
{
  std::optional< GpuMode > mode;          // empty when the output names no mode
  std::optional< std::string > error;     // set when the query itself failed
};

/**
 * @brief Client for the envycontrol command-line tool
 *
 * Turns the argument lists produced by CommandBuilder into process
 * invocations and folds their outcome into ApplyResult values. Nothing here
 * throws: spawn failures and non-zero exits are reported as failures.
 */
class EnvyControlClient
{
public:
  EnvyControlClient( ProcessRunner &runner, ClientOptions options = {} );

  EnvyControlClient( const EnvyControlClient & ) = delete;
  EnvyControlClient &operator=( const EnvyControlClient & ) = delete;

  /**
   * @brief Switch to @p mode with the given options
   * @return Success carrying @p mode, or Failure with the tool diagnostics
   */
  ApplyResult switchMode( GpuMode mode, const OptionStates &options );

  /**
   * @brief Revert the changes envycontrol made
   */
  ApplyResult reset();

  /**
   * @brief Ask envycontrol for the mode currently configured
   *
   * Never escalated.
   */
  QueryResult queryMode();

  /**
   * @brief Whether the tool can be found on PATH
   */
  [[nodiscard]] bool isInstalled() const;

  /**
   * @brief Start a system reboot without waiting for it
   */
  ApplyResult requestReboot();

  /**
   * @brief Run envycontrol with @p args and fold the outcome
   *
   * Escalation and --verbose are applied here. @p mode is reported back on
   * success without looking at the tool output.
   */
  ApplyResult execute( GpuAction action, const std::vector< std::string > &args,
                       std::optional< GpuMode > mode = std::nullopt );

  [[nodiscard]] const ClientOptions &options() const noexcept { return m_options; }

  /**
   * @brief Extract the mode named in `envycontrol --query` output
   */
  [[nodiscard]] static std::optional< GpuMode > parseQueryOutput( const std::string &output );

  /**
   * @brief Pick the most useful diagnostic from a failed outcome
   */
  [[nodiscard]] static std::string failureMessage( const ProcessOutcome &outcome, const std::string &program );

private:
  [[nodiscard]] ProcessRequest makeRequest( const std::vector< std::string > &args, bool escalate ) const;

  ProcessRunner &m_runner;
  ClientOptions m_options;
};

} // namespace envy
