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

#include <string>
#include <vector>

namespace envy
{

/**
 * @brief Builds envycontrol argument lists
 *
 * All functions are pure: the result depends only on the inputs and no
 * process is started. The privilege prefix and --verbose are added by
 * EnvyControlClient, not here.
 */
namespace CommandBuilder
{

/**
 * @brief Arguments that switch to @p mode with the options valid for it
 *
 * Options not valid for @p mode are ignored even when set.
 * @return e.g. { "-s", "nvidia", "--force-comp", "--coolbits", "28" }
 */
[[nodiscard]] std::vector< std::string > buildSwitchArgs( GpuMode mode, const OptionStates &options );

/**
 * @brief Arguments that revert every change envycontrol made
 */
[[nodiscard]] std::vector< std::string > buildResetArgs();

/**
 * @brief Arguments that ask envycontrol for the current mode
 */
[[nodiscard]] std::vector< std::string > buildQueryArgs();

/**
 * @brief Join arguments with spaces for log messages
 */
[[nodiscard]] std::string joinArgs( const std::vector< std::string > &args );

} // namespace CommandBuilder

} // namespace envy
