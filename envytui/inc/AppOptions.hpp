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

#include "EnvyControlClient.hpp"

#include <chrono>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace envy
{

constexpr std::string_view APP_NAME = "envytui";
constexpr std::string_view APP_VERSION = "0.1.0";

/**
 * @brief Runtime settings, taken from the command line only
 */
struct AppOptions
{
  ClientOptions client;
  std::chrono::milliseconds timeout { -1 };  // negative waits forever
  bool debug = false;
  bool color = true;
};

enum class ParseStatus
{
  Run,
  ShowHelp,
  ShowVersion,
  Error
};

struct ParseResult
{
  ParseStatus status = ParseStatus::Run;
  AppOptions options;
  std::string error;
};

/**
 * @brief Parse command-line arguments (without argv[0])
 */
[[nodiscard]] ParseResult parseArguments( const std::vector< std::string > &arguments );

void printUsage( std::ostream &out, std::string_view programName );
void printVersion( std::ostream &out );

} // namespace envy
