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

#include "CommandBuilder.hpp"

namespace envy::CommandBuilder
{

std::vector< std::string > buildSwitchArgs( GpuMode mode, const OptionStates &options )
{
  std::vector< std::string > args = { "-s", std::string( modeToken( mode ) ) };

  switch ( mode )
  {
    case GpuMode::Integrated:
      break;

    case GpuMode::Hybrid:
      if ( options.rtd3 )
      {
        args.emplace_back( "--rtd3" );
        args.push_back( std::to_string( rtd3LevelValue( options.values.rtd3Level ) ) );
      }
      break;

    case GpuMode::Nvidia:
      if ( options.forceCompositionPipeline )
        args.emplace_back( "--force-comp" );
      if ( options.coolbits )
      {
        args.emplace_back( "--coolbits" );
        args.push_back( std::to_string( options.values.coolbits ) );
      }
      break;
  }

  return args;
}

std::vector< std::string > buildResetArgs()
{
  return { "--reset" };
}

std::vector< std::string > buildQueryArgs()
{
  return { "--query" };
}

std::string joinArgs( const std::vector< std::string > &args )
{
  std::string joined;
  for ( const auto &arg : args )
  {
    if ( not joined.empty() )
      joined += ' ';
    joined += arg;
  }
  return joined;
}

} // namespace envy::CommandBuilder
