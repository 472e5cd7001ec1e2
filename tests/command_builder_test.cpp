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

#include <cassert>
#include <iostream>

using namespace envy;
using Args = std::vector< std::string >;

static void test_plain_switch()
{
  const OptionStates none;
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Integrated, none ) == ( Args{ "-s", "integrated" } ) );
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Hybrid, none ) == ( Args{ "-s", "hybrid" } ) );
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Nvidia, none ) == ( Args{ "-s", "nvidia" } ) );
}

static void test_hybrid_rtd3()
{
  OptionStates options;
  options.rtd3 = true;
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Hybrid, options ) == ( Args{ "-s", "hybrid", "--rtd3", "2" } ) );

  options.values.rtd3Level = Rtd3Level::Disabled;
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Hybrid, options ) == ( Args{ "-s", "hybrid", "--rtd3", "0" } ) );

  options.rtd3 = false;
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Hybrid, options ) == ( Args{ "-s", "hybrid" } ) );
}

static void test_nvidia_options_keep_order()
{
  OptionStates options;
  options.coolbits = true;
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Nvidia, options )
          == ( Args{ "-s", "nvidia", "--coolbits", "28" } ) );

  options.forceCompositionPipeline = true;
  options.values.coolbits = 31;
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Nvidia, options )
          == ( Args{ "-s", "nvidia", "--force-comp", "--coolbits", "31" } ) );

  options.coolbits = false;
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Nvidia, options ) == ( Args{ "-s", "nvidia", "--force-comp" } ) );
}

static void test_foreign_options_ignored()
{
  OptionStates options;
  options.rtd3 = true;
  options.forceCompositionPipeline = true;
  options.coolbits = true;

  assert( CommandBuilder::buildSwitchArgs( GpuMode::Integrated, options ) == ( Args{ "-s", "integrated" } ) );
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Hybrid, options ) == ( Args{ "-s", "hybrid", "--rtd3", "2" } ) );
  assert( CommandBuilder::buildSwitchArgs( GpuMode::Nvidia, options )
          == ( Args{ "-s", "nvidia", "--force-comp", "--coolbits", "28" } ) );
}

static void test_fixed_commands()
{
  assert( CommandBuilder::buildResetArgs() == Args{ "--reset" } );
  assert( CommandBuilder::buildQueryArgs() == Args{ "--query" } );
  assert( CommandBuilder::joinArgs( { "-s", "hybrid", "--rtd3", "2" } ) == "-s hybrid --rtd3 2" );
  assert( CommandBuilder::joinArgs( {} ).empty() );
}

int main()
{
  test_plain_switch();
  test_hybrid_rtd3();
  test_nvidia_options_keep_order();
  test_foreign_options_ignored();
  test_fixed_commands();

  std::cout << "command_builder_test passed\n";
  return 0;
}
