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

#include "CommonTypes.hpp"

#include <utility>

namespace envy
{

bool OptionStates::isSet( OptionFlag flag ) const noexcept
{
  switch ( flag )
  {
    case OptionFlag::Rtd3:
      return rtd3;
    case OptionFlag::ForceCompositionPipeline:
      return forceCompositionPipeline;
    case OptionFlag::Coolbits:
      return coolbits;
  }
  return false;
}

void OptionStates::set( OptionFlag flag, bool enabled ) noexcept
{
  switch ( flag )
  {
    case OptionFlag::Rtd3:
      rtd3 = enabled;
      break;
    case OptionFlag::ForceCompositionPipeline:
      forceCompositionPipeline = enabled;
      break;
    case OptionFlag::Coolbits:
      coolbits = enabled;
      break;
  }
}

bool OptionStates::any() const noexcept
{
  return rtd3 or forceCompositionPipeline or coolbits;
}

ApplyResult ApplyResult::success( GpuAction action, std::optional< GpuMode > mode )
{
  ApplyResult result;
  result.status = Status::Success;
  result.action = action;
  result.mode = mode;
  return result;
}

ApplyResult ApplyResult::failure( GpuAction action, std::string message )
{
  ApplyResult result;
  result.status = Status::Failure;
  result.action = action;
  result.message = std::move( message );
  return result;
}

std::string_view modeToken( GpuMode mode ) noexcept
{
  switch ( mode )
  {
    case GpuMode::Integrated: return "integrated";
    case GpuMode::Hybrid:     return "hybrid";
    case GpuMode::Nvidia:     return "nvidia";
  }
  return "integrated";
}

std::string_view modeLabel( GpuMode mode ) noexcept
{
  switch ( mode )
  {
    case GpuMode::Integrated: return "Integrated";
    case GpuMode::Hybrid:     return "Hybrid";
    case GpuMode::Nvidia:     return "Nvidia";
  }
  return "Integrated";
}

std::string_view modeDescription( GpuMode mode ) noexcept
{
  switch ( mode )
  {
    case GpuMode::Integrated:
      return "Use the Intel/AMD iGPU exclusively. The Nvidia GPU is turned off to save power.";
    case GpuMode::Hybrid:
      return "PRIME render offloading. The dGPU can be powered down when not in use.";
    case GpuMode::Nvidia:
      return "Use the Nvidia dGPU exclusively. Higher performance, higher power draw.";
  }
  return "";
}

ColorTag modeColor( GpuMode mode ) noexcept
{
  switch ( mode )
  {
    case GpuMode::Integrated: return ColorTag::Integrated;
    case GpuMode::Hybrid:     return ColorTag::Hybrid;
    case GpuMode::Nvidia:     return ColorTag::Nvidia;
  }
  return ColorTag::Default;
}

const std::vector< OptionFlag > &optionsForMode( GpuMode mode ) noexcept
{
  static const std::vector< OptionFlag > none;
  static const std::vector< OptionFlag > hybrid = { OptionFlag::Rtd3 };
  static const std::vector< OptionFlag > nvidia = { OptionFlag::ForceCompositionPipeline,
                                                    OptionFlag::Coolbits };

  switch ( mode )
  {
    case GpuMode::Integrated: return none;
    case GpuMode::Hybrid:     return hybrid;
    case GpuMode::Nvidia:     return nvidia;
  }
  return none;
}

bool optionValidForMode( OptionFlag flag, GpuMode mode ) noexcept
{
  for ( OptionFlag valid : optionsForMode( mode ) )
  {
    if ( valid == flag )
      return true;
  }
  return false;
}

std::string_view optionLabel( OptionFlag flag ) noexcept
{
  switch ( flag )
  {
    case OptionFlag::Rtd3:                     return "RTD3 Power Management";
    case OptionFlag::ForceCompositionPipeline: return "Force Composition Pipeline";
    case OptionFlag::Coolbits:                 return "Coolbits";
  }
  return "";
}

std::string_view optionDescription( OptionFlag flag ) noexcept
{
  switch ( flag )
  {
    case OptionFlag::Rtd3:
      return "Lets the dGPU enter a low-power state when idle. Higher levels save more power.";
    case OptionFlag::ForceCompositionPipeline:
      return "Forces the full composition pipeline. Fixes tearing at a small performance cost.";
    case OptionFlag::Coolbits:
      return "Unlocks overclocking, fan control and voltage adjustment in the Nvidia driver.";
  }
  return "";
}

int rtd3LevelValue( Rtd3Level level ) noexcept
{
  return static_cast< int >( level );
}

std::string_view rtd3LevelLabel( Rtd3Level level ) noexcept
{
  switch ( level )
  {
    case Rtd3Level::Disabled:          return "0 - Disabled";
    case Rtd3Level::CoarseGrained:     return "1 - Coarse-grained";
    case Rtd3Level::FineGrained:       return "2 - Fine-grained";
    case Rtd3Level::FineGrainedAmpere: return "3 - Fine-grained (Ampere+)";
  }
  return "";
}

} // namespace envy
