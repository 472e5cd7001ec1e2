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

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envy
{

/**
 * @brief GPU operating modes supported by envycontrol
 */
enum class GpuMode
{
  Integrated = 0,
  Hybrid = 1,
  Nvidia = 2
};

inline constexpr std::array< GpuMode, 3 > kAllModes = {
  GpuMode::Integrated, GpuMode::Hybrid, GpuMode::Nvidia
};

/**
 * @brief Mode-scoped boolean options passed to envycontrol
 */
enum class OptionFlag
{
  Rtd3,                      // Hybrid only
  ForceCompositionPipeline,  // Nvidia only
  Coolbits                   // Nvidia only
};

/**
 * @brief PCI-Express Runtime D3 power management levels (--rtd3 value)
 */
enum class Rtd3Level
{
  Disabled = 0,
  CoarseGrained = 1,
  FineGrained = 2,
  FineGrainedAmpere = 3
};

enum class Panel
{
  ModeList,
  OptionList
};

/**
 * @brief Semantic colors understood by the terminal renderer
 */
enum class ColorTag
{
  Default,
  Accent,
  Muted,
  Success,
  Error,
  Warning,
  Integrated,
  Hybrid,
  Nvidia
};

inline constexpr int kCoolbitsMin = 0;
inline constexpr int kCoolbitsMax = 31;
inline constexpr int kCoolbitsDefault = 28;

/**
 * @brief Parameters of the value-carrying options
 */
struct OptionValues
{
  Rtd3Level rtd3Level = Rtd3Level::FineGrained;
  int coolbits = kCoolbitsDefault;

  bool operator==( const OptionValues & ) const = default;
};

/**
 * @brief Toggle state of every option flag plus their parameters
 */
struct OptionStates
{
  bool rtd3 = false;
  bool forceCompositionPipeline = false;
  bool coolbits = false;
  OptionValues values;

  [[nodiscard]] bool isSet( OptionFlag flag ) const noexcept;
  void set( OptionFlag flag, bool enabled ) noexcept;
  [[nodiscard]] bool any() const noexcept;

  bool operator==( const OptionStates & ) const = default;
};

/**
 * @brief What an envycontrol invocation was trying to do
 */
enum class GpuAction
{
  Switch,
  Reset,
  Reboot,
  Query
};

/**
 * @brief Outcome of the last external command execution
 */
struct ApplyResult
{
  enum class Status
  {
    Success,
    Failure
  };

  Status status = Status::Failure;
  GpuAction action = GpuAction::Switch;
  std::optional< GpuMode > mode;  // mode requested, set for switch results
  std::string message;            // diagnostic text on failure

  [[nodiscard]] static ApplyResult success( GpuAction action, std::optional< GpuMode > mode = std::nullopt );
  [[nodiscard]] static ApplyResult failure( GpuAction action, std::string message );

  [[nodiscard]] bool ok() const noexcept { return status == Status::Success; }

  bool operator==( const ApplyResult & ) const = default;
};

// Mode metadata
[[nodiscard]] std::string_view modeToken( GpuMode mode ) noexcept;
[[nodiscard]] std::string_view modeLabel( GpuMode mode ) noexcept;
[[nodiscard]] std::string_view modeDescription( GpuMode mode ) noexcept;
[[nodiscard]] ColorTag modeColor( GpuMode mode ) noexcept;

// Option metadata
[[nodiscard]] const std::vector< OptionFlag > &optionsForMode( GpuMode mode ) noexcept;
[[nodiscard]] bool optionValidForMode( OptionFlag flag, GpuMode mode ) noexcept;
[[nodiscard]] std::string_view optionLabel( OptionFlag flag ) noexcept;
[[nodiscard]] std::string_view optionDescription( OptionFlag flag ) noexcept;

[[nodiscard]] int rtd3LevelValue( Rtd3Level level ) noexcept;
[[nodiscard]] std::string_view rtd3LevelLabel( Rtd3Level level ) noexcept;

} // namespace envy
