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

#include <optional>
#include <string>
#include <vector>

namespace envy
{

class SelectionState;

/**
 * @brief One selectable row of a panel
 */
struct ItemView
{
  std::string label;
  std::string description;
  ColorTag color = ColorTag::Default;
  bool highlighted = false;
  bool active = false;                // mode currently configured by envycontrol
  std::optional< bool > checked;      // set for toggle rows

  bool operator==( const ItemView & ) const = default;
};

struct PanelView
{
  std::string title;
  bool focused = false;
  std::vector< ItemView > items;
  std::string placeholder;            // shown when items is empty

  bool operator==( const PanelView & ) const = default;
};

enum class StatusKind
{
  None,
  Busy,
  Success,
  Failure
};

struct StatusLine
{
  StatusKind kind = StatusKind::None;
  std::string text;
  ColorTag color = ColorTag::Muted;

  bool operator==( const StatusLine & ) const = default;
};

struct KeyHint
{
  std::string key;
  std::string action;

  bool operator==( const KeyHint & ) const = default;
};

struct PromptView
{
  std::string title;
  std::string message;
  std::string hint;

  bool operator==( const PromptView & ) const = default;
};

/**
 * @brief Everything the terminal renderer needs for one frame
 */
struct Layout
{
  std::string title;
  std::string activeModeText;
  ColorTag activeModeColor = ColorTag::Muted;
  PanelView modes;
  PanelView options;
  StatusLine status;
  std::vector< KeyHint > hints;
  std::optional< PromptView > prompt;

  bool operator==( const Layout & ) const = default;
};

/**
 * @brief Project a SelectionState into a Layout
 *
 * Pure: the state is not modified and equal states give equal layouts.
 */
[[nodiscard]] Layout buildLayout( const SelectionState &state );

/**
 * @brief Status line wording for a result
 */
[[nodiscard]] StatusLine describeResult( const std::optional< ApplyResult > &result );

} // namespace envy
