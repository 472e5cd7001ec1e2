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

#include "LayoutModel.hpp"
#include "SelectionState.hpp"

#include <string>
#include <utility>

namespace envy
{

namespace
{
constexpr const char *APP_TITLE = "EnvyTUI";

// Tool output may span several lines; the status line has one.
std::string singleLine( const std::string &text )
{
  std::string line;
  line.reserve( text.size() );
  bool pendingSpace = false;
  for ( char c : text )
  {
    if ( c == '\n' or c == '\r' or c == '\t' )
    {
      pendingSpace = not line.empty();
      continue;
    }
    if ( pendingSpace )
    {
      line += ' ';
      pendingSpace = false;
    }
    line += c;
  }
  return line;
}

std::string optionRowLabel( OptionFlag flag, const OptionValues &values )
{
  std::string label( optionLabel( flag ) );
  switch ( flag )
  {
    case OptionFlag::Rtd3:
      label += " (level " + std::string( rtd3LevelLabel( values.rtd3Level ) ) + ")";
      break;
    case OptionFlag::Coolbits:
      label += " (value " + std::to_string( values.coolbits ) + ")";
      break;
    case OptionFlag::ForceCompositionPipeline:
      break;
  }
  return label;
}

StatusLine busyStatus( GpuAction action, GpuMode mode )
{
  StatusLine status;
  status.kind = StatusKind::Busy;
  status.color = ColorTag::Warning;
  switch ( action )
  {
    case GpuAction::Switch:
      status.text = "Switching to " + std::string( modeToken( mode ) ) + " mode...";
      break;
    case GpuAction::Reset:
      status.text = "Resetting envycontrol configuration...";
      break;
    case GpuAction::Reboot:
      status.text = "Requesting reboot...";
      break;
    case GpuAction::Query:
      status.text = "Querying current mode...";
      break;
  }
  return status;
}

PanelView buildModePanel( const SelectionState &state )
{
  PanelView panel;
  panel.title = "Graphics Mode";
  panel.focused = state.focusedPanel() == Panel::ModeList;

  for ( GpuMode mode : kAllModes )
  {
    ItemView item;
    item.label = std::string( modeLabel( mode ) );
    item.description = std::string( modeDescription( mode ) );
    item.color = modeColor( mode );
    item.highlighted = mode == state.currentMode();
    item.active = state.activeMode() == mode;
    panel.items.push_back( std::move( item ) );
  }
  return panel;
}

PanelView buildOptionPanel( const SelectionState &state )
{
  PanelView panel;
  panel.title = "Options";
  panel.focused = state.focusedPanel() == Panel::OptionList;

  const auto &flags = optionsForMode( state.currentMode() );
  if ( flags.empty() )
  {
    panel.placeholder = "No additional options for " + std::string( modeLabel( state.currentMode() ) ) + " mode.";
    return panel;
  }

  const OptionStates &options = state.optionStates();
  for ( std::size_t i = 0; i < flags.size(); ++i )
  {
    ItemView item;
    item.label = optionRowLabel( flags[ i ], options.values );
    item.description = std::string( optionDescription( flags[ i ] ) );
    item.color = ColorTag::Accent;
    item.highlighted = panel.focused and i == state.highlightedOptionIndex();
    item.checked = options.isSet( flags[ i ] );
    panel.items.push_back( std::move( item ) );
  }
  return panel;
}
} // namespace

StatusLine describeResult( const std::optional< ApplyResult > &result )
{
  StatusLine status;
  if ( not result )
    return status;

  if ( result->ok() )
  {
    status.kind = StatusKind::Success;
    status.color = ColorTag::Success;
    switch ( result->action )
    {
      case GpuAction::Switch:
        status.text = "Switched to "
                      + std::string( modeToken( result->mode.value_or( GpuMode::Integrated ) ) )
                      + " mode. Reboot for the change to take effect.";
        break;
      case GpuAction::Reset:
        status.text = "Reset successful. Reboot for the change to take effect.";
        break;
      case GpuAction::Reboot:
        status.text = "Rebooting...";
        break;
      case GpuAction::Query:
        status.text = "Current mode detected.";
        break;
    }
    return status;
  }

  status.kind = StatusKind::Failure;
  status.color = ColorTag::Error;
  switch ( result->action )
  {
    case GpuAction::Switch:
      status.text = "Failed to switch mode: ";
      break;
    case GpuAction::Reset:
      status.text = "Failed to reset: ";
      break;
    case GpuAction::Reboot:
      status.text = "Failed to reboot: ";
      break;
    case GpuAction::Query:
      status.text = "Failed to query mode: ";
      break;
  }
  status.text += singleLine( result->message );
  return status;
}

Layout buildLayout( const SelectionState &state )
{
  Layout layout;
  layout.title = APP_TITLE;

  if ( auto active = state.activeMode() )
  {
    layout.activeModeText = "Current Mode: " + std::string( modeLabel( *active ) );
    layout.activeModeColor = modeColor( *active );
  }
  else
  {
    layout.activeModeText = "Current Mode: Unknown";
    layout.activeModeColor = ColorTag::Muted;
  }

  layout.modes = buildModePanel( state );
  layout.options = buildOptionPanel( state );

  if ( auto busy = state.busyAction() )
    layout.status = busyStatus( *busy, state.currentMode() );
  else
    layout.status = describeResult( state.lastResult() );

  layout.hints = {
    { "↑↓/jk", "Move" },
    { "Tab", "Panel" },
    { "←→", "Adjust" },
    { "Space", "Toggle" },
    { "Enter", "Apply" },
    { "r", "Reset" },
    { "q", "Quit" },
  };

  if ( state.prompt() == Prompt::Reboot )
  {
    layout.prompt = PromptView{
      "Reboot",
      "Mode switched. Reboot now for the change to take effect?",
      "y/Enter: Yes  |  n/Esc: No"
    };
  }

  return layout;
}

} // namespace envy
