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

#include "SelectionState.hpp"
#include "EnvyControlClient.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace envy
{

namespace
{
constexpr const char *NOT_INSTALLED_MESSAGE = "envycontrol is not installed. Please install it first.";

std::size_t modeIndex( GpuMode mode )
{
  const auto it = std::find( kAllModes.begin(), kAllModes.end(), mode );
  return static_cast< std::size_t >( it - kAllModes.begin() );
}
} // namespace

SelectionState::SelectionState( GpuMode initialMode )
  : m_currentMode( initialMode )
{
}

InputOutcome SelectionState::applyInput( InputEvent event, EnvyControlClient &client )
{
  // while a prompt is open only its own answers (and quit) are accepted
  if ( m_prompt != Prompt::None
       and event != InputEvent::ConfirmPrompt
       and event != InputEvent::DismissPrompt
       and event != InputEvent::Quit )
  {
    return InputOutcome::Continue;
  }

  switch ( event )
  {
    case InputEvent::MoveUp:
      moveUp();
      break;
    case InputEvent::MoveDown:
      moveDown();
      break;
    case InputEvent::SwitchPanel:
      switchPanel();
      break;
    case InputEvent::ToggleOption:
      toggleOption();
      break;
    case InputEvent::IncreaseValue:
      adjustValue( 1 );
      break;
    case InputEvent::DecreaseValue:
      adjustValue( -1 );
      break;
    case InputEvent::ApplySelection:
      applySelection( client );
      break;
    case InputEvent::Reset:
      runReset( client );
      break;
    case InputEvent::ConfirmPrompt:
      confirmPrompt( client );
      break;
    case InputEvent::DismissPrompt:
      m_prompt = Prompt::None;
      break;
    case InputEvent::Quit:
      return InputOutcome::Quit;
  }

  return InputOutcome::Continue;
}

void SelectionState::moveUp()
{
  if ( m_focusedPanel == Panel::ModeList )
  {
    const std::size_t index = modeIndex( m_currentMode );
    selectMode( kAllModes[ ( index + kAllModes.size() - 1 ) % kAllModes.size() ] );
    return;
  }

  const auto &options = optionsForMode( m_currentMode );
  if ( options.empty() )
    return;
  m_highlightedOption = ( m_highlightedOption + options.size() - 1 ) % options.size();
}

void SelectionState::moveDown()
{
  if ( m_focusedPanel == Panel::ModeList )
  {
    const std::size_t index = modeIndex( m_currentMode );
    selectMode( kAllModes[ ( index + 1 ) % kAllModes.size() ] );
    return;
  }

  const auto &options = optionsForMode( m_currentMode );
  if ( options.empty() )
    return;
  m_highlightedOption = ( m_highlightedOption + 1 ) % options.size();
}

void SelectionState::switchPanel()
{
  if ( m_focusedPanel == Panel::OptionList )
  {
    m_focusedPanel = Panel::ModeList;
    return;
  }

  if ( optionsForMode( m_currentMode ).empty() )
    return;

  m_focusedPanel = Panel::OptionList;
}

void SelectionState::toggleOption()
{
  if ( m_focusedPanel != Panel::OptionList )
    return;

  if ( auto flag = highlightedOption() )
  {
    m_options.set( *flag, not m_options.isSet( *flag ) );
    logDebug( "[DEBUG] option %s -> %s", std::string( optionLabel( *flag ) ).c_str(),
              m_options.isSet( *flag ) ? "on" : "off" );
  }
}

void SelectionState::adjustValue( int delta )
{
  if ( m_focusedPanel != Panel::OptionList )
    return;

  const auto flag = highlightedOption();
  if ( not flag )
    return;

  switch ( *flag )
  {
    case OptionFlag::Rtd3:
    {
      const int level = std::clamp( rtd3LevelValue( m_options.values.rtd3Level ) + delta,
                                    rtd3LevelValue( Rtd3Level::Disabled ),
                                    rtd3LevelValue( Rtd3Level::FineGrainedAmpere ) );
      m_options.values.rtd3Level = static_cast< Rtd3Level >( level );
      break;
    }
    case OptionFlag::Coolbits:
      m_options.values.coolbits = std::clamp( m_options.values.coolbits + delta, kCoolbitsMin, kCoolbitsMax );
      break;
    case OptionFlag::ForceCompositionPipeline:
      break;
  }
}

void SelectionState::selectMode( GpuMode mode )
{
  m_currentMode = mode;
  m_highlightedOption = 0;

  for ( OptionFlag flag : { OptionFlag::Rtd3, OptionFlag::ForceCompositionPipeline, OptionFlag::Coolbits } )
  {
    if ( not optionValidForMode( flag, mode ) )
      m_options.set( flag, false );
  }

  if ( optionsForMode( mode ).empty() )
    m_focusedPanel = Panel::ModeList;
}

void SelectionState::setActiveMode( std::optional< GpuMode > mode )
{
  m_activeMode = mode;
}

void SelectionState::setLastResult( ApplyResult result )
{
  m_lastResult = std::move( result );
}

void SelectionState::setChangeCallback( ChangeCallback callback )
{
  m_changeCallback = std::move( callback );
}

std::optional< OptionFlag > SelectionState::highlightedOption() const noexcept
{
  const auto &options = optionsForMode( m_currentMode );
  if ( m_highlightedOption >= options.size() )
    return std::nullopt;
  return options[ m_highlightedOption ];
}

void SelectionState::applySelection( EnvyControlClient &client )
{
  m_busy = GpuAction::Switch;
  notifyChanged();

  ApplyResult result = client.switchMode( m_currentMode, m_options );
  m_busy.reset();

  if ( result.ok() )
  {
    m_activeMode = m_currentMode;
    m_prompt = Prompt::Reboot;
  }
  m_lastResult = std::move( result );
  notifyChanged();
}

void SelectionState::runReset( EnvyControlClient &client )
{
  m_busy = GpuAction::Reset;
  notifyChanged();

  ApplyResult result = client.reset();
  m_busy.reset();

  if ( result.ok() )
    m_activeMode.reset();
  m_lastResult = std::move( result );
  notifyChanged();
}

void SelectionState::confirmPrompt( EnvyControlClient &client )
{
  if ( m_prompt != Prompt::Reboot )
    return;

  m_prompt = Prompt::None;
  m_lastResult = client.requestReboot();
  notifyChanged();
}

void SelectionState::notifyChanged() const
{
  if ( m_changeCallback )
    m_changeCallback( *this );
}

void seedFromTool( SelectionState &state, EnvyControlClient &client )
{
  if ( not client.isInstalled() )
  {
    syslog( LOG_WARNING, "%s", NOT_INSTALLED_MESSAGE );
    state.setLastResult( ApplyResult::failure( GpuAction::Query, NOT_INSTALLED_MESSAGE ) );
    return;
  }

  const QueryResult query = client.queryMode();
  if ( query.mode )
  {
    const std::string_view token = modeToken( *query.mode );
    syslog( LOG_INFO, "Detected current mode: %.*s", static_cast< int >( token.size() ), token.data() );
    state.setActiveMode( query.mode );
    state.selectMode( *query.mode );
  }
  else if ( query.error )
  {
    state.setLastResult( ApplyResult::failure( GpuAction::Query, *query.error ) );
  }
}

} // namespace envy
