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

#include <cstddef>
#include <functional>
#include <optional>

namespace envy
{

class EnvyControlClient;

/**
 * @brief Discrete user intents produced by the key bindings
 */
enum class InputEvent
{
  MoveUp,
  MoveDown,
  SwitchPanel,
  ToggleOption,
  IncreaseValue,
  DecreaseValue,
  ApplySelection,
  Reset,
  Quit,
  ConfirmPrompt,
  DismissPrompt
};

enum class InputOutcome
{
  Continue,
  Quit
};

/**
 * @brief Modal prompts shown on top of the dashboard
 */
enum class Prompt
{
  None,
  Reboot
};

/**
 * @brief Interactive selection model of the dashboard
 *
 * Holds the highlighted mode, panel focus, option toggles and the outcome of
 * the last envycontrol call. Navigation only ever lands on options valid for
 * the highlighted mode, and changing mode clears toggles the new mode does
 * not support, so an invalid flag can never reach CommandBuilder.
 *
 * ApplySelection and Reset call into EnvyControlClient synchronously. The
 * change callback fires before such a call (with the busy action set) and
 * after it, so the caller can redraw around the blocking window.
 */
class SelectionState
{
public:
  using ChangeCallback = std::function< void( const SelectionState & ) >;

  explicit SelectionState( GpuMode initialMode = GpuMode::Integrated );

  /**
   * @brief Apply one input event
   * @param client Used by ApplySelection, Reset and ConfirmPrompt only
   * @return InputOutcome::Quit when the run loop should exit
   */
  InputOutcome applyInput( InputEvent event, EnvyControlClient &client );

  // Transitions without side effects outside this object
  void moveUp();
  void moveDown();
  void switchPanel();
  void toggleOption();
  void adjustValue( int delta );
  void selectMode( GpuMode mode );

  void setActiveMode( std::optional< GpuMode > mode );
  void setLastResult( ApplyResult result );
  void setChangeCallback( ChangeCallback callback );

  [[nodiscard]] GpuMode currentMode() const noexcept { return m_currentMode; }
  [[nodiscard]] Panel focusedPanel() const noexcept { return m_focusedPanel; }
  [[nodiscard]] const OptionStates &optionStates() const noexcept { return m_options; }
  [[nodiscard]] std::size_t highlightedOptionIndex() const noexcept { return m_highlightedOption; }
  [[nodiscard]] std::optional< OptionFlag > highlightedOption() const noexcept;
  [[nodiscard]] const std::optional< ApplyResult > &lastResult() const noexcept { return m_lastResult; }
  [[nodiscard]] std::optional< GpuMode > activeMode() const noexcept { return m_activeMode; }
  [[nodiscard]] std::optional< GpuAction > busyAction() const noexcept { return m_busy; }
  [[nodiscard]] Prompt prompt() const noexcept { return m_prompt; }

private:
  void applySelection( EnvyControlClient &client );
  void runReset( EnvyControlClient &client );
  void confirmPrompt( EnvyControlClient &client );
  void notifyChanged() const;

  GpuMode m_currentMode;
  Panel m_focusedPanel = Panel::ModeList;
  OptionStates m_options;
  std::size_t m_highlightedOption = 0;
  std::optional< ApplyResult > m_lastResult;
  std::optional< GpuMode > m_activeMode;
  std::optional< GpuAction > m_busy;
  Prompt m_prompt = Prompt::None;
  ChangeCallback m_changeCallback;
};

/**
 * @brief Seed @p state with the mode envycontrol currently has configured
 *
 * A detected mode becomes both the active and the highlighted mode. A missing
 * tool or a failed query is recorded as a Query failure for the status line.
 */
void seedFromTool( SelectionState &state, EnvyControlClient &client );

} // namespace envy
