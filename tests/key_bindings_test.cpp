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

#include "KeyBindings.hpp"
#include "TerminalScreen.hpp"

#include <cassert>
#include <iostream>

#include <ncurses.h>

using namespace envy;

static void test_dashboard_keys()
{
  assert( translateKey( KEY_UP, false ) == InputEvent::MoveUp );
  assert( translateKey( 'k', false ) == InputEvent::MoveUp );
  assert( translateKey( KEY_DOWN, false ) == InputEvent::MoveDown );
  assert( translateKey( 'j', false ) == InputEvent::MoveDown );
  assert( translateKey( KEY_LEFT, false ) == InputEvent::DecreaseValue );
  assert( translateKey( 'l', false ) == InputEvent::IncreaseValue );
  assert( translateKey( '\t', false ) == InputEvent::SwitchPanel );
  assert( translateKey( KEY_BTAB, false ) == InputEvent::SwitchPanel );
  assert( translateKey( ' ', false ) == InputEvent::ToggleOption );
  assert( translateKey( '\r', false ) == InputEvent::ApplySelection );
  assert( translateKey( KEY_ENTER, false ) == InputEvent::ApplySelection );
  assert( translateKey( 'r', false ) == InputEvent::Reset );
  assert( translateKey( 'q', false ) == InputEvent::Quit );
  assert( translateKey( 27, false ) == InputEvent::Quit );

  assert( not translateKey( 'x', false ) );
  assert( not translateKey( 'y', false ) );
  assert( not translateKey( KEY_RESIZE, false ) );
}

static void test_prompt_keys()
{
  assert( translateKey( 'y', true ) == InputEvent::ConfirmPrompt );
  assert( translateKey( 'Y', true ) == InputEvent::ConfirmPrompt );
  assert( translateKey( '\r', true ) == InputEvent::ConfirmPrompt );
  assert( translateKey( 'n', true ) == InputEvent::DismissPrompt );
  assert( translateKey( 27, true ) == InputEvent::DismissPrompt );

  // dashboard keys are ignored while the prompt is shown
  assert( not translateKey( 'q', true ) );
  assert( not translateKey( KEY_DOWN, true ) );
  assert( not translateKey( 'r', true ) );
}

static void test_resize_key()
{
  assert( TerminalScreen::isResizeKey( KEY_RESIZE ) );
  assert( not TerminalScreen::isResizeKey( 'q' ) );
}

int main()
{
  test_dashboard_keys();
  test_prompt_keys();
  test_resize_key();

  std::cout << "key_bindings_test passed\n";
  return 0;
}
