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

#include <ncurses.h>

namespace envy
{

namespace
{
constexpr int ESCAPE_KEY = 27;
constexpr int TAB_KEY = '\t';
}

std::optional< InputEvent > translateKey( int key, bool promptOpen ) noexcept
{
  if ( promptOpen )
  {
    switch ( key )
    {
      case 'y':
      case 'Y':
      case '\n':
      case '\r':
      case KEY_ENTER:
        return InputEvent::ConfirmPrompt;
      case 'n':
      case 'N':
      case ESCAPE_KEY:
        return InputEvent::DismissPrompt;
      default:
        return std::nullopt;
    }
  }

  switch ( key )
  {
    case KEY_UP:
    case 'k':
      return InputEvent::MoveUp;
    case KEY_DOWN:
    case 'j':
      return InputEvent::MoveDown;
    case KEY_LEFT:
    case 'h':
      return InputEvent::DecreaseValue;
    case KEY_RIGHT:
    case 'l':
      return InputEvent::IncreaseValue;
    case TAB_KEY:
    case KEY_BTAB:
      return InputEvent::SwitchPanel;
    case ' ':
      return InputEvent::ToggleOption;
    case '\n':
    case '\r':
    case KEY_ENTER:
      return InputEvent::ApplySelection;
    case 'r':
      return InputEvent::Reset;
    case 'q':
    case ESCAPE_KEY:
      return InputEvent::Quit;
    default:
      return std::nullopt;
  }
}

} // namespace envy
