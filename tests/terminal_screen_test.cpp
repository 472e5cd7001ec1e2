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


#include "TerminalScreen.hpp"

#include <cassert>
#include <iostream>

using namespace envy;

static void test_every_mode_fits_at_minimum_size()
{
  const int rows = TerminalScreen::panelHeight( TerminalScreen::MIN_ROWS );
  assert( TerminalScreen::panelCapacity( rows ) >= static_cast< int >( kAllModes.size() ) );

  // one row less would already hide the last mode
  const int shorter = TerminalScreen::panelHeight( TerminalScreen::MIN_ROWS - 1 );
  assert( TerminalScreen::panelCapacity( shorter ) < static_cast< int >( kAllModes.size() ) );
}

static void test_panel_capacity()
{
  assert( TerminalScreen::panelCapacity( 0 ) == 0 );
  assert( TerminalScreen::panelCapacity( 4 ) == 0 );
  assert( TerminalScreen::panelCapacity( 5 ) == 1 );
  assert( TerminalScreen::panelCapacity( 10 ) == 2 );
  assert( TerminalScreen::panelCapacity( 11 ) == 3 );
  assert( TerminalScreen::panelHeight( 5 ) == 0 );
}

int main()
{
  test_every_mode_fits_at_minimum_size();
  test_panel_capacity();

  std::cout << "terminal_screen_test passed\n";
  return 0;
}
