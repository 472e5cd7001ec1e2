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

#include "LayoutModel.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// ncurses types, kept opaque so its macros stay out of other translation units
struct screen;
struct _win_st;

namespace envy
{

/**
 * @brief Raised when the terminal cannot be put into curses mode
 */
class TerminalError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief ncurses renderer for a Layout
 *
 * Owns curses mode for its lifetime: the constructor enters it (throwing
 * TerminalError on failure) and the destructor always restores the
 * terminal. Input is non-blocking; readPendingKeys() drains whatever the
 * terminal has buffered.
 */
class TerminalScreen
{
  static constexpr int HEADER_ROWS = 4;
  static constexpr int FOOTER_ROWS = 3;
  static constexpr int ITEM_ROWS = 3;
  static constexpr int PANEL_CHROME_ROWS = 3;  // top border, blank row, bottom border

public:
  // Smallest terminal that still shows every mode row
  static constexpr int MIN_ROWS = HEADER_ROWS + FOOTER_ROWS + PANEL_CHROME_ROWS
                                  + ITEM_ROWS * static_cast< int >( kAllModes.size() ) - 1;
  static constexpr int MIN_COLS = 44;

  explicit TerminalScreen( bool useColor = true );
  ~TerminalScreen();

  TerminalScreen( const TerminalScreen & ) = delete;
  TerminalScreen( TerminalScreen && ) = delete;
  TerminalScreen &operator=( const TerminalScreen & ) = delete;
  TerminalScreen &operator=( TerminalScreen && ) = delete;

  /**
   * @brief Redraw the whole screen from @p layout
   */
  void draw( const Layout &layout );

  /**
   * @brief Return every key currently buffered, in arrival order
   *
   * Terminal resizes show up as KEY_RESIZE.
   */
  [[nodiscard]] std::vector< int > readPendingKeys();

  /**
   * @brief File descriptor to watch for input
   */
  [[nodiscard]] int inputFd() const noexcept;

  /**
   * @brief Whether @p key reports a terminal size change
   */
  [[nodiscard]] static bool isResizeKey( int key ) noexcept;

  /**
   * @brief Height of the two side-by-side panels on a terminal of @p screenRows
   */
  [[nodiscard]] static int panelHeight( int screenRows ) noexcept;

  /**
   * @brief Number of items a panel of @p height rows can show
   */
  [[nodiscard]] static int panelCapacity( int height ) noexcept;

private:
  void initColors();
  [[nodiscard]] int attributesFor( ColorTag color ) const noexcept;
  void drawHeader( const Layout &layout, int width );
  void drawPanel( const PanelView &panel, int top, int left, int height, int width );
  void drawFooter( const Layout &layout, int height, int width );
  void drawPrompt( const PromptView &prompt, int height, int width );
  void putText( _win_st *win, int row, int col, const std::string &text, int maxWidth, int attributes );

  screen *m_screen = nullptr;
  bool m_useColor;
  bool m_hasColor = false;
};

} // namespace envy
