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
#include "Logging.hpp"

#include <algorithm>
#include <cstdio>

#include <unistd.h>
#include <ncurses.h>

namespace envy
{

namespace
{
// Extended color slots used when the terminal allows redefining colors
constexpr short FIRST_CUSTOM_COLOR = 20;

struct ColorDefinition
{
  ColorTag tag;
  short red, green, blue;   // 0..1000
  short fallback;
};

constexpr ColorDefinition COLOR_TABLE[] = {
  { ColorTag::Accent,     545, 361, 965, COLOR_MAGENTA },
  { ColorTag::Muted,      392, 392, 471, COLOR_WHITE },
  { ColorTag::Success,    133, 773, 369, COLOR_GREEN },
  { ColorTag::Error,      937, 267, 267, COLOR_RED },
  { ColorTag::Warning,    918, 702,  31, COLOR_YELLOW },
  { ColorTag::Integrated, 231, 510, 965, COLOR_BLUE },
  { ColorTag::Hybrid,      63, 725, 506, COLOR_CYAN },
  { ColorTag::Nvidia,     463, 725,   0, COLOR_GREEN },
};

short pairNumber( ColorTag tag )
{
  return static_cast< short >( tag );
}

// Length in terminal cells, counting each UTF-8 sequence as one cell
int displayWidth( const std::string &text )
{
  int width = 0;
  for ( unsigned char c : text )
  {
    if ( ( c & 0xC0 ) != 0x80 )
      ++width;
  }
  return width;
}

std::string clipText( const std::string &text, int maxWidth )
{
  if ( maxWidth <= 0 )
    return {};
  if ( displayWidth( text ) <= maxWidth )
    return text;

  std::string clipped;
  int width = 0;
  for ( std::size_t i = 0; i < text.size(); ++i )
  {
    const unsigned char c = static_cast< unsigned char >( text[ i ] );
    if ( ( c & 0xC0 ) != 0x80 )
    {
      if ( width == maxWidth - 1 )
        break;
      ++width;
    }
    clipped += text[ i ];
  }
  clipped += "~";
  return clipped;
}
} // namespace

TerminalScreen::TerminalScreen( bool useColor )
  : m_useColor( useColor )
{
  if ( not isatty( STDIN_FILENO ) or not isatty( STDOUT_FILENO ) )
    throw TerminalError( "standard input and output must be a terminal" );

  m_screen = newterm( nullptr, stdout, stdin );
  if ( m_screen == nullptr )
    throw TerminalError( "cannot initialize the terminal (check the TERM setting)" );

  set_term( m_screen );
  cbreak();
  noecho();
  nonl();
  keypad( stdscr, TRUE );
  nodelay( stdscr, TRUE );
  set_escdelay( 25 );
  if ( curs_set( 0 ) == ERR )
    logDebug( "[DEBUG] terminal cannot hide the cursor" );

  initColors();
  syslog( LOG_INFO, "Terminal initialized (%dx%d, color %s)", COLS, LINES, m_hasColor ? "on" : "off" );
}

TerminalScreen::~TerminalScreen()
{
  if ( m_screen == nullptr )
    return;

  endwin();
  delscreen( m_screen );
  m_screen = nullptr;
}

int TerminalScreen::inputFd() const noexcept
{
  return STDIN_FILENO;
}

bool TerminalScreen::isResizeKey( int key ) noexcept
{
  return key == KEY_RESIZE;
}

int TerminalScreen::panelHeight( int screenRows ) noexcept
{
  return std::max( 0, screenRows - HEADER_ROWS - FOOTER_ROWS );
}

int TerminalScreen::panelCapacity( int height ) noexcept
{
  // the last item needs no blank row after its description
  return std::max( 0, ( height - PANEL_CHROME_ROWS + 1 ) / ITEM_ROWS );
}

std::vector< int > TerminalScreen::readPendingKeys()
{
  std::vector< int > keys;
  for ( int ch = getch(); ch != ERR; ch = getch() )
    keys.push_back( ch );
  return keys;
}

void TerminalScreen::initColors()
{
  if ( not m_useColor or not has_colors() )
    return;

  start_color();
  use_default_colors();
  m_hasColor = true;

  const bool custom = can_change_color() and COLORS >= 32;
  short slot = FIRST_CUSTOM_COLOR;
  for ( const auto &def : COLOR_TABLE )
  {
    if ( custom )
    {
      init_color( slot, def.red, def.green, def.blue );
      init_pair( pairNumber( def.tag ), slot, -1 );
      ++slot;
    }
    else
    {
      init_pair( pairNumber( def.tag ), def.fallback, -1 );
    }
  }
}

int TerminalScreen::attributesFor( ColorTag color ) const noexcept
{
  if ( not m_hasColor or color == ColorTag::Default )
    return 0;
  return static_cast< int >( COLOR_PAIR( pairNumber( color ) ) );
}

void TerminalScreen::putText( WINDOW *win, int row, int col, const std::string &text, int maxWidth, int attributes )
{
  const std::string clipped = clipText( text, maxWidth );
  if ( clipped.empty() )
    return;

  wattron( win, attributes );
  mvwaddstr( win, row, col, clipped.c_str() );
  wattroff( win, attributes );
}

void TerminalScreen::draw( const Layout &layout )
{
  int height = 0;
  int width = 0;
  getmaxyx( stdscr, height, width );

  werase( stdscr );

  if ( height < MIN_ROWS or width < MIN_COLS )
  {
    const std::string message = "Terminal too small (" + std::to_string( width ) + "x" + std::to_string( height ) + ")";
    putText( stdscr, height / 2, std::max( 0, ( width - displayWidth( message ) ) / 2 ), message, width,
             attributesFor( ColorTag::Warning ) );
    wnoutrefresh( stdscr );
    doupdate();
    return;
  }

  drawHeader( layout, width );
  drawFooter( layout, height, width );
  wnoutrefresh( stdscr );

  const int panelTop = HEADER_ROWS;
  const int rows = panelHeight( height );
  const int panelWidth = ( width - 3 ) / 2;
  drawPanel( layout.modes, panelTop, 1, rows, panelWidth );
  drawPanel( layout.options, panelTop, 2 + panelWidth, rows, width - panelWidth - 3 );

  if ( layout.prompt )
    drawPrompt( *layout.prompt, height, width );

  doupdate();
}

void TerminalScreen::drawHeader( const Layout &layout, int width )
{
  const int titleCol = std::max( 0, ( width - displayWidth( layout.title ) ) / 2 );
  putText( stdscr, 1, titleCol, layout.title, width, attributesFor( ColorTag::Accent ) | static_cast< int >( A_BOLD ) );

  const int modeCol = std::max( 0, ( width - displayWidth( layout.activeModeText ) ) / 2 );
  putText( stdscr, 2, modeCol, layout.activeModeText, width, attributesFor( layout.activeModeColor ) );

  wattron( stdscr, attributesFor( ColorTag::Muted ) );
  mvwhline( stdscr, HEADER_ROWS - 1, 0, ACS_HLINE, width );
  wattroff( stdscr, attributesFor( ColorTag::Muted ) );
}

void TerminalScreen::drawPanel( const PanelView &panel, int top, int left, int height, int width )
{
  if ( height < 4 or width < 10 )
    return;

  WINDOW *win = newwin( height, width, top, left );
  if ( win == nullptr )
  {
    syslog( LOG_WARNING, "Failed to create panel window %s", panel.title.c_str() );
    return;
  }

  const int borderAttributes = attributesFor( panel.focused ? ColorTag::Accent : ColorTag::Muted );
  wattron( win, borderAttributes );
  box( win, 0, 0 );
  wattroff( win, borderAttributes );
  putText( win, 0, 2, " " + panel.title + " ", width - 4,
           borderAttributes | ( panel.focused ? static_cast< int >( A_BOLD ) : 0 ) );

  const int innerWidth = width - 4;
  const std::size_t capacity = static_cast< std::size_t >( panelCapacity( height ) );
  int row = 2;

  if ( panel.items.empty() )
  {
    putText( win, row, 2, panel.placeholder, innerWidth, attributesFor( ColorTag::Muted ) );
  }

  for ( std::size_t i = 0; i < panel.items.size() and i < capacity; ++i )
  {
    const ItemView &item = panel.items[ i ];

    std::string line = item.highlighted ? "> " : "  ";
    if ( item.checked )
      line += *item.checked ? "[x] " : "[ ] ";
    line += item.label;

    int attributes = attributesFor( item.color );
    if ( item.highlighted )
      attributes |= static_cast< int >( panel.focused ? ( A_REVERSE | A_BOLD ) : A_BOLD );
    putText( win, row, 2, line, innerWidth, attributes );

    if ( item.active )
    {
      const int markerCol = 2 + std::min( displayWidth( line ), innerWidth ) + 1;
      putText( win, row, markerCol, "(active)", innerWidth - markerCol + 2, attributesFor( ColorTag::Success ) );
    }

    const std::string indent = item.checked ? "      " : "  ";
    putText( win, row + 1, 2, indent + item.description, innerWidth, attributesFor( ColorTag::Muted ) );
    row += ITEM_ROWS;
  }

  wnoutrefresh( win );
  delwin( win );
}

void TerminalScreen::drawFooter( const Layout &layout, int height, int width )
{
  const int statusRow = height - FOOTER_ROWS;
  if ( layout.status.kind != StatusKind::None )
  {
    int attributes = attributesFor( layout.status.color );
    if ( layout.status.kind == StatusKind::Failure )
      attributes |= static_cast< int >( A_BOLD );
    putText( stdscr, statusRow, 1, layout.status.text, width - 2, attributes );
  }

  wattron( stdscr, attributesFor( ColorTag::Muted ) );
  mvwhline( stdscr, statusRow + 1, 0, ACS_HLINE, width );
  wattroff( stdscr, attributesFor( ColorTag::Muted ) );

  int col = 1;
  const int hintRow = statusRow + 2;
  for ( const auto &hint : layout.hints )
  {
    const std::string key = " " + hint.key + " ";
    const std::string action = hint.action + " ";
    if ( col + displayWidth( key ) + displayWidth( action ) >= width )
      break;

    putText( stdscr, hintRow, col, key, width - col, attributesFor( ColorTag::Accent ) | static_cast< int >( A_BOLD ) );
    col += displayWidth( key );
    putText( stdscr, hintRow, col, action, width - col, attributesFor( ColorTag::Muted ) );
    col += displayWidth( action );
  }
}

void TerminalScreen::drawPrompt( const PromptView &prompt, int height, int width )
{
  const int promptWidth = std::min( 60, width - 4 );
  const int promptHeight = 7;
  WINDOW *win = newwin( promptHeight, promptWidth, ( height - promptHeight ) / 2, ( width - promptWidth ) / 2 );
  if ( win == nullptr )
  {
    syslog( LOG_WARNING, "Failed to create prompt window" );
    return;
  }

  const int borderAttributes = attributesFor( ColorTag::Warning );
  werase( win );
  wattron( win, borderAttributes );
  box( win, 0, 0 );
  wattroff( win, borderAttributes );
  putText( win, 0, 2, " " + prompt.title + " ", promptWidth - 4, borderAttributes | static_cast< int >( A_BOLD ) );

  const int innerWidth = promptWidth - 4;
  putText( win, 2, 2 + std::max( 0, ( innerWidth - displayWidth( prompt.message ) ) / 2 ), prompt.message,
           innerWidth, 0 );
  putText( win, 4, 2 + std::max( 0, ( innerWidth - displayWidth( prompt.hint ) ) / 2 ), prompt.hint,
           innerWidth, attributesFor( ColorTag::Muted ) );

  wnoutrefresh( win );
  delwin( win );
}

} // namespace envy
