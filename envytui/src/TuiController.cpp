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

#include "TuiController.hpp"
#include "EnvyControlClient.hpp"
#include "KeyBindings.hpp"
#include "LayoutModel.hpp"
#include "Logging.hpp"
#include "SelectionState.hpp"
#include "TerminalScreen.hpp"

namespace envy
{

TuiController::TuiController( TerminalScreen &screen, SelectionState &state, EnvyControlClient &client,
                              QObject *parent )
  : QObject( parent ),
    m_screen( screen ),
    m_state( state ),
    m_client( client )
{
}

TuiController::~TuiController()
{
  m_state.setChangeCallback( nullptr );
}

void TuiController::start()
{
  seedFromTool( m_state, m_client );

  // Busy states are shown while the subprocess is still running
  m_state.setChangeCallback( [ this ]( const SelectionState & ) { redraw(); } );
  redraw();

  m_notifier = std::make_unique< QSocketNotifier >( m_screen.inputFd(), QSocketNotifier::Read );
  connect( m_notifier.get(), &QSocketNotifier::activated, this, &TuiController::onInputReady );
}

void TuiController::onInputReady()
{
  if ( m_quitting )
    return;

  for ( const int key : m_screen.readPendingKeys() )
  {
    if ( TerminalScreen::isResizeKey( key ) )
      continue;

    const auto event = translateKey( key, m_state.prompt() != Prompt::None );
    if ( not event )
    {
      logDebug( "[DEBUG] ignoring key %d", key );
      continue;
    }

    if ( m_state.applyInput( *event, m_client ) == InputOutcome::Quit )
    {
      m_quitting = true;
      m_notifier->setEnabled( false );
      emit quitRequested();
      return;
    }
  }

  redraw();
}

void TuiController::redraw()
{
  m_screen.draw( buildLayout( m_state ) );
}

} // namespace envy
