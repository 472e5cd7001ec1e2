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

#include <QObject>
#include <QSocketNotifier>

#include <memory>

namespace envy
{

class EnvyControlClient;
class SelectionState;
class TerminalScreen;

/**
 * @brief Runs the dashboard on the Qt event loop
 *
 * Watches the terminal for input, feeds every key through the key bindings
 * into the SelectionState in arrival order and redraws. Subprocess calls
 * triggered by a key block the loop until they finish; keys typed meanwhile
 * are handled afterwards.
 */
class TuiController : public QObject
{
  Q_OBJECT

public:
  TuiController( TerminalScreen &screen, SelectionState &state, EnvyControlClient &client,
                 QObject *parent = nullptr );
  ~TuiController() override;

  TuiController( const TuiController & ) = delete;
  TuiController &operator=( const TuiController & ) = delete;

  /**
   * @brief Detect the current mode, draw the first frame and start
   *        listening for input
   */
  void start();

signals:
  void quitRequested();

private slots:
  void onInputReady();

private:
  void redraw();

  TerminalScreen &m_screen;
  SelectionState &m_state;
  EnvyControlClient &m_client;
  std::unique_ptr< QSocketNotifier > m_notifier;
  bool m_quitting = false;
};

} // namespace envy
