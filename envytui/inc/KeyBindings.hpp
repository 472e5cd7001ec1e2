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

#include "SelectionState.hpp"

#include <optional>

namespace envy
{

/**
 * @brief Map an ncurses key code to an input event
 * @param key Value returned by getch()
 * @param promptOpen Whether a modal prompt is currently shown
 * @return The event, or std::nullopt for unbound keys
 */
[[nodiscard]] std::optional< InputEvent > translateKey( int key, bool promptOpen ) noexcept;

} // namespace envy
