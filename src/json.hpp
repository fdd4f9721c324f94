/*
    Kitties - breeding and trading collectibles on XAYA
    Copyright (C) 2021  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef KITTIES_JSON_HPP
#define KITTIES_JSON_HPP

#include <json/json.h>

namespace kitties
{

/**
 * Converts one of the protocol buffers into a JSON form.  This is
 * implemented for the notification messages, so that they can be logged
 * and returned in the same format as the rest of the game state.
 */
template <typename Proto>
  Json::Value ProtoToJson (const Proto& pb);

} // namespace kitties

#endif // KITTIES_JSON_HPP
