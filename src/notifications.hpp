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

#ifndef KITTIES_NOTIFICATIONS_HPP
#define KITTIES_NOTIFICATIONS_HPP

#include "proto/notifications.pb.h"

namespace kitties
{

/**
 * Receiver of the notifications emitted for successfully processed moves.
 * Delivery is fire-and-forget; nothing in the game state depends on it.
 */
class NotificationSink
{

public:

  NotificationSink () = default;
  virtual ~NotificationSink () = default;

  NotificationSink (const NotificationSink&) = delete;
  void operator= (const NotificationSink&) = delete;

  virtual void Notify (const proto::Notification& n) = 0;

};

/**
 * Notification sink that writes all notifications to the log.
 */
class LoggingNotificationSink : public NotificationSink
{

public:

  LoggingNotificationSink () = default;

  void Notify (const proto::Notification& n) override;

};

} // namespace kitties

#endif // KITTIES_NOTIFICATIONS_HPP
