/*
    Shim to provide the GPX date/time conventions on top of QDateTime.

    Copyright (C) 2012, 2013 Robert Lipe, robertlipe@gpsbabel.org

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA 02111 USA

 */

#ifndef DATETIME_H_INCLUDED_
#define DATETIME_H_INCLUDED_

#include <optional>             // for optional

#include <QDate>                // for QDate
#include <QDateTime>            // for QDateTime
#include <QString>              // for QString
#include <QStringView>          // for QStringView
#include <QTime>                // for QTime
#include <QTimeZone>            // for QTimeZone

namespace gpxio
{

class DateTime : public QDateTime
{
public:
  DateTime() = default;
  DateTime(const QDate& date, const QTime& time) : QDateTime(date, time, QTimeZone::utc()) {}
  DateTime(const QDateTime& dt) : QDateTime(dt) {}

  // Like toString, but with subsecond time that's included only when
  // the trailing digits aren't .000.  Always UTC.
  QString toPrettyString() const
  {
    if (time().msec()) {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ss.zzzZ"));
    } else {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ssZ"));
    }
  }
};

/*
 * Parse an xsd:dateTime, e.g. 2002-02-10T21:01:29.250Z or
 * 2002-02-10T13:01:29-08:00.  A value without a zone is taken as UTC.
 * Returns an empty optional if the text isn't a complete date and time.
 */
std::optional<DateTime> xml_parse_time(QStringView dateTimeString);

} // namespace gpxio

#endif // DATETIME_H_INCLUDED_
