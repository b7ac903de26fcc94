/*
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

#include "src/core/datetime.h"

#include <cmath>                   // for lround
#include <optional>                // for optional, nullopt

#include <QDate>                   // for QDate
#include <QRegularExpression>      // for QRegularExpression
#include <QRegularExpressionMatch> // for QRegularExpressionMatch
#include <QString>                 // for QString
#include <QStringView>             // for QStringView
#include <QTime>                   // for QTime

namespace gpxio
{

std::optional<DateTime> xml_parse_time(QStringView dateTimeString)
{
  static const QRegularExpression re(QStringLiteral(
                                       R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d+))?(Z|[+-]\d{2}:\d{2})?$)"));

  const QRegularExpressionMatch match = re.match(dateTimeString.trimmed().toString());
  if (!match.hasMatch()) {
    return std::nullopt;
  }

  const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
  const QTime time(match.captured(4).toInt(), match.captured(5).toInt(), match.captured(6).toInt());
  if (!date.isValid() || !time.isValid()) {
    return std::nullopt;
  }

  QDateTime dt(date, time, QTimeZone::utc());

  // Fractional seconds are kept to the millisecond.
  const QString fraction = match.captured(7);
  if (!fraction.isEmpty()) {
    const double frac = QStringLiteral("0.%1").arg(fraction).toDouble();
    dt = dt.addMSecs(std::lround(frac * 1000.0));
  }

  const QString zone = match.captured(8);
  if (!zone.isEmpty() && zone != QLatin1String("Z")) {
    const int hours = zone.mid(1, 2).toInt();
    const int minutes = zone.mid(4, 2).toInt();
    if (hours > 23 || minutes > 59) {
      return std::nullopt;
    }
    const int offset = 3600 * hours + 60 * minutes;
    // local time = UTC + offset
    dt = dt.addSecs(zone.startsWith('-') ? offset : -offset);
  }

  return DateTime(dt);
}

} // namespace gpxio
