/*
    Errors raised while reading or writing GPX documents.

    Copyright (C) 2002-2015 Robert Lipe, gpsbabel.org

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
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

 */

#include "gpx_error.h"

#include <stdexcept>            // for runtime_error
#include <utility>              // for move

#include <QString>              // for QString, QStringLiteral

namespace gpxio
{

Error::Error(Kind kind, const QString& message, QString tag, QString parent, QString text)
  : std::runtime_error(message.toStdString()),
    kind_(kind),
    tag_(std::move(tag)),
    parent_(std::move(parent)),
    text_(std::move(text))
{
}

Error Error::malformedXml(const QString& message, qint64 line, qint64 column)
{
  QString what = QStringLiteral("GPX: malformed XML");
  if (line > 0) {
    what += QStringLiteral(" at line %1, column %2").arg(line).arg(column);
  }
  what += QStringLiteral(": %1").arg(message);
  Error error(Kind::malformed_xml, what, QString(), QString(), message);
  error.line_ = line;
  error.column_ = column;
  return error;
}

Error Error::invalidChildElement(const QString& child, const QString& parent)
{
  return Error(Kind::invalid_child_element,
               QStringLiteral("GPX: invalid child element <%1> in <%2>").arg(child, parent),
               child, parent, QString());
}

Error Error::invalidValue(const QString& field, const QString& text)
{
  return Error(Kind::invalid_value,
               QStringLiteral("GPX: invalid value \"%1\" for %2").arg(text, field),
               field, QString(), text);
}

Error Error::missingAttribute(const QString& attribute, const QString& tag)
{
  return Error(Kind::missing_attribute,
               QStringLiteral("GPX: <%1> lacks mandatory attribute \"%2\"").arg(tag, attribute),
               attribute, tag, QString());
}

Error Error::sinkFailure(const QString& message)
{
  return Error(Kind::sink_failure,
               QStringLiteral("GPX: write failed: %1").arg(message),
               QString(), QString(), message);
}

} // namespace gpxio
