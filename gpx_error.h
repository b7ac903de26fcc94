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
#ifndef GPX_ERROR_H_INCLUDED_
#define GPX_ERROR_H_INCLUDED_

#include <stdexcept>            // for runtime_error

#include <QString>              // for QString
#include <QtGlobal>             // for qint64

namespace gpxio
{

/*
 * Every failure of a read or write is terminal and is reported by
 * throwing one of these.  No partial document is ever returned.
 */
class Error : public std::runtime_error
{
public:
  enum class Kind {
    malformed_xml,
    invalid_child_element,
    invalid_value,
    missing_attribute,
    sink_failure
  };

  /* Factories */

  static Error malformedXml(const QString& message, qint64 line = 0, qint64 column = 0);
  // child appeared inside parent where it isn't allowed.
  static Error invalidChildElement(const QString& child, const QString& parent);
  // field held text that couldn't be converted.
  static Error invalidValue(const QString& field, const QString& text);
  // attribute is mandatory on tag.
  static Error missingAttribute(const QString& attribute, const QString& tag);
  static Error sinkFailure(const QString& message);

  /* Member Functions */

  Kind kind() const
  {
    return kind_;
  }
  const QString& tag() const
  {
    return tag_;
  }
  const QString& parent() const
  {
    return parent_;
  }
  const QString& text() const
  {
    return text_;
  }
  qint64 lineNumber() const
  {
    return line_;
  }
  qint64 columnNumber() const
  {
    return column_;
  }

private:
  Error(Kind kind, const QString& message, QString tag, QString parent, QString text);

  Kind kind_;
  QString tag_;
  QString parent_;
  QString text_;
  qint64 line_{0};
  qint64 column_{0};
};

} // namespace gpxio

#endif // GPX_ERROR_H_INCLUDED_
