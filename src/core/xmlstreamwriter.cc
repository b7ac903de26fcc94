/*
    Copyright (C) 2013 Robert Lipe, gpsbabel.org

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

#include "src/core/xmlstreamwriter.h"

#include <optional>                 // for optional

#include <QLocale>                  // for QLocale::FloatingPointShortest
#include <QString>                  // for QString
#include <QXmlStreamWriter>         // for QXmlStreamWriter

// We rely on Qt to strip out characters that are illegal in xml.  These can
// creep into our structures from documents built by hand.

namespace gpxio
{

QString XmlStreamWriter::formatNumber(double value)
{
  return QString::number(value, 'g', QLocale::FloatingPointShortest);
}

// Don't emit the element unless the value is present.  A present but
// empty value is still written, as an empty element.
void XmlStreamWriter::writeOptionalTextElement(const QString& qualifiedName, const std::optional<QString>& text)
{
  if (text) {
    QXmlStreamWriter::writeTextElement(qualifiedName, *text);
  }
}

} // namespace gpxio
