/*
    Copyright (C) 2002-2013 Robert Lipe, gpsbabel.org

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
#ifndef SRC_CORE_XMLTAG_H
#define SRC_CORE_XMLTAG_H

#include <vector>                                  // for vector

#include <QString>                                 // for QString
#include <QStringView>                             // for QStringView
#include <QXmlStreamAttributes>                    // for QXmlStreamAttributes
#include <QXmlStreamNamespaceDeclarations>         // for QXmlStreamNamespaceDeclarations

namespace gpxio
{

/*
 * A raw XML element kept verbatim, with everything below it.
 * cdata is the text before the first child, parentcdata is the text
 * that follows this element inside its parent.
 */
class XmlTag
{
public:

  /* Member Functions */

  // depth first, this tag included.  Names are compared case insensitively.
  const XmlTag* xml_findfirst(QStringView name) const;
  QString xml_attribute(QStringView attrname) const;

  /* Data Members */

  QString tagname;         // qualified name as it appeared, e.g. "gpxtpx:hr"
  QString namespaceUri;
  QXmlStreamAttributes attributes;
  QXmlStreamNamespaceDeclarations namespaceDeclarations;
  QString cdata;
  QString parentcdata;
  std::vector<XmlTag> children;
};

bool operator==(const XmlTag& lhs, const XmlTag& rhs);
bool operator!=(const XmlTag& lhs, const XmlTag& rhs);

} // namespace gpxio

#endif // SRC_CORE_XMLTAG_H
