/*
    Read GPX 1.0 and 1.1 documents.

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
#ifndef GPX_READER_H_INCLUDED_
#define GPX_READER_H_INCLUDED_

#include <optional>                          // for optional
#include <vector>                            // for vector

#include <QString>                           // for QString
#include <QStringView>                       // for QStringView
#include <QXmlStreamAttributes>              // for QXmlStreamAttributes
#include <QXmlStreamNamespaceDeclarations>   // for QXmlStreamNamespaceDeclarations
#include <QXmlStreamReader>                  // for QXmlStreamReader

#include "gpx.h"                             // for ReaderOptions
#include "gpx_schema.h"                      // for GpxSchema, tag_type
#include "gpx_types.h"                       // for Gpx, Waypoint, Track, ...
#include "src/core/datetime.h"               // for DateTime
#include "src/core/xmltag.h"                 // for XmlTag

namespace gpxio
{

/*
 * A recursive descent parser over a QXmlStreamReader.  Every parse_
 * function is entered with the reader on the start tag of its element
 * and returns with the reader on the matching end tag.
 */
class GpxReader
{
public:
  GpxReader(QXmlStreamReader* xml_reader, const ReaderOptions& reader_options);

  Gpx read();

private:
  /* Member Functions */

  template<typename Handler>
  void parse_children(QStringView parent, std::optional<Extensions>* extensions, Handler handle);

  GpxVersion select_version(const QXmlStreamAttributes& attr) const;
  void parse_gpx(Gpx& gpx);
  Metadata parse_metadata();
  Person parse_person();
  QString parse_email();
  Copyright parse_copyright();
  Bounds parse_bounds();
  Link parse_link();
  Waypoint parse_waypoint();
  Route parse_route();
  Track parse_track();
  TrackSegment parse_trackseg();

  void parse_extensions(std::optional<Extensions>* extensions);
  XmlTag capture_tag(const QXmlStreamNamespaceDeclarations& scope);
  void redeclare(XmlTag& tag, const QXmlStreamNamespaceDeclarations& scope,
                 QStringView prefix, QStringView uri) const;
  QString written_namespace(const QXmlStreamNamespaceDeclarations& own,
                            const QXmlStreamNamespaceDeclarations& scope,
                            QStringView prefix) const;
  void capture_content(QString& cdata, std::vector<XmlTag>& children,
                       const QXmlStreamNamespaceDeclarations& scope);
  void capture_foreign(std::optional<Extensions>* extensions);
  void note_namespaces();

  QString read_text();
  double read_double();
  int read_int();
  unsigned int read_uint(unsigned int max);
  DateTime read_time();
  fix_type read_fix();

  QString attr_string(const QXmlStreamAttributes& attr, const QString& name) const;
  double attr_double(const QXmlStreamAttributes& attr, const QString& name) const;

  [[noreturn]] void throw_reader_error() const;

  /* Data Members */

  QXmlStreamReader* reader;
  ReaderOptions options;
  const GpxSchema& schema;
  GpxVersion version{GpxVersion::gpx_1_1};
  QXmlStreamNamespaceDeclarations namespaces;
  int depth{0};
};

} // namespace gpxio

#endif // GPX_READER_H_INCLUDED_
