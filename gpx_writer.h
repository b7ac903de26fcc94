/*
    Write GPX 1.0 and 1.1 documents.

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
#ifndef GPX_WRITER_H_INCLUDED_
#define GPX_WRITER_H_INCLUDED_

#include <climits>                     // for UINT_MAX
#include <optional>                    // for optional

#include <QIODevice>                   // for QIODevice
#include <QList>                       // for QList
#include <QString>                     // for QString

#include "gpx.h"                       // for WriterOptions
#include "gpx_schema.h"                // for GpxSchema, tag_type
#include "gpx_types.h"                 // for Gpx, Waypoint, Track, ...
#include "src/core/datetime.h"         // for DateTime
#include "src/core/xmlstreamwriter.h"  // for XmlStreamWriter
#include "src/core/xmltag.h"           // for XmlTag

namespace gpxio
{

/*
 * Emits a document in schema order for one target version.  Every
 * optional child is gated on the same schema table the reader uses, so
 * whatever the target version can't carry is left out.
 */
class GpxWriter
{
public:
  GpxWriter(QIODevice* output, const WriterOptions& writer_options);

  void write(const Gpx& gpx);

private:
  /* Member Functions */

  bool allowed(tag_type type) const;
  void write_text(tag_type type, const std::optional<QString>& text);
  void write_number(tag_type type, const std::optional<double>& value);
  void write_uint(tag_type type, const std::optional<unsigned int>& value, unsigned int max = UINT_MAX);
  void write_time(tag_type type, const std::optional<DateTime>& time);
  void write_links(const QList<Link>& links, tag_type link_type,
                   tag_type url_type, tag_type urlname_type);
  void write_link(const QString& tagname, const Link& link);

  void write_legacy_metadata(const Metadata& metadata);
  void write_metadata(const Metadata& metadata);
  void write_person(const Person& person);
  void write_email(const QString& email);
  void write_copyright(const Copyright& copyright);
  void write_bounds(const Bounds& bounds);
  void write_waypoint(const QString& tagname, const Waypoint& wpt);
  void write_route(const Route& rte);
  void write_track(const Track& trk);
  void write_trackseg(const TrackSegment& seg);
  void write_extensions(const std::optional<Extensions>& extensions);
  void fprint_xml_chain(const XmlTag& tag);

  void check_sink() const;

  /* Data Members */

  QIODevice* device;
  WriterOptions options;
  XmlStreamWriter writer;
  const GpxSchema& schema;
  GpxVersion version{GpxVersion::gpx_1_1};
};

} // namespace gpxio

#endif // GPX_WRITER_H_INCLUDED_
