/*
    In-memory model of a GPX document.

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
#ifndef GPX_TYPES_H_INCLUDED_
#define GPX_TYPES_H_INCLUDED_

#include <optional>                            // for optional
#include <vector>                              // for vector

#include <QList>                               // for QList
#include <QString>                             // for QString
#include <QXmlStreamNamespaceDeclarations>     // for QXmlStreamNamespaceDeclarations

#include "src/core/datetime.h"                 // for DateTime
#include "src/core/xmltag.h"                   // for XmlTag

namespace gpxio
{

enum class GpxVersion {
  gpx_1_0,
  gpx_1_1
};

QString version_string(GpxVersion version);        // "1.0"
QString version_namespace(GpxVersion version);     // "http://www.topografix.com/GPX/1/0"
QString version_schema_location(GpxVersion version);

enum fix_type {
  fix_none = 0,
  fix_2d = 1,
  fix_3d,
  fix_dgps,
  fix_pps
};

struct Link;
struct Person;
struct Copyright;
struct Bounds;
struct Extensions;
struct Metadata;
struct Waypoint;
struct TrackSegment;
struct Track;
struct Route;
class Gpx;

// Structural equality, field by field.
bool operator==(const Link& lhs, const Link& rhs);
bool operator!=(const Link& lhs, const Link& rhs);
bool operator==(const Person& lhs, const Person& rhs);
bool operator!=(const Person& lhs, const Person& rhs);
bool operator==(const Copyright& lhs, const Copyright& rhs);
bool operator!=(const Copyright& lhs, const Copyright& rhs);
bool operator==(const Bounds& lhs, const Bounds& rhs);
bool operator!=(const Bounds& lhs, const Bounds& rhs);
bool operator==(const Extensions& lhs, const Extensions& rhs);
bool operator!=(const Extensions& lhs, const Extensions& rhs);
bool operator==(const Metadata& lhs, const Metadata& rhs);
bool operator!=(const Metadata& lhs, const Metadata& rhs);
bool operator==(const Waypoint& lhs, const Waypoint& rhs);
bool operator!=(const Waypoint& lhs, const Waypoint& rhs);
bool operator==(const TrackSegment& lhs, const TrackSegment& rhs);
bool operator!=(const TrackSegment& lhs, const TrackSegment& rhs);
bool operator==(const Track& lhs, const Track& rhs);
bool operator!=(const Track& lhs, const Track& rhs);
bool operator==(const Route& lhs, const Route& rhs);
bool operator!=(const Route& lhs, const Route& rhs);
bool operator==(const Gpx& lhs, const Gpx& rhs);
bool operator!=(const Gpx& lhs, const Gpx& rhs);

struct Link {
  Link() = default;
  explicit Link(const QString& h) : href(h) {}

  QString href;
  std::optional<QString> text;
  std::optional<QString> type;
};

struct Person {
  std::optional<QString> name;
  std::optional<QString> email;        // id@domain
  std::optional<Link> link;
};

struct Copyright {
  QString author;
  std::optional<int> year;
  std::optional<QString> license;
};

struct Bounds {
  double min_lat{0};
  double min_lon{0};
  double max_lat{0};
  double max_lon{0};
};

/*
 * The contents of an <extensions> element, kept as raw XML.
 * cdata is any text directly inside <extensions>.
 */
struct Extensions {
  QString cdata;
  std::vector<XmlTag> tags;
};

struct Metadata {
  std::optional<QString> name;
  std::optional<QString> description;
  std::optional<Person> author;
  std::optional<Copyright> copyright;
  QList<Link> links;
  std::optional<DateTime> time;
  std::optional<QString> keywords;
  std::optional<Bounds> bounds;
  std::optional<Extensions> extensions;
};

struct Waypoint {
  Waypoint() = default;
  Waypoint(double lat, double lon) : latitude(lat), longitude(lon) {}

  double latitude{0};
  double longitude{0};
  std::optional<double> elevation;
  std::optional<DateTime> time;
  std::optional<double> course;        // GPX 1.0 only
  std::optional<double> speed;         // GPX 1.0 only
  std::optional<double> magnetic_variation;
  std::optional<double> geoid_height;
  std::optional<QString> name;
  std::optional<QString> comment;
  std::optional<QString> description;
  std::optional<QString> source;
  QList<Link> links;
  std::optional<QString> symbol;
  std::optional<QString> type;
  std::optional<fix_type> fix;
  std::optional<unsigned int> satellites;
  std::optional<double> hdop;
  std::optional<double> vdop;
  std::optional<double> pdop;
  std::optional<double> age_of_dgps_data;
  std::optional<unsigned int> dgps_id;
  std::optional<Extensions> extensions;
};

struct TrackSegment {
  QList<Waypoint> points;
  std::optional<Extensions> extensions;
};

struct Track {
  std::optional<QString> name;
  std::optional<QString> comment;
  std::optional<QString> description;
  std::optional<QString> source;
  QList<Link> links;
  std::optional<unsigned int> number;
  std::optional<QString> type;
  QList<TrackSegment> segments;
  std::optional<Extensions> extensions;
};

struct Route {
  std::optional<QString> name;
  std::optional<QString> comment;
  std::optional<QString> description;
  std::optional<QString> source;
  QList<Link> links;
  std::optional<unsigned int> number;
  std::optional<QString> type;
  QList<Waypoint> points;
  std::optional<Extensions> extensions;
};

class Gpx
{
public:
  explicit Gpx(GpxVersion version = GpxVersion::gpx_1_1) : version_(version) {}

  GpxVersion version() const
  {
    return version_;
  }

  std::optional<QString> creator;
  std::optional<Metadata> metadata;
  QList<Waypoint> waypoints;
  QList<Track> tracks;
  QList<Route> routes;
  std::optional<Extensions> extensions;
  // prefixed namespaces declared on GPX elements, re-declared on the root when writing.
  QXmlStreamNamespaceDeclarations namespaces;

private:
  GpxVersion version_;
};

} // namespace gpxio

#endif // GPX_TYPES_H_INCLUDED_
