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

#include "gpx_types.h"

#include <QString>              // for QString, QStringLiteral

namespace gpxio
{

QString version_string(GpxVersion version)
{
  return (version == GpxVersion::gpx_1_0) ? QStringLiteral("1.0") : QStringLiteral("1.1");
}

QString version_namespace(GpxVersion version)
{
  return QStringLiteral("http://www.topografix.com/GPX/%1")
         .arg((version == GpxVersion::gpx_1_0) ? QStringLiteral("1/0") : QStringLiteral("1/1"));
}

QString version_schema_location(GpxVersion version)
{
  const QString ns = version_namespace(version);
  return QStringLiteral("%1 %1/gpx.xsd").arg(ns);
}

bool operator==(const Link& lhs, const Link& rhs)
{
  return lhs.href == rhs.href &&
         lhs.text == rhs.text &&
         lhs.type == rhs.type;
}

bool operator!=(const Link& lhs, const Link& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Person& lhs, const Person& rhs)
{
  return lhs.name == rhs.name &&
         lhs.email == rhs.email &&
         lhs.link == rhs.link;
}

bool operator!=(const Person& lhs, const Person& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Copyright& lhs, const Copyright& rhs)
{
  return lhs.author == rhs.author &&
         lhs.year == rhs.year &&
         lhs.license == rhs.license;
}

bool operator!=(const Copyright& lhs, const Copyright& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Bounds& lhs, const Bounds& rhs)
{
  return lhs.min_lat == rhs.min_lat &&
         lhs.min_lon == rhs.min_lon &&
         lhs.max_lat == rhs.max_lat &&
         lhs.max_lon == rhs.max_lon;
}

bool operator!=(const Bounds& lhs, const Bounds& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Extensions& lhs, const Extensions& rhs)
{
  return lhs.cdata == rhs.cdata &&
         lhs.tags == rhs.tags;
}

bool operator!=(const Extensions& lhs, const Extensions& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Metadata& lhs, const Metadata& rhs)
{
  return lhs.name == rhs.name &&
         lhs.description == rhs.description &&
         lhs.author == rhs.author &&
         lhs.copyright == rhs.copyright &&
         lhs.links == rhs.links &&
         lhs.time == rhs.time &&
         lhs.keywords == rhs.keywords &&
         lhs.bounds == rhs.bounds &&
         lhs.extensions == rhs.extensions;
}

bool operator!=(const Metadata& lhs, const Metadata& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Waypoint& lhs, const Waypoint& rhs)
{
  return lhs.latitude == rhs.latitude &&
         lhs.longitude == rhs.longitude &&
         lhs.elevation == rhs.elevation &&
         lhs.time == rhs.time &&
         lhs.course == rhs.course &&
         lhs.speed == rhs.speed &&
         lhs.magnetic_variation == rhs.magnetic_variation &&
         lhs.geoid_height == rhs.geoid_height &&
         lhs.name == rhs.name &&
         lhs.comment == rhs.comment &&
         lhs.description == rhs.description &&
         lhs.source == rhs.source &&
         lhs.links == rhs.links &&
         lhs.symbol == rhs.symbol &&
         lhs.type == rhs.type &&
         lhs.fix == rhs.fix &&
         lhs.satellites == rhs.satellites &&
         lhs.hdop == rhs.hdop &&
         lhs.vdop == rhs.vdop &&
         lhs.pdop == rhs.pdop &&
         lhs.age_of_dgps_data == rhs.age_of_dgps_data &&
         lhs.dgps_id == rhs.dgps_id &&
         lhs.extensions == rhs.extensions;
}

bool operator!=(const Waypoint& lhs, const Waypoint& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const TrackSegment& lhs, const TrackSegment& rhs)
{
  return lhs.points == rhs.points &&
         lhs.extensions == rhs.extensions;
}

bool operator!=(const TrackSegment& lhs, const TrackSegment& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Track& lhs, const Track& rhs)
{
  return lhs.name == rhs.name &&
         lhs.comment == rhs.comment &&
         lhs.description == rhs.description &&
         lhs.source == rhs.source &&
         lhs.links == rhs.links &&
         lhs.number == rhs.number &&
         lhs.type == rhs.type &&
         lhs.segments == rhs.segments &&
         lhs.extensions == rhs.extensions;
}

bool operator!=(const Track& lhs, const Track& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Route& lhs, const Route& rhs)
{
  return lhs.name == rhs.name &&
         lhs.comment == rhs.comment &&
         lhs.description == rhs.description &&
         lhs.source == rhs.source &&
         lhs.links == rhs.links &&
         lhs.number == rhs.number &&
         lhs.type == rhs.type &&
         lhs.points == rhs.points &&
         lhs.extensions == rhs.extensions;
}

bool operator!=(const Route& lhs, const Route& rhs)
{
  return !(lhs == rhs);
}

bool operator==(const Gpx& lhs, const Gpx& rhs)
{
  return lhs.version() == rhs.version() &&
         lhs.creator == rhs.creator &&
         lhs.metadata == rhs.metadata &&
         lhs.waypoints == rhs.waypoints &&
         lhs.tracks == rhs.tracks &&
         lhs.routes == rhs.routes &&
         lhs.extensions == rhs.extensions &&
         lhs.namespaces == rhs.namespaces;
}

bool operator!=(const Gpx& lhs, const Gpx& rhs)
{
  return !(lhs == rhs);
}

} // namespace gpxio
