/*
    Which children each GPX element may carry, per GPX version.

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

#include "gpx_schema.h"

#include <QHash>                // for QHash
#include <QString>              // for QString, QLatin1Char
#include <QStringView>          // for QStringView

namespace gpxio
{

namespace
{

struct schema_entry {
  const char* parent;
  const char* child;
  tag_type type;
  bool gpx_1_0;
  bool gpx_1_1;
};

#define GPX10 true, false
#define GPX11 false, true
#define GPXANY true, true

#define GPXWPTTYPETAG(name,type,versions) \
  {"wpt", name, type, versions}, \
  {"trkpt", name, type, versions}, \
  {"rtept", name, type, versions}

/*
 * The allowed children of every GPX element.  Order within an element
 * is not checked when reading.  Anything not listed here, other than
 * <extensions> where it is listed, is an invalid child.
 */
const schema_entry schema_table[] = {
  {"gpx", "metadata", tag_type::gpx_metadata, GPX11},
  {"gpx", "wpt", tag_type::gpx_wpt, GPXANY},
  {"gpx", "rte", tag_type::gpx_rte, GPXANY},
  {"gpx", "trk", tag_type::gpx_trk, GPXANY},
  {"gpx", "extensions", tag_type::extensions, GPXANY},
  {"gpx", "name", tag_type::gpx_name, GPX10},
  {"gpx", "desc", tag_type::gpx_desc, GPX10},
  {"gpx", "author", tag_type::gpx_author, GPX10},
  {"gpx", "email", tag_type::gpx_email, GPX10},
  {"gpx", "url", tag_type::gpx_url, GPX10},
  {"gpx", "urlname", tag_type::gpx_urlname, GPX10},
  {"gpx", "time", tag_type::gpx_time, GPX10},
  {"gpx", "keywords", tag_type::gpx_keywords, GPX10},
  {"gpx", "bounds", tag_type::gpx_bounds, GPX10},

  {"metadata", "name", tag_type::metadata_name, GPX11},
  {"metadata", "desc", tag_type::metadata_desc, GPX11},
  {"metadata", "author", tag_type::metadata_author, GPX11},
  {"metadata", "copyright", tag_type::metadata_copyright, GPX11},
  {"metadata", "link", tag_type::metadata_link, GPX11},
  {"metadata", "time", tag_type::metadata_time, GPX11},
  {"metadata", "keywords", tag_type::metadata_keywords, GPX11},
  {"metadata", "bounds", tag_type::metadata_bounds, GPX11},
  {"metadata", "extensions", tag_type::extensions, GPXANY},

  GPXWPTTYPETAG("ele", tag_type::wpttype_ele, GPXANY),
  GPXWPTTYPETAG("time", tag_type::wpttype_time, GPXANY),
  GPXWPTTYPETAG("course", tag_type::wpttype_course, GPX10),
  GPXWPTTYPETAG("speed", tag_type::wpttype_speed, GPX10),
  GPXWPTTYPETAG("magvar", tag_type::wpttype_magvar, GPXANY),
  GPXWPTTYPETAG("geoidheight", tag_type::wpttype_geoidheight, GPXANY),
  GPXWPTTYPETAG("name", tag_type::wpttype_name, GPXANY),
  GPXWPTTYPETAG("cmt", tag_type::wpttype_cmt, GPXANY),
  GPXWPTTYPETAG("desc", tag_type::wpttype_desc, GPXANY),
  GPXWPTTYPETAG("src", tag_type::wpttype_src, GPXANY),
  GPXWPTTYPETAG("link", tag_type::wpttype_link, GPX11),
  GPXWPTTYPETAG("url", tag_type::wpttype_url, GPX10),
  GPXWPTTYPETAG("urlname", tag_type::wpttype_urlname, GPX10),
  GPXWPTTYPETAG("sym", tag_type::wpttype_sym, GPXANY),
  GPXWPTTYPETAG("type", tag_type::wpttype_type, GPXANY),
  GPXWPTTYPETAG("fix", tag_type::wpttype_fix, GPXANY),
  GPXWPTTYPETAG("sat", tag_type::wpttype_sat, GPXANY),
  GPXWPTTYPETAG("hdop", tag_type::wpttype_hdop, GPXANY),
  GPXWPTTYPETAG("vdop", tag_type::wpttype_vdop, GPXANY),
  GPXWPTTYPETAG("pdop", tag_type::wpttype_pdop, GPXANY),
  GPXWPTTYPETAG("ageofdgpsdata", tag_type::wpttype_ageofdgpsdata, GPXANY),
  GPXWPTTYPETAG("dgpsid", tag_type::wpttype_dgpsid, GPXANY),
  GPXWPTTYPETAG("extensions", tag_type::extensions, GPXANY),

  {"rte", "name", tag_type::rte_name, GPXANY},
  {"rte", "cmt", tag_type::rte_cmt, GPXANY},
  {"rte", "desc", tag_type::rte_desc, GPXANY},
  {"rte", "src", tag_type::rte_src, GPXANY},
  {"rte", "link", tag_type::rte_link, GPX11},
  {"rte", "url", tag_type::rte_url, GPX10},
  {"rte", "urlname", tag_type::rte_urlname, GPX10},
  {"rte", "number", tag_type::rte_number, GPXANY},
  {"rte", "type", tag_type::rte_type, GPX11},
  {"rte", "rtept", tag_type::rte_rtept, GPXANY},
  {"rte", "extensions", tag_type::extensions, GPXANY},

  {"trk", "name", tag_type::trk_name, GPXANY},
  {"trk", "cmt", tag_type::trk_cmt, GPXANY},
  {"trk", "desc", tag_type::trk_desc, GPXANY},
  {"trk", "src", tag_type::trk_src, GPXANY},
  {"trk", "link", tag_type::trk_link, GPX11},
  {"trk", "url", tag_type::trk_url, GPX10},
  {"trk", "urlname", tag_type::trk_urlname, GPX10},
  {"trk", "number", tag_type::trk_number, GPXANY},
  {"trk", "type", tag_type::trk_type, GPX11},
  {"trk", "trkseg", tag_type::trk_trkseg, GPXANY},
  {"trk", "extensions", tag_type::extensions, GPXANY},

  {"trkseg", "trkpt", tag_type::trkseg_trkpt, GPXANY},
  {"trkseg", "extensions", tag_type::extensions, GPXANY},

  {"link", "text", tag_type::link_text, GPX11},
  {"link", "type", tag_type::link_type, GPX11},

  {"author", "name", tag_type::person_name, GPX11},
  {"author", "email", tag_type::person_email, GPX11},
  {"author", "link", tag_type::person_link, GPX11},

  {"copyright", "year", tag_type::copyright_year, GPX11},
  {"copyright", "license", tag_type::copyright_license, GPX11},
};

#undef GPXWPTTYPETAG
#undef GPXANY
#undef GPX11
#undef GPX10

QString make_key(QStringView parent, QStringView child)
{
  QString key;
  key.reserve(parent.size() + 1 + child.size());
  key.append(parent).append(QLatin1Char('/')).append(child);
  return key;
}

} // namespace

GpxSchema::GpxSchema()
{
  for (const auto& entry : schema_table) {
    const tag_mapping mapping{entry.type, entry.gpx_1_0, entry.gpx_1_1};
    hash.insert(make_key(QString::fromLatin1(entry.parent), QString::fromLatin1(entry.child)), mapping);
    // wpttype_ and extensions appear under several parents with the same versions.
    if (!by_type.contains(static_cast<int>(entry.type))) {
      by_type.insert(static_cast<int>(entry.type), type_entry{QString::fromLatin1(entry.child), mapping});
    }
  }
}

const GpxSchema& GpxSchema::instance()
{
  static const GpxSchema schema;
  return schema;
}

tag_type GpxSchema::lookup(QStringView parent, QStringView child, GpxVersion version) const
{
  // returns default constructed value if key not found.
  const tag_mapping mapping = hash.value(make_key(parent, child));
  return mapping.allowed(version) ? mapping.type : tag_type::unknown;
}

bool GpxSchema::has_extensions(QStringView parent, GpxVersion version) const
{
  return lookup(parent, u"extensions", version) == tag_type::extensions;
}

bool GpxSchema::allows(tag_type type, GpxVersion version) const
{
  return by_type.value(static_cast<int>(type)).mapping.allowed(version);
}

QString GpxSchema::tag_name(tag_type type) const
{
  return by_type.value(static_cast<int>(type)).name;
}

} // namespace gpxio
