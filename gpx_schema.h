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
#ifndef GPX_SCHEMA_H_INCLUDED_
#define GPX_SCHEMA_H_INCLUDED_

#include <QHash>                // for QHash
#include <QString>              // for QString
#include <QStringView>          // for QStringView

#include "gpx_types.h"          // for GpxVersion

namespace gpxio
{

/*
 * One value per (parent, child) pair the schema knows about.  The
 * wpttype_ values are shared by wpt, trkpt and rtept.
 */
enum class tag_type {
  unknown = 0,
  extensions,

  gpx_metadata,            /* GPX 1.1 */
  gpx_wpt,
  gpx_rte,
  gpx_trk,
  gpx_name,                /* GPX 1.0 */
  gpx_desc,                /* GPX 1.0 */
  gpx_author,              /* GPX 1.0 */
  gpx_email,               /* GPX 1.0 */
  gpx_url,                 /* GPX 1.0 */
  gpx_urlname,             /* GPX 1.0 */
  gpx_time,                /* GPX 1.0 */
  gpx_keywords,            /* GPX 1.0 */
  gpx_bounds,              /* GPX 1.0 */

  metadata_name,
  metadata_desc,
  metadata_author,
  metadata_copyright,
  metadata_link,
  metadata_time,
  metadata_keywords,
  metadata_bounds,

  wpttype_ele,
  wpttype_time,
  wpttype_course,          /* GPX 1.0 */
  wpttype_speed,           /* GPX 1.0 */
  wpttype_magvar,
  wpttype_geoidheight,
  wpttype_name,
  wpttype_cmt,
  wpttype_desc,
  wpttype_src,
  wpttype_link,            /* GPX 1.1 */
  wpttype_url,             /* GPX 1.0 */
  wpttype_urlname,         /* GPX 1.0 */
  wpttype_sym,
  wpttype_type,
  wpttype_fix,
  wpttype_sat,
  wpttype_hdop,
  wpttype_vdop,
  wpttype_pdop,
  wpttype_ageofdgpsdata,
  wpttype_dgpsid,

  rte_name,
  rte_cmt,
  rte_desc,
  rte_src,
  rte_link,                /* GPX 1.1 */
  rte_url,                 /* GPX 1.0 */
  rte_urlname,             /* GPX 1.0 */
  rte_number,
  rte_type,                /* GPX 1.1 */
  rte_rtept,

  trk_name,
  trk_cmt,
  trk_desc,
  trk_src,
  trk_link,                /* GPX 1.1 */
  trk_url,                 /* GPX 1.0 */
  trk_urlname,             /* GPX 1.0 */
  trk_number,
  trk_type,                /* GPX 1.1 */
  trk_trkseg,

  trkseg_trkpt,

  link_text,
  link_type,

  person_name,
  person_email,
  person_link,

  copyright_year,
  copyright_license
};

class GpxSchema
{
public:
  /* Types */

  struct tag_mapping {
    tag_type type{tag_type::unknown};
    bool gpx_1_0{false};
    bool gpx_1_1{false};

    bool allowed(GpxVersion version) const
    {
      return (version == GpxVersion::gpx_1_0) ? gpx_1_0 : gpx_1_1;
    }
  };

  /* Member Functions */

  static const GpxSchema& instance();

  // What child is inside parent under version, tag_type::unknown if it may not appear there.
  tag_type lookup(QStringView parent, QStringView child, GpxVersion version) const;
  // Whether parent has an extension point under version.
  bool has_extensions(QStringView parent, GpxVersion version) const;
  // Whether the writer may emit type under version.
  bool allows(tag_type type, GpxVersion version) const;
  QString tag_name(tag_type type) const;

private:
  /* Types */

  struct type_entry {
    QString name;
    tag_mapping mapping;
  };

  /* Member Functions */

  GpxSchema();

  /* Data Members */

  QHash<QString, tag_mapping> hash;     // "parent/child"
  QHash<int, type_entry> by_type;
};

} // namespace gpxio

#endif // GPX_SCHEMA_H_INCLUDED_
