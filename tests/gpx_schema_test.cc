/*
    Tests for the GPX content model table.

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

#include <QString>              // for QString, QStringLiteral

#include <gtest/gtest.h>

#include "gpx_schema.h"
#include "gpx_types.h"

namespace gpxio
{
namespace
{

constexpr GpxVersion v10 = GpxVersion::gpx_1_0;
constexpr GpxVersion v11 = GpxVersion::gpx_1_1;

TEST(GpxSchema, WaypointChildrenSharedByAllPointKinds)
{
  const GpxSchema& schema = GpxSchema::instance();
  for (const char16_t* parent : {u"wpt", u"trkpt", u"rtept"}) {
    EXPECT_EQ(schema.lookup(parent, u"ele", v11), tag_type::wpttype_ele);
    EXPECT_EQ(schema.lookup(parent, u"ele", v10), tag_type::wpttype_ele);
    EXPECT_EQ(schema.lookup(parent, u"dgpsid", v11), tag_type::wpttype_dgpsid);
    EXPECT_EQ(schema.lookup(parent, u"extensions", v11), tag_type::extensions);
  }
}

TEST(GpxSchema, VersionSpecificChildren)
{
  const GpxSchema& schema = GpxSchema::instance();

  EXPECT_EQ(schema.lookup(u"wpt", u"speed", v10), tag_type::wpttype_speed);
  EXPECT_EQ(schema.lookup(u"wpt", u"speed", v11), tag_type::unknown);
  EXPECT_EQ(schema.lookup(u"trkpt", u"course", v10), tag_type::wpttype_course);
  EXPECT_EQ(schema.lookup(u"trkpt", u"course", v11), tag_type::unknown);

  EXPECT_EQ(schema.lookup(u"wpt", u"link", v11), tag_type::wpttype_link);
  EXPECT_EQ(schema.lookup(u"wpt", u"link", v10), tag_type::unknown);
  EXPECT_EQ(schema.lookup(u"wpt", u"url", v10), tag_type::wpttype_url);
  EXPECT_EQ(schema.lookup(u"wpt", u"url", v11), tag_type::unknown);

  EXPECT_EQ(schema.lookup(u"gpx", u"metadata", v11), tag_type::gpx_metadata);
  EXPECT_EQ(schema.lookup(u"gpx", u"metadata", v10), tag_type::unknown);
  EXPECT_EQ(schema.lookup(u"gpx", u"author", v10), tag_type::gpx_author);
  EXPECT_EQ(schema.lookup(u"gpx", u"author", v11), tag_type::unknown);

  EXPECT_EQ(schema.lookup(u"trk", u"type", v11), tag_type::trk_type);
  EXPECT_EQ(schema.lookup(u"trk", u"type", v10), tag_type::unknown);
}

TEST(GpxSchema, UnknownPairs)
{
  const GpxSchema& schema = GpxSchema::instance();
  EXPECT_EQ(schema.lookup(u"trk", u"bogus", v11), tag_type::unknown);
  EXPECT_EQ(schema.lookup(u"rte", u"trkseg", v11), tag_type::unknown);
  EXPECT_EQ(schema.lookup(u"trk", u"rtept", v11), tag_type::unknown);
  EXPECT_EQ(schema.lookup(u"bogus", u"name", v11), tag_type::unknown);
  // element names are case sensitive
  EXPECT_EQ(schema.lookup(u"trk", u"Name", v11), tag_type::unknown);
}

TEST(GpxSchema, ExtensionPoints)
{
  const GpxSchema& schema = GpxSchema::instance();
  for (const char16_t* parent : {u"gpx", u"metadata", u"wpt", u"trkpt", u"rtept", u"rte", u"trk", u"trkseg"}) {
    EXPECT_TRUE(schema.has_extensions(parent, v11)) << QString::fromUtf16(parent).toStdString();
    EXPECT_TRUE(schema.has_extensions(parent, v10)) << QString::fromUtf16(parent).toStdString();
  }
  for (const char16_t* parent : {u"link", u"author", u"email", u"copyright", u"bounds"}) {
    EXPECT_FALSE(schema.has_extensions(parent, v11)) << QString::fromUtf16(parent).toStdString();
  }
}

TEST(GpxSchema, WriterQueries)
{
  const GpxSchema& schema = GpxSchema::instance();
  EXPECT_TRUE(schema.allows(tag_type::wpttype_speed, v10));
  EXPECT_FALSE(schema.allows(tag_type::wpttype_speed, v11));
  EXPECT_TRUE(schema.allows(tag_type::gpx_metadata, v11));
  EXPECT_FALSE(schema.allows(tag_type::gpx_metadata, v10));
  EXPECT_TRUE(schema.allows(tag_type::gpx_url, v10));
  EXPECT_FALSE(schema.allows(tag_type::unknown, v10));
  EXPECT_FALSE(schema.allows(tag_type::unknown, v11));

  EXPECT_EQ(schema.tag_name(tag_type::wpttype_geoidheight), QStringLiteral("geoidheight"));
  EXPECT_EQ(schema.tag_name(tag_type::rte_rtept), QStringLiteral("rtept"));
  EXPECT_EQ(schema.tag_name(tag_type::trkseg_trkpt), QStringLiteral("trkpt"));
  EXPECT_EQ(schema.tag_name(tag_type::gpx_urlname), QStringLiteral("urlname"));
  EXPECT_EQ(schema.tag_name(tag_type::copyright_license), QStringLiteral("license"));
  EXPECT_TRUE(schema.tag_name(tag_type::unknown).isEmpty());
}

} // namespace
} // namespace gpxio
