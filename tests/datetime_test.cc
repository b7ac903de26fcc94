/*
    Tests for the xsd:dateTime parser.

    Copyright (C) 2012, 2013 Robert Lipe, robertlipe@gpsbabel.org

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
    Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA 02111 USA

 */

#include <optional>             // for optional

#include <QDate>                // for QDate
#include <QString>              // for QString, QStringLiteral
#include <QTime>                // for QTime
#include <QTimeZone>            // for QTimeZone

#include <gtest/gtest.h>

#include "src/core/datetime.h"

namespace gpxio
{
namespace
{

TEST(XmlParseTime, Utc)
{
  const auto dt = xml_parse_time(u"2009-10-17T18:37:26Z");
  ASSERT_TRUE(dt.has_value());
  EXPECT_EQ(dt->date(), QDate(2009, 10, 17));
  EXPECT_EQ(dt->time(), QTime(18, 37, 26));
  EXPECT_EQ(dt->offsetFromUtc(), 0);
}

TEST(XmlParseTime, NoZoneIsUtc)
{
  const auto dt = xml_parse_time(u"2009-10-17T18:37:26");
  ASSERT_TRUE(dt.has_value());
  EXPECT_EQ(*dt, DateTime(QDate(2009, 10, 17), QTime(18, 37, 26)));
}

TEST(XmlParseTime, Offsets)
{
  const DateTime expected(QDate(2009, 10, 17), QTime(18, 37, 26));
  EXPECT_EQ(xml_parse_time(u"2009-10-17T20:37:26+02:00"), expected);
  EXPECT_EQ(xml_parse_time(u"2009-10-17T13:07:26-05:30"), expected);
  EXPECT_EQ(xml_parse_time(u"2009-10-18T00:37:26+06:00"), expected);
  EXPECT_EQ(xml_parse_time(u"2009-10-17T18:37:26+00:00"), expected);
}

TEST(XmlParseTime, FractionalSeconds)
{
  auto dt = xml_parse_time(u"2009-10-17T18:37:26.250Z");
  ASSERT_TRUE(dt.has_value());
  EXPECT_EQ(dt->time().msec(), 250);

  dt = xml_parse_time(u"2009-10-17T18:37:26.5Z");
  ASSERT_TRUE(dt.has_value());
  EXPECT_EQ(dt->time().msec(), 500);

  // kept to the millisecond
  dt = xml_parse_time(u"2009-10-17T18:37:26.1234Z");
  ASSERT_TRUE(dt.has_value());
  EXPECT_EQ(dt->time().msec(), 123);

  dt = xml_parse_time(u"2009-10-17T18:37:26.9996Z");
  ASSERT_TRUE(dt.has_value());
  EXPECT_EQ(*dt, DateTime(QDate(2009, 10, 17), QTime(18, 37, 27)));
}

TEST(XmlParseTime, SurroundingWhitespace)
{
  EXPECT_TRUE(xml_parse_time(u"  2009-10-17T18:37:26Z\n").has_value());
}

TEST(XmlParseTime, Rejected)
{
  EXPECT_FALSE(xml_parse_time(u"").has_value());
  EXPECT_FALSE(xml_parse_time(u"2001-10-26").has_value());
  EXPECT_FALSE(xml_parse_time(u"2001-10-26T21:32").has_value());
  EXPECT_FALSE(xml_parse_time(u"2001-10-26T25:32:52Z").has_value());
  EXPECT_FALSE(xml_parse_time(u"2001-02-30T12:00:00Z").has_value());
  EXPECT_FALSE(xml_parse_time(u"2001-10-26 21:32:52Z").has_value());
  EXPECT_FALSE(xml_parse_time(u"2001-10-26T21:32:52+24:00").has_value());
  EXPECT_FALSE(xml_parse_time(u"2001-10-26T21:32:52+0200").has_value());
  EXPECT_FALSE(xml_parse_time(u"yesterday").has_value());
}

TEST(DateTime, PrettyString)
{
  EXPECT_EQ(DateTime(QDate(2009, 10, 17), QTime(18, 37, 26)).toPrettyString(),
            QStringLiteral("2009-10-17T18:37:26Z"));
  EXPECT_EQ(DateTime(QDate(2009, 10, 17), QTime(18, 37, 26, 7)).toPrettyString(),
            QStringLiteral("2009-10-17T18:37:26.007Z"));

  // always written in UTC
  const QDateTime offset(QDate(2009, 10, 17), QTime(20, 37, 26), QTimeZone(7200));
  EXPECT_EQ(DateTime(offset).toPrettyString(), QStringLiteral("2009-10-17T18:37:26Z"));
}

} // namespace
} // namespace gpxio
