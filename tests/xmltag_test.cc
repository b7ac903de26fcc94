/*
    Tests for captured XML element trees.

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

#include <QString>                    // for QString, QStringLiteral
#include <QXmlStreamAttributes>       // for QXmlStreamAttributes

#include <gtest/gtest.h>

#include "src/core/xmltag.h"

namespace gpxio
{
namespace
{

XmlTag make_tag(const QString& name, const QString& cdata = QString())
{
  XmlTag tag;
  tag.tagname = name;
  tag.cdata = cdata;
  return tag;
}

XmlTag make_tree()
{
  XmlTag root = make_tag(QStringLiteral("gpxtpx:TrackPointExtension"));
  root.attributes.append(QStringLiteral("version"), QStringLiteral("1"));
  XmlTag hr = make_tag(QStringLiteral("gpxtpx:hr"), QStringLiteral("171"));
  XmlTag nested = make_tag(QStringLiteral("gpxtpx:sensor"));
  nested.children.push_back(make_tag(QStringLiteral("gpxtpx:cad"), QStringLiteral("80")));
  root.children.push_back(hr);
  root.children.push_back(nested);
  root.children.push_back(make_tag(QStringLiteral("gpxtpx:cad"), QStringLiteral("90")));
  return root;
}

TEST(XmlTag, FindFirstIsDepthFirst)
{
  const XmlTag root = make_tree();
  EXPECT_EQ(root.xml_findfirst(u"gpxtpx:TrackPointExtension"), &root);

  const XmlTag* cad = root.xml_findfirst(u"gpxtpx:cad");
  ASSERT_NE(cad, nullptr);
  EXPECT_EQ(cad->cdata, QStringLiteral("80"));

  EXPECT_EQ(root.xml_findfirst(u"gpxtpx:missing"), nullptr);
}

TEST(XmlTag, FindFirstIgnoresCase)
{
  const XmlTag root = make_tree();
  const XmlTag* hr = root.xml_findfirst(u"GPXTPX:HR");
  ASSERT_NE(hr, nullptr);
  EXPECT_EQ(hr->cdata, QStringLiteral("171"));
}

TEST(XmlTag, Attributes)
{
  const XmlTag root = make_tree();
  EXPECT_EQ(root.xml_attribute(u"version"), QStringLiteral("1"));
  EXPECT_EQ(root.xml_attribute(u"VERSION"), QStringLiteral("1"));
  EXPECT_TRUE(root.xml_attribute(u"missing").isNull());
}

TEST(XmlTag, Equality)
{
  const XmlTag a = make_tree();
  XmlTag b = make_tree();
  EXPECT_TRUE(a == b);

  b.children.back().parentcdata = QStringLiteral("tail");
  EXPECT_TRUE(a != b);

  b = make_tree();
  b.children.front().cdata = QStringLiteral("172");
  EXPECT_FALSE(a == b);

  b = make_tree();
  b.namespaceUri = QStringLiteral("urn:x");
  EXPECT_FALSE(a == b);
}

} // namespace
} // namespace gpxio
