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

#include "gpx_reader.h"

#include <climits>                          // for UINT_MAX
#include <cmath>                            // for isfinite
#include <optional>                         // for optional
#include <utility>                          // for as_const
#include <vector>                           // for vector

#include <QLatin1String>                    // for QLatin1String
#include <QString>                          // for QString, QStringLiteral
#include <QStringView>                      // for QStringView
#include <QVersionNumber>                   // for QVersionNumber
#include <QXmlStreamAttributes>             // for QXmlStreamAttributes
#include <QXmlStreamNamespaceDeclaration>   // for QXmlStreamNamespaceDeclaration
#include <QXmlStreamReader>                 // for QXmlStreamReader, QXmlStreamReader::Characters, QXmlStreamReader::EndElement, QXmlStreamReader::Invalid, QXmlStreamReader::StartElement

#include "gpx_error.h"                      // for Error
#include "src/core/logging.h"               // for Warning, gbDebug, DebugIndent

namespace gpxio
{

namespace
{

const QVersionNumber gpx_1_0 = QVersionNumber(1, 0).normalized();
const QVersionNumber gpx_1_1 = QVersionNumber(1, 1).normalized();

bool is_gpx_namespace(QStringView uri)
{
  return uri.isEmpty() || uri.startsWith(QLatin1String("http://www.topografix.com/GPX/"));
}

Metadata& legacy_metadata(Gpx& gpx)
{
  if (!gpx.metadata) {
    gpx.metadata.emplace();
  }
  return *gpx.metadata;
}

Person& legacy_author(Gpx& gpx)
{
  Metadata& metadata = legacy_metadata(gpx);
  if (!metadata.author) {
    metadata.author.emplace();
  }
  return *metadata.author;
}

/*
 * Handle the grossness of GPX 1.0 links, a url and an optional urlname
 * that may appear in either order.  Without a url there is no link.
 */
void add_legacy_link(QList<Link>& links, const std::optional<QString>& url,
                     const std::optional<QString>& urlname)
{
  if (url) {
    Link link(*url);
    link.text = urlname;
    links.append(link);
  }
}

} // namespace

GpxReader::GpxReader(QXmlStreamReader* xml_reader, const ReaderOptions& reader_options)
  : reader(xml_reader),
    options(reader_options),
    schema(GpxSchema::instance())
{
}

/*
 * The one generic dispatch loop.  Each child start tag is looked up in
 * the schema for (parent, child, version): extension content is captured
 * here, anything unknown is rejected, everything else goes to handle.
 */
template<typename Handler>
void GpxReader::parse_children(QStringView parent, std::optional<Extensions>* extensions, Handler handle)
{
  while (!reader->atEnd()) {
    switch (reader->readNext()) {
    case QXmlStreamReader::StartElement: {
      gbDebug(2, options.debug_level) << DebugIndent(depth) << "<" << reader->qualifiedName() << ">";
      ++depth;
      if (!is_gpx_namespace(reader->namespaceUri())) {
        // GPX 1.0 allows elements from other namespaces where 1.1 has <extensions>.
        if (extensions && version == GpxVersion::gpx_1_0 && schema.has_extensions(parent, version)) {
          capture_foreign(extensions);
        } else {
          throw Error::invalidChildElement(reader->qualifiedName().toString(), parent.toString());
        }
      } else {
        note_namespaces();
        const tag_type type = schema.lookup(parent, reader->name(), version);
        if (type == tag_type::unknown) {
          throw Error::invalidChildElement(reader->qualifiedName().toString(), parent.toString());
        }
        if (type == tag_type::extensions) {
          if (extensions) {
            parse_extensions(extensions);
          } else {
            reader->skipCurrentElement();
          }
        } else {
          handle(type);
        }
      }
      --depth;
      break;
    }
    case QXmlStreamReader::EndElement:
      return;
    case QXmlStreamReader::Invalid:
      throw_reader_error();
    default:
      // whitespace, comments and processing instructions.
      break;
    }
  }
  throw_reader_error();
}

Gpx GpxReader::read()
{
  while (!reader->atEnd()) {
    switch (reader->readNext()) {
    case QXmlStreamReader::StartElement: {
      if (reader->name() != QLatin1String("gpx")) {
        throw Error::invalidChildElement(reader->qualifiedName().toString(), QStringLiteral("#document"));
      }
      const QXmlStreamAttributes attr = reader->attributes();
      version = select_version(attr);
      Gpx gpx(version);
      if (attr.hasAttribute(QLatin1String("creator"))) {
        gpx.creator = attr.value(QLatin1String("creator")).toString();
      }
      note_namespaces();
      parse_gpx(gpx);
      gpx.namespaces = namespaces;

      gbDebug(1, options.debug_level) << "GPX: read version " << version_string(version)
                                      << ": " << gpx.waypoints.size() << " waypoints, "
                                      << gpx.routes.size() << " routes, "
                                      << gpx.tracks.size() << " tracks.";
      // Anything after the root element is ignored.
      return gpx;
    }
    case QXmlStreamReader::Invalid:
      throw_reader_error();
    default:
      // prolog: declaration, DTD, comments.
      break;
    }
  }
  throw_reader_error();
}

GpxVersion GpxReader::select_version(const QXmlStreamAttributes& attr) const
{
  const QString text = attr.value(QLatin1String("version")).toString();
  const QVersionNumber number = QVersionNumber::fromString(text).normalized();
  if (number == gpx_1_0) {
    return GpxVersion::gpx_1_0;
  }
  if (number == gpx_1_1) {
    return GpxVersion::gpx_1_1;
  }
  if (options.reject_unknown_version) {
    throw Error::invalidValue(QStringLiteral("version"), text);
  }
  Warning() << "GPX: unrecognized version" << text << "read as"
            << version_string(options.fallback_version);
  return options.fallback_version;
}

void GpxReader::parse_gpx(Gpx& gpx)
{
  std::optional<QString> url;
  std::optional<QString> urlname;

  parse_children(u"gpx", &gpx.extensions, [&](tag_type type) {
    switch (type) {
    case tag_type::gpx_metadata:
      gpx.metadata = parse_metadata();
      break;
    case tag_type::gpx_wpt:
      gpx.waypoints.append(parse_waypoint());
      break;
    case tag_type::gpx_rte:
      gpx.routes.append(parse_route());
      break;
    case tag_type::gpx_trk:
      gpx.tracks.append(parse_track());
      break;
    /* GPX 1.0 keeps the document description on the root. */
    case tag_type::gpx_name:
      legacy_metadata(gpx).name = read_text();
      break;
    case tag_type::gpx_desc:
      legacy_metadata(gpx).description = read_text();
      break;
    case tag_type::gpx_author:
      legacy_author(gpx).name = read_text();
      break;
    case tag_type::gpx_email:
      legacy_author(gpx).email = read_text();
      break;
    case tag_type::gpx_url:
      url = read_text();
      break;
    case tag_type::gpx_urlname:
      urlname = read_text();
      break;
    case tag_type::gpx_time:
      legacy_metadata(gpx).time = read_time();
      break;
    case tag_type::gpx_keywords:
      legacy_metadata(gpx).keywords = read_text();
      break;
    case tag_type::gpx_bounds:
      legacy_metadata(gpx).bounds = parse_bounds();
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });

  if (url) {
    add_legacy_link(legacy_metadata(gpx).links, url, urlname);
  }
}

Metadata GpxReader::parse_metadata()
{
  Metadata metadata;
  parse_children(u"metadata", &metadata.extensions, [&](tag_type type) {
    switch (type) {
    case tag_type::metadata_name:
      metadata.name = read_text();
      break;
    case tag_type::metadata_desc:
      metadata.description = read_text();
      break;
    case tag_type::metadata_author:
      metadata.author = parse_person();
      break;
    case tag_type::metadata_copyright:
      metadata.copyright = parse_copyright();
      break;
    case tag_type::metadata_link:
      metadata.links.append(parse_link());
      break;
    case tag_type::metadata_time:
      metadata.time = read_time();
      break;
    case tag_type::metadata_keywords:
      metadata.keywords = read_text();
      break;
    case tag_type::metadata_bounds:
      metadata.bounds = parse_bounds();
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });
  return metadata;
}

Person GpxReader::parse_person()
{
  Person person;
  parse_children(reader->name().toString(), nullptr, [&](tag_type type) {
    switch (type) {
    case tag_type::person_name:
      person.name = read_text();
      break;
    case tag_type::person_email:
      person.email = parse_email();
      break;
    case tag_type::person_link:
      person.link = parse_link();
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });
  return person;
}

// <email id="jane" domain="example.com"/> is kept as jane@example.com.
QString GpxReader::parse_email()
{
  const QXmlStreamAttributes attr = reader->attributes();
  const QString id = attr_string(attr, QStringLiteral("id"));
  const QString domain = attr_string(attr, QStringLiteral("domain"));
  parse_children(u"email", nullptr, [&](tag_type) {
    reader->skipCurrentElement();
  });
  return id + QLatin1Char('@') + domain;
}

Copyright GpxReader::parse_copyright()
{
  Copyright copyright;
  copyright.author = attr_string(reader->attributes(), QStringLiteral("author"));
  parse_children(u"copyright", nullptr, [&](tag_type type) {
    switch (type) {
    case tag_type::copyright_year:
      copyright.year = read_int();
      break;
    case tag_type::copyright_license:
      copyright.license = read_text();
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });
  return copyright;
}

Bounds GpxReader::parse_bounds()
{
  const QXmlStreamAttributes attr = reader->attributes();
  Bounds bounds;
  bounds.min_lat = attr_double(attr, QStringLiteral("minlat"));
  bounds.min_lon = attr_double(attr, QStringLiteral("minlon"));
  bounds.max_lat = attr_double(attr, QStringLiteral("maxlat"));
  bounds.max_lon = attr_double(attr, QStringLiteral("maxlon"));
  parse_children(u"bounds", nullptr, [&](tag_type) {
    reader->skipCurrentElement();
  });
  return bounds;
}

Link GpxReader::parse_link()
{
  Link link(attr_string(reader->attributes(), QStringLiteral("href")));
  parse_children(u"link", nullptr, [&](tag_type type) {
    switch (type) {
    case tag_type::link_text:
      link.text = read_text();
      break;
    case tag_type::link_type:
      link.type = read_text();
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });
  return link;
}

/*
 * <wpt>, <trkpt> and <rtept> share one content model.
 */
Waypoint GpxReader::parse_waypoint()
{
  const QXmlStreamAttributes attr = reader->attributes();
  Waypoint wpt;
  wpt.latitude = attr_double(attr, QStringLiteral("lat"));
  wpt.longitude = attr_double(attr, QStringLiteral("lon"));
  std::optional<QString> url;
  std::optional<QString> urlname;

  parse_children(reader->name().toString(), &wpt.extensions, [&](tag_type type) {
    switch (type) {
    case tag_type::wpttype_ele:
      wpt.elevation = read_double();
      break;
    case tag_type::wpttype_time:
      wpt.time = read_time();
      break;
    case tag_type::wpttype_course:
      wpt.course = read_double();
      break;
    case tag_type::wpttype_speed:
      wpt.speed = read_double();
      break;
    case tag_type::wpttype_magvar:
      wpt.magnetic_variation = read_double();
      break;
    case tag_type::wpttype_geoidheight:
      wpt.geoid_height = read_double();
      break;
    case tag_type::wpttype_name:
      wpt.name = read_text();
      break;
    case tag_type::wpttype_cmt:
      wpt.comment = read_text();
      break;
    case tag_type::wpttype_desc:
      wpt.description = read_text();
      break;
    case tag_type::wpttype_src:
      wpt.source = read_text();
      break;
    case tag_type::wpttype_link:
      wpt.links.append(parse_link());
      break;
    case tag_type::wpttype_url:
      url = read_text();
      break;
    case tag_type::wpttype_urlname:
      urlname = read_text();
      break;
    case tag_type::wpttype_sym:
      wpt.symbol = read_text();
      break;
    case tag_type::wpttype_type:
      wpt.type = read_text();
      break;
    case tag_type::wpttype_fix:
      wpt.fix = read_fix();
      break;
    case tag_type::wpttype_sat:
      wpt.satellites = read_uint(UINT_MAX);
      break;
    case tag_type::wpttype_hdop:
      wpt.hdop = read_double();
      break;
    case tag_type::wpttype_vdop:
      wpt.vdop = read_double();
      break;
    case tag_type::wpttype_pdop:
      wpt.pdop = read_double();
      break;
    case tag_type::wpttype_ageofdgpsdata:
      wpt.age_of_dgps_data = read_double();
      break;
    case tag_type::wpttype_dgpsid:
      wpt.dgps_id = read_uint(1023);
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });

  add_legacy_link(wpt.links, url, urlname);
  return wpt;
}

Route GpxReader::parse_route()
{
  Route rte;
  std::optional<QString> url;
  std::optional<QString> urlname;

  parse_children(u"rte", &rte.extensions, [&](tag_type type) {
    switch (type) {
    case tag_type::rte_name:
      rte.name = read_text();
      break;
    case tag_type::rte_cmt:
      rte.comment = read_text();
      break;
    case tag_type::rte_desc:
      rte.description = read_text();
      break;
    case tag_type::rte_src:
      rte.source = read_text();
      break;
    case tag_type::rte_link:
      rte.links.append(parse_link());
      break;
    case tag_type::rte_url:
      url = read_text();
      break;
    case tag_type::rte_urlname:
      urlname = read_text();
      break;
    case tag_type::rte_number:
      rte.number = read_uint(UINT_MAX);
      break;
    case tag_type::rte_type:
      rte.type = read_text();
      break;
    case tag_type::rte_rtept:
      rte.points.append(parse_waypoint());
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });

  add_legacy_link(rte.links, url, urlname);
  return rte;
}

Track GpxReader::parse_track()
{
  Track trk;
  std::optional<QString> url;
  std::optional<QString> urlname;

  parse_children(u"trk", &trk.extensions, [&](tag_type type) {
    switch (type) {
    case tag_type::trk_name:
      trk.name = read_text();
      break;
    case tag_type::trk_cmt:
      trk.comment = read_text();
      break;
    case tag_type::trk_desc:
      trk.description = read_text();
      break;
    case tag_type::trk_src:
      trk.source = read_text();
      break;
    case tag_type::trk_link:
      trk.links.append(parse_link());
      break;
    case tag_type::trk_url:
      url = read_text();
      break;
    case tag_type::trk_urlname:
      urlname = read_text();
      break;
    case tag_type::trk_number:
      trk.number = read_uint(UINT_MAX);
      break;
    case tag_type::trk_type:
      trk.type = read_text();
      break;
    case tag_type::trk_trkseg:
      trk.segments.append(parse_trackseg());
      break;
    default:
      reader->skipCurrentElement();
      break;
    }
  });

  add_legacy_link(trk.links, url, urlname);
  return trk;
}

TrackSegment GpxReader::parse_trackseg()
{
  TrackSegment seg;
  parse_children(u"trkseg", &seg.extensions, [&](tag_type type) {
    if (type == tag_type::trkseg_trkpt) {
      seg.points.append(parse_waypoint());
    } else {
      reader->skipCurrentElement();
    }
  });
  return seg;
}

/*
 * Extension content is never interpreted, only kept.  Whatever an
 * element already collected, from an earlier <extensions> or from
 * foreign 1.0 elements, is kept ahead of it in document order.
 */
void GpxReader::parse_extensions(std::optional<Extensions>* extensions)
{
  Extensions captured;
  capture_content(captured.cdata, captured.tags, QXmlStreamNamespaceDeclarations());
  if (!*extensions) {
    *extensions = std::move(captured);
    return;
  }
  (*extensions)->cdata += captured.cdata;
  for (auto& tag : captured.tags) {
    (*extensions)->tags.push_back(std::move(tag));
  }
}

/*
 * scope holds the declarations the captured ancestors of this element
 * will carry when written.
 */
XmlTag GpxReader::capture_tag(const QXmlStreamNamespaceDeclarations& scope)
{
  XmlTag tag;
  tag.tagname = reader->qualifiedName().toString();
  // Unprefixed content inherits the default GPX namespace, which follows
  // the version written, so it is kept as having no namespace.
  if (!is_gpx_namespace(reader->namespaceUri())) {
    tag.namespaceUri = reader->namespaceUri().toString();
  }
  tag.attributes = reader->attributes();
  tag.namespaceDeclarations = reader->namespaceDeclarations();

  redeclare(tag, scope, reader->prefix(), reader->namespaceUri());
  for (const auto& attribute : std::as_const(tag.attributes)) {
    redeclare(tag, scope, attribute.prefix(), attribute.namespaceUri());
  }

  QXmlStreamNamespaceDeclarations inner = scope;
  inner.append(tag.namespaceDeclarations);
  capture_content(tag.cdata, tag.children, inner);
  return tag;
}

/*
 * A prefix rebound on a GPX element below the root is not hoisted, so
 * once written under the root's binding it would resolve to another
 * namespace.  Such a binding is declared on the captured tag itself.
 */
void GpxReader::redeclare(XmlTag& tag, const QXmlStreamNamespaceDeclarations& scope,
                          QStringView prefix, QStringView uri) const
{
  if (prefix.isEmpty() || prefix == QLatin1String("xml") || prefix == QLatin1String("xmlns")) {
    return;
  }
  if (written_namespace(tag.namespaceDeclarations, scope, prefix) != uri) {
    tag.namespaceDeclarations.append(QXmlStreamNamespaceDeclaration(prefix.toString(), uri.toString()));
  }
}

// The namespace prefix will resolve to in the written document.
QString GpxReader::written_namespace(const QXmlStreamNamespaceDeclarations& own,
                                     const QXmlStreamNamespaceDeclarations& scope,
                                     QStringView prefix) const
{
  for (const auto* list : {&own, &scope, &namespaces}) {
    for (auto it = list->crbegin(); it != list->crend(); ++it) {
      if (it->prefix() == prefix) {
        return it->namespaceUri().toString();
      }
    }
  }
  // The writer always binds xsi on the root.
  if (prefix == QLatin1String("xsi")) {
    return QStringLiteral("http://www.w3.org/2001/XMLSchema-instance");
  }
  return QString();
}

// Text ahead of the first child goes to cdata, text after a child to its parentcdata.
void GpxReader::capture_content(QString& cdata, std::vector<XmlTag>& children,
                                const QXmlStreamNamespaceDeclarations& scope)
{
  while (!reader->atEnd()) {
    switch (reader->readNext()) {
    case QXmlStreamReader::StartElement:
      children.push_back(capture_tag(scope));
      break;
    case QXmlStreamReader::Characters:
      if (children.empty()) {
        cdata += reader->text();
      } else {
        children.back().parentcdata += reader->text();
      }
      break;
    case QXmlStreamReader::EndElement:
      cdata = cdata.trimmed();
      for (auto& child : children) {
        child.parentcdata = child.parentcdata.trimmed();
      }
      return;
    case QXmlStreamReader::Invalid:
      throw_reader_error();
    default:
      break;
    }
  }
  throw_reader_error();
}

void GpxReader::capture_foreign(std::optional<Extensions>* extensions)
{
  if (!*extensions) {
    extensions->emplace();
  }
  (*extensions)->tags.push_back(capture_tag(QXmlStreamNamespaceDeclarations()));
}

/*
 * Prefixed namespaces declared on GPX elements are hoisted so the
 * writer can declare them once on the root.  The first binding of a
 * prefix wins.
 */
void GpxReader::note_namespaces()
{
  const QXmlStreamNamespaceDeclarations ns = reader->namespaceDeclarations();
  for (const auto& n : ns) {
    if (n.prefix().isEmpty() || n.prefix() == QLatin1String("xsi")) {
      continue;
    }
    bool known = false;
    for (const auto& have : std::as_const(namespaces)) {
      if (have.prefix() == n.prefix()) {
        known = true;
        break;
      }
    }
    if (!known) {
      namespaces.append(n);
    }
  }
}

QString GpxReader::read_text()
{
  const QString field = reader->qualifiedName().toString();
  QString text;
  while (!reader->atEnd()) {
    switch (reader->readNext()) {
    case QXmlStreamReader::Characters:
      text += reader->text();
      break;
    case QXmlStreamReader::StartElement:
      throw Error::invalidChildElement(reader->qualifiedName().toString(), field);
    case QXmlStreamReader::EndElement:
      return text.trimmed();
    case QXmlStreamReader::Invalid:
      throw_reader_error();
    default:
      break;
    }
  }
  throw_reader_error();
}

double GpxReader::read_double()
{
  const QString field = reader->name().toString();
  const QString text = read_text();
  bool ok = false;
  const double value = text.toDouble(&ok);
  if (!ok || !std::isfinite(value)) {
    throw Error::invalidValue(field, text);
  }
  return value;
}

int GpxReader::read_int()
{
  const QString field = reader->name().toString();
  const QString text = read_text();
  bool ok = false;
  const int value = text.toInt(&ok);
  if (!ok) {
    throw Error::invalidValue(field, text);
  }
  return value;
}

unsigned int GpxReader::read_uint(unsigned int max)
{
  const QString field = reader->name().toString();
  const QString text = read_text();
  bool ok = false;
  const unsigned int value = text.toUInt(&ok);
  if (!ok || value > max) {
    throw Error::invalidValue(field, text);
  }
  return value;
}

DateTime GpxReader::read_time()
{
  const QString field = reader->name().toString();
  const QString text = read_text();
  const std::optional<DateTime> time = xml_parse_time(text);
  if (!time) {
    throw Error::invalidValue(field, text);
  }
  return *time;
}

fix_type GpxReader::read_fix()
{
  const QString field = reader->name().toString();
  const QString text = read_text();
  if (text == QLatin1String("none")) {
    return fix_none;
  } else if (text == QLatin1String("2d")) {
    return fix_2d;
  } else if (text == QLatin1String("3d")) {
    return fix_3d;
  } else if (text == QLatin1String("dgps")) {
    return fix_dgps;
  } else if (text == QLatin1String("pps")) {
    return fix_pps;
  }
  throw Error::invalidValue(field, text);
}

QString GpxReader::attr_string(const QXmlStreamAttributes& attr, const QString& name) const
{
  if (!attr.hasAttribute(name)) {
    throw Error::missingAttribute(name, reader->qualifiedName().toString());
  }
  return attr.value(name).toString();
}

double GpxReader::attr_double(const QXmlStreamAttributes& attr, const QString& name) const
{
  const QString text = attr_string(attr, name).trimmed();
  bool ok = false;
  const double value = text.toDouble(&ok);
  if (!ok || !std::isfinite(value)) {
    throw Error::invalidValue(name, text);
  }
  return value;
}

void GpxReader::throw_reader_error() const
{
  if (reader->hasError()) {
    throw Error::malformedXml(reader->errorString(), reader->lineNumber(), reader->columnNumber());
  }
  throw Error::malformedXml(QStringLiteral("unexpected end of document"),
                            reader->lineNumber(), reader->columnNumber());
}

} // namespace gpxio
