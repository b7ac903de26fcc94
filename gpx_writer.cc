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

#include "gpx_writer.h"

#include <cmath>                            // for isfinite
#include <optional>                         // for optional

#include <QIODevice>                        // for QIODevice
#include <QLatin1String>                    // for QLatin1String
#include <QString>                          // for QString, QStringLiteral
#include <QXmlStreamAttribute>              // for QXmlStreamAttribute
#include <QXmlStreamNamespaceDeclaration>   // for QXmlStreamNamespaceDeclaration

#include "gpx_error.h"                      // for Error
#include "src/core/logging.h"               // for gbDebug

namespace gpxio
{

namespace
{

QString fix_string(fix_type fix)
{
  switch (fix) {
  case fix_none:
    return QStringLiteral("none");
  case fix_2d:
    return QStringLiteral("2d");
  case fix_3d:
    return QStringLiteral("3d");
  case fix_dgps:
    return QStringLiteral("dgps");
  case fix_pps:
    return QStringLiteral("pps");
  }
  return QString();
}

// xsd:decimal has no NaN or INF.
QString decimal_string(const QString& name, double value)
{
  if (!std::isfinite(value)) {
    throw Error::invalidValue(name, XmlStreamWriter::formatNumber(value));
  }
  return XmlStreamWriter::formatNumber(value);
}

} // namespace

GpxWriter::GpxWriter(QIODevice* output, const WriterOptions& writer_options)
  : device(output),
    options(writer_options),
    writer(output),
    schema(GpxSchema::instance())
{
}

void GpxWriter::write(const Gpx& gpx)
{
  if (device == nullptr || !device->isWritable()) {
    throw Error::sinkFailure(QStringLiteral("output device is not open for writing"));
  }

  version = options.version.value_or(gpx.version());

  writer.setAutoFormatting(options.auto_formatting);
  writer.setAutoFormattingIndent(options.indent);
  writer.writeStartDocument();

  writer.writeStartElement(QStringLiteral("gpx"));
  writer.writeAttribute(QStringLiteral("version"), version_string(version));
  if (gpx.creator) {
    writer.writeAttribute(QStringLiteral("creator"), *gpx.creator);
  } else if (!options.creator.isEmpty()) {
    writer.writeAttribute(QStringLiteral("creator"), options.creator);
  }
  writer.writeAttribute(QStringLiteral("xmlns"), version_namespace(version));
  writer.writeAttribute(QStringLiteral("xmlns:xsi"),
                        QStringLiteral("http://www.w3.org/2001/XMLSchema-instance"));
  writer.writeAttribute(QStringLiteral("xsi:schemaLocation"), version_schema_location(version));
  for (const auto& n : gpx.namespaces) {
    if (n.prefix().isEmpty() || n.prefix() == QLatin1String("xsi")) {
      continue;
    }
    writer.writeAttribute(QStringLiteral("xmlns:") + n.prefix().toString(),
                          n.namespaceUri().toString());
  }

  if (gpx.metadata) {
    if (allowed(tag_type::gpx_metadata)) {
      write_metadata(*gpx.metadata);
    } else {
      write_legacy_metadata(*gpx.metadata);
    }
  }
  for (const auto& wpt : gpx.waypoints) {
    write_waypoint(QStringLiteral("wpt"), wpt);
  }
  check_sink();
  for (const auto& rte : gpx.routes) {
    write_route(rte);
  }
  check_sink();
  for (const auto& trk : gpx.tracks) {
    write_track(trk);
  }
  write_extensions(gpx.extensions);

  writer.writeEndElement();
  writer.writeEndDocument();
  check_sink();

  gbDebug(1, options.debug_level) << "GPX: wrote version " << version_string(version)
                                  << ": " << gpx.waypoints.size() << " waypoints, "
                                  << gpx.routes.size() << " routes, "
                                  << gpx.tracks.size() << " tracks.";
}

bool GpxWriter::allowed(tag_type type) const
{
  return schema.allows(type, version);
}

void GpxWriter::write_text(tag_type type, const std::optional<QString>& text)
{
  if (allowed(type)) {
    writer.writeOptionalTextElement(schema.tag_name(type), text);
  }
}

void GpxWriter::write_number(tag_type type, const std::optional<double>& value)
{
  if (value && allowed(type)) {
    const QString name = schema.tag_name(type);
    writer.writeTextElement(name, decimal_string(name, *value));
  }
}

void GpxWriter::write_uint(tag_type type, const std::optional<unsigned int>& value, unsigned int max)
{
  if (value && allowed(type)) {
    if (*value > max) {
      throw Error::invalidValue(schema.tag_name(type), QString::number(*value));
    }
    writer.writeTextElement(schema.tag_name(type), QString::number(*value));
  }
}

void GpxWriter::write_time(tag_type type, const std::optional<DateTime>& time)
{
  if (time && allowed(type)) {
    writer.writeTextElement(schema.tag_name(type), time->toPrettyString());
  }
}

/*
 * Handle the grossness of GPX 1.0 vs. 1.1 handling of linky links.
 * 1.0 has room for a single url/urlname pair.
 */
void GpxWriter::write_links(const QList<Link>& links, tag_type link_type,
                            tag_type url_type, tag_type urlname_type)
{
  if (allowed(link_type)) {
    for (const auto& link : links) {
      write_link(schema.tag_name(link_type), link);
    }
  } else if (allowed(url_type) && !links.isEmpty()) {
    const Link& link = links.first();
    writer.writeTextElement(schema.tag_name(url_type), link.href);
    write_text(urlname_type, link.text);
  }
}

void GpxWriter::write_link(const QString& tagname, const Link& link)
{
  writer.writeStartElement(tagname);
  writer.writeAttribute(QStringLiteral("href"), link.href);
  write_text(tag_type::link_text, link.text);
  write_text(tag_type::link_type, link.type);
  writer.writeEndElement();
}

/*
 * GPX 1.0 has no <metadata>, its fields sit directly on the root.
 */
void GpxWriter::write_legacy_metadata(const Metadata& metadata)
{
  write_text(tag_type::gpx_name, metadata.name);
  write_text(tag_type::gpx_desc, metadata.description);
  if (metadata.author) {
    write_text(tag_type::gpx_author, metadata.author->name);
    write_text(tag_type::gpx_email, metadata.author->email);
  }
  write_links(metadata.links, tag_type::metadata_link, tag_type::gpx_url, tag_type::gpx_urlname);
  write_time(tag_type::gpx_time, metadata.time);
  write_text(tag_type::gpx_keywords, metadata.keywords);
  if (metadata.bounds && allowed(tag_type::gpx_bounds)) {
    write_bounds(*metadata.bounds);
  }
}

void GpxWriter::write_metadata(const Metadata& metadata)
{
  writer.writeStartElement(QStringLiteral("metadata"));
  write_text(tag_type::metadata_name, metadata.name);
  write_text(tag_type::metadata_desc, metadata.description);
  if (metadata.author && allowed(tag_type::metadata_author)) {
    write_person(*metadata.author);
  }
  if (metadata.copyright && allowed(tag_type::metadata_copyright)) {
    write_copyright(*metadata.copyright);
  }
  write_links(metadata.links, tag_type::metadata_link, tag_type::unknown, tag_type::unknown);
  write_time(tag_type::metadata_time, metadata.time);
  write_text(tag_type::metadata_keywords, metadata.keywords);
  if (metadata.bounds && allowed(tag_type::metadata_bounds)) {
    write_bounds(*metadata.bounds);
  }
  write_extensions(metadata.extensions);
  writer.writeEndElement();
}

void GpxWriter::write_person(const Person& person)
{
  writer.writeStartElement(QStringLiteral("author"));
  write_text(tag_type::person_name, person.name);
  if (person.email && allowed(tag_type::person_email)) {
    write_email(*person.email);
  }
  if (person.link && allowed(tag_type::person_link)) {
    write_link(schema.tag_name(tag_type::person_link), *person.link);
  }
  writer.writeEndElement();
}

void GpxWriter::write_email(const QString& email)
{
  const auto at = email.lastIndexOf(QLatin1Char('@'));
  if (at < 0) {
    throw Error::invalidValue(QStringLiteral("email"), email);
  }
  writer.writeStartElement(QStringLiteral("email"));
  writer.writeAttribute(QStringLiteral("id"), email.left(at));
  writer.writeAttribute(QStringLiteral("domain"), email.mid(at + 1));
  writer.writeEndElement();
}

void GpxWriter::write_copyright(const Copyright& copyright)
{
  writer.writeStartElement(QStringLiteral("copyright"));
  writer.writeAttribute(QStringLiteral("author"), copyright.author);
  if (copyright.year && allowed(tag_type::copyright_year)) {
    writer.writeTextElement(schema.tag_name(tag_type::copyright_year), QString::number(*copyright.year));
  }
  write_text(tag_type::copyright_license, copyright.license);
  writer.writeEndElement();
}

void GpxWriter::write_bounds(const Bounds& bounds)
{
  writer.writeStartElement(QStringLiteral("bounds"));
  writer.writeAttribute(QStringLiteral("minlat"), decimal_string(QStringLiteral("minlat"), bounds.min_lat));
  writer.writeAttribute(QStringLiteral("minlon"), decimal_string(QStringLiteral("minlon"), bounds.min_lon));
  writer.writeAttribute(QStringLiteral("maxlat"), decimal_string(QStringLiteral("maxlat"), bounds.max_lat));
  writer.writeAttribute(QStringLiteral("maxlon"), decimal_string(QStringLiteral("maxlon"), bounds.max_lon));
  writer.writeEndElement();
}

void GpxWriter::write_waypoint(const QString& tagname, const Waypoint& wpt)
{
  writer.writeStartElement(tagname);
  writer.writeAttribute(QStringLiteral("lat"), decimal_string(QStringLiteral("lat"), wpt.latitude));
  writer.writeAttribute(QStringLiteral("lon"), decimal_string(QStringLiteral("lon"), wpt.longitude));

  write_number(tag_type::wpttype_ele, wpt.elevation);
  write_time(tag_type::wpttype_time, wpt.time);
  write_number(tag_type::wpttype_course, wpt.course);
  write_number(tag_type::wpttype_speed, wpt.speed);
  write_number(tag_type::wpttype_magvar, wpt.magnetic_variation);
  write_number(tag_type::wpttype_geoidheight, wpt.geoid_height);
  write_text(tag_type::wpttype_name, wpt.name);
  write_text(tag_type::wpttype_cmt, wpt.comment);
  write_text(tag_type::wpttype_desc, wpt.description);
  write_text(tag_type::wpttype_src, wpt.source);
  write_links(wpt.links, tag_type::wpttype_link, tag_type::wpttype_url, tag_type::wpttype_urlname);
  write_text(tag_type::wpttype_sym, wpt.symbol);
  write_text(tag_type::wpttype_type, wpt.type);
  if (wpt.fix && allowed(tag_type::wpttype_fix)) {
    writer.writeTextElement(schema.tag_name(tag_type::wpttype_fix), fix_string(*wpt.fix));
  }
  write_uint(tag_type::wpttype_sat, wpt.satellites);
  write_number(tag_type::wpttype_hdop, wpt.hdop);
  write_number(tag_type::wpttype_vdop, wpt.vdop);
  write_number(tag_type::wpttype_pdop, wpt.pdop);
  write_number(tag_type::wpttype_ageofdgpsdata, wpt.age_of_dgps_data);
  write_uint(tag_type::wpttype_dgpsid, wpt.dgps_id, 1023);
  write_extensions(wpt.extensions);
  writer.writeEndElement();
}

void GpxWriter::write_route(const Route& rte)
{
  writer.writeStartElement(QStringLiteral("rte"));
  write_text(tag_type::rte_name, rte.name);
  write_text(tag_type::rte_cmt, rte.comment);
  write_text(tag_type::rte_desc, rte.description);
  write_text(tag_type::rte_src, rte.source);
  write_links(rte.links, tag_type::rte_link, tag_type::rte_url, tag_type::rte_urlname);
  write_uint(tag_type::rte_number, rte.number);
  write_text(tag_type::rte_type, rte.type);
  // 1.1 puts extensions ahead of the points, 1.0 takes foreign content last.
  if (version == GpxVersion::gpx_1_1) {
    write_extensions(rte.extensions);
  }
  for (const auto& wpt : rte.points) {
    write_waypoint(schema.tag_name(tag_type::rte_rtept), wpt);
  }
  if (version == GpxVersion::gpx_1_0) {
    write_extensions(rte.extensions);
  }
  writer.writeEndElement();
}

void GpxWriter::write_track(const Track& trk)
{
  writer.writeStartElement(QStringLiteral("trk"));
  write_text(tag_type::trk_name, trk.name);
  write_text(tag_type::trk_cmt, trk.comment);
  write_text(tag_type::trk_desc, trk.description);
  write_text(tag_type::trk_src, trk.source);
  write_links(trk.links, tag_type::trk_link, tag_type::trk_url, tag_type::trk_urlname);
  write_uint(tag_type::trk_number, trk.number);
  write_text(tag_type::trk_type, trk.type);
  if (version == GpxVersion::gpx_1_1) {
    write_extensions(trk.extensions);
  }
  for (const auto& seg : trk.segments) {
    write_trackseg(seg);
  }
  if (version == GpxVersion::gpx_1_0) {
    write_extensions(trk.extensions);
  }
  writer.writeEndElement();
}

void GpxWriter::write_trackseg(const TrackSegment& seg)
{
  writer.writeStartElement(schema.tag_name(tag_type::trk_trkseg));
  for (const auto& wpt : seg.points) {
    write_waypoint(schema.tag_name(tag_type::trkseg_trkpt), wpt);
  }
  write_extensions(seg.extensions);
  writer.writeEndElement();
}

void GpxWriter::write_extensions(const std::optional<Extensions>& extensions)
{
  if (!extensions) {
    return;
  }
  writer.writeStartElement(QStringLiteral("extensions"));
  if (!extensions->cdata.isEmpty()) {
    writer.writeCharacters(extensions->cdata);
  }
  for (const auto& tag : extensions->tags) {
    fprint_xml_chain(tag);
  }
  writer.writeEndElement();
}

void GpxWriter::fprint_xml_chain(const XmlTag& tag)
{
  writer.writeStartElement(tag.tagname);
  for (const auto& n : tag.namespaceDeclarations) {
    const QString prefix = n.prefix().isEmpty() ? QStringLiteral("xmlns")
                           : QStringLiteral("xmlns:") + n.prefix().toString();
    writer.writeAttribute(prefix, n.namespaceUri().toString());
  }
  for (const auto& attribute : tag.attributes) {
    writer.writeAttribute(attribute.qualifiedName().toString(), attribute.value().toString());
  }
  if (!tag.cdata.isEmpty()) {
    writer.writeCharacters(tag.cdata);
  }
  for (const auto& child : tag.children) {
    fprint_xml_chain(child);
  }
  writer.writeEndElement();
  if (!tag.parentcdata.isEmpty()) {
    writer.writeCharacters(tag.parentcdata);
  }
}

void GpxWriter::check_sink() const
{
  if (writer.hasError()) {
    throw Error::sinkFailure(device->errorString());
  }
}

} // namespace gpxio
