/*
    Access GPX data files.

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
#ifndef GPX_H_INCLUDED_
#define GPX_H_INCLUDED_

#include <optional>                    // for optional

#include <QByteArray>                  // for QByteArray
#include <QIODevice>                   // for QIODevice
#include <QString>                     // for QString

#include "gpx_error.h"                 // for Error
#include "gpx_types.h"                 // for Gpx, GpxVersion

namespace gpxio
{

struct ReaderOptions {
  // Used when the root version attribute is missing or isn't 1.0 or 1.1.
  GpxVersion fallback_version{GpxVersion::gpx_1_1};
  // Throw instead of falling back.
  bool reject_unknown_version{false};
  int debug_level{0};
};

struct WriterOptions {
  // Target version, the document's own version if not set.
  std::optional<GpxVersion> version;
  // Written when the document has no creator.  Empty means none.
  QString creator;
  bool auto_formatting{true};
  int indent{2};
  int debug_level{0};
};

/*
 * Read a complete GPX document.  Throws Error on any failure.
 */
Gpx read(QIODevice* device, const ReaderOptions& options = ReaderOptions());
Gpx read(const QByteArray& data, const ReaderOptions& options = ReaderOptions());

/*
 * Write gpx as UTF-8 XML.  Fields the target version can't carry are
 * dropped silently.  Throws Error on any failure.
 */
void write(const Gpx& gpx, QIODevice* device, const WriterOptions& options = WriterOptions());
QByteArray write(const Gpx& gpx, const WriterOptions& options = WriterOptions());

} // namespace gpxio

#endif // GPX_H_INCLUDED_
