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

#include "gpx.h"

#include <QBuffer>              // for QBuffer
#include <QByteArray>           // for QByteArray
#include <QIODevice>            // for QIODevice
#include <QString>              // for QStringLiteral
#include <QXmlStreamReader>     // for QXmlStreamReader

#include "gpx_error.h"          // for Error
#include "gpx_reader.h"         // for GpxReader
#include "gpx_writer.h"         // for GpxWriter

namespace gpxio
{

Gpx read(QIODevice* device, const ReaderOptions& options)
{
  if (device == nullptr || !device->isReadable()) {
    throw Error::malformedXml(QStringLiteral("input device is not open for reading"));
  }
  QXmlStreamReader reader(device);
  return GpxReader(&reader, options).read();
}

Gpx read(const QByteArray& data, const ReaderOptions& options)
{
  QXmlStreamReader reader(data);
  return GpxReader(&reader, options).read();
}

void write(const Gpx& gpx, QIODevice* device, const WriterOptions& options)
{
  GpxWriter(device, options).write(gpx);
}

QByteArray write(const Gpx& gpx, const WriterOptions& options)
{
  QByteArray data;
  QBuffer buffer(&data);
  if (!buffer.open(QIODevice::WriteOnly)) {
    throw Error::sinkFailure(buffer.errorString());
  }
  write(gpx, &buffer, options);
  buffer.close();
  return data;
}

} // namespace gpxio
