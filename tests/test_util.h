/*
    Helpers shared by the gpxio tests.

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
#ifndef TESTS_TEST_UTIL_H_
#define TESTS_TEST_UTIL_H_

#include <optional>             // for optional, nullopt
#include <ostream>              // for ostream

#include <QByteArray>           // for QByteArray
#include <QString>              // for QString

#include "gpx.h"                // for read, write
#include "gpx_error.h"          // for Error

// Lets gtest show QStrings as text in failure messages.
inline void PrintTo(const QString& s, std::ostream* os)
{
  *os << '"' << s.toStdString() << '"';
}

namespace gpxio
{

// Runs f and returns the Error it threw, if any.
template<typename F>
std::optional<Error> capture_error(F f)
{
  try {
    f();
  } catch (const Error& e) {
    return e;
  }
  return std::nullopt;
}

inline std::optional<Error> read_error(const char* xml, const ReaderOptions& options = ReaderOptions())
{
  return capture_error([&]() {
    read(QByteArray(xml), options);
  });
}

// Write under the given options and read the result back.
inline Gpx reread(const Gpx& gpx, const WriterOptions& options = WriterOptions())
{
  return read(write(gpx, options));
}

} // namespace gpxio

#endif // TESTS_TEST_UTIL_H_
