/*
    Copyright (C) 2014 Robert Lipe, robertlipe+source@gpsbabel.org

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
#ifndef SRC_CORE_LOGGING_H_
#define SRC_CORE_LOGGING_H_

// A wrapper for QDebug that provides a sensible Warning() and gbDebug()
// with convenient functions, stream operators and manipulators.
// The library never installs a message handler, that belongs to the
// application.

#include <QDebug>            // for QDebug
#include <QtGlobal>          // for QtWarningMsg, QtDebugMsg

namespace gpxio
{

class Warning : public QDebug
{
public:
  explicit Warning() : QDebug(QtWarningMsg) {}
};

class DebugIndent
{
public:
  explicit DebugIndent(int level) : level_(level) {}
  friend QDebug& operator<<(QDebug& debug, const DebugIndent& indent);

private:
  int level_;
};

QDebug& operator<< (QDebug& debug, const DebugIndent& indent);

class ConditionalDebug {
public:
  ConditionalDebug(int level, int threshold) : enabled_(level <= threshold) {
    if (enabled_) {
      debug_ = new QDebug(QtDebugMsg);
      debug_->nospace().noquote();
    } else {
      debug_ = nullptr;
    }
  }

  ConditionalDebug(const ConditionalDebug&) = delete;
  ConditionalDebug& operator=(const ConditionalDebug&) = delete;
  ConditionalDebug(ConditionalDebug&& other) noexcept : enabled_(other.enabled_), debug_(other.debug_) {
    other.debug_ = nullptr;
  }
  ConditionalDebug& operator=(ConditionalDebug&&) = delete;

  ~ConditionalDebug() {
    delete debug_;
  }

  template<typename T>
  ConditionalDebug& operator<<(const T& value) {
    if (debug_) {
      *debug_ << value;
    }
    return *this;
  }

private:
  bool enabled_;
  QDebug* debug_;
};

// gbDebug(level, threshold) << blah; only logs if threshold >= level.
inline ConditionalDebug gbDebug(int level, int threshold) {
  return ConditionalDebug(level, threshold);
}

} // namespace gpxio

#endif //  SRC_CORE_LOGGING_H_
