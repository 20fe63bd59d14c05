#pragma once

#include "pdf_defs.hpp"
#include <cstdint>
#include <optional>
#include <qpdf/QPDFObjectHandle.hh>
#include <sstream>
#include <string>
#include <utility>

namespace dtrsign::pdf {

struct ObjRawId {
  int id = 0;
  int gen = 0;

  [[nodiscard]] std::string ToString() const noexcept {
    std::ostringstream builder;
    builder << id << " " << gen << " obj";
    return builder.str();
  }

  [[nodiscard]] std::string ToStringRef() const noexcept {
    std::ostringstream builder;
    builder << id << " " << gen << " R";
    return builder.str();
  }

  ObjRawId &operator++() noexcept {
    ++id;
    return *this;
  }

  bool operator==(const ObjRawId &other) const noexcept {
    return id == other.id && gen == other.gen;
  }

  bool operator<(const ObjRawId &other) const noexcept {
    return id == other.id ? gen < other.gen : id < other.id;
  }

  static ObjRawId CopyIdFromExisting(const QPDFObjectHandle &other) noexcept;
};

struct XYReal {
  double x = 0;
  double y = 0;

  [[nodiscard]] std::string ToString() const;
};

struct BBox {
  XYReal left_bottom;
  XYReal right_top;

  [[nodiscard]] double Width() const noexcept {
    return right_top.x - left_bottom.x;
  }
  [[nodiscard]] double Height() const noexcept {
    return right_top.y - left_bottom.y;
  }
  /// @brief true if other lies inside this box, shared edges allowed
  [[nodiscard]] bool Contains(const BBox &other) const noexcept;

  [[nodiscard]] std::string ToString() const;
};

/*
Transformation matrix in pdf
[a b 0]
[c d 0]
[e f 1]
*/

struct Matrix {
  double a = 1;
  double b = 0;
  double c = 0;
  double d = 1;
  double e = 0;
  double f = 0;

  [[nodiscard]] std::string toString() const;
};

struct XRefEntry {
  ObjRawId id;
  size_t offset = 0;
  uint32_t gen = 0;

  [[nodiscard]] std::string ToString() const;
};

} // namespace dtrsign::pdf
