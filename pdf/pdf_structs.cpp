/* File: pdf_structs.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/


#include "pdf_structs.hpp"

#include <initializer_list>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>

#include "pdf_utils.hpp"

namespace dtrsign::pdf {

namespace {

// numbers separated by a single space, no trailing zeros
std::string JoinNumbers(std::initializer_list<double> vals) {
  std::string res;
  for (const double val : vals) {
    if (!res.empty()) {
      res += ' ';
    }
    res += DoubleToString10(val);
  }
  return res;
}

} // namespace

std::string XYReal::ToString() const { return JoinNumbers({x, y}); }

bool BBox::Contains(const BBox &other) const noexcept {
  return other.left_bottom.x >= left_bottom.x &&
         other.left_bottom.y >= left_bottom.y &&
         other.right_top.x <= right_top.x && other.right_top.y <= right_top.y;
}

std::string BBox::ToString() const {
  return "[ " +
         JoinNumbers({left_bottom.x, left_bottom.y, right_top.x, right_top.y}) +
         " ]";
}

std::string Matrix::toString() const { return JoinNumbers({a, b, c, d, e, f}); }

ObjRawId ObjRawId::CopyIdFromExisting(const QPDFObjectHandle &other) noexcept {
  return {other.getObjectID(), other.getGeneration()};
}

// nnnnnnnnnn ggggg n EOL, exactly 20 bytes [7.5.4]
std::string XRefEntry::ToString() const {
  std::ostringstream builder;
  builder << std::setfill('0') << std::setw(10) << offset << ' '
          << std::setw(5) << gen << " n \n";
  return builder.str();
}

} // namespace dtrsign::pdf
