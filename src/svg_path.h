/*
 * This file is part of bezflat, a cubic bezier curve flattening toolkit
 * Copyright (C) 2024 The bezflat authors
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 * 
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <vector>
#include <clipper.hpp>
#include <pugixml.hpp>

#include "bezflat.hpp"

namespace bezflat {
/* Parse usvg-normalized path data (absolute M, L, C and Z only) and flatten it. Points are mapped through mat before
 * flattening, so tolerance is in mat's output units. Returns false and leaves out untouched on malformed input. */
bool parse_path_data(const char *path_data, const xform2d &mat, double tolerance, Polylines &out);

bool load_svg_path(const xform2d &mat, const pugi::xml_node &node, double tolerance, Polylines &stroke, ClipperLib::Paths *fill=nullptr);
void polylines_to_fill(const Polylines &polys, ClipperLib::PolyFillType fill_rule, ClipperLib::Paths &out);
}
