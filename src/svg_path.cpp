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

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

#include "svg_import_defs.h"
#include "svg_import_util.h"
#include "svg_path.h"
#include "flatten.hpp"

using namespace std;
using namespace bezflat;

namespace {
    /* Close the current subpath, or end it as an open path. Single points are dropped. */
    void finish_subpath(Polylines &out, Polyline &current, bool closed) {
        if (closed && current.m_points.size() > 1 && current.m_points.back() == current.m_points.front()) {
            current.m_points.pop_back();
        }

        if (current.m_points.size() > 1) {
            current.m_closed = closed;
            out.push_back(current);
        }

        current.m_points.clear();
        current.m_closed = false;
    }

    bool read_point(istringstream &in, d2p &p) {
        in >> p[0] >> p[1];
        return !in.fail();
    }
}

bool bezflat::parse_path_data(const char *path_data, const xform2d &mat, double tolerance, Polylines &out) {
    istringstream in(path_data);

    Polylines subpaths;
    Polyline current;
    string cmd;
    d2p start {0, 0}; /* first point of current subpath, document units */
    d2p a {0, 0}; /* current point, document units */
    d2p b, c, d;

    bool first = true;
    while (in >> cmd) {
        if (first && cmd != "M") {
            cerr << "Error: Path data must start with a move to (M) command, got \"" << cmd << "\"" << endl;
            return false;
        }
        first = false;

        if (cmd == "Z") { /* Close path */
            finish_subpath(subpaths, current, true);
            a = start;

        } else if (cmd == "M") { /* Move to */
            finish_subpath(subpaths, current, false);

            if (!read_point(in, a)) {
                cerr << "Error: Missing coordinates after M command in path data" << endl;
                return false;
            }
            start = a;
            current.m_points.push_back(mat.doc2phys(a));

        } else if (cmd == "L") { /* Line to */
            if (current.m_points.empty()) { /* drawing on after Z */
                current.m_points.push_back(mat.doc2phys(start));
            }

            if (!read_point(in, a)) {
                cerr << "Error: Missing coordinates after L command in path data" << endl;
                return false;
            }
            current.m_points.push_back(mat.doc2phys(a));

        } else if (cmd == "C") { /* Curve to */
            if (current.m_points.empty()) {
                current.m_points.push_back(mat.doc2phys(start));
            }

            if (!read_point(in, b) || !read_point(in, c) || !read_point(in, d)) {
                cerr << "Error: Missing coordinates after C command in path data" << endl;
                return false;
            }

            flatten_cubic(mat.doc2phys(cubic_segment(a, b, c, d)), tolerance, current.m_points);
            a = d;

        } else {
            cerr << "Error: Unsupported path command \"" << cmd << "\". Only absolute M, L, C and Z are supported, "
                "preprocess the input using usvg." << endl;
            return false;
        }
    }

    finish_subpath(subpaths, current, false);
    out.insert(out.end(), subpaths.begin(), subpaths.end());
    return true;
}

/* Union all subpaths, treating every one of them as closed, using the given fill rule. Output is in clipper fixed
 * point coordinates. */
void bezflat::polylines_to_fill(const Polylines &polys, ClipperLib::PolyFillType fill_rule, ClipperLib::Paths &out) {
    ClipperLib::Clipper c;
    c.StrictlySimple(true);

    for (const auto &poly : polys) {
        ClipperLib::Path path;
        for (const auto &p : poly.m_points) {
            path.emplace_back(ClipperLib::IntPoint{
                    (ClipperLib::cInt)round(p[0]*clipper_scale),
                    (ClipperLib::cInt)round(p[1]*clipper_scale)
            });
        }
        /* clipper rejects paths without area (fewer than three points, or all collinear). */
        if (!c.AddPath(path, ClipperLib::ptSubject, /* closed= */ true)) {
            continue;
        }
    }

    out.clear();
    if (!c.Execute(ClipperLib::ctUnion, out, fill_rule, fill_rule)) {
        cerr << "Warning: Cannot compute fill area of path" << endl;
        out.clear();
    }
}

bool bezflat::load_svg_path(const xform2d &mat, const pugi::xml_node &node, double tolerance, Polylines &stroke, ClipperLib::Paths *fill) {
    const auto *path_data = node.attribute("d").value();

    Polylines polys;
    if (!parse_path_data(path_data, mat, tolerance, polys)) {
        return false;
    }

    if (fill) {
        polylines_to_fill(polys, clipper_fill_rule(node), *fill);
    }

    stroke.insert(stroke.end(), polys.begin(), polys.end());
    return true;
}
