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
#include <string>
#include <iostream>
#include <iomanip>
#include <bezflat.hpp>

using namespace bezflat;
using namespace std;

SimpleSVGOutput::SimpleSVGOutput(ostream &out, bool only_polys, int digits_frac, string stroke_color, string fill_color)
    : StreamPolylineSink(out, only_polys),
    m_digits_frac(digits_frac),
    m_stroke_color(stroke_color),
    m_fill_color(fill_color)
{
}

void SimpleSVGOutput::header_impl(d2p origin, d2p size) {
    m_offset[0] = origin[0];
    m_offset[1] = origin[1];
    m_out << "<svg width=\"" << size[0] << "mm\" height=\"" << size[1] << "mm\" viewBox=\"0 0 "
        << size[0] << " " << size[1] << "\" xmlns=\"http://www.w3.org/2000/svg\">" << endl;
}

void SimpleSVGOutput::write_points(const Polygon &points) {
    m_out << "M " << setprecision(m_digits_frac) << (points[0][0] + m_offset[0])
          << " " << setprecision(m_digits_frac) << (points[0][1] + m_offset[1]);
    for (size_t i=1; i<points.size(); i++) {
        m_out << " L " << setprecision(m_digits_frac) << (points[i][0] + m_offset[0])
              << " " << setprecision(m_digits_frac) << (points[i][1] + m_offset[1]);
    }
}

SimpleSVGOutput &SimpleSVGOutput::operator<<(const Polyline &poly) {
    if (poly.m_points.size() < 2) {
        cerr << "Warning: " << poly.m_points.size() << "-element polyline passed to SimpleSVGOutput" << endl;
        return *this;
    }

    m_out << "<path fill=\"none\" stroke=\"" << m_stroke_color << "\" stroke-width=\"0.1\" d=\"";
    write_points(poly.m_points);
    if (poly.m_closed) {
        m_out << " Z";
    }
    m_out << "\"/>" << endl;

    return *this;
}

/* All polygons of one fill area go into a single path so holes render as holes. */
SimpleSVGOutput &SimpleSVGOutput::operator<<(const ClipperLib::Paths &paths) {
    if (paths.empty()) {
        return *this;
    }

    m_out << "<path fill=\"" << m_fill_color << "\" fill-rule=\"evenodd\" d=\"";
    bool first = true;
    for (const auto &path : paths) {
        if (path.size() < 3)
            continue;

        Polygon points;
        for (const auto &p : path) {
            points.push_back(d2p{((double)p.X) / clipper_scale, ((double)p.Y) / clipper_scale});
        }

        if (!first)
            m_out << " ";
        first = false;

        write_points(points);
        m_out << " Z";
    }
    m_out << "\"/>" << endl;

    return *this;
}

void SimpleSVGOutput::footer_impl() {
    m_out << "</svg>" << endl;
}
