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

#include <string>
#include <iostream>
#include <iomanip>
#include <bezflat.hpp>

using namespace bezflat;
using namespace std;

TextPolylineOutput::TextPolylineOutput(ostream &out, bool only_polys, int digits_frac)
    : StreamPolylineSink(out, only_polys),
    m_digits_frac(digits_frac)
{
}

void TextPolylineOutput::header_impl(d2p origin, d2p size) {
    m_out << "# bezflat " << lib_version << endl;
    m_out << "# origin " << origin[0] << " " << origin[1] << " size " << size[0] << " " << size[1] << " mm" << endl;
}

TextPolylineOutput &TextPolylineOutput::operator<<(const Polyline &poly) {
    if (!m_first) {
        m_out << endl;
    }
    m_first = false;

    for (const auto &p : poly.m_points) {
        m_out << setprecision(m_digits_frac) << p[0] << " " << setprecision(m_digits_frac) << p[1] << endl;
    }

    if (poly.m_closed) {
        m_out << "# closed" << endl;
    }

    return *this;
}

void TextPolylineOutput::footer_impl() {
}
