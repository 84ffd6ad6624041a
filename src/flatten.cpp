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

/* Closed-form flattening of cubic beziers after Hain et al., "Fast, precise flattening of cubic Bézier path and offset
 * curves". For a small step t the cubic term of the curve is negligible, and the remaining parabola's deviation from
 * its chord can be solved for directly. This yields fewer points than recursive subdivision for the same tolerance.
 * The step estimate only holds on curve pieces without inflections, so the curve is first cut at its inflection
 * points. */

#include <flatten.hpp>
#include <cmath>
#include <assert.h>

using namespace bezflat;

namespace {
    /* Above this, float error in the step estimate starts to dominate at small tolerances. Snap to a full step
     * instead of emitting a near-duplicate last vertex. */
    constexpr double full_step_threshold = 0.995;

    inline bool in_unit_range(double t) {
        return t >= 0.0 && t < 1.0;
    }
}

/* See www.faculty.idc.ac.il/arik/quality/appendixa.html */
up_to_two<double> bezflat::find_inflections(const cubic_segment &seg) {
    d2p pa = seg.ctrl1 - seg.from;
    d2p pb = seg.ctrl2 - seg.ctrl1 * 2.0 + seg.from;
    d2p pc = seg.to - seg.ctrl2 * 3.0 + seg.ctrl1 * 3.0 - seg.from;

    double a = cross2d(pb, pc);
    double b = cross2d(pa, pc);
    double c = cross2d(pa, pb);

    up_to_two<double> out;

    if (a == 0.0) { /* not a quadratic */
        if (b == 0.0) {
            /* Constant curvature sign: no inflections, unless the constant is zero. Then the curve is a straight line
             * and we report a single inflection at t=0, which makes the stepper treat the whole curve as one flat
             * run. */
            if (c == 0.0) {
                out.push(0.0);
            }

        } else {
            double t = -c / b;
            if (in_unit_range(t)) {
                out.push(t);
            }
        }

        return out;
    }

    double discriminant = b*b - 4.0*a*c;

    if (discriminant < 0.0) {
        return out;
    }

    if (discriminant == 0.0) {
        double t = -b / (2.0*a);
        if (in_unit_range(t)) {
            out.push(t);
        }
        return out;
    }

    /* Numerically stable variant of the quadratic formula, avoids cancellation between b and sqrt(D) */
    double discriminant_sqrt = sqrt(discriminant);
    double q = -0.5 * (b < 0.0 ? b - discriminant_sqrt : b + discriminant_sqrt);

    double t1 = q / a;
    double t2 = c / q;
    if (t1 > t2) {
        std::swap(t1, t2);
    }

    if (in_unit_range(t1)) {
        out.push(t1);
    }

    if (in_unit_range(t2)) {
        out.push(t2);
    }

    return out;
}

double bezflat::flattening_step(const cubic_segment &seg, double tolerance) {
    d2p v1 = seg.ctrl1 - seg.from;
    d2p v2 = seg.ctrl2 - seg.from;

    /* Division-free form of
     *   s2 = cross(v2, v1) / hypot(v1)
     *   t = 2 * sqrt(tolerance / (3 * abs(s2)))
     */
    double v1_cross_v2 = cross2d(v2, v1);
    double h = d2p_hypot(v1);
    if (v1_cross_v2 * h == 0.0) {
        return 1.0;
    }

    double s2inv = h / v1_cross_v2;
    double t = 2.0 * sqrt(tolerance * fabs(s2inv) / 3.0);

    if (t >= full_step_threshold) {
        return 1.0;
    }

    return t;
}

cubic_flattening_iter::cubic_flattening_iter(const cubic_segment &seg, double tolerance)
    : m_remaining(seg),
    m_tolerance(tolerance)
{
    assert(tolerance > 0.0);

    auto inflections = find_inflections(seg);
    m_next_inflection = inflections.get(0);

    if (!m_next_inflection) {
        m_current = seg;
        return;
    }

    double t1 = *m_next_inflection;
    auto [before, after] = seg.split(t1);
    m_current = before;
    m_remaining = after;

    if (auto t2 = inflections.get(1)) {
        /* Cutting off [0, t1] rescales the remaining parameter range */
        m_following_inflection = (*t2 - t1) / (1.0 - t1);
    }
}

std::optional<d2p> cubic_flattening_iter::next() {
    if (!m_current && m_next_inflection) {
        if (m_following_inflection) {
            auto [before, after] = m_remaining.split(*m_following_inflection);
            m_current = before;
            m_remaining = after;

        } else { /* last piece, no more inflections */
            m_current = m_remaining;
        }

        m_next_inflection = m_following_inflection;
        m_following_inflection.reset();
    }

    if (!m_current) {
        return std::nullopt;
    }

    double t = flattening_step(*m_current, m_tolerance);
    if (t >= 1.0) {
        d2p to = m_current->to;
        m_current.reset();
        return to;
    }

    m_current = m_current->after_split(t);
    return m_current->from;
}

void bezflat::flatten_cubic(const cubic_segment &seg, double tolerance, const point_sink_fun &sink) {
    cubic_flattening_iter iter(seg, tolerance);
    while (auto p = iter.next()) {
        sink(*p);
    }
}

void bezflat::flatten_cubic(const cubic_segment &seg, double tolerance, Polygon &out) {
    for (const d2p &p : cubic_flattening_iter(seg, tolerance)) {
        if (!out.empty() && out.back() == p)
            continue;
        out.push_back(p);
    }
}
