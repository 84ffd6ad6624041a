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

#include <array>
#include <vector>
#include <string>
#include <sstream>
#include <optional>
#include <utility>
#include <cmath>
#include <algorithm>
#include <assert.h>

using namespace std;

namespace bezflat {

    typedef std::array<double, 2> d2p;
    typedef std::vector<d2p> Polygon;

    inline d2p operator+(const d2p &a, const d2p &b) {
        return d2p{a[0] + b[0], a[1] + b[1]};
    }

    inline d2p operator-(const d2p &a, const d2p &b) {
        return d2p{a[0] - b[0], a[1] - b[1]};
    }

    inline d2p operator*(const d2p &a, double f) {
        return d2p{a[0] * f, a[1] * f};
    }

    /* z component of the 3d cross product of a and b */
    inline double cross2d(const d2p &a, const d2p &b) {
        return a[0] * b[1] - a[1] * b[0];
    }

    inline double d2p_hypot(const d2p &v) {
        return std::hypot(v[0], v[1]);
    }

    inline d2p lerp(const d2p &a, const d2p &b, double t) {
        return d2p{a[0] + (b[0] - a[0]) * t, a[1] + (b[1] - a[1]) * t};
    }

    /* Ordered container holding at most two values, stored inline. */
    template <typename T>
    class up_to_two {
        public:
            up_to_two() : m_size(0) {}

            void push(T val) {
                assert(m_size < 2);
                m_data[m_size++] = val;
            }

            size_t size() const { return m_size; }
            bool empty() const { return m_size == 0; }

            const T &operator[](size_t i) const {
                assert(i < m_size);
                return m_data[i];
            }

            std::optional<T> get(size_t i) const {
                if (i >= m_size)
                    return std::nullopt;
                return m_data[i];
            }

            const T *begin() const { return m_data.data(); }
            const T *end() const { return m_data.data() + m_size; }

        private:
            std::array<T, 2> m_data {};
            size_t m_size;
    };

    class cubic_segment {
        public:
            cubic_segment(d2p from, d2p ctrl1, d2p ctrl2, d2p to) :
                from(from), ctrl1(ctrl1), ctrl2(ctrl2), to(to) {}

            cubic_segment() : cubic_segment({0, 0}, {0, 0}, {0, 0}, {0, 0}) {}

            d2p sample(double t) const {
                double u = 1.0 - t;
                double a = u*u*u, b = 3.0*u*u*t, c = 3.0*u*t*t, d = t*t*t;
                return d2p {
                    from[0]*a + ctrl1[0]*b + ctrl2[0]*c + to[0]*d,
                    from[1]*a + ctrl1[1]*b + ctrl2[1]*c + to[1]*d
                };
            }

            /* de Casteljau subdivision. Both halves are re-parameterized over [0, 1]. The end points of the input are
             * passed through unchanged so repeated splits do not drift. */
            std::pair<cubic_segment, cubic_segment> split(double t) const {
                d2p p01 = lerp(from, ctrl1, t);
                d2p p12 = lerp(ctrl1, ctrl2, t);
                d2p p23 = lerp(ctrl2, to, t);
                d2p p012 = lerp(p01, p12, t);
                d2p p123 = lerp(p12, p23, t);
                d2p p0123 = lerp(p012, p123, t);

                return {
                    cubic_segment(from, p01, p012, p0123),
                    cubic_segment(p0123, p123, p23, to)
                };
            }

            cubic_segment before_split(double t) const {
                return split(t).first;
            }

            cubic_segment after_split(double t) const {
                d2p p12 = lerp(ctrl1, ctrl2, t);
                d2p p23 = lerp(ctrl2, to, t);
                d2p p123 = lerp(p12, p23, t);
                d2p p0123 = lerp(lerp(lerp(from, ctrl1, t), p12, t), p123, t);
                return cubic_segment(p0123, p123, p23, to);
            }

            bool operator==(const cubic_segment &other) const {
                return from == other.from && ctrl1 == other.ctrl1 && ctrl2 == other.ctrl2 && to == other.to;
            }

            d2p from, ctrl1, ctrl2, to;
    };

    class xform2d {
        public:
            xform2d(double xx, double xy, double yx, double yy, double x0=0.0, double y0=0.0) :
                xx(xx), xy(xy), x0(x0), yx(yx), yy(yy), y0(y0) {}
            
            xform2d() : xform2d(1.0, 0.0, 0.0, 1.0) {}

            /* Parses usvg's "matrix(a b c d e f)" transform syntax. Anything else results in the identity transform. */
            xform2d(const string &svg_transform) : xform2d() {
                string start("matrix(");
                if (svg_transform.size() <= start.length() || svg_transform.compare(0, start.length(), start) != 0)
                    return;
                if (svg_transform.back() != ')')
                    return;

                string args = svg_transform.substr(start.length(), svg_transform.length() - start.length() - 1);
                std::replace(args.begin(), args.end(), ',', ' ');
                istringstream in(args);

                double a, b, c, d, e, f;
                in >> a >> b >> c >> d >> e >> f;
                if (in.fail())
                    return;

                xx=a, yx=b, xy=c, yy=d, x0=e, y0=f;
            }

            xform2d &translate(double x, double y) {
                xform2d xf(1, 0, 0, 1, x, y);
                return transform(xf);
            }

            xform2d &scale(double x, double y) {
                xform2d xf(x, 0, 0, y);
                return transform(xf);
            }

            /* Apply other *before* this transform, i.e. other maps child coordinates into ours. */
            xform2d &transform(const xform2d &other) {
                double n_xx = other.xx * xx + other.yx * xy;
                double n_yx = other.xx * yx + other.yx * yy;

                double n_xy = other.xy * xx + other.yy * xy;
                double n_yy = other.xy * yx + other.yy * yy;

                double n_x0 = other.x0 * xx + other.y0 * xy + x0;
                double n_y0 = other.x0 * yx + other.y0 * yy + y0;

                xx = n_xx;
                yx = n_yx;
                xy = n_xy;
                yy = n_yy;
                x0 = n_x0;
                y0 = n_y0;

                return *this;
            }

            double doc2phys_dist(double dist_doc) const {
                return dist_doc * sqrt(xx*xx + xy*xy);
            }

            d2p doc2phys(const d2p p) const {
                return d2p {
                    xx * p[0] + xy * p[1] + x0,
                    yx * p[0] + yy * p[1] + y0
                };
            }

            /* Affine maps preserve bezier form, so mapping the control points maps the curve. */
            cubic_segment doc2phys(const cubic_segment &seg) const {
                return cubic_segment(doc2phys(seg.from), doc2phys(seg.ctrl1), doc2phys(seg.ctrl2), doc2phys(seg.to));
            }

            bool identity() const {
                return xx == 1.0 && xy == 0.0 && yx == 0.0 && yy == 1.0 && x0 == 0.0 && y0 == 0.0;
            }

        private:
            double xx, xy, x0,
                   yx, yy, y0;
    };
}
