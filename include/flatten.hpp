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

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>

#include "geom2d.hpp"

namespace bezflat {

    typedef std::function<void (const d2p &)> point_sink_fun;

    /* Parameters in [0, 1) where the curvature of seg changes sign, in ascending order. A curve that is a straight line
     * (or otherwise fully degenerate) reports a single inflection at t=0. */
    up_to_two<double> find_inflections(const cubic_segment &seg);

    /* Largest t in (0, 1] such that the chord from seg.sample(0) to seg.sample(t) stays within tolerance of the curve.
     * seg must not contain an inflection point. */
    double flattening_step(const cubic_segment &seg, double tolerance);

    /* Lazily flattens a cubic segment. Yields the vertices of the approximating polyline, ending with seg.to. The
     * curve's start point is not yielded, except when an inflection sits at t=0 (straight or degenerate curves), in
     * which case seg.from comes first. Single pass. */
    class cubic_flattening_iter {
        public:
            cubic_flattening_iter(const cubic_segment &seg, double tolerance);

            std::optional<d2p> next();
            bool done() const { return !m_current && !m_next_inflection; }

            class iterator {
                public:
                    using iterator_category = std::input_iterator_tag;
                    using value_type = d2p;
                    using difference_type = std::ptrdiff_t;
                    using pointer = const d2p *;
                    using reference = const d2p &;

                    iterator() : m_parent(nullptr) {}
                    explicit iterator(cubic_flattening_iter *parent) : m_parent(parent) { advance(); }

                    reference operator*() const { return *m_value; }
                    pointer operator->() const { return &*m_value; }
                    iterator &operator++() { advance(); return *this; }
                    void operator++(int) { advance(); }

                    bool operator==(const iterator &other) const { return m_parent == other.m_parent; }
                    bool operator!=(const iterator &other) const { return m_parent != other.m_parent; }

                private:
                    void advance() {
                        m_value = m_parent->next();
                        if (!m_value)
                            m_parent = nullptr;
                    }

                    cubic_flattening_iter *m_parent;
                    std::optional<d2p> m_value;
            };

            iterator begin() { return iterator(this); }
            iterator end() { return iterator(); }

        private:
            cubic_segment m_remaining;
            /* inflection-free piece currently being stepped through */
            std::optional<cubic_segment> m_current;
            std::optional<double> m_next_inflection;
            /* already re-mapped into m_remaining's parameter space */
            std::optional<double> m_following_inflection;
            double m_tolerance;
    };

    /* Calls sink once for each vertex cubic_flattening_iter would yield, in the same order. */
    void flatten_cubic(const cubic_segment &seg, double tolerance, const point_sink_fun &sink);

    /* Appends the vertices to out, which usually already ends with seg.from. A vertex equal to the current last point
     * of out is not appended. */
    void flatten_cubic(const cubic_segment &seg, double tolerance, Polygon &out);
}
