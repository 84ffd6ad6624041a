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

#include <map>
#include <iostream>
#include <string>
#include <array>
#include <vector>
#include <functional>

#include <clipper.hpp>
#include <pugixml.hpp>

#include "svg_import_defs.h"
#include "geom2d.hpp"
#include "flatten.hpp"

namespace bezflat {

    constexpr char lib_version[] = "1.0";

    /* One flattened subpath. The last point of a closed polyline is not repeated. */
    class Polyline {
    public:
        Polygon m_points;
        bool m_closed = false;
    };

    typedef std::vector<Polyline> Polylines;

    class PolylineSink {
        public:
            virtual ~PolylineSink() {}
            virtual void header(d2p origin, d2p size) {(void) origin; (void) size;}
            virtual PolylineSink &operator<<(const Polyline &poly) = 0;
            virtual PolylineSink &operator<<(const Polylines &polys) {
                for (const auto &poly : polys) {
                    *this << poly;
                }
                return *this;
            }
            /* Fill area of one path as returned by clipper. Holes are separate paths of opposite orientation. */
            virtual PolylineSink &operator<<(const ClipperLib::Paths &paths) {
                for (const auto &path : paths) {
                    Polyline out;
                    out.m_closed = true;
                    for (const auto &p : path) {
                        out.m_points.push_back(d2p{
                                ((double)p.X) / clipper_scale, ((double)p.Y) / clipper_scale
                        });
                    }
                    *this << out;
                }
                return *this;
            }
            virtual void footer() {}
    };

    class StreamPolylineSink : public PolylineSink {
    public:
        StreamPolylineSink(std::ostream &out, bool only_polys=false) : m_only_polys(only_polys), m_out(out) {}
        virtual ~StreamPolylineSink() {}
        virtual void header(d2p origin, d2p size) { if (!m_only_polys) header_impl(origin, size); }
        virtual void footer() { if (!m_only_polys) { footer_impl(); } m_out.flush(); }

    protected:
        virtual void header_impl(d2p origin, d2p size) = 0;
        virtual void footer_impl() = 0;

        bool m_only_polys = false;
        std::ostream &m_out;
    };

    typedef std::function<void (const Polyline &)> lambda_sink_fun;
    class LambdaPolylineSink : public PolylineSink {
    public:
        LambdaPolylineSink(lambda_sink_fun lambda) : m_lambda(lambda) {}

        using PolylineSink::operator<<;
        virtual LambdaPolylineSink &operator<<(const Polyline &poly);
    private:
        lambda_sink_fun m_lambda;
    };

    class SimpleSVGOutput : public StreamPolylineSink {
    public:
        SimpleSVGOutput(std::ostream &out, bool only_polys=false, int digits_frac=6, std::string stroke_color="#000000", std::string fill_color="#000000");
        virtual ~SimpleSVGOutput() {}
        using PolylineSink::operator<<;
        virtual SimpleSVGOutput &operator<<(const Polyline &poly);
        virtual SimpleSVGOutput &operator<<(const ClipperLib::Paths &paths);
        virtual void header_impl(d2p origin, d2p size);
        virtual void footer_impl();

    private:
        void write_points(const Polygon &points);

        int m_digits_frac;
        std::string m_stroke_color;
        std::string m_fill_color;
        d2p m_offset = {0, 0};
    };

    /* Plain text, one "x y" line per vertex. Polylines are separated by blank lines, closed ones carry a "# closed"
     * marker after their last vertex. */
    class TextPolylineOutput : public StreamPolylineSink {
    public:
        TextPolylineOutput(std::ostream &out, bool only_polys=false, int digits_frac=6);
        virtual ~TextPolylineOutput() {}
        using PolylineSink::operator<<;
        virtual TextPolylineOutput &operator<<(const Polyline &poly);
        virtual void header_impl(d2p origin, d2p size);
        virtual void footer_impl();

    private:
        int m_digits_frac;
        bool m_first = true;
    };

    class RenderSettings {
    public:
        double curve_tolerance_mm = 0.01;
        bool fill_mode = false;
    };

    class RenderStats {
    public:
        size_t paths = 0;
        size_t skipped_paths = 0;
        size_t polylines = 0;
        size_t vertices = 0;
    };

    class RenderContext {
        public:
            RenderContext(const RenderSettings &settings, PolylineSink &sink, xform2d mat, RenderStats &stats)
                : m_sink(sink), m_settings(settings), m_mat(mat), m_stats(stats) {}
            RenderContext(RenderContext &parent, xform2d transform)
                : m_sink(parent.m_sink), m_settings(parent.m_settings), m_mat(parent.m_mat), m_stats(parent.m_stats) {
                m_mat.transform(transform);
            }

            PolylineSink &sink() { return m_sink; }
            const RenderSettings &settings() { return m_settings; }
            xform2d &mat() { return m_mat; }
            RenderStats &stats() { return m_stats; }

        private:
            PolylineSink &m_sink;
            const RenderSettings &m_settings;
            xform2d m_mat;
            RenderStats &m_stats;
    };

    class SVGDocument {
        public:
            SVGDocument() : _valid(false) {}

            /* true -> load successful */
            bool load(std::istream &in, double scale=1.0);
            bool load(std::string filename, double scale=1.0);
            bool valid() const { return _valid; }
            operator bool() const { return valid(); }

            double width() const { return page_w_mm; }
            double height() const { return page_h_mm; }

            RenderStats render(const RenderSettings &rset, PolylineSink &sink);
            RenderStats render_to_list(const RenderSettings &rset, Polylines &out);

        private:
            void export_svg_group(RenderContext &ctx, const pugi::xml_node &group);
            void export_svg_path(RenderContext &ctx, const pugi::xml_node &node);

            bool _valid;
            pugi::xml_document svg_doc;
            pugi::xml_node root_elem;
            double vb_x, vb_y, vb_w, vb_h;
            double page_w, page_h;
            double page_w_mm, page_h_mm;

            static constexpr double assumed_usvg_dpi = 96.0;
    };
}
