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

#include <iostream>
#include <fstream>
#include <sstream>
#include <cmath>

#include <bezflat.hpp>
#include "svg_import_defs.h"
#include "svg_import_util.h"
#include "svg_path.h"

using namespace bezflat;
using namespace std;

bool bezflat::SVGDocument::load(string filename, double scale) {
    ifstream in_f;
    in_f.open(filename);

    if (!in_f) {
        cerr << "Error: Cannot open input file \"" << filename << "\"" << endl;
        return false;
    }

    return load(in_f, scale);
}

bool bezflat::SVGDocument::load(istream &in, double scale) {
    _valid = false;

    /* Load XML document */
    auto res = svg_doc.load(in);
    if (!res) {
        cerr << "Error: Cannot parse input file: " << res.description() << endl;
        return false;
    }

    root_elem = svg_doc.child("svg");
    if (!root_elem) {
        cerr << "Error: Input file is missing root <svg> element" << endl;
        return false;
    }

    page_w = usvg_double_attr(root_elem, "width", std::nan(""));
    page_h = usvg_double_attr(root_elem, "height", std::nan(""));

    /* Set up the document's viewport transform */
    istringstream vb_stream(root_elem.attribute("viewBox").value());
    vb_stream >> vb_x >> vb_y >> vb_w >> vb_h;
    if (vb_stream.fail()) {
        if (root_elem.attribute("viewBox")) { /* A document with just width/height and no viewBox is okay. */
            cerr << "Warning: Invalid viewBox, defaulting to width/height values" << endl;
        }

        if (isnan(page_w) || isnan(page_h)) {
            cerr << "Warning: Neither width/height nor viewBox given on <svg> root element. Assuming a 200mm page." << endl;
            vb_w = vb_h = page_w = page_h = 200.0 / 25.4 * assumed_usvg_dpi;
            vb_x = vb_y = 0;
        } else {
            vb_x = vb_y = 0;
            vb_w = page_w;
            vb_h = page_h;
        }
    } else if (isnan(page_w) || isnan(page_h)) {
        cerr << "Info: No page width or height given, defaulting to viewBox values." << endl;
        page_w = vb_w;
        page_h = vb_h;
    }

    if (!(vb_w > 0.0 && vb_h > 0.0)) {
        cerr << "Error: Document viewBox has zero or negative size" << endl;
        return false;
    }

    /* usvg resolves all units to px at its configured DPI */
    page_w_mm = page_w / assumed_usvg_dpi * 25.4 * scale;
    page_h_mm = page_h / assumed_usvg_dpi * 25.4 * scale;
    if (!(page_w_mm > 0.0 && page_h_mm > 0.0 && page_w_mm < 10e3 && page_h_mm < 10e3)) {
        cerr << "Warning: Page has zero or negative size, or is larger than 10 x 10 meters! Parsed size: " << page_w_mm << " x " << page_h_mm << " millimeter" << endl;
    }

    if (fabs((vb_w / page_w) / (vb_h / page_h) - 1.0) > 0.001) {
        cerr << "Warning: Document has different document unit scale in x and y direction!" << endl;
    }

    _valid = true;
    return true;
}

RenderStats bezflat::SVGDocument::render(const RenderSettings &rset, PolylineSink &sink) {
    RenderStats stats;
    if (!_valid) {
        cerr << "Error: Cannot render, no document loaded" << endl;
        return stats;
    }

    /* Map the viewBox onto the page, in mm. */
    xform2d viewport_xf;
    viewport_xf.scale(page_w_mm / vb_w, page_h_mm / vb_h).translate(-vb_x, -vb_y);

    RenderContext ctx(rset, sink, viewport_xf, stats);
    sink.header({0, 0}, {page_w_mm, page_h_mm});
    export_svg_group(ctx, root_elem);
    sink.footer();

    return stats;
}

RenderStats bezflat::SVGDocument::render_to_list(const RenderSettings &rset, Polylines &out) {
    LambdaPolylineSink sink([&out](const Polyline &poly) {
        out.push_back(poly);
    });
    return render(rset, sink);
}

/* Recursively export all SVG elements in the given group. */
void bezflat::SVGDocument::export_svg_group(RenderContext &ctx, const pugi::xml_node &group) {
    for (const auto &node : group.children()) {
        string name(node.name());
        if (node.type() != pugi::node_element)
            continue;

        RenderContext elem_ctx(ctx, xform2d(node.attribute("transform").value()));

        if (name == "g") {
            export_svg_group(elem_ctx, node);

        } else if (name == "path") {
            export_svg_path(elem_ctx, node);

        } else if (name == "defs" || name == "title" || name == "desc" || name == "metadata") {
            /* ignore */
        } else {
            cerr << "Warning: Ignoring unexpected child: <" << node.name() << ">" << endl;
        }
    }
}

void bezflat::SVGDocument::export_svg_path(RenderContext &ctx, const pugi::xml_node &node) {
    ctx.stats().paths++;

    bool fill_mode = ctx.settings().fill_mode;
    if (fill_mode && string(node.attribute("fill").value()) == "none") { /* nothing to fill */
        return;
    }

    Polylines stroke;
    ClipperLib::Paths fill;
    if (!load_svg_path(ctx.mat(), node, ctx.settings().curve_tolerance_mm, stroke, fill_mode ? &fill : nullptr)) {
        cerr << "Warning: Skipping path \"" << node.attribute("id").value() << "\" with invalid path data" << endl;
        ctx.stats().skipped_paths++;
        return;
    }

    if (fill_mode) {
        if (fill.empty())
            return;

        ctx.stats().polylines += fill.size();
        for (const auto &p : fill)
            ctx.stats().vertices += p.size();
        ctx.sink() << fill;

    } else {
        ctx.stats().polylines += stroke.size();
        for (const auto &p : stroke)
            ctx.stats().vertices += p.m_points.size();
        ctx.sink() << stroke;
    }
}
