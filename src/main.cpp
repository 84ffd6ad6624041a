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

#include <cstdlib>
#include <cstdio>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <vector>
#include <algorithm>
#include <string>
#include <exception>
#include <cctype>
#include <argagg.hpp>
#include <bezflat.hpp>
#include "util.h"

using argagg::parser_results;
using argagg::parser;
using namespace std;
using namespace bezflat;

static bool parse_curve_arg(const string &arg, cubic_segment &out) {
    string s(arg);
    replace(s.begin(), s.end(), ',', ' ');
    istringstream in(s);

    double v[8];
    for (auto &x : v) {
        in >> x;
    }
    if (in.fail()) {
        return false;
    }

    string rest;
    in >> rest;
    if (!rest.empty()) {
        return false;
    }

    out = cubic_segment({v[0], v[1]}, {v[2], v[3]}, {v[4], v[5]}, {v[6], v[7]});
    return true;
}

static int flatten_single_curve(const cubic_segment &seg, double tolerance, bool use_push_api, PolylineSink &sink) {
    Polyline poly;
    poly.m_points.push_back(seg.from);

    /* curves with an inflection at t=0 yield their start point again */
    auto append = [&poly](const d2p &p) {
        if (poly.m_points.back() != p)
            poly.m_points.push_back(p);
    };

    if (use_push_api) {
        flatten_cubic(seg, tolerance, append);

    } else {
        for (const d2p &p : cubic_flattening_iter(seg, tolerance)) {
            append(p);
        }
    }

    auto inflections = find_inflections(seg);
    cerr << "Info: " << inflections.size() << " inflection point(s)";
    for (double t : inflections) {
        cerr << " t=" << t;
    }
    cerr << ", " << poly.m_points.size() << " vertices" << endl;

    double max_x = max({seg.from[0], seg.ctrl1[0], seg.ctrl2[0], seg.to[0], 0.0});
    double max_y = max({seg.from[1], seg.ctrl1[1], seg.ctrl2[1], seg.to[1], 0.0});
    sink.header({0, 0}, {max_x, max_y});
    sink << poly;
    sink.footer();
    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    parser argparser {{
            {"help", {"-h", "--help"},
                "Print help and exit",
                0},
            {"version", {"-v", "--version"},
                "Print version and exit",
                0},
            {"ofmt", {"-o", "--format"},
                "Output format. Supported: svg, text",
                1},
            {"precision", {"-p", "--precision"},
                "Number of significant digits used for exported coordinates. Default: 6",
                1},
            {"stroke_color", {"--stroke-color"},
                "SVG color to use for flattened path outlines (SVG output only; default: black)",
                1},
            {"fill_color", {"--fill-color"},
                "SVG color to use for fill areas (SVG output with --fill only; default: black)",
                1},
            {"geometric_tolerance", {"-t", "--tolerance"},
                "Maximum deviation of the flattened polylines from the curves in mm. Default: 0.01mm.",
                1},
            {"fill", {"--fill"},
                "Output the fill area of each path (union of its closed subpaths under its fill rule) instead of its flattened outline.",
                0},
            {"no_header", {"--no-header"},
                "Do not export output format header/footer, only export the polylines themselves",
                0},
            {"scale", {"--scale"},
                "Scale input SVG by the given factor.",
                1},
            {"curve", {"-c", "--curve"},
                "Flatten a single cubic bezier instead of reading an SVG. Format: x0,y0,x1,y1,x2,y2,x3,y3",
                1},
            {"push", {"--push"},
                "With --curve, use the callback flattening API instead of the iterator API. Output is identical.",
                0},
            {"skip_usvg", {"--no-usvg"},
                "Do not preprocess input using usvg. The input must only contain absolute M, L, C and Z path commands.",
                0},
            {"usvg-dpi", {"--usvg-dpi"},
                "Passed through to usvg's --dpi, in case the input file has different ideas of DPI than usvg has.",
                1},
    }};

    ostringstream usage;
    usage
        << argv[0] << " " << lib_version << endl
        << endl
        << "Usage: " << argv[0] << " [options]... [input_file] [output_file]" << endl
        << endl
        << "Specify \"-\" for stdin/stdout." << endl
        << endl;

    argagg::parser_results args;
    try {
        args = argparser.parse(argc, argv);
    } catch (const std::exception &e) {
        cerr << "Error: " << e.what() << endl;
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_FAILURE;
    }

    if (args["help"]) {
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_SUCCESS;
    }

    if (args["version"]) {
        cerr << lib_version << endl;
        return EXIT_SUCCESS;
    }

    string in_f_name;
    istream *in_f = &cin;
    ifstream in_f_file;
    string out_f_name;
    ostream *out_f = &cout;
    ofstream out_f_file;

    if (args.pos.size() >= 1) {
        in_f_name = args.pos[0];

        if (args.pos.size() >= 2) {
            out_f_name = args.pos[1];
        }
    }

    double tolerance;
    double scale;
    int precision;
    try {
        tolerance = args["geometric_tolerance"].as<double>(0.01); /* mm */
        scale = args["scale"].as<double>(1.0);
        precision = args["precision"].as<int>(6);
    } catch (const std::exception &e) {
        cerr << "Error: Invalid numeric argument: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (!(tolerance > 0.0) || !isfinite(tolerance)) {
        cerr << "Error: --tolerance must be a positive number" << endl;
        return EXIT_FAILURE;
    }

    if (!(scale > 0.0) || !isfinite(scale)) {
        cerr << "Error: --scale must be a positive number" << endl;
        return EXIT_FAILURE;
    }

    if (precision < 1) {
        cerr << "Error: --precision must be at least 1" << endl;
        return EXIT_FAILURE;
    }

    if (!out_f_name.empty() && out_f_name != "-") {
        out_f_file.open(out_f_name);
        if (!out_f_file) {
            cerr << "Error: Cannot open output file \"" << out_f_name << "\"" << endl;
            return EXIT_FAILURE;
        }
        out_f = &out_f_file;
    }

    bool only_polys = args["no_header"];

    string fmt = args["ofmt"] ? args["ofmt"].as<string>() : "svg";
    transform(fmt.begin(), fmt.end(), fmt.begin(), [](unsigned char c){ return std::tolower(c); });

    PolylineSink *sink = nullptr;
    if (fmt == "svg") {
        string stroke_color = args["stroke_color"] ? args["stroke_color"].as<string>() : "#000000";
        string fill_color = args["fill_color"] ? args["fill_color"].as<string>() : "#000000";
        sink = new SimpleSVGOutput(*out_f, only_polys, precision, stroke_color, fill_color);

    } else if (fmt == "text" || fmt == "txt") {
        sink = new TextPolylineOutput(*out_f, only_polys, precision);

    } else {
        cerr << "Error: Unknown output format \"" << fmt << "\"" << endl;
        return EXIT_FAILURE;
    }

    if (args["curve"]) {
        cubic_segment seg;
        if (!parse_curve_arg(args["curve"].as<string>(), seg)) {
            cerr << "Error: --curve must be of form x0,y0,x1,y1,x2,y2,x3,y3" << endl;
            delete sink;
            return EXIT_FAILURE;
        }

        int rc = flatten_single_curve(seg, tolerance, args["push"], *sink);
        delete sink;
        return rc;
    }

    if (!in_f_name.empty() && in_f_name != "-") {
        in_f_file.open(in_f_name);
        if (!in_f_file) {
            cerr << "Error: Cannot open input file \"" << in_f_name << "\"" << endl;
            delete sink;
            return EXIT_FAILURE;
        }
        in_f = &in_f_file;
    }

    SVGDocument doc;
    bool loaded = false;

    if (args["skip_usvg"]) {
        loaded = doc.load(*in_f, scale);

    } else {
        string barf = temp_file_path(".svg");
        string frob = temp_file_path(".svg");

        /* c++ has the best hacks */
        std::ostringstream sstr;
        sstr << in_f->rdbuf();

        ofstream tmp_out(barf.c_str());
        tmp_out << sstr.str();
        tmp_out.close();

        vector<string> command_line;
        if (args["usvg-dpi"]) {
            command_line.push_back("--dpi");
            command_line.push_back(args["usvg-dpi"].as<string>());
        }
        command_line.push_back(barf);
        command_line.push_back(frob);

        if (run_cargo_command("usvg", command_line, "USVG")) {
            remove(barf.c_str());
            delete sink;
            return EXIT_FAILURE;
        }

        loaded = doc.load(frob, scale);
        remove(frob.c_str());
        remove(barf.c_str());
    }

    if (!loaded) {
        cerr << "Error: Cannot load input file \"" << in_f_name << "\", exiting." << endl;
        delete sink;
        return EXIT_FAILURE;
    }

    cerr << "Info: Page size " << doc.width() << " mm x " << doc.height() << " mm" << endl;

    RenderSettings rset {
        tolerance,
        (bool) args["fill"],
    };

    RenderStats stats = doc.render(rset, *sink);
    cerr << "Info: Flattened " << stats.paths << " paths into " << stats.polylines << " polylines with "
        << stats.vertices << " vertices";
    if (stats.skipped_paths) {
        cerr << ", skipped " << stats.skipped_paths << " invalid paths";
    }
    cerr << endl;

    delete sink;
    return EXIT_SUCCESS;
}
