#include <iostream>
#include <cmath>
#include <cstdio>
#include <random>
#include <vector>
#include <algorithm>

#include <flatten.hpp>

#include <minunit.h>

using namespace bezflat;

char msg[1024];

static Polygon flatten_iter(const cubic_segment &seg, double tolerance) {
    Polygon out;
    for (const d2p &p : cubic_flattening_iter(seg, tolerance)) {
        out.push_back(p);
    }
    return out;
}

static Polygon flatten_push(const cubic_segment &seg, double tolerance) {
    Polygon out;
    flatten_cubic(seg, tolerance, [&out](const d2p &p) {
        out.push_back(p);
    });
    return out;
}

static void reference_flatten_piece(const cubic_segment &piece, double tolerance, Polygon &out) {
    cubic_segment rest = piece;
    for (;;) {
        double t = flattening_step(rest, tolerance);
        if (t == 1.0)
            break;
        rest = rest.after_split(t);
        out.push_back(rest.from);
    }
    out.push_back(rest.to);
}

/* Straightforward recursive formulation: cut at the inflections, then step through each piece. */
static Polygon flatten_reference(const cubic_segment &seg, double tolerance) {
    Polygon out;
    auto inflections = find_inflections(seg);
    cubic_segment rest = seg;

    if (!inflections.empty()) {
        double t1 = inflections[0];
        auto [before, after] = seg.split(t1);
        reference_flatten_piece(before, tolerance, out);
        rest = after;

        if (inflections.size() == 2) {
            double t2 = (inflections[1] - t1) / (1.0 - t1);
            auto [before2, after2] = rest.split(t2);
            reference_flatten_piece(before2, tolerance, out);
            rest = after2;
        }
    }

    reference_flatten_piece(rest, tolerance, out);
    return out;
}

static void print_points(const char *label, const Polygon &pts) {
    std::cerr << label << ":";
    for (const auto &p : pts) {
        std::cerr << " (" << p[0] << ", " << p[1] << ")";
    }
    std::cerr << std::endl;
}

static bool points_approx_eq(const Polygon &a, const Polygon &b, const char *label_a="iter", const char *label_b="push") {
    if (a.size() != b.size()) {
        snprintf(msg, sizeof(msg), "Lengths differ (%s %zu != %s %zu)", label_a, a.size(), label_b, b.size());
        print_points(label_a, a);
        print_points(label_b, b);
        return false;
    }

    for (size_t i=0; i<a.size(); i++) {
        if (fabs(a[i][0] - b[i][0]) > 1e-7 || fabs(a[i][1] - b[i][1]) > 1e-7) {
            snprintf(msg, sizeof(msg), "Point %zu differs: %s (%f, %f) != %s (%f, %f)",
                    i, label_a, a[i][0], a[i][1], label_b, b[i][0], b[i][1]);
            print_points(label_a, a);
            print_points(label_b, b);
            return false;
        }
    }

    return true;
}

/* Distance of p to the closest segment of the polyline */
static double polyline_dist(const d2p &p, const Polygon &poly) {
    double best = INFINITY;
    for (size_t i=0; i+1<poly.size(); i++) {
        d2p d = poly[i+1] - poly[i];
        double len_sq = d[0]*d[0] + d[1]*d[1];
        double t = 0.0;
        if (len_sq > 0.0) {
            t = ((p[0] - poly[i][0]) * d[0] + (p[1] - poly[i][1]) * d[1]) / len_sq;
            t = std::clamp(t, 0.0, 1.0);
        }
        best = std::min(best, d2p_hypot(p - lerp(poly[i], poly[i+1], t)));
    }
    return best;
}

static double max_deviation(const cubic_segment &seg, const Polygon &flattened) {
    Polygon poly { seg.from };
    poly.insert(poly.end(), flattened.begin(), flattened.end());

    double worst = 0.0;
    for (int i=0; i<=1000; i++) {
        worst = std::max(worst, polyline_dist(seg.sample(i / 1000.0), poly));
    }
    return worst;
}

static void check_both_apis(const cubic_segment &seg, double tolerance, size_t min_len) {
    Polygon iter_points = flatten_iter(seg, tolerance);
    Polygon push_points = flatten_push(seg, tolerance);
    Polygon ref_points = flatten_reference(seg, tolerance);

    mu_assert(points_approx_eq(iter_points, push_points), msg);
    mu_assert(points_approx_eq(iter_points, ref_points, "iter", "reference"), msg);

    snprintf(msg, sizeof(msg), "Expected more than %zu points, got %zu", min_len, iter_points.size());
    mu_assert(iter_points.size() > min_len, msg);

    mu_assert(iter_points.back() == seg.to, "Iterator does not end exactly at the curve's end point");
    mu_assert(push_points.back() == seg.to, "Callback does not end exactly at the curve's end point");
}

static void check_inflections(const up_to_two<double> &inflections) {
    mu_assert(inflections.size() <= 2, "More than two inflections");
    for (size_t i=0; i<inflections.size(); i++) {
        snprintf(msg, sizeof(msg), "Inflection %zu out of range: %f", i, inflections[i]);
        mu_assert(inflections[i] >= 0.0 && inflections[i] < 1.0, msg);
    }
    if (inflections.size() == 2) {
        mu_assert(inflections[0] < inflections[1], "Inflections not in ascending order");
    }
}

MU_TEST(test_iter_vs_callback_arc) {
    cubic_segment seg({0, 0}, {1, 0}, {1, 1}, {0, 1});
    check_both_apis(seg, 0.01, 2);
}

MU_TEST(test_iter_vs_callback_s_curve) {
    cubic_segment seg({0, 0}, {1, 0}, {0, 1}, {1, 1});
    check_both_apis(seg, 0.01, 2);
}

MU_TEST(test_iter_vs_callback_rounded_corner) {
    cubic_segment seg({141, 135}, {141, 130}, {140, 130}, {131, 130});
    check_both_apis(seg, 0.01, 2);
}

/* second control point coincides with the end point */
MU_TEST(test_iter_vs_callback_duplicate_end_point) {
    cubic_segment seg({11.71726, 9.07143}, {1.889879, 13.22917}, {18.142855, 19.27679}, {18.142855, 19.27679});
    check_both_apis(seg, 0.15, 1);
}

MU_TEST(test_iter_vs_callback_two_inflections) {
    cubic_segment seg({-3, 2}, {1, 3}, {0, 4}, {0, 0});
    mu_assert_int_eq(2, (int) find_inflections(seg).size());
    check_both_apis(seg, 0.01, 2);
}

MU_TEST(test_iter_vs_callback_random_curves) {
    std::mt19937 rng(0x5eed);
    std::uniform_real_distribution<double> coord(-100.0, 100.0);
    const double tolerances[] = {0.001, 0.01, 0.1, 1.0};

    for (int i=0; i<400; i++) {
        cubic_segment seg({coord(rng), coord(rng)}, {coord(rng), coord(rng)}, {coord(rng), coord(rng)}, {coord(rng), coord(rng)});
        check_inflections(find_inflections(seg));
        check_both_apis(seg, tolerances[i % 4], 0);
    }
}

MU_TEST(test_iter_exhausted) {
    cubic_segment seg({0, 0}, {1, 0}, {1, 1}, {0, 1});
    cubic_flattening_iter iter(seg, 0.1);

    size_t n = 0;
    while (iter.next()) {
        n++;
        mu_assert(n < 1000, "Iterator does not terminate");
    }

    mu_check(n > 0);
    mu_check(iter.done());
    mu_check(!iter.next());
    mu_check(!iter.next());
    mu_check(iter.begin() == iter.end());
}

MU_TEST(test_no_inflections_in_arc) {
    cubic_segment seg({0, 0}, {1, 0}, {1, 1}, {0, 1});
    mu_check(find_inflections(seg).empty());
}

MU_TEST(test_single_inflection_in_s_curve) {
    cubic_segment seg({0, 0}, {1, 0}, {0, 1}, {1, 1});
    auto inflections = find_inflections(seg);
    mu_assert_int_eq(1, (int) inflections.size());
    mu_assert_double_eq(0.5, inflections[0]);
}

MU_TEST(test_two_inflections_ascending) {
    cubic_segment seg({4, -5}, {1, 3}, {4, -3}, {-4, 5});
    auto inflections = find_inflections(seg);
    mu_assert_int_eq(2, (int) inflections.size());
    check_inflections(inflections);
    mu_check(fabs(inflections[0] - 1.0/7.0) < 1e-9);
    mu_check(fabs(inflections[1] - 0.6) < 1e-9);
}

MU_TEST(test_straight_line_inflection_at_zero) {
    cubic_segment seg({0, 0}, {1, 1}, {2, 2}, {3, 3});
    auto inflections = find_inflections(seg);
    mu_assert_int_eq(1, (int) inflections.size());
    mu_check(inflections[0] == 0.0);

    Polygon pts = flatten_push(seg, 0.01);
    mu_assert_int_eq(2, (int) pts.size());
    mu_check(pts.back() == seg.to);
    mu_check(points_approx_eq(flatten_iter(seg, 0.01), pts));
}

MU_TEST(test_reference_two_inflections) {
    cubic_segment seg({4, -5}, {1, 3}, {4, -3}, {-4, 5});
    for (double tolerance : {0.001, 0.01, 0.1}) {
        mu_assert(points_approx_eq(flatten_iter(seg, tolerance), flatten_reference(seg, tolerance), "iter", "reference"), msg);
    }

    /* the middle piece must actually be emitted: the curve passes through its inflection points */
    Polygon pts = flatten_iter(seg, 0.01);
    d2p at_t2 = seg.sample(0.6);
    bool found = false;
    for (const d2p &p : pts) {
        if (fabs(p[0] - at_t2[0]) < 1e-9 && fabs(p[1] - at_t2[1]) < 1e-9)
            found = true;
    }
    mu_assert(found, "Second inflection point missing from output");
}

MU_TEST(test_polygon_append_skips_repeated_start) {
    /* ctrl1 == from puts an inflection at t=0, so the start point is yielded again */
    cubic_segment seg({0, 0}, {0, 0}, {10, 5}, {20, 0});
    auto inflections = find_inflections(seg);
    mu_check(!inflections.empty() && inflections[0] == 0.0);
    mu_check(flatten_iter(seg, 0.01).front() == seg.from);

    Polygon out { seg.from };
    flatten_cubic(seg, 0.01, out);
    mu_check(out.size() > 2);
    mu_check(out.back() == seg.to);
    for (size_t i=0; i+1<out.size(); i++) {
        snprintf(msg, sizeof(msg), "Vertex %zu repeated: (%f, %f)", i, out[i][0], out[i][1]);
        mu_assert(out[i] != out[i+1], msg);
    }

    cubic_segment line({0, 0}, {5, 0}, {10, 0}, {20, 0});
    Polygon line_out { line.from };
    flatten_cubic(line, 0.01, line_out);
    mu_assert_int_eq(2, (int) line_out.size());
    mu_check(line_out[1] == line.to);
}

MU_TEST(test_point_curve) {
    cubic_segment seg({5, 5}, {5, 5}, {5, 5}, {5, 5});
    auto inflections = find_inflections(seg);
    mu_assert_int_eq(1, (int) inflections.size());

    Polygon pts = flatten_iter(seg, 0.01);
    mu_check(!pts.empty());
    mu_check(pts.back() == seg.to);
}

MU_TEST(test_step_degenerate_handle) {
    /* ctrl1 == from */
    cubic_segment seg({0, 0}, {0, 0}, {1, 1}, {2, 0});
    mu_check(flattening_step(seg, 0.01) == 1.0);

    /* collinear handles */
    cubic_segment line({0, 0}, {1, 0}, {2, 0}, {5, 3});
    mu_check(flattening_step(line, 0.01) == 1.0);
}

MU_TEST(test_step_range) {
    cubic_segment seg({0, 0}, {1, 0}, {1, 1}, {0, 1});
    double t = flattening_step(seg, 0.01);
    mu_check(t > 0.0 && t < 1.0);

    /* coarse tolerance covers the whole curve in one step */
    mu_check(flattening_step(seg, 10.0) == 1.0);

    /* step grows with tolerance */
    mu_check(flattening_step(seg, 0.001) < t);
}

MU_TEST(test_smaller_tolerance_more_points) {
    cubic_segment seg({0, 0}, {1, 0}, {1, 1}, {0, 1});
    mu_check(flatten_iter(seg, 0.001).size() > flatten_iter(seg, 0.01).size());
    mu_check(flatten_iter(seg, 0.01).size() > flatten_iter(seg, 0.1).size());
}

MU_TEST(test_deviation_bounded) {
    cubic_segment arc({0, 0}, {1, 0}, {1, 1}, {0, 1});
    double dev = max_deviation(arc, flatten_iter(arc, 0.01));
    snprintf(msg, sizeof(msg), "Deviation %f too large", dev);
    mu_assert(dev < 0.02, msg);

    cubic_segment corner({141, 135}, {141, 130}, {140, 130}, {131, 130});
    dev = max_deviation(corner, flatten_iter(corner, 0.01));
    snprintf(msg, sizeof(msg), "Deviation %f too large", dev);
    mu_assert(dev < 0.02, msg);
}

MU_TEST(test_split_exact_end_points) {
    cubic_segment seg({0.1, 0.2}, {1.3, 0.7}, {-0.4, 2.9}, {3.3, 1.1});
    auto [before, after] = seg.split(0.3);
    mu_check(before.from == seg.from);
    mu_check(after.to == seg.to);
    mu_check(before.to == after.from);
    mu_check(seg.after_split(0.3) == after);
    mu_check(seg.before_split(0.3) == before);

    d2p mid = seg.sample(0.3);
    mu_check(fabs(mid[0] - after.from[0]) < 1e-12 && fabs(mid[1] - after.from[1]) < 1e-12);

    /* splitting the remainder again lands on the same curve */
    cubic_segment rest = after.after_split(0.5);
    d2p expected = seg.sample(0.3 + 0.7 * 0.5);
    mu_check(fabs(rest.from[0] - expected[0]) < 1e-12 && fabs(rest.from[1] - expected[1]) < 1e-12);
}

MU_TEST(test_up_to_two) {
    up_to_two<double> v;
    mu_check(v.empty());
    mu_check(!v.get(0));
    v.push(0.25);
    v.push(0.75);
    mu_assert_int_eq(2, (int) v.size());
    mu_check(*v.get(1) == 0.75);
    mu_check(!v.get(2));

    double sum = 0;
    for (double x : v)
        sum += x;
    mu_assert_double_eq(1.0, sum);
}

MU_TEST_SUITE(flatten_suite) {
    MU_RUN_TEST(test_iter_vs_callback_arc);
    MU_RUN_TEST(test_iter_vs_callback_s_curve);
    MU_RUN_TEST(test_iter_vs_callback_rounded_corner);
    MU_RUN_TEST(test_iter_vs_callback_duplicate_end_point);
    MU_RUN_TEST(test_iter_vs_callback_two_inflections);
    MU_RUN_TEST(test_iter_vs_callback_random_curves);
    MU_RUN_TEST(test_iter_exhausted);
    MU_RUN_TEST(test_no_inflections_in_arc);
    MU_RUN_TEST(test_single_inflection_in_s_curve);
    MU_RUN_TEST(test_two_inflections_ascending);
    MU_RUN_TEST(test_straight_line_inflection_at_zero);
    MU_RUN_TEST(test_reference_two_inflections);
    MU_RUN_TEST(test_polygon_append_skips_repeated_start);
    MU_RUN_TEST(test_point_curve);
    MU_RUN_TEST(test_step_degenerate_handle);
    MU_RUN_TEST(test_step_range);
    MU_RUN_TEST(test_smaller_tolerance_more_points);
    MU_RUN_TEST(test_deviation_bounded);
    MU_RUN_TEST(test_split_exact_end_points);
    MU_RUN_TEST(test_up_to_two);
};

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    MU_RUN_SUITE(flatten_suite);
    MU_REPORT();
    return MU_EXIT_CODE;
}
