// =============================================================================
// SAL - Local Getis-Ord G / G* Tests
// =============================================================================
//
// Complete test coverage for the local half of sal/binding/c_api/getis_ord.h
//
// Functions tested:
//   - sal_getis_ord_local (binary / row-standardized, G / G*)
//
// Reference implementation: published six-point values and the dense Eigen
// oracle (oracle.hpp)
// Precision requirement: Tolerance::normal() for analytic moments
//
// =============================================================================

#include "test.hpp"

#include <algorithm>
#include <cmath>

using namespace sal::test;
using precision::Tolerance;

namespace {

// Output buffers of one local run
struct LocalRun {
    explicit LocalRun(sal_size_t n, sal_size_t perms, bool keep_sim = false)
        : Gs(n), EGs(n), VGs(n), Zs(n), p_norm(n), p_sim(n), z_sim(n), p_z_sim(n),
          sim(keep_sim ? n * perms : 0), perms(perms) {}

    sal_error_t run(sal_weights_t w, const std::vector<sal_real_t>& y, sal_transform_t transform,
                    bool star, uint64_t seed = 42, sal_cancel_t cancel = nullptr) {
        return sal_getis_ord_local(
            w, y.data(), y.size(), transform, star ? SAL_TRUE : SAL_FALSE, perms, seed,
            Gs.data(), EGs.data(), VGs.data(), Zs.data(), p_norm.data(),
            p_sim.data(), z_sim.data(), p_z_sim.data(),
            sim.empty() ? nullptr : sim.data(), cancel, &summary);
    }

    std::vector<sal_real_t> Gs;
    std::vector<sal_real_t> EGs;
    std::vector<sal_real_t> VGs;
    std::vector<sal_real_t> Zs;
    std::vector<sal_real_t> p_norm;
    std::vector<sal_real_t> p_sim;
    std::vector<sal_real_t> z_sim;
    std::vector<sal_real_t> p_z_sim;
    std::vector<sal_real_t> sim;
    sal_size_t perms;
    sal_local_g_summary_t summary{};
};

void check_reference(const LocalRun& out, const fixture::six::LocalRef& ref) {
    SAL_ASSERT_VEC_NEAR(ref.Gs, out.Gs, 6, Tolerance::normal());
    SAL_ASSERT_VEC_NEAR(ref.EGs, out.EGs, 6, Tolerance::normal());
    SAL_ASSERT_VEC_NEAR(ref.VGs, out.VGs, 6, Tolerance::normal());
    SAL_ASSERT_VEC_NEAR(ref.Zs, out.Zs, 6, Tolerance::normal());
    for (std::size_t i = 0; i < 6; ++i) {
        SAL_ASSERT_NEAR(oracle::normal_sf(std::abs(ref.Zs[i])), out.p_norm[i], 1e-9);
    }
}

void check_oracle(const Graph& g, const std::vector<sal_real_t>& y,
                  sal_transform_t transform, bool star) {
    Weights w = make_weights(g);
    LocalRun out(g.n(), 0);
    SAL_ASSERT_EQ(out.run(w, y, transform, star), SAL_OK);

    const auto ref = oracle::local_g(g, to_eigen(y), transform, star);
    SAL_ASSERT_VEC_NEAR(ref.Gs, out.Gs, g.n(), Tolerance::normal());
    SAL_ASSERT_VEC_NEAR(ref.EGs, out.EGs, g.n(), Tolerance::normal());
    SAL_ASSERT_VEC_NEAR(ref.VGs, out.VGs, g.n(), Tolerance::statistical());
    SAL_ASSERT_VEC_NEAR(ref.Zs, out.Zs, g.n(), Tolerance::statistical());
}

} // namespace

SAL_TEST_BEGIN

// =============================================================================
// Analytic Inference: Six-Point Reference
// =============================================================================

SAL_TEST_SUITE(six_points)

SAL_TEST_CASE(binary_g) {
    Weights w = make_weights(fixture::six_points());
    LocalRun out(6, 0);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_BINARY, false), SAL_OK);
    check_reference(out, fixture::six::binary_g);
}

SAL_TEST_CASE(binary_gstar) {
    Weights w = make_weights(fixture::six_points());
    LocalRun out(6, 0);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_BINARY, true), SAL_OK);
    check_reference(out, fixture::six::binary_gstar);
}

SAL_TEST_CASE(row_g) {
    Weights w = make_weights(fixture::six_points());
    LocalRun out(6, 0);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_ROW, false), SAL_OK);
    check_reference(out, fixture::six::row_g);
}

SAL_TEST_CASE(row_gstar) {
    Weights w = make_weights(fixture::six_points());
    LocalRun out(6, 0);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_ROW, true), SAL_OK);
    check_reference(out, fixture::six::row_gstar);
}

SAL_TEST_CASE(no_permutations_summary_empty) {
    Weights w = make_weights(fixture::six_points());
    LocalRun out(6, 0);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_ROW, false), SAL_OK);

    SAL_ASSERT_EQ(out.summary.permutations, static_cast<sal_size_t>(0));
    SAL_ASSERT_EQ(out.summary.completed, static_cast<sal_size_t>(0));
    SAL_ASSERT_EQ(out.summary.cancelled, SAL_FALSE);
    SAL_ASSERT_NAN(out.summary.EG_sim);
    SAL_ASSERT_NAN(out.summary.seG_sim);
}

SAL_TEST_CASE(simulation_outputs_optional_without_permutations) {
    Weights w = make_weights(fixture::six_points());
    const std::vector<sal_real_t> y = fixture::six_values();
    std::vector<sal_real_t> Gs(6), EGs(6), VGs(6), Zs(6), p(6);

    SAL_ASSERT_EQ(sal_getis_ord_local(w, y.data(), 6, SAL_TRANSFORM_BINARY, SAL_FALSE, 0, 42,
                                      Gs.data(), EGs.data(), VGs.data(), Zs.data(), p.data(),
                                      nullptr, nullptr, nullptr, nullptr, nullptr, nullptr),
                  SAL_OK);
    SAL_ASSERT_VEC_NEAR(fixture::six::binary_g.Gs, Gs, 6, Tolerance::normal());
}

SAL_TEST_SUITE_END

// =============================================================================
// Analytic Inference: Oracle
// =============================================================================

SAL_TEST_SUITE(oracle)

SAL_TEST_CASE(binary_variants_match_oracle) {
    Random rng(21);
    const Graph g = random_symmetric(120, 3, rng);
    const std::vector<sal_real_t> y = random_values(g.n(), 0.5, 30.0, rng);

    check_oracle(g, y, SAL_TRANSFORM_BINARY, false);
    check_oracle(g, y, SAL_TRANSFORM_BINARY, true);
}

SAL_TEST_CASE(row_variants_match_oracle_weighted) {
    // Row-standardized G uses the original weights; G* uses binary weights
    Random rng(22);
    const Graph g = with_random_weights(lattice(9, 11), 0.2, 3.0, rng);
    const std::vector<sal_real_t> y = random_values(g.n(), 0.5, 30.0, rng);

    check_oracle(g, y, SAL_TRANSFORM_ROW, false);
    check_oracle(g, y, SAL_TRANSFORM_ROW, true);
}

SAL_TEST_CASE(gstar_ignores_edge_weights) {
    Random rng(23);
    const Graph plain = lattice(5, 6);
    const Graph weighted = with_random_weights(plain, 0.2, 3.0, rng);
    const std::vector<sal_real_t> y = random_values(plain.n(), 1.0, 9.0, rng);

    Weights w1 = make_weights(plain);
    Weights w2 = make_weights(weighted);
    LocalRun a(plain.n(), 0);
    LocalRun b(plain.n(), 0);
    SAL_ASSERT_EQ(a.run(w1, y, SAL_TRANSFORM_ROW, true), SAL_OK);
    SAL_ASSERT_EQ(b.run(w2, y, SAL_TRANSFORM_ROW, true), SAL_OK);

    SAL_ASSERT_VEC_NEAR(a.Gs, b.Gs, plain.n(), Tolerance::strict());
    SAL_ASSERT_VEC_NEAR(a.Zs, b.Zs, plain.n(), Tolerance::strict());
}

SAL_TEST_CASE(invariant_to_positive_scaling) {
    Random rng(24);
    const Graph g = random_symmetric(50, 3, rng);
    Weights w = make_weights(g);
    const std::vector<sal_real_t> y = random_values(g.n(), 1.0, 9.0, rng);
    std::vector<sal_real_t> scaled(y);
    for (auto& v : scaled) v *= 7.25;

    for (bool star : {false, true}) {
        LocalRun a(g.n(), 0);
        LocalRun b(g.n(), 0);
        SAL_ASSERT_EQ(a.run(w, y, SAL_TRANSFORM_BINARY, star), SAL_OK);
        SAL_ASSERT_EQ(b.run(w, scaled, SAL_TRANSFORM_BINARY, star), SAL_OK);

        SAL_ASSERT_VEC_NEAR(a.Gs, b.Gs, g.n(), Tolerance::normal());
        SAL_ASSERT_VEC_NEAR(a.Zs, b.Zs, g.n(), Tolerance::normal());
    }
}

SAL_TEST_SUITE_END

// =============================================================================
// Conditional Permutation
// =============================================================================

SAL_TEST_SUITE(simulation)

SAL_TEST_CASE(location_zero_pseudo_p_value) {
    // Location 0 has two neighbors; 9 of the 10 pairs of the other values sum
    // to at least the observed lag. Neither row standardization nor adding
    // y_0 to both sides changes that order, so p_sim is close to 0.1 for all
    // four variants.
    Weights w = make_weights(fixture::six_points());
    const sal_transform_t transforms[] = {SAL_TRANSFORM_BINARY, SAL_TRANSFORM_ROW};

    for (const sal_transform_t t : transforms) {
        for (const bool star : {false, true}) {
            LocalRun out(6, 999);
            SAL_ASSERT_EQ(out.run(w, fixture::six_values(), t, star, 42), SAL_OK);
            SAL_ASSERT_GE(out.p_sim[0], 0.072);
            SAL_ASSERT_LE(out.p_sim[0], 0.13);
        }
    }
}

SAL_TEST_CASE(p_sim_matches_sim_rows) {
    Weights w = make_weights(fixture::six_points());
    const sal_size_t m = 499;
    LocalRun out(6, m, true);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_ROW, false, 8), SAL_OK);

    SAL_ASSERT_EQ(out.summary.permutations, m);
    SAL_ASSERT_EQ(out.summary.completed, m);
    SAL_ASSERT_EQ(out.summary.cancelled, SAL_FALSE);

    for (sal_size_t i = 0; i < 6; ++i) {
        const sal_real_t* row = out.sim.data() + i * m;
        SAL_ASSERT_NEAR(oracle::folded_pvalue(row, m, out.Gs[i]), out.p_sim[i], 1e-15);
        SAL_ASSERT_GE(out.p_sim[i], 1.0 / (m + 1));
        SAL_ASSERT_LE(out.p_sim[i], 0.5 + 1.0 / (m + 1));
    }
}

SAL_TEST_CASE(summary_pooled_over_all_locations) {
    Weights w = make_weights(fixture::six_points());
    const sal_size_t m = 199;
    LocalRun out(6, m, true);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_BINARY, true, 5), SAL_OK);

    const auto mom = oracle::moments(out.sim.data(), out.sim.size());
    SAL_ASSERT_TRUE(precision::approx_equal(mom.mean, out.summary.EG_sim));
    SAL_ASSERT_TRUE(precision::approx_equal(mom.std, out.summary.seG_sim));
    SAL_ASSERT_TRUE(precision::approx_equal(mom.std * mom.std, out.summary.VG_sim));

    for (sal_size_t i = 0; i < 6; ++i) {
        const double z = (out.Gs[i] - mom.mean) / mom.std;
        SAL_ASSERT_TRUE(precision::approx_equal(z, out.z_sim[i]));
        SAL_ASSERT_NEAR(oracle::normal_sf(std::abs(z)), out.p_z_sim[i], 1e-9);
    }
}

SAL_TEST_CASE(single_neighbor_draws_exclude_self) {
    // Location 2 has one neighbor: each draw of G is y_j / (sum y - y_2) for
    // some j != 2
    Weights w = make_weights(fixture::six_points());
    const std::vector<sal_real_t> y = fixture::six_values();
    const sal_size_t m = 300;
    LocalRun out(6, m, true);
    SAL_ASSERT_EQ(out.run(w, y, SAL_TRANSFORM_BINARY, false, 77), SAL_OK);

    const double rest = 28.2 - y[2];
    const sal_real_t* row = out.sim.data() + 2 * m;
    for (sal_size_t t = 0; t < m; ++t) {
        bool found = false;
        for (sal_size_t j = 0; j < 6; ++j) {
            if (j == 2) continue;
            if (std::abs(row[t] - y[j] / rest) < 1e-12) found = true;
        }
        SAL_ASSERT_MSG(found, "simulated value is not another location's value");
    }
}

SAL_TEST_CASE(single_neighbor_star_draws_include_self) {
    // G*: each draw at location 5 is (y_5 + y_j) / sum y for some j != 5
    Weights w = make_weights(fixture::six_points());
    const std::vector<sal_real_t> y = fixture::six_values();
    const sal_size_t m = 300;
    LocalRun out(6, m, true);
    SAL_ASSERT_EQ(out.run(w, y, SAL_TRANSFORM_BINARY, true, 78), SAL_OK);

    const sal_real_t* row = out.sim.data() + 5 * m;
    for (sal_size_t t = 0; t < m; ++t) {
        bool found = false;
        for (sal_size_t j = 0; j < 5; ++j) {
            if (std::abs(row[t] - (y[5] + y[j]) / 28.2) < 1e-12) found = true;
        }
        SAL_ASSERT_MSG(found, "simulated G* value does not include the location itself");
    }
}

SAL_TEST_CASE(draw_means_near_expectation) {
    // Binary G: the permutation mean at i is card_i / (n - 1) = EGs_i
    Random rng(31);
    const Graph g = random_symmetric(40, 2, rng);
    Weights w = make_weights(g);
    const std::vector<sal_real_t> y = random_values(g.n(), 1.0, 10.0, rng);
    const sal_size_t m = 999;

    LocalRun out(g.n(), m, true);
    SAL_ASSERT_EQ(out.run(w, y, SAL_TRANSFORM_BINARY, false, 2024), SAL_OK);

    for (sal_size_t i = 0; i < g.n(); ++i) {
        const auto mom = oracle::moments(out.sim.data() + i * m, m);
        const double se = mom.std / std::sqrt(static_cast<double>(m));
        SAL_ASSERT_LE(std::abs(mom.mean - out.EGs[i]), 6.0 * se + 1e-12);
    }
}

SAL_TEST_CASE(same_seed_same_draws) {
    Weights w = make_weights(fixture::six_points());
    const std::vector<sal_real_t> y = fixture::six_values();

    LocalRun a(6, 99, true);
    LocalRun b(6, 99, true);
    LocalRun c(6, 99, true);
    SAL_ASSERT_EQ(a.run(w, y, SAL_TRANSFORM_ROW, false, 1000), SAL_OK);
    SAL_ASSERT_EQ(b.run(w, y, SAL_TRANSFORM_ROW, false, 1000), SAL_OK);
    SAL_ASSERT_EQ(c.run(w, y, SAL_TRANSFORM_ROW, false, 1001), SAL_OK);

    SAL_ASSERT_TRUE(a.sim == b.sim);
    SAL_ASSERT_TRUE(a.p_sim == b.p_sim);
    SAL_ASSERT_FALSE(a.sim == c.sim);
}

SAL_TEST_CASE(island_left_out_of_simulation) {
    // Six-point graph plus an isolated seventh location
    const Graph g = from_neighbors({{1, 3}, {0, 3, 4}, {4}, {0, 1, 4}, {1, 2, 3, 5}, {4}, {}});
    const std::vector<sal_real_t> y = {2.0, 3.0, 3.2, 5.0, 8.0, 7.0, 4.0};
    Weights w = make_weights(g);
    const sal_size_t m = 199;
    const sal_transform_t transforms[] = {SAL_TRANSFORM_ROW, SAL_TRANSFORM_BINARY};

    for (const sal_transform_t t : transforms) {
        LocalRun out(7, m, true);
        SAL_ASSERT_EQ(out.run(w, y, t, false, 12), SAL_OK);

        SAL_ASSERT_NAN(out.p_sim[6]);
        SAL_ASSERT_NAN(out.z_sim[6]);
        SAL_ASSERT_NAN(out.p_z_sim[6]);
        for (sal_size_t r = 0; r < m; ++r) {
            SAL_ASSERT_NAN(out.sim[6 * m + r]);
        }

        // Pooled over the six connected locations only
        const auto mom = oracle::moments(out.sim.data(), 6 * m);
        SAL_ASSERT_TRUE(std::isfinite(out.summary.EG_sim));
        SAL_ASSERT_TRUE(precision::approx_equal(mom.mean, out.summary.EG_sim));
        SAL_ASSERT_TRUE(precision::approx_equal(mom.std, out.summary.seG_sim));

        for (sal_size_t i = 0; i < 6; ++i) {
            const sal_real_t* row = out.sim.data() + i * m;
            SAL_ASSERT_NEAR(oracle::folded_pvalue(row, m, out.Gs[i]), out.p_sim[i], 1e-15);
            SAL_ASSERT_TRUE(std::isfinite(out.z_sim[i]));
        }
    }

    // G* keeps the island's own value in every draw
    LocalRun star(7, m, true);
    SAL_ASSERT_EQ(star.run(w, y, SAL_TRANSFORM_ROW, true, 12), SAL_OK);
    SAL_ASSERT_FALSE(std::isnan(star.p_sim[6]));
    SAL_ASSERT_TRUE(std::isfinite(star.summary.EG_sim));
}

SAL_TEST_SUITE_END

// =============================================================================
// Transform Handling
// =============================================================================

SAL_TEST_SUITE(transform)

SAL_TEST_CASE(caller_transform_restored) {
    Weights w = make_weights(fixture::six_points());
    const bool stars[] = {false, true};
    const sal_transform_t transforms[] = {SAL_TRANSFORM_BINARY, SAL_TRANSFORM_ROW};

    for (bool star : stars) {
        for (sal_transform_t t : transforms) {
            LocalRun out(6, 19);
            SAL_ASSERT_EQ(out.run(w, fixture::six_values(), t, star), SAL_OK);

            sal_transform_t now = -1;
            SAL_ASSERT_EQ(sal_weights_get_transform(w, &now), SAL_OK);
            SAL_ASSERT_EQ(now, SAL_TRANSFORM_ORIGINAL);
        }
    }
}

SAL_TEST_CASE(result_independent_of_entry_transform) {
    Weights w = make_weights(fixture::six_points());
    LocalRun a(6, 0);
    LocalRun b(6, 0);

    SAL_ASSERT_EQ(a.run(w, fixture::six_values(), SAL_TRANSFORM_ROW, false), SAL_OK);
    SAL_ASSERT_EQ(sal_weights_set_transform(w, SAL_TRANSFORM_BINARY), SAL_OK);
    SAL_ASSERT_EQ(b.run(w, fixture::six_values(), SAL_TRANSFORM_ROW, false), SAL_OK);

    SAL_ASSERT_TRUE(a.Gs == b.Gs);
}

SAL_TEST_SUITE_END

// =============================================================================
// Validation
// =============================================================================

SAL_TEST_SUITE(validation)

SAL_TEST_CASE(reject_original_transform) {
    Weights w = make_weights(fixture::six_points());
    LocalRun out(6, 0);
    SAL_ASSERT_EQ(out.run(w, fixture::six_values(), SAL_TRANSFORM_ORIGINAL, false),
                  SAL_ERROR_INVALID_ARGUMENT);
    SAL_ASSERT_STR_CONTAINS(sal_get_last_error(), "transform");
}

SAL_TEST_CASE(reject_too_few_locations) {
    Weights w = make_weights(ring(3));
    LocalRun out(3, 0);
    SAL_ASSERT_EQ(out.run(w, {1.0, 2.0, 3.0}, SAL_TRANSFORM_BINARY, false),
                  SAL_ERROR_INVALID_ARGUMENT);
}

SAL_TEST_CASE(reject_length_mismatch) {
    Weights w = make_weights(fixture::six_points());
    LocalRun out(6, 0);
    SAL_ASSERT_EQ(out.run(w, std::vector<sal_real_t>(5, 1.0), SAL_TRANSFORM_BINARY, false),
                  SAL_ERROR_DIMENSION_MISMATCH);
}

SAL_TEST_CASE(reject_missing_simulation_outputs) {
    Weights w = make_weights(fixture::six_points());
    const std::vector<sal_real_t> y = fixture::six_values();
    std::vector<sal_real_t> Gs(6), EGs(6), VGs(6), Zs(6), p(6);

    SAL_ASSERT_EQ(sal_getis_ord_local(w, y.data(), 6, SAL_TRANSFORM_BINARY, SAL_FALSE, 9, 42,
                                      Gs.data(), EGs.data(), VGs.data(), Zs.data(), p.data(),
                                      nullptr, nullptr, nullptr, nullptr, nullptr, nullptr),
                  SAL_ERROR_NULL_POINTER);
}

SAL_TEST_CASE(reject_null_required_outputs) {
    Weights w = make_weights(fixture::six_points());
    const std::vector<sal_real_t> y = fixture::six_values();
    std::vector<sal_real_t> buf(6);

    SAL_ASSERT_EQ(sal_getis_ord_local(w, y.data(), 6, SAL_TRANSFORM_BINARY, SAL_FALSE, 0, 42,
                                      nullptr, buf.data(), buf.data(), buf.data(), buf.data(),
                                      nullptr, nullptr, nullptr, nullptr, nullptr, nullptr),
                  SAL_ERROR_NULL_POINTER);
}

SAL_TEST_SUITE_END

SAL_TEST_END

SAL_TEST_MAIN()
