// =============================================================================
// FILE: sal/binding/c_api/getis_ord.cpp
// BRIEF: C API implementation for Getis-Ord global G and local G / G*
// =============================================================================

#include "sal/binding/c_api/getis_ord.h"
#include "sal/binding/c_api/core/internal.hpp"
#include "sal/kernel/getis_ord.hpp"

using namespace sal;
using namespace sal::binding;
using namespace sal::kernel::getis_ord;

namespace {

const CancelToken* token_of(sal_cancel_t cancel) noexcept {
    return cancel ? &cancel->token : nullptr;
}

Array<Real> optional_array(sal_real_t* ptr, Size len) noexcept {
    return ptr ? Array<Real>(ptr, len) : Array<Real>();
}

Array<Size> optional_counts(sal_size_t* ptr, Size len) noexcept {
    return ptr ? Array<Size>(ptr, len) : Array<Size>();
}

void fill_result(const GlobalGResult& r, sal_global_g_result_t* out) noexcept {
    out->G = r.G;
    out->EG = r.EG;
    out->EG2 = r.EG2;
    out->VG = r.VG;
    out->z_norm = r.z_norm;
    out->p_norm = r.p_norm;

    out->b0 = r.b0;
    out->b1 = r.b1;
    out->b2 = r.b2;
    out->b3 = r.b3;
    out->b4 = r.b4;
    out->den_sum = r.den_sum;

    out->permutations = static_cast<sal_size_t>(r.permutations);
    out->completed = static_cast<sal_size_t>(r.completed);
    out->cancelled = r.cancelled ? SAL_TRUE : SAL_FALSE;

    out->p_sim = r.p_sim;
    out->EG_sim = r.EG_sim;
    out->seG_sim = r.seG_sim;
    out->VG_sim = r.VG_sim;
    out->z_sim = r.z_sim;
    out->p_z_sim = r.p_z_sim;
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Global G
// =============================================================================

SAL_EXPORT sal_error_t sal_getis_ord_global(
    sal_weights_t weights,
    const sal_real_t* y,
    const sal_size_t n,
    const sal_size_t n_permutations,
    const uint64_t seed,
    sal_real_t* sim,
    sal_cancel_t cancel,
    sal_global_g_result_t* result) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(y, "Values array is null");
    SAL_C_API_CHECK_NULL(result, "Output result is null");

    SAL_C_API_TRY
        const GlobalGResult r = global_g(
            weights->graph,
            Array<const Real>(y, static_cast<Size>(n)),
            static_cast<Size>(n_permutations),
            seed,
            optional_array(sim, static_cast<Size>(n_permutations)),
            token_of(cancel)
        );
        fill_result(r, result);
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

// =============================================================================
// Local G / G*
// =============================================================================

SAL_EXPORT sal_error_t sal_getis_ord_local(
    sal_weights_t weights,
    const sal_real_t* y,
    const sal_size_t n,
    const sal_transform_t transform,
    const sal_bool_t star,
    const sal_size_t n_permutations,
    const uint64_t seed,
    sal_real_t* Gs,
    sal_real_t* EGs,
    sal_real_t* VGs,
    sal_real_t* Zs,
    sal_real_t* p_norm,
    sal_real_t* p_sim,
    sal_real_t* z_sim,
    sal_real_t* p_z_sim,
    sal_real_t* sim,
    sal_cancel_t cancel,
    sal_local_g_summary_t* summary) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(y, "Values array is null");
    SAL_C_API_CHECK_NULL(Gs, "Output Gs array is null");
    SAL_C_API_CHECK_NULL(EGs, "Output EGs array is null");
    SAL_C_API_CHECK_NULL(VGs, "Output VGs array is null");
    SAL_C_API_CHECK_NULL(Zs, "Output Zs array is null");
    SAL_C_API_CHECK_NULL(p_norm, "Output p_norm array is null");
    if (n_permutations > 0) {
        SAL_C_API_CHECK_NULL(p_sim, "Output p_sim array is null");
        SAL_C_API_CHECK_NULL(z_sim, "Output z_sim array is null");
        SAL_C_API_CHECK_NULL(p_z_sim, "Output p_z_sim array is null");
    }

    SAL_C_API_TRY
        const auto len = static_cast<Size>(n);
        const auto perms = static_cast<Size>(n_permutations);

        LocalGOutput out;
        out.Gs = Array<Real>(Gs, len);
        out.EGs = Array<Real>(EGs, len);
        out.VGs = Array<Real>(VGs, len);
        out.Zs = Array<Real>(Zs, len);
        out.p_norm = Array<Real>(p_norm, len);
        out.p_sim = optional_array(p_sim, len);
        out.z_sim = optional_array(z_sim, len);
        out.p_z_sim = optional_array(p_z_sim, len);
        out.sim = optional_array(sim, len * perms);

        const LocalGResult r = local_g(
            weights->graph,
            Array<const Real>(y, len),
            out,
            static_cast<Transform>(transform),
            star != SAL_FALSE,
            perms,
            seed,
            token_of(cancel)
        );

        if (summary) {
            summary->EG_sim = r.EG_sim;
            summary->seG_sim = r.seG_sim;
            summary->VG_sim = r.VG_sim;
            summary->permutations = static_cast<sal_size_t>(r.permutations);
            summary->completed = static_cast<sal_size_t>(r.completed);
            summary->cancelled = r.cancelled ? SAL_TRUE : SAL_FALSE;
        }
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

// =============================================================================
// Batch
// =============================================================================

SAL_EXPORT sal_error_t sal_getis_ord_global_batch(
    sal_weights_t weights,
    const sal_real_t* values,
    const sal_size_t n_features,
    const sal_size_t n,
    const sal_pvalue_kind_t kind,
    const sal_size_t n_permutations,
    const uint64_t seed,
    sal_real_t* stat,
    sal_real_t* pval,
    sal_size_t* completed,
    sal_cancel_t cancel) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(values, "Values matrix is null");
    SAL_C_API_CHECK_NULL(stat, "Output stat array is null");
    SAL_C_API_CHECK_NULL(pval, "Output pval array is null");
    SAL_C_API_CHECK(n == weights->graph.n(), SAL_ERROR_DIMENSION_MISMATCH,
                    "Feature length does not match the number of locations");

    SAL_C_API_TRY
        const auto nf = static_cast<Size>(n_features);
        global_g_batch(
            weights->graph,
            Array<const Real>(values, nf * static_cast<Size>(n)),
            nf,
            Array<Real>(stat, nf),
            Array<Real>(pval, nf),
            optional_counts(completed, nf),
            static_cast<PValueKind>(kind),
            static_cast<Size>(n_permutations),
            seed,
            token_of(cancel)
        );
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

SAL_EXPORT sal_error_t sal_getis_ord_local_batch(
    sal_weights_t weights,
    const sal_real_t* values,
    const sal_size_t n_features,
    const sal_size_t n,
    const sal_transform_t transform,
    const sal_bool_t star,
    const sal_pvalue_kind_t kind,
    const sal_size_t n_permutations,
    const uint64_t seed,
    sal_real_t* stat,
    sal_real_t* pval,
    sal_size_t* completed,
    sal_cancel_t cancel) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(values, "Values matrix is null");
    SAL_C_API_CHECK_NULL(stat, "Output stat array is null");
    SAL_C_API_CHECK_NULL(pval, "Output pval array is null");
    SAL_C_API_CHECK(n == weights->graph.n(), SAL_ERROR_DIMENSION_MISMATCH,
                    "Feature length does not match the number of locations");

    SAL_C_API_TRY
        const auto total = static_cast<Size>(n_features) * static_cast<Size>(n);
        local_g_batch(
            weights->graph,
            Array<const Real>(values, total),
            static_cast<Size>(n_features),
            Array<Real>(stat, total),
            Array<Real>(pval, total),
            optional_counts(completed, static_cast<Size>(n_features)),
            static_cast<PValueKind>(kind),
            static_cast<Transform>(transform),
            star != SAL_FALSE,
            static_cast<Size>(n_permutations),
            seed,
            token_of(cancel)
        );
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

} // extern "C"
