// =============================================================================
// FILE: sal/binding/c_api/weights.cpp
// BRIEF: C API implementation for spatial weights graphs and the spatial lag
// =============================================================================

#include "sal/binding/c_api/weights.h"
#include "sal/binding/c_api/core/internal.hpp"
#include "sal/core/weights.hpp"
#include "sal/kernel/lag.hpp"

#include <memory>

using namespace sal;
using namespace sal::binding;

extern "C" {

// =============================================================================
// Lifecycle
// =============================================================================

SAL_EXPORT sal_error_t sal_weights_create(
    sal_weights_t* out,
    const sal_size_t n,
    const sal_index_t* indptr,
    const sal_index_t* indices,
    const sal_real_t* weights,
    const sal_index_t* ids) {

    SAL_C_API_CHECK_NULL(out, "Output handle pointer is null");
    SAL_C_API_CHECK_NULL(indptr, "indptr array is null");
    SAL_C_API_CHECK(n > 0, SAL_ERROR_INVALID_ARGUMENT,
                    "Weights graph needs at least one location");
    SAL_C_API_CHECK(indptr[0] == 0 && indptr[n] >= 0, SAL_ERROR_INVALID_ARGUMENT,
                    "indptr must start at 0 and end at a non-negative nnz");

    const auto nnz = static_cast<Size>(indptr[n]);
    SAL_C_API_CHECK(nnz == 0 || indices != nullptr, SAL_ERROR_NULL_POINTER,
                    "indices array is null");

    SAL_C_API_TRY
        *out = nullptr;

        WeightsGraph graph(
            Array<const Index>(indptr, static_cast<Size>(n) + 1),
            Array<const Index>(indices, nnz),
            weights ? Array<const Real>(weights, nnz) : Array<const Real>(),
            ids ? Array<const Index>(ids, static_cast<Size>(n)) : Array<const Index>()
        );

        *out = new sal_weights(std::move(graph));
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

SAL_EXPORT sal_error_t sal_weights_destroy(sal_weights_t* weights) {
    if (weights == nullptr || *weights == nullptr) {
        SAL_C_API_RETURN_OK;  // Already null
    }
    delete *weights;
    *weights = nullptr;
    SAL_C_API_RETURN_OK;
}

// =============================================================================
// Property Queries
// =============================================================================

SAL_EXPORT sal_error_t sal_weights_n(sal_weights_t weights, sal_size_t* out) {
    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = static_cast<sal_size_t>(weights->graph.n());
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_weights_nnz(sal_weights_t weights, sal_size_t* out) {
    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = static_cast<sal_size_t>(weights->graph.nnz());
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_weights_max_cardinality(sal_weights_t weights, sal_index_t* out) {
    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = static_cast<sal_index_t>(weights->graph.max_cardinality());
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_weights_cardinalities(
    sal_weights_t weights,
    sal_index_t* out,
    const sal_size_t n) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(out, "Output array is null");
    SAL_C_API_CHECK(n >= weights->graph.n(), SAL_ERROR_DIMENSION_MISMATCH,
                    "Output array smaller than the number of locations");

    const auto& g = weights->graph;
    for (Size i = 0; i < g.n(); ++i) {
        out[i] = static_cast<sal_index_t>(g.cardinality(i));
    }
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_weights_ids(
    sal_weights_t weights,
    sal_index_t* out,
    const sal_size_t n) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(out, "Output array is null");
    SAL_C_API_CHECK(n >= weights->graph.n(), SAL_ERROR_DIMENSION_MISMATCH,
                    "Output array smaller than the number of locations");

    const auto ids = weights->graph.ids();
    for (Size i = 0; i < ids.len; ++i) {
        out[i] = static_cast<sal_index_t>(ids[i]);
    }
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_weights_sums(
    sal_weights_t weights,
    sal_real_t* s0,
    sal_real_t* s1,
    sal_real_t* s2) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");

    const auto& sums = weights->graph.sums();
    if (s0) *s0 = static_cast<sal_real_t>(sums.s0);
    if (s1) *s1 = static_cast<sal_real_t>(sums.s1);
    if (s2) *s2 = static_cast<sal_real_t>(sums.s2);
    SAL_C_API_RETURN_OK;
}

// =============================================================================
// Transform
// =============================================================================

SAL_EXPORT sal_error_t sal_weights_get_transform(sal_weights_t weights, sal_transform_t* out) {
    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(out, "Output pointer is null");

    *out = static_cast<sal_transform_t>(weights->graph.transform());
    SAL_C_API_RETURN_OK;
}

SAL_EXPORT sal_error_t sal_weights_set_transform(sal_weights_t weights, const sal_transform_t transform) {
    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");

    SAL_C_API_TRY
        weights->graph.set_transform(static_cast<Transform>(transform));
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

SAL_EXPORT sal_error_t sal_transform_scope_begin(sal_weights_t weights, const sal_transform_t forced) {
    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK(!weights->scope_open(), SAL_ERROR_INVALID_ARGUMENT,
                    "A transform scope is already open on this graph");

    SAL_C_API_TRY
        weights->scope = std::make_unique<ScopedTransform>(
            weights->graph, static_cast<Transform>(forced));
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

SAL_EXPORT sal_error_t sal_transform_scope_end(sal_weights_t weights) {
    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK(weights->scope_open(), SAL_ERROR_INVALID_ARGUMENT,
                    "No transform scope is open on this graph");

    SAL_C_API_TRY
        // Closed whether or not restore succeeds
        const std::unique_ptr<ScopedTransform> scope = std::move(weights->scope);
        scope->restore();
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

// =============================================================================
// Spatial Lag
// =============================================================================

SAL_EXPORT sal_error_t sal_spatial_lag(
    sal_weights_t weights,
    const sal_real_t* y,
    const sal_size_t n,
    sal_real_t* out) {

    SAL_C_API_CHECK_NULL(weights, "Weights handle is null");
    SAL_C_API_CHECK_NULL(y, "Values array is null");
    SAL_C_API_CHECK_NULL(out, "Output array is null");

    SAL_C_API_TRY
        kernel::lag::spatial_lag(
            weights->graph,
            Array<const Real>(y, static_cast<Size>(n)),
            Array<Real>(out, static_cast<Size>(n))
        );
        SAL_C_API_RETURN_OK;
    SAL_C_API_CATCH
}

} // extern "C"
