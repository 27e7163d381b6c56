// =============================================================================
// SAL - Core C API Tests
// =============================================================================
//
// Tests version info, error reporting, thread control and cancellation tokens
// defined in core.h.
//
// =============================================================================

#include "test.hpp"

#include <cstring>
#include <string>

using namespace sal::test;

SAL_TEST_BEGIN

// =============================================================================
// Version Information
// =============================================================================

SAL_TEST_SUITE(version)

SAL_TEST_CASE(version_matches_header) {
    const char* version = sal_get_version();
    SAL_ASSERT_NOT_NULL(version);

    const std::string expected = std::to_string(SAL_C_API_VERSION_MAJOR) + "." +
                                 std::to_string(SAL_C_API_VERSION_MINOR) + "." +
                                 std::to_string(SAL_C_API_VERSION_PATCH);
    SAL_ASSERT_EQ(expected, std::string(version));
}

SAL_TEST_CASE(build_config_names_precision) {
    const char* config = sal_get_build_config();
    SAL_ASSERT_NOT_NULL(config);

    if (sizeof(sal_real_t) == 8) {
        SAL_ASSERT_STR_CONTAINS(config, "float64");
    } else {
        SAL_ASSERT_STR_CONTAINS(config, "float32");
    }
    if (sizeof(sal_index_t) == 8) {
        SAL_ASSERT_STR_CONTAINS(config, "int64");
    } else {
        SAL_ASSERT_STR_CONTAINS(config, "int32");
    }
}

SAL_TEST_SUITE_END

// =============================================================================
// Error Reporting
// =============================================================================

SAL_TEST_SUITE(errors)

SAL_TEST_CASE(error_codes_defined) {
    SAL_ASSERT_EQ(SAL_OK, 0);
    SAL_ASSERT_EQ(SAL_ERROR_UNKNOWN, 1);
    SAL_ASSERT_EQ(SAL_ERROR_INTERNAL, 2);
    SAL_ASSERT_EQ(SAL_ERROR_OUT_OF_MEMORY, 3);
    SAL_ASSERT_EQ(SAL_ERROR_NULL_POINTER, 4);
    SAL_ASSERT_EQ(SAL_ERROR_INVALID_ARGUMENT, 10);
    SAL_ASSERT_EQ(SAL_ERROR_DIMENSION_MISMATCH, 11);
    SAL_ASSERT_EQ(SAL_ERROR_RANGE_ERROR, 13);
    SAL_ASSERT_EQ(SAL_ERROR_INDEX_OUT_OF_BOUNDS, 14);
    SAL_ASSERT_EQ(SAL_ERROR_TRANSFORM_RESTORE, 60);
}

SAL_TEST_CASE(error_initial_state) {
    sal_clear_error();

    SAL_ASSERT_EQ(sal_get_last_error_code(), SAL_OK);
    const char* msg = sal_get_last_error();
    SAL_ASSERT_NOT_NULL(msg);
}

SAL_TEST_CASE(error_after_null_pointer) {
    sal_clear_error();

    sal_size_t n = 0;
    const sal_error_t err = sal_weights_n(nullptr, &n);

    SAL_ASSERT_EQ(err, SAL_ERROR_NULL_POINTER);
    SAL_ASSERT_EQ(sal_get_last_error_code(), SAL_ERROR_NULL_POINTER);
    SAL_ASSERT_STR_CONTAINS(sal_get_last_error(), "null");
}

SAL_TEST_CASE(error_message_from_exception) {
    sal_clear_error();

    // Neighbor index out of range surfaces as a bounds error with context
    const std::vector<sal_index_t> indptr = {0, 1, 2};
    const std::vector<sal_index_t> indices = {1, 7};
    sal_weights_t w = nullptr;
    const sal_error_t err = sal_weights_create(&w, 2, indptr.data(), indices.data(),
                                               nullptr, nullptr);

    SAL_ASSERT_EQ(err, SAL_ERROR_INDEX_OUT_OF_BOUNDS);
    SAL_ASSERT_NULL(w);
    SAL_ASSERT_STR_CONTAINS(sal_get_last_error(), "out of range");
}

SAL_TEST_CASE(clear_error_resets_state) {
    sal_size_t n = 0;
    SAL_ASSERT_NE(sal_weights_n(nullptr, &n), SAL_OK);
    SAL_ASSERT_NE(sal_get_last_error_code(), SAL_OK);

    sal_clear_error();
    SAL_ASSERT_EQ(sal_get_last_error_code(), SAL_OK);
}

SAL_TEST_CASE(is_ok_and_is_error) {
    SAL_ASSERT_EQ(sal_is_ok(SAL_OK), SAL_TRUE);
    SAL_ASSERT_EQ(sal_is_ok(SAL_ERROR_INVALID_ARGUMENT), SAL_FALSE);
    SAL_ASSERT_EQ(sal_is_error(SAL_OK), SAL_FALSE);
    SAL_ASSERT_EQ(sal_is_error(SAL_ERROR_TRANSFORM_RESTORE), SAL_TRUE);
}

SAL_TEST_SUITE_END

// =============================================================================
// Threading
// =============================================================================

SAL_TEST_SUITE(threads)

SAL_TEST_CASE(num_threads_at_least_one) {
    SAL_ASSERT_GE(sal_get_num_threads(), static_cast<sal_size_t>(1));
}

SAL_TEST_CASE(set_num_threads_zero_selects_hardware) {
    SAL_ASSERT_EQ(sal_set_num_threads(0), SAL_OK);
    SAL_ASSERT_GE(sal_get_num_threads(), static_cast<sal_size_t>(1));
}

SAL_TEST_CASE(set_num_threads_roundtrip) {
    const std::string config = sal_get_build_config();
    SAL_SKIP_IF(config.find("serial") != std::string::npos, "serial backend has one thread");

    SAL_ASSERT_EQ(sal_set_num_threads(2), SAL_OK);
    SAL_ASSERT_EQ(sal_get_num_threads(), static_cast<sal_size_t>(2));
    SAL_ASSERT_EQ(sal_set_num_threads(0), SAL_OK);
}

SAL_TEST_SUITE_END

// =============================================================================
// Cancellation Tokens
// =============================================================================

SAL_TEST_SUITE(cancel)

SAL_TEST_CASE(cancel_lifecycle) {
    Cancel c = make_cancel();
    SAL_ASSERT_TRUE(c.valid());

    sal_bool_t requested = SAL_TRUE;
    SAL_ASSERT_EQ(sal_cancel_requested(c, &requested), SAL_OK);
    SAL_ASSERT_EQ(requested, SAL_FALSE);

    SAL_ASSERT_EQ(sal_cancel_request(c), SAL_OK);
    SAL_ASSERT_EQ(sal_cancel_requested(c, &requested), SAL_OK);
    SAL_ASSERT_EQ(requested, SAL_TRUE);

    SAL_ASSERT_EQ(sal_cancel_reset(c), SAL_OK);
    SAL_ASSERT_EQ(sal_cancel_requested(c, &requested), SAL_OK);
    SAL_ASSERT_EQ(requested, SAL_FALSE);
}

SAL_TEST_CASE(cancel_destroy_null_safe) {
    SAL_ASSERT_EQ(sal_cancel_destroy(nullptr), SAL_OK);

    sal_cancel_t c = nullptr;
    SAL_ASSERT_EQ(sal_cancel_destroy(&c), SAL_OK);

    SAL_ASSERT_EQ(sal_cancel_create(&c), SAL_OK);
    SAL_ASSERT_NOT_NULL(c);
    SAL_ASSERT_EQ(sal_cancel_destroy(&c), SAL_OK);
    SAL_ASSERT_NULL(c);
}

SAL_TEST_CASE(cancel_null_handle) {
    sal_bool_t requested = SAL_FALSE;
    SAL_ASSERT_EQ(sal_cancel_request(nullptr), SAL_ERROR_NULL_POINTER);
    SAL_ASSERT_EQ(sal_cancel_reset(nullptr), SAL_ERROR_NULL_POINTER);
    SAL_ASSERT_EQ(sal_cancel_requested(nullptr, &requested), SAL_ERROR_NULL_POINTER);
    SAL_ASSERT_EQ(sal_cancel_create(nullptr), SAL_ERROR_NULL_POINTER);
}

SAL_TEST_CASE(cancel_guard_move) {
    Cancel a = make_cancel();
    sal_cancel_t raw = a.get();

    Cancel b = std::move(a);
    SAL_ASSERT_NULL(a.get());
    SAL_ASSERT_EQ(b.get(), raw);
}

SAL_TEST_SUITE_END

SAL_TEST_END

SAL_TEST_MAIN()
