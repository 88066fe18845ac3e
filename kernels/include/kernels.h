#pragma once

/*
 * Native kernels exported with C linkage and the platform C calling
 * convention. Symbol names are stable and unmangled: hosts resolve them by
 * exactly `collatz_steps` and `bubble_sort`.
 *
 * Both functions are pure apart from the documented buffer mutation, keep no
 * state between calls, never allocate and report no errors.
 */

#include <stddef.h>
#include <stdint.h>

#if defined(KERNELS_BUILDING_MODULE)
#define KERNELS_API __attribute__((visibility("default")))
#else
#define KERNELS_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Number of steps for `n` to reach 1, where one step maps even `n` to `n / 2`
 * and odd `n` to `3n + 1`. The loop runs while `n > 1`, so every `n <= 1`
 * (zero and negative values included) yields 0.
 *
 * `3n + 1` wraps modulo 2^32 like two's complement hardware arithmetic. A
 * wrapped negative value ends the loop. Termination for positive input is the
 * Collatz conjecture itself; nothing bounds the running time, callers that
 * need a bound must enforce it outside of the call.
 */
KERNELS_API int32_t collatz_steps(int32_t n);

/*
 * Sorts `len` elements starting at `ptr` into non-descending order in place.
 * Equal elements keep their relative order. Runs in O(len^2) time.
 *
 * The caller must guarantee that:
 *   - `ptr` addresses at least `len` initialized int32_t values,
 *   - nothing else reads or writes that memory until the call returns.
 * The callee neither checks these conditions nor keeps any reference to the
 * memory after returning. Violations are undefined behavior.
 *
 * `len == 0` never touches memory, so `ptr` may be NULL in that case.
 */
KERNELS_API void bubble_sort(int32_t* ptr, size_t len);

typedef int32_t (*collatz_steps_fn)(int32_t);
typedef void (*bubble_sort_fn)(int32_t*, size_t);

#ifdef __cplusplus
}
#endif
