#ifndef NDSHADER_API_H
#define NDSHADER_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>

// Error codes
typedef enum {
    NDSHADER_OK = 0,
    NDSHADER_ERROR_INVALID_DIMENSION = 1,
    NDSHADER_ERROR_INCOMPATIBLE_FEATURES = 2,
    NDSHADER_ERROR_MISSING_DEPENDENCY = 3,
    NDSHADER_ERROR_ORDER = 4,
    NDSHADER_ERROR_CONFLICT = 5,
    NDSHADER_ERROR_COMPILATION_FAILED = 6,
    NDSHADER_ERROR_INVALID_KEY = 7,
    NDSHADER_ERROR_NULL_POINTER = 8,
    NDSHADER_ERROR_OUT_OF_RANGE = 9,
    NDSHADER_ERROR_INTERNAL = 10
} ndshader_error_t;

typedef enum {
    NDSHADER_FAMILY_SPHERE = 0,
    NDSHADER_FAMILY_HYPERBULB = 1,
    NDSHADER_FAMILY_MANDELBOX = 2,
    NDSHADER_FAMILY_KALI = 3
} ndshader_family_t;

typedef enum {
    NDSHADER_OPACITY_SOLID = 0,
    NDSHADER_OPACITY_SIMPLE_ALPHA = 1,
    NDSHADER_OPACITY_LAYERED_SURFACES = 2,
    NDSHADER_OPACITY_VOLUMETRIC_DENSITY = 3
} ndshader_opacity_mode_t;

typedef enum {
    NDSHADER_COLOR_MONOCHROMATIC = 0,
    NDSHADER_COLOR_COSINE = 1,
    NDSHADER_COLOR_NORMAL = 2,
    NDSHADER_COLOR_DISTANCE = 3,
    NDSHADER_COLOR_ORBIT_TRAP = 4
} ndshader_color_algorithm_t;

typedef enum {
    NDSHADER_UNIFORM_FLOAT = 0,
    NDSHADER_UNIFORM_INT = 1,
    NDSHADER_UNIFORM_VEC3 = 2
} ndshader_uniform_type_t;

typedef enum {
    NDSHADER_STATE_UNCACHED = 0,
    NDSHADER_STATE_COMPOSING = 1,
    NDSHADER_STATE_CACHED = 2,
    NDSHADER_STATE_FAILED = 3
} ndshader_variant_state_t;

typedef struct {
    ndshader_family_t family;
    size_t dimension;
    int normals;
    int lighting;
    int shadows;
    int ambient_occlusion;
    int fresnel;
    ndshader_opacity_mode_t opacity;
    ndshader_color_algorithm_t color;
} ndshader_variant_key_t;

typedef struct {
    const char* name;            // owned by the variant handle
    ndshader_uniform_type_t type;
    size_t arity;                // 1 for scalars
} ndshader_uniform_t;

// Opaque handle types
typedef struct ndshader_context_t* ndshader_context_handle;
typedef struct ndshader_variant_t* ndshader_variant_handle;

// Context management
ndshader_context_handle ndshader_context_create(void);
void ndshader_context_destroy(ndshader_context_handle ctx);

// Fills a key with the default feature set (3D hyperbulb, normals + lighting)
void ndshader_default_key(ndshader_variant_key_t* out_key);

// Composition (cache-backed). A variant handle stays valid after cache
// clears until it is released.
ndshader_error_t ndshader_compose(
    ndshader_context_handle ctx,
    const ndshader_variant_key_t* key,
    ndshader_variant_handle* out_variant
);

ndshader_error_t ndshader_compose_canonical(
    ndshader_context_handle ctx,
    const char* canonical_key,
    ndshader_variant_handle* out_variant
);

void ndshader_variant_release(ndshader_variant_handle variant);

// Variant accessors
const char* ndshader_variant_source(ndshader_variant_handle variant);
size_t ndshader_variant_source_length(ndshader_variant_handle variant);
const char* ndshader_variant_key_string(ndshader_variant_handle variant);
size_t ndshader_variant_uniform_count(ndshader_variant_handle variant);
ndshader_error_t ndshader_variant_uniform_at(
    ndshader_variant_handle variant,
    size_t index,
    ndshader_uniform_t* out_uniform
);

// Host link feedback. On failure *out_fallback receives the last known good
// variant of the same family, or NULL.
ndshader_error_t ndshader_report_link_result(
    ndshader_context_handle ctx,
    ndshader_variant_handle variant,
    int success,
    const char* log,
    ndshader_variant_handle* out_fallback
);

ndshader_variant_state_t ndshader_variant_state(
    ndshader_context_handle ctx,
    const ndshader_variant_key_t* key
);

// Cache control
size_t ndshader_cache_clear(ndshader_context_handle ctx);
size_t ndshader_cache_size(ndshader_context_handle ctx);

// Composer options; both clear the cache when they change the output
void ndshader_set_glsl_version(ndshader_context_handle ctx, const char* version);
void ndshader_set_module_markers(ndshader_context_handle ctx, int enabled);

// Error handling
const char* ndshader_error_string(ndshader_error_t error);
const char* ndshader_get_last_error_message(ndshader_context_handle ctx);

#ifdef __cplusplus
}
#endif

#endif // NDSHADER_API_H
