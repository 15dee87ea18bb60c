#pragma once

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
  NDSLICE_OK = 0,
  NDSLICE_ERROR_INVALID_DIMENSION = 1,
  NDSLICE_ERROR_INVALID_PLANE = 2,
  NDSLICE_ERROR_DUPLICATE_PLANE = 3,
  NDSLICE_ERROR_NULL_BUFFER = 4,
  NDSLICE_ERROR_BUFFER_TOO_SMALL = 5,
  NDSLICE_ERROR_INVALID_CONFIG = 6,
  NDSLICE_ERROR_VERSION_MISMATCH = 7,
} ndslice_status_t;

struct NdsliceRotationAngle {
  unsigned int i;
  unsigned int j;
  float theta;
};

// Number of floats written by ndslice_compute_slice_uniforms: uBasisX, uBasisY,
// uBasisZ and uOrigin as float[11] each.
#define NDSLICE_SLICE_UNIFORM_FLOATS 44

size_t ndslice_rotation_plane_count(size_t dimension);

// Writes the row-major dimension x dimension rotation into out_matrix.
ndslice_status_t ndslice_compose_rotation(size_t dimension, const struct NdsliceRotationAngle* angles,
                                          size_t angle_count, float* out_matrix, size_t out_length);

// Frobenius norm of (R^T R - I) for a row-major matrix
float ndslice_orthogonality_drift(const float* matrix, size_t order);

// One call per frame: compose rotation, build the origin from slice parameters
// (axes 3..dimension-1) and pack the basis uniforms.
ndslice_status_t ndslice_compute_slice_uniforms(size_t dimension, const struct NdsliceRotationAngle* angles,
                                                size_t angle_count, const float* slice_parameters,
                                                size_t parameter_count, float* out_uniforms, size_t out_length);

// Projects structure-of-arrays vertices into slice coordinates using uniforms
// produced by ndslice_compute_slice_uniforms.
ndslice_status_t ndslice_project_vertices(const float* slice_uniforms, size_t dimension, const float* vertices,
                                          size_t vertex_count, float* out_positions, size_t out_length);

const char* ndslice_status_string(ndslice_status_t status);

#ifdef __cplusplus
}
#endif
