#pragma once

#include <cstddef>
#include <string>

#include "ndslice/types.hpp"

namespace ndslice {

struct RotationAngle {
  unsigned int i{0};
  unsigned int j{0};
  float theta{0.0f};
};

[[nodiscard]] std::size_t rotation_plane_count(std::size_t dimension);

// Ascending (i,j) enumeration: (0,1), (0,2), ..., (0,N-1), (1,2), ...
// Returns rotation_plane_count(dimension) when (i,j) is not a plane of the space.
[[nodiscard]] std::size_t rotation_plane_index(unsigned int i, unsigned int j, std::size_t dimension);
Status rotation_plane_at(std::size_t index, std::size_t dimension, unsigned int& out_i, unsigned int& out_j);

// X, Y, Z, W, V, U, then A6, A7, ...
[[nodiscard]] std::string axis_name(std::size_t axis);
[[nodiscard]] std::string plane_name(unsigned int i, unsigned int j);

// Wraps into [0, 2*pi). Non-finite input becomes 0.
[[nodiscard]] float sanitize_angle(float theta);

void set_identity(MatrixN& matrix, std::size_t order);

// Post-multiplies `matrix` by the elementary rotation of plane (i,j):
// G[i][i] = G[j][j] = cos, G[i][j] = -sin, G[j][i] = sin.
void apply_plane_rotation(MatrixN& matrix, unsigned int i, unsigned int j, float theta);

// Builds R from scratch as G(p0) * G(p1) * ... with the planes taken in ascending
// (i,j) order whatever the input order. Planes with i >= j, j >= dimension, or
// repeated planes reject the whole set and leave `out` as the identity.
Status compose_rotation(std::size_t dimension, const RotationAngle* angles, std::size_t angle_count, MatrixN& out);

// Frobenius norm of R^T R - I
[[nodiscard]] float orthogonality_drift(const MatrixN& matrix);

}  // namespace ndslice
