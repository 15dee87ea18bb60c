#include "ndslice/rotations.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace ndslice {

namespace {

constexpr float kTwoPi = 6.28318530717958647692f;
constexpr std::size_t kMaxPlanes = kMaxDimension * (kMaxDimension - 1) / 2;
constexpr const char* kAxisNames[] = {"X", "Y", "Z", "W", "V", "U"};

}  // namespace

std::size_t rotation_plane_count(std::size_t dimension) {
  if (dimension < 2) {
    return 0;
  }
  return dimension * (dimension - 1) / 2;
}

std::size_t rotation_plane_index(unsigned int i, unsigned int j, std::size_t dimension) {
  const std::size_t count = rotation_plane_count(dimension);
  if (i >= j || j >= dimension) {
    return count;
  }
  // Planes with first axis below i: sum over a < i of (dimension - 1 - a)
  const std::size_t before = static_cast<std::size_t>(i) * (2 * dimension - i - 1) / 2;
  return before + (j - i - 1);
}

Status rotation_plane_at(std::size_t index, std::size_t dimension, unsigned int& out_i, unsigned int& out_j) {
  if (!valid_dimension(dimension)) {
    return Status::kInvalidDimension;
  }
  if (index >= rotation_plane_count(dimension)) {
    return Status::kInvalidPlane;
  }
  std::size_t remaining = index;
  for (unsigned int i = 0; i + 1 < dimension; ++i) {
    const std::size_t row = dimension - 1 - i;
    if (remaining < row) {
      out_i = i;
      out_j = static_cast<unsigned int>(i + 1 + remaining);
      return Status::kSuccess;
    }
    remaining -= row;
  }
  return Status::kInvalidPlane;
}

std::string axis_name(std::size_t axis) {
  if (axis < sizeof(kAxisNames) / sizeof(kAxisNames[0])) {
    return kAxisNames[axis];
  }
  return "A" + std::to_string(axis);
}

std::string plane_name(unsigned int i, unsigned int j) {
  return axis_name(i) + axis_name(j);
}

float sanitize_angle(float theta) {
  if (!std::isfinite(theta)) {
    return 0.0f;
  }
  float wrapped = std::fmod(theta, kTwoPi);
  if (wrapped < 0.0f) {
    wrapped += kTwoPi;
  }
  if (wrapped >= kTwoPi) {
    wrapped = 0.0f;
  }
  return wrapped;
}

void set_identity(MatrixN& matrix, std::size_t order) {
  matrix.order = order;
  matrix.data.fill(0.0f);
  for (std::size_t k = 0; k < order; ++k) {
    matrix.at(k, k) = 1.0f;
  }
}

void apply_plane_rotation(MatrixN& matrix, unsigned int i, unsigned int j, float theta) {
  if (i >= matrix.order || j >= matrix.order || i == j) {
    return;
  }

  const float c = std::cos(theta);
  const float s = std::sin(theta);

  for (std::size_t row = 0; row < matrix.order; ++row) {
    const float a = matrix.at(row, i);
    const float b = matrix.at(row, j);

    matrix.at(row, i) = c * a + s * b;
    matrix.at(row, j) = c * b - s * a;
  }
}

Status compose_rotation(std::size_t dimension, const RotationAngle* angles, std::size_t angle_count, MatrixN& out) {
  if (!valid_dimension(dimension)) {
    return Status::kInvalidDimension;
  }
  set_identity(out, dimension);
  if (angle_count == 0) {
    return Status::kSuccess;
  }
  if (angles == nullptr) {
    return Status::kNullBuffer;
  }
  if (angle_count > kMaxPlanes) {
    return Status::kDuplicatePlane;
  }

  std::array<RotationAngle, kMaxPlanes> ordered{};
  for (std::size_t idx = 0; idx < angle_count; ++idx) {
    const RotationAngle& angle = angles[idx];
    if (angle.i >= angle.j || angle.j >= dimension) {
      return Status::kInvalidPlane;
    }
    ordered[idx] = angle;
  }

  std::sort(ordered.begin(), ordered.begin() + static_cast<std::ptrdiff_t>(angle_count),
            [](const RotationAngle& a, const RotationAngle& b) {
              return a.i != b.i ? a.i < b.i : a.j < b.j;
            });

  for (std::size_t idx = 1; idx < angle_count; ++idx) {
    if (ordered[idx].i == ordered[idx - 1].i && ordered[idx].j == ordered[idx - 1].j) {
      return Status::kDuplicatePlane;
    }
  }

  for (std::size_t idx = 0; idx < angle_count; ++idx) {
    const float theta = sanitize_angle(ordered[idx].theta);
    if (theta == 0.0f) {
      continue;
    }
    apply_plane_rotation(out, ordered[idx].i, ordered[idx].j, theta);
  }

  return Status::kSuccess;
}

float orthogonality_drift(const MatrixN& matrix) {
  const std::size_t order = matrix.order;
  float drift = 0.0f;

  for (std::size_t i = 0; i < order; ++i) {
    for (std::size_t j = 0; j < order; ++j) {
      // (R^T R)_ij = sum_k R[k,i] * R[k,j]
      float rtr_ij = 0.0f;
      for (std::size_t k = 0; k < order; ++k) {
        rtr_ij += matrix.at(k, i) * matrix.at(k, j);
      }
      if (i == j) {
        rtr_ij -= 1.0f;
      }
      drift += rtr_ij * rtr_ij;
    }
  }

  return std::sqrt(drift);
}

}  // namespace ndslice
