#pragma once

#include <array>
#include <cstddef>

namespace ndslice {

constexpr std::size_t kMinDimension = 2;
constexpr std::size_t kMaxDimension = 11;

enum class Status {
  kSuccess = 0,
  kInvalidDimension,
  kInvalidPlane,
  kDuplicatePlane,
  kNullBuffer,
  kBufferTooSmall,
  kInvalidConfig,
  kVersionMismatch,
};

[[nodiscard]] inline bool valid_dimension(std::size_t dimension) {
  return dimension >= kMinDimension && dimension <= kMaxDimension;
}

// Fixed-capacity N-vector. Components at and above `dimension` stay zero.
using VectorN = std::array<float, kMaxDimension>;

// Row-major N x N matrix stored in an 11 x 11 block; stride is always kMaxDimension.
struct MatrixN {
  std::size_t order{0};
  std::array<float, kMaxDimension * kMaxDimension> data{};

  [[nodiscard]] float at(std::size_t row, std::size_t col) const { return data[row * kMaxDimension + col]; }
  float& at(std::size_t row, std::size_t col) { return data[row * kMaxDimension + col]; }
};

struct ConstBufferView {
  const float* data{nullptr};
  std::size_t length{0};
};

struct BufferView {
  float* data{nullptr};
  std::size_t length{0};
};

}  // namespace ndslice
