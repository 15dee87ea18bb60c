#pragma once

#include <array>
#include <cstddef>

#include "ndslice/estimators.hpp"
#include "ndslice/slice_basis.hpp"

namespace ndslice {

enum class MarchOutcome {
  kHit,
  kMiss,           // travelled past max_distance
  kStepExhausted,  // ran out of steps before deciding
};

struct RaymarchSettings {
  int max_steps{256};
  float max_distance{20.0f};
  float surface_epsilon{1e-3f};
  // threshold(t) = surface_epsilon * (1 + threshold_growth * t)
  float threshold_growth{0.0f};
  int iteration_budget{0};  // <= 0 uses the estimator's own max_iterations
  // Normal sampling offset as a multiple of threshold(t)
  float normal_scale{1.0f};
};

struct RayHit {
  MarchOutcome outcome{MarchOutcome::kMiss};
  float t{0.0f};
  int steps{0};
  std::array<float, 3> position{};
  std::array<float, 3> normal{};  // valid only for kHit
  EstimatorResult sample{};
};

[[nodiscard]] float surface_threshold(const RaymarchSettings& settings, float t);

// distance * safety_factor. Field estimators always carry safety_factor < 1.
[[nodiscard]] float effective_step(const DistanceEstimator& estimator, float distance);

// Evaluates the estimator at a 3D ray-space point through the slice mapping.
[[nodiscard]] EstimatorResult sample_slice(const DistanceEstimator& estimator, const SliceBasis& basis,
                                           const std::array<float, 3>& position, int iteration_budget);

// `direction` need not be normalized. The estimator dimension must match the basis.
RayHit raymarch(const DistanceEstimator& estimator, const SliceBasis& basis, const std::array<float, 3>& origin,
                const std::array<float, 3>& direction, const RaymarchSettings& settings);

// Central-difference gradient of the estimator's scalar output in ray space,
// normalized. Returns false when the gradient vanishes.
bool estimate_normal(const DistanceEstimator& estimator, const SliceBasis& basis, const std::array<float, 3>& position,
                     float step, int iteration_budget, std::array<float, 3>& out_normal);

}  // namespace ndslice
