#include "ndslice/raymarch.hpp"

#include <cmath>

namespace ndslice {

namespace {

constexpr float kMinDirectionLength = 1e-8f;

}  // namespace

float surface_threshold(const RaymarchSettings& settings, float t) {
  return settings.surface_epsilon * (1.0f + settings.threshold_growth * std::fabs(t));
}

float effective_step(const DistanceEstimator& estimator, float distance) {
  return distance * estimator.safety_factor();
}

EstimatorResult sample_slice(const DistanceEstimator& estimator, const SliceBasis& basis,
                             const std::array<float, 3>& position, int iteration_budget) {
  VectorN point{};
  map_to_nd(basis, position[0], position[1], position[2], point.data());
  return estimator.evaluate(point.data(), iteration_budget);
}

RayHit raymarch(const DistanceEstimator& estimator, const SliceBasis& basis, const std::array<float, 3>& origin,
                const std::array<float, 3>& direction, const RaymarchSettings& settings) {
  RayHit hit{};
  if (estimator.config().dimension != basis.dimension) {
    return hit;
  }

  const float length =
      std::sqrt(direction[0] * direction[0] + direction[1] * direction[1] + direction[2] * direction[2]);
  if (length < kMinDirectionLength) {
    return hit;
  }
  const std::array<float, 3> dir{direction[0] / length, direction[1] / length, direction[2] / length};

  float t = 0.0f;
  for (int step = 0; step < settings.max_steps; ++step) {
    const std::array<float, 3> p{origin[0] + t * dir[0], origin[1] + t * dir[1], origin[2] + t * dir[2]};
    const EstimatorResult sample = sample_slice(estimator, basis, p, settings.iteration_budget);

    hit.steps = step + 1;
    hit.t = t;
    hit.position = p;
    hit.sample = sample;

    const float threshold = surface_threshold(settings, t);
    if (sample.distance < threshold) {
      hit.outcome = MarchOutcome::kHit;
      if (!estimate_normal(estimator, basis, p, threshold * settings.normal_scale, settings.iteration_budget,
                           hit.normal)) {
        hit.normal = {-dir[0], -dir[1], -dir[2]};
      }
      return hit;
    }

    t += effective_step(estimator, sample.distance);
    if (t > settings.max_distance) {
      hit.outcome = MarchOutcome::kMiss;
      hit.t = t;
      return hit;
    }
  }

  hit.outcome = MarchOutcome::kStepExhausted;
  return hit;
}

bool estimate_normal(const DistanceEstimator& estimator, const SliceBasis& basis, const std::array<float, 3>& position,
                     float step, int iteration_budget, std::array<float, 3>& out_normal) {
  if (!(step > 0.0f)) {
    return false;
  }

  std::array<float, 3> gradient{};
  for (std::size_t axis = 0; axis < 3; ++axis) {
    std::array<float, 3> plus = position;
    std::array<float, 3> minus = position;
    plus[axis] += step;
    minus[axis] -= step;

    const float f_plus = sample_slice(estimator, basis, plus, iteration_budget).distance;
    const float f_minus = sample_slice(estimator, basis, minus, iteration_budget).distance;
    gradient[axis] = (f_plus - f_minus) / (2.0f * step);
  }

  const float norm = std::sqrt(gradient[0] * gradient[0] + gradient[1] * gradient[1] + gradient[2] * gradient[2]);
  if (!(norm > 0.0f) || !std::isfinite(norm)) {
    return false;
  }
  for (std::size_t axis = 0; axis < 3; ++axis) {
    out_normal[axis] = gradient[axis] / norm;
  }
  return true;
}

}  // namespace ndslice
