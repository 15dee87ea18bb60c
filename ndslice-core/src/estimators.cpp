#include "ndslice/estimators.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ndslice {

namespace {

constexpr float kRadiusEpsilon = 1e-6f;
constexpr float kDivisorEpsilon = 1e-8f;
constexpr float kMaxDerivative = 1e30f;
constexpr float kLargeTrap = std::numeric_limits<float>::max();

constexpr const char* kFamilyNames[kEstimatorFamilyCount] = {"sphere", "hyperbulb", "mandelbox", "kali"};

float dot(const float* a, const float* b, std::size_t dimension) {
  float sum = 0.0f;
  for (std::size_t axis = 0; axis < dimension; ++axis) {
    sum += a[axis] * b[axis];
  }
  return sum;
}

void copy_point(const float* point, std::size_t dimension, VectorN& out) {
  out.fill(0.0f);
  for (std::size_t axis = 0; axis < dimension; ++axis) {
    out[axis] = point[axis];
  }
}

class SphereEstimator final : public DistanceEstimator {
 public:
  using DistanceEstimator::DistanceEstimator;

  EstimatorKind kind() const override { return EstimatorKind::kTrueDistance; }

  EstimatorResult evaluate(const float* point, int /*iteration_budget*/) const override {
    EstimatorResult result{};
    const float r2 = dot(point, point, config_.dimension);
    result.distance = std::sqrt(r2) - config_.sphere.radius;
    result.trap = r2;
    return result;
  }
};

// z <- powmap(z) + c with dr <- power * r^(power-1) * dr + 1,
// distance = 0.5 * log(r) * r / dr.
class HyperbulbEstimator final : public DistanceEstimator {
 public:
  using DistanceEstimator::DistanceEstimator;

  EstimatorKind kind() const override { return EstimatorKind::kTrueDistance; }

  EstimatorResult evaluate(const float* point, int iteration_budget) const override {
    const std::size_t dimension = config_.dimension;
    const float power = config_.hyperbulb.power;
    const float bailout = config_.bailout_radius;
    const float bailout2 = bailout * bailout;
    const int budget = resolve_budget(iteration_budget);

    VectorN z{};
    copy_point(point, dimension, z);

    float r2 = dot(z.data(), z.data(), dimension);
    float dr = 1.0f;
    EstimatorResult result{};
    result.trap = r2;

    int iteration = 0;
    for (; iteration < budget; ++iteration) {
      if (r2 > bailout2) {
        result.escaped = true;
        break;
      }
      const float r = std::sqrt(r2);
      dr = std::min(power * std::pow(std::max(r, kRadiusEpsilon), power - 1.0f) * dr + 1.0f, kMaxDerivative);

      hyperbulb_power_map(z.data(), dimension, power, z.data());
      for (std::size_t axis = 0; axis < dimension; ++axis) {
        z[axis] += point[axis];
      }
      r2 = dot(z.data(), z.data(), dimension);
      result.trap = std::min(result.trap, r2);
    }
    if (!result.escaped && r2 > bailout2) {
      result.escaped = true;
    }

    const float r = std::sqrt(r2);
    result.iterations = iteration;
    result.distance = 0.5f * std::log(std::max(r, kRadiusEpsilon)) * r / std::max(dr, kDivisorEpsilon);
    result.smooth_iterations = result.escaped ? smooth_escape(iteration, r, bailout, power)
                                              : static_cast<float>(iteration);
    return result;
  }
};

// box fold, sphere fold, then z <- scale * z + c. The folds are conformal so a
// scalar dr is enough: distance = |z| / |dr|.
class MandelboxEstimator final : public DistanceEstimator {
 public:
  using DistanceEstimator::DistanceEstimator;

  EstimatorKind kind() const override { return EstimatorKind::kTrueDistance; }

  EstimatorResult evaluate(const float* point, int iteration_budget) const override {
    const std::size_t dimension = config_.dimension;
    const MandelboxParams& params = config_.mandelbox;
    const float bailout = config_.bailout_radius;
    const float bailout2 = bailout * bailout;
    const float min_radius2 = params.min_radius * params.min_radius;
    const float fixed_radius2 = params.fixed_radius * params.fixed_radius;
    const float abs_scale = std::fabs(params.scale);
    const int budget = resolve_budget(iteration_budget);

    VectorN z{};
    copy_point(point, dimension, z);
    VectorN c{};
    if (params.julia_mode) {
      c = params.julia_constant;
    } else {
      copy_point(point, dimension, c);
    }

    float r2 = dot(z.data(), z.data(), dimension);
    float dr = 1.0f;
    EstimatorResult result{};
    result.trap = r2;

    int iteration = 0;
    for (; iteration < budget; ++iteration) {
      box_fold(z.data(), dimension, params.folding_limit);
      dr *= sphere_fold(z.data(), dimension, min_radius2, fixed_radius2);

      for (std::size_t axis = 0; axis < dimension; ++axis) {
        z[axis] = params.scale * z[axis] + c[axis];
      }
      dr = std::min(dr * abs_scale + (params.julia_mode ? 0.0f : 1.0f), kMaxDerivative);

      r2 = dot(z.data(), z.data(), dimension);
      result.trap = std::min(result.trap, r2);
      if (r2 > bailout2) {
        result.escaped = true;
        ++iteration;
        break;
      }
    }

    const float r = std::sqrt(r2);
    result.iterations = iteration;
    result.distance = r / std::max(std::fabs(dr), kDivisorEpsilon);
    result.smooth_iterations = result.escaped ? smooth_escape(iteration, r, bailout, std::max(abs_scale, 2.0f))
                                              : static_cast<float>(iteration);
    return result;
  }
};

// z <- gain * |z| / max(z.z, eps) + c. The abs fold breaks conformality, so the
// value is only a field and is marched with a safety factor. Escaped orbits use
// the log-radius estimate, bounded ones the distance of their trap to the
// shell, and the result is intersected with the bounding ball.
class KaliEstimator final : public DistanceEstimator {
 public:
  using DistanceEstimator::DistanceEstimator;

  EstimatorKind kind() const override { return EstimatorKind::kField; }

  EstimatorResult evaluate(const float* point, int iteration_budget) const override {
    const std::size_t dimension = config_.dimension;
    const KaliParams& params = config_.kali;
    const float bailout = config_.bailout_radius;
    const float bailout2 = bailout * bailout;
    const float epsilon = std::max(params.epsilon, kDivisorEpsilon);
    const int budget = resolve_budget(iteration_budget);

    VectorN z{};
    copy_point(point, dimension, z);

    float r2 = dot(z.data(), z.data(), dimension);
    const float bound = std::sqrt(r2) - params.bound_radius;
    float dr = 1.0f;
    EstimatorResult result{};
    result.trap = kLargeTrap;

    int iteration = 0;
    for (; iteration < budget; ++iteration) {
      const float inverse = params.reciprocal_gain / std::max(r2, epsilon);
      for (std::size_t axis = 0; axis < dimension; ++axis) {
        z[axis] = std::fabs(z[axis]) * inverse + params.constant[axis];
      }
      dr = std::min(dr * std::fabs(inverse), kMaxDerivative);

      r2 = dot(z.data(), z.data(), dimension);
      result.trap = std::min(result.trap, r2);
      if (r2 > bailout2) {
        result.escaped = true;
        ++iteration;
        break;
      }
    }

    const float r = std::sqrt(r2);
    float structure = 0.0f;
    if (result.escaped) {
      structure = 0.5f * std::log(std::max(r, kRadiusEpsilon)) * r / std::max(dr, kDivisorEpsilon);
    } else {
      structure = std::sqrt(result.trap) - params.shell_radius;
    }

    result.iterations = iteration;
    result.distance = std::max(bound, structure);
    result.smooth_iterations = result.escaped ? smooth_escape(iteration, r, bailout, 2.0f)
                                              : static_cast<float>(iteration);
    return result;
  }
};

}  // namespace

EstimatorKind family_kind(EstimatorFamily family) {
  return family == EstimatorFamily::kKali ? EstimatorKind::kField : EstimatorKind::kTrueDistance;
}

const char* family_name(EstimatorFamily family) {
  const auto index = static_cast<std::size_t>(family);
  return index < kEstimatorFamilyCount ? kFamilyNames[index] : "unknown";
}

bool parse_family(const std::string& name, EstimatorFamily& out) {
  for (std::size_t index = 0; index < kEstimatorFamilyCount; ++index) {
    if (name == kFamilyNames[index]) {
      out = static_cast<EstimatorFamily>(index);
      return true;
    }
  }
  return false;
}

EstimatorConfig default_estimator_config(EstimatorFamily family, std::size_t dimension) {
  EstimatorConfig config{};
  config.family = family;
  config.dimension = dimension;

  switch (family) {
    case EstimatorFamily::kSphere:
      config.max_iterations = 1;
      config.bailout_radius = 4.0f;
      break;
    case EstimatorFamily::kHyperbulb:
      config.max_iterations = 80;
      config.bailout_radius = 4.0f;
      break;
    case EstimatorFamily::kMandelbox:
      config.max_iterations = 50;
      // r / dr underestimates only once the orbit is far outside the set,
      // which reaches about radius 10 at scale -1.5
      config.bailout_radius = 1000.0f;
      break;
    case EstimatorFamily::kKali:
      config.max_iterations = 24;
      config.bailout_radius = 10.0f;
      config.safety_factor = 0.7f;
      for (std::size_t axis = 0; axis < kMaxDimension; ++axis) {
        config.kali.constant[axis] = axis < dimension ? -0.5f : 0.0f;
      }
      break;
  }
  return config;
}

Status validate_estimator_config(const EstimatorConfig& config) {
  if (!valid_dimension(config.dimension)) {
    return Status::kInvalidDimension;
  }
  if (static_cast<std::size_t>(config.family) >= kEstimatorFamilyCount) {
    return Status::kInvalidConfig;
  }
  if (config.max_iterations <= 0 || config.max_iterations > kMaxIterationBudget) {
    return Status::kInvalidConfig;
  }
  if (!std::isfinite(config.bailout_radius) || config.bailout_radius <= 0.0f) {
    return Status::kInvalidConfig;
  }
  if (!(config.safety_factor > 0.0f && config.safety_factor <= 1.0f)) {
    return Status::kInvalidConfig;
  }
  if (family_kind(config.family) == EstimatorKind::kField && config.safety_factor >= 1.0f) {
    return Status::kInvalidConfig;
  }

  switch (config.family) {
    case EstimatorFamily::kSphere:
      if (!(config.sphere.radius > 0.0f)) {
        return Status::kInvalidConfig;
      }
      break;
    case EstimatorFamily::kHyperbulb:
      if (!(config.hyperbulb.power > 1.0f) || !std::isfinite(config.hyperbulb.power)) {
        return Status::kInvalidConfig;
      }
      break;
    case EstimatorFamily::kMandelbox: {
      const MandelboxParams& params = config.mandelbox;
      if (!(params.min_radius > 0.0f) || params.fixed_radius < params.min_radius || !(params.folding_limit > 0.0f)) {
        return Status::kInvalidConfig;
      }
      if (!std::isfinite(params.scale) || params.scale == 0.0f) {
        return Status::kInvalidConfig;
      }
      break;
    }
    case EstimatorFamily::kKali:
      if (!(config.kali.epsilon > 0.0f) || !std::isfinite(config.kali.reciprocal_gain)) {
        return Status::kInvalidConfig;
      }
      if (!(config.kali.bound_radius > 0.0f) || !std::isfinite(config.kali.bound_radius) ||
          !(config.kali.shell_radius >= 0.0f)) {
        return Status::kInvalidConfig;
      }
      break;
  }
  return Status::kSuccess;
}

int DistanceEstimator::resolve_budget(int iteration_budget) const {
  if (iteration_budget <= 0) {
    return config_.max_iterations;
  }
  return std::min(iteration_budget, config_.max_iterations);
}

std::unique_ptr<DistanceEstimator> make_estimator(const EstimatorConfig& config, Status* status) {
  const Status validation = validate_estimator_config(config);
  if (status != nullptr) {
    *status = validation;
  }
  if (validation != Status::kSuccess) {
    return nullptr;
  }

  switch (config.family) {
    case EstimatorFamily::kSphere:
      return std::make_unique<SphereEstimator>(config);
    case EstimatorFamily::kHyperbulb:
      return std::make_unique<HyperbulbEstimator>(config);
    case EstimatorFamily::kMandelbox:
      return std::make_unique<MandelboxEstimator>(config);
    case EstimatorFamily::kKali:
      return std::make_unique<KaliEstimator>(config);
  }
  return nullptr;
}

void box_fold(float* z, std::size_t dimension, float limit) {
  for (std::size_t axis = 0; axis < dimension; ++axis) {
    const float clamped = std::max(-limit, std::min(limit, z[axis]));
    z[axis] = clamped * 2.0f - z[axis];
  }
}

float sphere_fold(float* z, std::size_t dimension, float min_radius2, float fixed_radius2) {
  const float r2 = dot(z, z, dimension);
  const float inner2 = std::max(min_radius2, kDivisorEpsilon);

  float factor = 1.0f;
  if (r2 < inner2) {
    factor = fixed_radius2 / inner2;
  } else if (r2 < fixed_radius2) {
    factor = fixed_radius2 / std::max(r2, kDivisorEpsilon);
  }

  if (factor != 1.0f) {
    for (std::size_t axis = 0; axis < dimension; ++axis) {
      z[axis] *= factor;
    }
  }
  return factor;
}

void hyperbulb_power_map(const float* z, std::size_t dimension, float power, float* out) {
  if (dimension < 2) {
    return;
  }

  const float r2 = dot(z, z, dimension);
  const float r = std::sqrt(r2);
  if (r < kRadiusEpsilon) {
    for (std::size_t axis = 0; axis < dimension; ++axis) {
      out[axis] = 0.0f;
    }
    return;
  }

  // theta[0..D-3] from acos against the remaining tail norm, theta[D-2] from atan2
  VectorN theta{};
  float tail2 = r2;
  for (std::size_t axis = 0; axis + 2 < dimension; ++axis) {
    const float tail = std::sqrt(std::max(tail2, kDivisorEpsilon));
    const float cos_angle = std::max(-1.0f, std::min(1.0f, z[axis] / tail));
    theta[axis] = std::acos(cos_angle);
    tail2 -= z[axis] * z[axis];
  }
  theta[dimension - 2] = std::atan2(z[dimension - 1], z[dimension - 2]);

  const float radius = std::pow(r, power);
  float sin_product = 1.0f;
  for (std::size_t axis = 0; axis + 2 < dimension; ++axis) {
    const float angle = theta[axis] * power;
    out[axis] = radius * sin_product * std::cos(angle);
    sin_product *= std::sin(angle);
  }
  const float last = theta[dimension - 2] * power;
  out[dimension - 2] = radius * sin_product * std::cos(last);
  out[dimension - 1] = radius * sin_product * std::sin(last);
}

float smooth_escape(int iteration, float radius, float bailout, float degree) {
  const float base = static_cast<float>(iteration);
  if (radius <= 1.0f || bailout <= 1.0f || degree <= 1.0f) {
    return base;
  }
  const float ratio = std::log(radius) / std::log(bailout);
  if (ratio <= 0.0f) {
    return base;
  }
  return base + 1.0f - std::log(ratio) / std::log(degree);
}

}  // namespace ndslice
