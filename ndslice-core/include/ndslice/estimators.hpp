#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "ndslice/types.hpp"

namespace ndslice {

enum class EstimatorFamily {
  kSphere = 0,
  kHyperbulb,
  kMandelbox,
  kKali,
};

constexpr std::size_t kEstimatorFamilyCount = 4;

// True distance estimators return a conservative lower bound on the distance to
// the set. Field estimators return an accumulated scalar with no such guarantee
// and must be marched with safety_factor < 1.
enum class EstimatorKind {
  kTrueDistance,
  kField,
};

[[nodiscard]] EstimatorKind family_kind(EstimatorFamily family);
[[nodiscard]] const char* family_name(EstimatorFamily family);
bool parse_family(const std::string& name, EstimatorFamily& out);

struct SphereParams {
  float radius{1.0f};
};

struct HyperbulbParams {
  float power{8.0f};
};

struct MandelboxParams {
  float scale{-1.5f};
  float folding_limit{1.0f};
  float min_radius{0.5f};
  float fixed_radius{1.0f};
  bool julia_mode{false};
  VectorN julia_constant{};
};

// The reciprocal fold fills all of space, so the structure is cut to a ball of
// bound_radius. Bounded orbits form a surface where their closest approach to
// the origin reaches shell_radius.
struct KaliParams {
  VectorN constant{};
  float reciprocal_gain{1.0f};
  float epsilon{1e-4f};  // floor on |z|^2 before the reciprocal
  float bound_radius{2.0f};
  float shell_radius{0.25f};
};

// Universal knobs plus one parameter block per family. Only the block matching
// `family` is read. Every field is a plain number so a timeline can write it
// directly between frames.
struct EstimatorConfig {
  EstimatorFamily family{EstimatorFamily::kHyperbulb};
  std::size_t dimension{3};
  int max_iterations{80};
  float bailout_radius{4.0f};
  float safety_factor{1.0f};

  SphereParams sphere{};
  HyperbulbParams hyperbulb{};
  MandelboxParams mandelbox{};
  KaliParams kali{};
};

struct EstimatorResult {
  float distance{0.0f};
  float trap{0.0f};               // min |z|^2 over the orbit
  float smooth_iterations{0.0f};  // fractional escape value for coloring
  int iterations{0};
  bool escaped{false};
};

constexpr int kMaxIterationBudget = 1024;

[[nodiscard]] EstimatorConfig default_estimator_config(EstimatorFamily family, std::size_t dimension);
[[nodiscard]] Status validate_estimator_config(const EstimatorConfig& config);

class DistanceEstimator {
 public:
  explicit DistanceEstimator(const EstimatorConfig& config) : config_(config) {}
  virtual ~DistanceEstimator() = default;

  [[nodiscard]] virtual EstimatorKind kind() const = 0;

  // `point` holds config().dimension components. A budget <= 0 uses
  // config().max_iterations; larger budgets are capped by it.
  [[nodiscard]] virtual EstimatorResult evaluate(const float* point, int iteration_budget) const = 0;

  [[nodiscard]] const EstimatorConfig& config() const { return config_; }
  [[nodiscard]] float safety_factor() const { return config_.safety_factor; }

 protected:
  [[nodiscard]] int resolve_budget(int iteration_budget) const;

  EstimatorConfig config_;
};

// Returns nullptr and sets *status when the config does not validate.
std::unique_ptr<DistanceEstimator> make_estimator(const EstimatorConfig& config, Status* status = nullptr);

// Building blocks shared with the GLSL modules. All divisions are floored.

// z_i = clamp(z_i, -limit, limit) * 2 - z_i
void box_fold(float* z, std::size_t dimension, float limit);

// Scales z by fixed_r2 / min_r2 inside the inner radius and by fixed_r2 / |z|^2
// between the radii. Returns the factor applied so callers can scale dr.
float sphere_fold(float* z, std::size_t dimension, float min_radius2, float fixed_radius2);

// Hyperspherical power map: r -> r^power, every angle -> angle * power.
// `out` may alias `z`.
void hyperbulb_power_map(const float* z, std::size_t dimension, float power, float* out);

// i + 1 - log(log r / log bailout) / log degree
[[nodiscard]] float smooth_escape(int iteration, float radius, float bailout, float degree);

}  // namespace ndslice
