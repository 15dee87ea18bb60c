#include "ndshader/composer.h"
#include "ndshader/module_library.h"
#include "ndslice/types.hpp"
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace ndshader {

namespace {

const char* family_define(EstimatorFamily family) {
    switch (family) {
        case EstimatorFamily::kSphere: return "FAMILY_SPHERE";
        case EstimatorFamily::kHyperbulb: return "FAMILY_HYPERBULB";
        case EstimatorFamily::kMandelbox: return "FAMILY_MANDELBOX";
        case EstimatorFamily::kKali: return "FAMILY_KALI";
    }
    return "FAMILY_UNKNOWN";
}

void require_feature(bool enabled, bool dependency, const char* feature, const char* needed) {
    if (enabled && !dependency) {
        throw CompositionError(CompositionErrorKind::kMissingDependency,
                               std::string(feature) + " requires " + needed);
    }
}

} // namespace

const char* composition_error_kind_name(CompositionErrorKind kind) {
    switch (kind) {
        case CompositionErrorKind::kNone: return "none";
        case CompositionErrorKind::kInvalidDimension: return "invalid-dimension";
        case CompositionErrorKind::kIncompatibleFeatures: return "incompatible-features";
        case CompositionErrorKind::kMissingDependency: return "missing-dependency";
        case CompositionErrorKind::kOrder: return "order";
        case CompositionErrorKind::kConflict: return "conflict";
        case CompositionErrorKind::kCompilationFailed: return "compilation-failed";
    }
    return "unknown";
}

bool operator==(const ComposerOptions& a, const ComposerOptions& b) {
    return a.glsl_version == b.glsl_version && a.module_markers == b.module_markers;
}

size_t CompiledVariant::uniform_index(const std::string& name) const {
    for (size_t i = 0; i < uniform_layout.size(); ++i) {
        if (uniform_layout[i].name == name) {
            return i;
        }
    }
    return uniform_layout.size();
}

void validate_features(const VariantKey& key) {
    if (!ndslice::valid_dimension(key.dimension)) {
        throw CompositionError(CompositionErrorKind::kInvalidDimension,
                               "Dimension " + std::to_string(key.dimension) + " outside [" +
                               std::to_string(ndslice::kMinDimension) + ", " +
                               std::to_string(ndslice::kMaxDimension) + "]");
    }
    if (static_cast<size_t>(key.family) >= ndslice::kEstimatorFamilyCount) {
        throw CompositionError(CompositionErrorKind::kIncompatibleFeatures, "Unknown object family");
    }
    if (static_cast<size_t>(key.features.opacity) >= kOpacityModeCount ||
        static_cast<size_t>(key.features.color) >= kColorAlgorithmCount) {
        throw CompositionError(CompositionErrorKind::kIncompatibleFeatures, "Unknown opacity mode or color algorithm");
    }

    const FeatureFlags& f = key.features;
    require_feature(f.lighting, f.normals, "lighting", "normals");
    require_feature(f.shadows, f.lighting, "shadows", "lighting");
    require_feature(f.fresnel, f.lighting, "fresnel", "lighting");
    require_feature(f.ambient_occlusion, f.normals, "ambient occlusion", "normals");
    require_feature(f.color == ColorAlgorithm::kNormal, f.normals, "normal color algorithm", "normals");

    if (f.opacity == OpacityMode::kVolumetricDensity && f.shadows) {
        throw CompositionError(CompositionErrorKind::kIncompatibleFeatures,
                               "volumetricDensity opacity has no surface to cast shadows from");
    }
}

void validate_modules(const std::vector<ShaderModule>& modules) {
    std::set<std::string> names;
    ModuleStage previous = ModuleStage::kHeader;
    for (const ShaderModule& module : modules) {
        if (!names.insert(module.name).second) {
            throw CompositionError(CompositionErrorKind::kConflict, "Duplicate module: " + module.name);
        }
        if (module.stage < previous) {
            throw CompositionError(CompositionErrorKind::kOrder,
                                   "Module " + module.name + " (" + stage_name(module.stage) +
                                   ") placed after a " + stage_name(previous) + " module");
        }
        previous = module.stage;
    }

    std::set<std::string> produced;
    std::map<std::string, UniformDecl> uniforms;
    for (const ShaderModule& module : modules) {
        for (const std::string& input : module.consumes) {
            if (produced.count(input) == 0) {
                throw CompositionError(CompositionErrorKind::kMissingDependency,
                                       "Module " + module.name + " consumes '" + input +
                                       "' which no earlier module produces");
            }
        }

        for (const UniformDecl& decl : module.uniforms) {
            auto it = uniforms.find(decl.name);
            if (it == uniforms.end()) {
                uniforms.emplace(decl.name, decl);
            } else if (!(it->second == decl)) {
                throw CompositionError(CompositionErrorKind::kConflict,
                                       "Uniform " + decl.name + " redeclared by " + module.name +
                                       " with a different type");
            }
        }

        for (const std::string& output : module.produces) {
            produced.insert(output);
        }
    }

    if (produced.count("entry") == 0) {
        throw CompositionError(CompositionErrorKind::kMissingDependency, "No module provides the entry point");
    }
}

Composer::Composer(const ComposerOptions& options)
    : options_(options), error_kind_(CompositionErrorKind::kNone) {}

std::unique_ptr<CompiledVariant> Composer::compose(const VariantKey& key) {
    error_message_.clear();
    error_kind_ = CompositionErrorKind::kNone;

    try {
        validate_features(key);
    } catch (const CompositionError& e) {
        error_message_ = e.what();
        error_kind_ = e.kind();
        spdlog::warn("ndshader: cannot compose {}: {}", key.canonical(), error_message_);
        return nullptr;
    }

    return assemble(key, select_modules(key));
}

std::unique_ptr<CompiledVariant> Composer::assemble(const VariantKey& key,
                                                    const std::vector<ShaderModule>& modules) {
    error_message_.clear();
    error_kind_ = CompositionErrorKind::kNone;

    try {
        if (!ndslice::valid_dimension(key.dimension)) {
            throw CompositionError(CompositionErrorKind::kInvalidDimension,
                                   "Dimension " + std::to_string(key.dimension) + " outside [" +
                                   std::to_string(ndslice::kMinDimension) + ", " +
                                   std::to_string(ndslice::kMaxDimension) + "]");
        }
        validate_modules(modules);
        return emit(key, modules);
    } catch (const CompositionError& e) {
        error_message_ = e.what();
        error_kind_ = e.kind();
        spdlog::warn("ndshader: cannot assemble {}: {}", key.canonical(), error_message_);
        return nullptr;
    }
}

void Composer::write_defines(const VariantKey& key, std::string& out) const {
    const FeatureFlags& f = key.features;

    out += "#define DIMENSION " + std::to_string(key.dimension) + "\n";
    out += "#define MAX_ITERATIONS " + std::to_string(ndslice::kMaxIterationBudget) + "\n";
    out += "#define " + std::string(family_define(key.family)) + "\n";
    if (f.normals) {
        out += "#define USE_NORMALS\n";
    }
    if (f.lighting) {
        out += "#define USE_LIGHTING\n";
    }
    if (f.shadows) {
        out += "#define USE_SHADOWS\n";
    }
    if (f.ambient_occlusion) {
        out += "#define USE_AO\n";
    }
    if (f.fresnel) {
        out += "#define USE_FRESNEL\n";
    }
    out += "#define OPACITY_MODE " + std::to_string(static_cast<int>(f.opacity)) + "\n";
    out += "#define COLOR_ALGORITHM " + std::to_string(static_cast<int>(f.color)) + "\n";
}

std::unique_ptr<CompiledVariant> Composer::emit(const VariantKey& key,
                                                const std::vector<ShaderModule>& modules) const {
    auto variant = std::make_unique<CompiledVariant>();
    variant->key = key;

    std::string& source = variant->source;
    source += "#version " + options_.glsl_version + "\n";
    if (options_.module_markers) {
        source += "// variant: " + key.canonical() + "\n";
    }
    write_defines(key, source);

    std::set<std::string> declared;
    for (const ShaderModule& module : modules) {
        variant->modules.push_back(module.name);

        source += "\n";
        if (options_.module_markers) {
            source += "// module: " + module.name + " (" + stage_name(module.stage) + ")\n";
        }
        for (const UniformDecl& decl : module.uniforms) {
            if (!declared.insert(decl.name).second) {
                continue;
            }
            variant->uniform_layout.push_back(decl);
            source += declare_uniform(decl);
            source += "\n";
        }
        source += module.source;
    }

    return variant;
}

} // namespace ndshader
