#include "ndshader/module_library.h"
#include "glsl_blocks.h"
#include "ndslice/types.hpp"

namespace ndshader {

namespace {

const size_t kArrayArity = ndslice::kMaxDimension;

UniformDecl scalar(const char* name, UniformType type = UniformType::kFloat) {
    return UniformDecl{name, type, 1};
}

UniformDecl vector_n(const char* name) {
    return UniformDecl{name, UniformType::kFloat, kArrayArity};
}

ShaderModule estimator_module(EstimatorFamily family) {
    ShaderModule module;
    module.stage = ModuleStage::kEstimator;
    module.consumes = {"slice_mapping", "family_uniforms"};
    module.produces = {"estimator"};

    switch (family) {
        case EstimatorFamily::kSphere:
            module.name = "sphere_estimator";
            module.source = glsl::kSphereEstimator;
            break;
        case EstimatorFamily::kHyperbulb:
            module.name = "hyperbulb_estimator";
            module.source = glsl::kHyperbulbEstimator;
            break;
        case EstimatorFamily::kMandelbox:
            module.name = "mandelbox_estimator";
            module.source = glsl::kMandelboxEstimator;
            break;
        case EstimatorFamily::kKali:
            module.name = "kali_estimator";
            module.source = glsl::kKaliEstimator;
            break;
    }
    return module;
}

ShaderModule color_module(ColorAlgorithm algorithm) {
    ShaderModule module;
    module.stage = ModuleStage::kColor;
    module.consumes = {"hit_t"};
    module.produces = {"surface_color"};

    switch (algorithm) {
        case ColorAlgorithm::kMonochromatic:
            module.name = "color_monochromatic";
            module.uniforms = {scalar("uBaseColor", UniformType::kVec3)};
            module.source = glsl::kColorMonochromatic;
            break;
        case ColorAlgorithm::kCosine:
            module.name = "color_cosine";
            module.uniforms = {
                scalar("uPaletteA", UniformType::kVec3),
                scalar("uPaletteB", UniformType::kVec3),
                scalar("uPaletteC", UniformType::kVec3),
                scalar("uPaletteD", UniformType::kVec3)
            };
            module.source = glsl::kColorCosine;
            break;
        case ColorAlgorithm::kNormal:
            module.name = "color_normal";
            module.consumes.push_back("normal");
            module.uniforms = {scalar("uBaseColor", UniformType::kVec3)};
            module.source = glsl::kColorNormal;
            break;
        case ColorAlgorithm::kDistance:
            module.name = "color_distance";
            module.uniforms = {scalar("uBaseColor", UniformType::kVec3)};
            module.source = glsl::kColorDistance;
            break;
        case ColorAlgorithm::kOrbitTrap:
            module.name = "color_orbit_trap";
            module.uniforms = {scalar("uBaseColor", UniformType::kVec3)};
            module.source = glsl::kColorOrbitTrap;
            break;
    }
    return module;
}

ShaderModule opacity_module(OpacityMode mode) {
    ShaderModule module;
    module.stage = ModuleStage::kOpacity;
    module.consumes = {"march"};
    module.produces = {"opacity"};

    switch (mode) {
        case OpacityMode::kSolid:
            module.name = "opacity_solid";
            module.source = glsl::kOpacitySolid;
            break;
        case OpacityMode::kSimpleAlpha:
            module.name = "opacity_simple_alpha";
            module.uniforms = {scalar("uSimpleAlpha")};
            module.source = glsl::kOpacitySimpleAlpha;
            break;
        case OpacityMode::kLayeredSurfaces:
            module.name = "opacity_layered_surfaces";
            module.uniforms = {scalar("uLayerCount", UniformType::kInt), scalar("uLayerOpacity")};
            module.source = glsl::kOpacityLayeredSurfaces;
            break;
        case OpacityMode::kVolumetricDensity:
            module.name = "opacity_volumetric_density";
            module.uniforms = {scalar("uVolumetricDensity")};
            module.source = glsl::kOpacityVolumetricDensity;
            break;
    }
    return module;
}

} // namespace

std::vector<UniformDecl> shared_uniforms() {
    return {
        vector_n("uBasisX"),
        vector_n("uBasisY"),
        vector_n("uBasisZ"),
        vector_n("uOrigin"),
        scalar("uDimension", UniformType::kInt),
        scalar("uIterations", UniformType::kInt),
        scalar("uEscapeRadius"),
        scalar("uSafetyFactor"),
        scalar("uSurfaceEpsilon"),
        scalar("uThresholdGrowth"),
        scalar("uMaxSteps", UniformType::kInt),
        scalar("uMaxDistance"),
        scalar("uCameraPosition", UniformType::kVec3)
    };
}

std::vector<UniformDecl> family_uniforms(EstimatorFamily family) {
    switch (family) {
        case EstimatorFamily::kSphere:
            return {scalar("uSphereRadius")};
        case EstimatorFamily::kHyperbulb:
            return {scalar("uPower")};
        case EstimatorFamily::kMandelbox:
            return {
                scalar("uScale"),
                scalar("uFoldingLimit"),
                scalar("uMinRadius2"),
                scalar("uFixedRadius2"),
                scalar("uJuliaMode", UniformType::kInt),
                vector_n("uJuliaC")
            };
        case EstimatorFamily::kKali:
            return {
                vector_n("uKaliConstant"),
                scalar("uReciprocalGain"),
                scalar("uKaliEpsilon"),
                scalar("uKaliBoundRadius"),
                scalar("uKaliShellRadius")
            };
    }
    return {};
}

std::vector<ShaderModule> select_modules(const VariantKey& key) {
    const FeatureFlags& features = key.features;
    std::vector<ShaderModule> modules;

    modules.push_back(ShaderModule{
        "header", ModuleStage::kHeader, {}, {}, {"precision", "varyings"}, glsl::kHeader});
    modules.push_back(ShaderModule{
        "shared_uniforms", ModuleStage::kSharedUniforms, shared_uniforms(), {},
        {"slice_uniforms", "march_uniforms", "camera"}, ""});
    modules.push_back(ShaderModule{
        std::string(ndslice::family_name(key.family)) + "_uniforms", ModuleStage::kFamilyUniforms,
        family_uniforms(key.family), {}, {"family_uniforms"}, ""});
    modules.push_back(ShaderModule{
        "slice_math", ModuleStage::kMath, {}, {"slice_uniforms", "march_uniforms"},
        {"slice_mapping", "surface_threshold"}, glsl::kSliceMath});
    modules.push_back(estimator_module(key.family));
    modules.push_back(ShaderModule{
        "raymarch", ModuleStage::kRaymarch, {}, {"estimator", "surface_threshold"},
        {"march", "hit_t"}, glsl::kRaymarch});

    if (features.normals) {
        modules.push_back(ShaderModule{
            "normals", ModuleStage::kNormals, {}, {"estimator", "surface_threshold"},
            {"normal"}, glsl::kNormals});
    }
    if (features.lighting) {
        modules.push_back(ShaderModule{
            "lighting", ModuleStage::kLighting,
            {
                scalar("uLightDirection", UniformType::kVec3),
                scalar("uLightColor", UniformType::kVec3),
                scalar("uAmbientStrength"),
                scalar("uSpecularPower")
            },
            {"normal"}, {"lighting", "light_direction"}, glsl::kLighting});
    }
    if (features.fresnel) {
        modules.push_back(ShaderModule{
            "fresnel", ModuleStage::kLighting, {scalar("uFresnelIntensity")},
            {"lighting", "normal"}, {"fresnel"}, glsl::kFresnel});
    }
    if (features.shadows) {
        modules.push_back(ShaderModule{
            "shadows", ModuleStage::kShadows,
            {scalar("uShadowSteps", UniformType::kInt), scalar("uShadowSoftness")},
            {"estimator", "lighting", "light_direction"}, {"shadow"}, glsl::kShadows});
    }
    if (features.ambient_occlusion) {
        modules.push_back(ShaderModule{
            "ambient_occlusion", ModuleStage::kAmbientOcclusion, {scalar("uAOStrength")},
            {"estimator", "normal"}, {"ambient_occlusion"}, glsl::kAmbientOcclusion});
    }

    modules.push_back(color_module(features.color));
    modules.push_back(opacity_module(features.opacity));
    modules.push_back(ShaderModule{
        "main", ModuleStage::kMain, {}, {"varyings", "camera", "march", "surface_color", "opacity"},
        {"entry"}, glsl::kMain});

    return modules;
}

} // namespace ndshader
