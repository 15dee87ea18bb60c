#include "ndshader/module.h"

namespace ndshader {

bool operator==(const UniformDecl& a, const UniformDecl& b) {
    return a.name == b.name && a.type == b.type && a.arity == b.arity;
}

const char* glsl_type_name(UniformType type) {
    switch (type) {
        case UniformType::kFloat: return "float";
        case UniformType::kInt: return "int";
        case UniformType::kVec3: return "vec3";
    }
    return "float";
}

std::string declare_uniform(const UniformDecl& decl) {
    std::string line = "uniform ";
    line += glsl_type_name(decl.type);
    line += ' ';
    line += decl.name;
    if (decl.arity > 1) {
        line += '[';
        line += std::to_string(decl.arity);
        line += ']';
    }
    line += ';';
    return line;
}

const char* stage_name(ModuleStage stage) {
    switch (stage) {
        case ModuleStage::kHeader: return "header";
        case ModuleStage::kSharedUniforms: return "shared-uniforms";
        case ModuleStage::kFamilyUniforms: return "family-uniforms";
        case ModuleStage::kMath: return "math";
        case ModuleStage::kEstimator: return "estimator";
        case ModuleStage::kRaymarch: return "raymarch";
        case ModuleStage::kNormals: return "normals";
        case ModuleStage::kLighting: return "lighting";
        case ModuleStage::kShadows: return "shadows";
        case ModuleStage::kAmbientOcclusion: return "ambient-occlusion";
        case ModuleStage::kColor: return "color";
        case ModuleStage::kOpacity: return "opacity";
        case ModuleStage::kMain: return "main";
    }
    return "unknown";
}

} // namespace ndshader
