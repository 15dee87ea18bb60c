#include "ndshader/api.h"
#include "ndslice/api.h"

#include <emscripten/emscripten.h>
#include <emscripten/bind.h>
#include <emscripten/val.h>

#include <cstdint>
#include <string>
#include <vector>

using emscripten::val;

// Raw C API exports for hosts that manage the heap themselves
extern "C" {

EMSCRIPTEN_KEEPALIVE
ndshader_context_handle wasm_context_create() {
    return ndshader_context_create();
}

EMSCRIPTEN_KEEPALIVE
void wasm_context_destroy(ndshader_context_handle ctx) {
    ndshader_context_destroy(ctx);
}

EMSCRIPTEN_KEEPALIVE
ndshader_error_t wasm_compose_canonical(
    ndshader_context_handle ctx,
    const char* canonical_key,
    ndshader_variant_handle* out_variant) {
    return ndshader_compose_canonical(ctx, canonical_key, out_variant);
}

EMSCRIPTEN_KEEPALIVE
void wasm_variant_release(ndshader_variant_handle variant) {
    ndshader_variant_release(variant);
}

EMSCRIPTEN_KEEPALIVE
const char* wasm_variant_source(ndshader_variant_handle variant) {
    return ndshader_variant_source(variant);
}

EMSCRIPTEN_KEEPALIVE
ndslice_status_t wasm_compute_slice_uniforms(
    size_t dimension,
    const NdsliceRotationAngle* angles,
    size_t angle_count,
    const float* slice_parameters,
    size_t parameter_count,
    float* out_uniforms,
    size_t out_length) {
    return ndslice_compute_slice_uniforms(dimension, angles, angle_count, slice_parameters, parameter_count,
                                          out_uniforms, out_length);
}

EMSCRIPTEN_KEEPALIVE
size_t wasm_cache_clear(ndshader_context_handle ctx) {
    return ndshader_cache_clear(ctx);
}

EMSCRIPTEN_KEEPALIVE
const char* wasm_error_string(ndshader_error_t error) {
    return ndshader_error_string(error);
}

EMSCRIPTEN_KEEPALIVE
const char* wasm_get_last_error_message(ndshader_context_handle ctx) {
    return ndshader_get_last_error_message(ctx);
}

} // extern "C"

namespace {

inline ndshader_context_handle to_context(uintptr_t value) {
    return reinterpret_cast<ndshader_context_handle>(value);
}

inline ndshader_variant_handle to_variant(uintptr_t value) {
    return reinterpret_cast<ndshader_variant_handle>(value);
}

inline uintptr_t from_context(ndshader_context_handle ctx) {
    return reinterpret_cast<uintptr_t>(ctx);
}

inline uintptr_t from_variant(ndshader_variant_handle variant) {
    return reinterpret_cast<uintptr_t>(variant);
}

int flag(const val& object, const char* name, int fallback) {
    val field = object[name];
    if (field.isUndefined() || field.isNull()) {
        return fallback;
    }
    return field.as<bool>() ? 1 : 0;
}

ndshader_variant_key_t key_from_object(const val& object) {
    ndshader_variant_key_t key;
    ndshader_default_key(&key);
    if (!object["family"].isUndefined()) {
        key.family = static_cast<ndshader_family_t>(object["family"].as<int>());
    }
    if (!object["dimension"].isUndefined()) {
        key.dimension = object["dimension"].as<size_t>();
    }
    key.normals = flag(object, "normals", key.normals);
    key.lighting = flag(object, "lighting", key.lighting);
    key.shadows = flag(object, "shadows", key.shadows);
    key.ambient_occlusion = flag(object, "ambientOcclusion", key.ambient_occlusion);
    key.fresnel = flag(object, "fresnel", key.fresnel);
    if (!object["opacity"].isUndefined()) {
        key.opacity = static_cast<ndshader_opacity_mode_t>(object["opacity"].as<int>());
    }
    if (!object["color"].isUndefined()) {
        key.color = static_cast<ndshader_color_algorithm_t>(object["color"].as<int>());
    }
    return key;
}

val make_uniform_layout(ndshader_variant_handle variant) {
    val layout = val::array();
    const size_t count = ndshader_variant_uniform_count(variant);
    for (size_t i = 0; i < count; ++i) {
        ndshader_uniform_t uniform{};
        if (ndshader_variant_uniform_at(variant, i, &uniform) != NDSHADER_OK) {
            break;
        }
        val entry = val::object();
        entry.set("name", std::string(uniform.name));
        entry.set("type", static_cast<int>(uniform.type));
        entry.set("arity", static_cast<unsigned int>(uniform.arity));
        layout.set(i, entry);
    }
    return layout;
}

val make_variant_object(ndshader_variant_handle variant) {
    val obj = val::object();
    obj.set("variant", from_variant(variant));
    obj.set("key", std::string(ndshader_variant_key_string(variant)));
    obj.set("source", std::string(ndshader_variant_source(variant), ndshader_variant_source_length(variant)));
    obj.set("uniforms", make_uniform_layout(variant));
    return obj;
}

val make_compose_result(ndshader_context_handle ctx, ndshader_error_t error, ndshader_variant_handle variant) {
    val result = val::object();
    result.set("error", static_cast<int>(error));
    if (error == NDSHADER_OK) {
        result.set("variant", make_variant_object(variant));
        result.set("message", std::string());
    } else {
        const char* message = ndshader_get_last_error_message(ctx);
        result.set("variant", val::null());
        result.set("message", message ? std::string(message) : std::string());
    }
    return result;
}

} // namespace

uintptr_t context_create_binding() {
    return from_context(ndshader_context_create());
}

void context_destroy_binding(uintptr_t ctx_value) {
    ndshader_context_destroy(to_context(ctx_value));
}

val compose_binding(uintptr_t ctx_value, val key_val) {
    ndshader_context_handle ctx = to_context(ctx_value);
    ndshader_variant_key_t key = key_from_object(key_val);
    ndshader_variant_handle variant = nullptr;
    ndshader_error_t error = ndshader_compose(ctx, &key, &variant);
    return make_compose_result(ctx, error, variant);
}

val compose_canonical_binding(uintptr_t ctx_value, const std::string& canonical) {
    ndshader_context_handle ctx = to_context(ctx_value);
    ndshader_variant_handle variant = nullptr;
    ndshader_error_t error = ndshader_compose_canonical(ctx, canonical.c_str(), &variant);
    return make_compose_result(ctx, error, variant);
}

void variant_release_binding(uintptr_t variant_value) {
    ndshader_variant_release(to_variant(variant_value));
}

val report_link_result_binding(uintptr_t ctx_value, uintptr_t variant_value, bool success, const std::string& log) {
    ndshader_context_handle ctx = to_context(ctx_value);
    ndshader_variant_handle fallback = nullptr;
    ndshader_error_t error = ndshader_report_link_result(ctx, to_variant(variant_value), success ? 1 : 0,
                                                         log.c_str(), &fallback);

    val result = val::object();
    result.set("error", static_cast<int>(error));
    result.set("fallback", fallback ? make_variant_object(fallback) : val::null());
    return result;
}

val slice_uniforms_binding(unsigned int dimension, val angles_val, val parameters_val) {
    const size_t angle_count = angles_val["length"].as<size_t>();
    std::vector<NdsliceRotationAngle> angles;
    angles.reserve(angle_count);
    for (size_t i = 0; i < angle_count; ++i) {
        val entry = angles_val[i];
        NdsliceRotationAngle angle{};
        angle.i = entry["i"].as<unsigned int>();
        angle.j = entry["j"].as<unsigned int>();
        angle.theta = entry["theta"].as<float>();
        angles.push_back(angle);
    }
    std::vector<float> parameters = emscripten::vecFromJSArray<float>(parameters_val);

    std::vector<float> uniforms(NDSLICE_SLICE_UNIFORM_FLOATS, 0.0f);
    ndslice_status_t status = ndslice_compute_slice_uniforms(
        dimension,
        angles.empty() ? nullptr : angles.data(),
        angles.size(),
        parameters.empty() ? nullptr : parameters.data(),
        parameters.size(),
        uniforms.data(),
        uniforms.size()
    );

    val result = val::object();
    result.set("status", static_cast<int>(status));
    val values = val::array();
    for (size_t i = 0; i < uniforms.size(); ++i) {
        values.set(i, uniforms[i]);
    }
    result.set("uniforms", values);
    return result;
}

int variant_state_binding(uintptr_t ctx_value, val key_val) {
    ndshader_variant_key_t key = key_from_object(key_val);
    return static_cast<int>(ndshader_variant_state(to_context(ctx_value), &key));
}

size_t cache_clear_binding(uintptr_t ctx_value) {
    return ndshader_cache_clear(to_context(ctx_value));
}

size_t cache_size_binding(uintptr_t ctx_value) {
    return ndshader_cache_size(to_context(ctx_value));
}

void set_glsl_version_binding(uintptr_t ctx_value, const std::string& version) {
    ndshader_set_glsl_version(to_context(ctx_value), version.c_str());
}

void set_module_markers_binding(uintptr_t ctx_value, bool enabled) {
    ndshader_set_module_markers(to_context(ctx_value), enabled ? 1 : 0);
}

std::string error_string_binding(int error) {
    return ndshader_error_string(static_cast<ndshader_error_t>(error));
}

std::string get_last_error_binding(uintptr_t ctx_value) {
    const char* message = ndshader_get_last_error_message(to_context(ctx_value));
    return message ? std::string(message) : std::string();
}

EMSCRIPTEN_BINDINGS(ndshader_module_bindings) {
    emscripten::function("contextCreate", &context_create_binding);
    emscripten::function("contextDestroy", &context_destroy_binding);
    emscripten::function("compose", &compose_binding);
    emscripten::function("composeCanonical", &compose_canonical_binding);
    emscripten::function("variantRelease", &variant_release_binding);
    emscripten::function("reportLinkResult", &report_link_result_binding);
    emscripten::function("variantState", &variant_state_binding);
    emscripten::function("cacheClear", &cache_clear_binding);
    emscripten::function("cacheSize", &cache_size_binding);
    emscripten::function("setGlslVersion", &set_glsl_version_binding);
    emscripten::function("setModuleMarkers", &set_module_markers_binding);
    emscripten::function("errorString", &error_string_binding);
    emscripten::function("getLastErrorMessage", &get_last_error_binding);

    emscripten::function("sliceUniforms", &slice_uniforms_binding);
}
