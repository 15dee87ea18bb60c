#include "ndshader/api.h"
#include "ndshader/composer.h"
#include "ndshader/variant_cache.h"
#include "ndshader/variant_key.h"
#include <exception>
#include <memory>
#include <string>

struct ndshader_context_t {
    ndshader::VariantCache cache;
    std::string last_error;
};

struct ndshader_variant_t {
    ndshader::VariantPtr variant;
    std::string canonical;
};

namespace {

ndshader_error_t to_error(ndshader::CompositionErrorKind kind) {
    switch (kind) {
        case ndshader::CompositionErrorKind::kNone: return NDSHADER_OK;
        case ndshader::CompositionErrorKind::kInvalidDimension: return NDSHADER_ERROR_INVALID_DIMENSION;
        case ndshader::CompositionErrorKind::kIncompatibleFeatures: return NDSHADER_ERROR_INCOMPATIBLE_FEATURES;
        case ndshader::CompositionErrorKind::kMissingDependency: return NDSHADER_ERROR_MISSING_DEPENDENCY;
        case ndshader::CompositionErrorKind::kOrder: return NDSHADER_ERROR_ORDER;
        case ndshader::CompositionErrorKind::kConflict: return NDSHADER_ERROR_CONFLICT;
        case ndshader::CompositionErrorKind::kCompilationFailed: return NDSHADER_ERROR_COMPILATION_FAILED;
    }
    return NDSHADER_ERROR_INVALID_KEY;
}

ndshader::VariantKey from_c_key(const ndshader_variant_key_t& key) {
    ndshader::VariantKey out;
    out.family = static_cast<ndshader::EstimatorFamily>(key.family);
    out.dimension = key.dimension;
    out.features.normals = key.normals != 0;
    out.features.lighting = key.lighting != 0;
    out.features.shadows = key.shadows != 0;
    out.features.ambient_occlusion = key.ambient_occlusion != 0;
    out.features.fresnel = key.fresnel != 0;
    out.features.opacity = static_cast<ndshader::OpacityMode>(key.opacity);
    out.features.color = static_cast<ndshader::ColorAlgorithm>(key.color);
    return out;
}

ndshader_variant_handle make_handle(const ndshader::VariantPtr& variant) {
    auto handle = new ndshader_variant_t();
    handle->variant = variant;
    handle->canonical = variant->key.canonical();
    return handle;
}

ndshader_error_t compose_key(ndshader_context_handle ctx, const ndshader::VariantKey& key,
                             ndshader_variant_handle* out_variant) {
    try {
        std::string error;
        ndshader::CompositionErrorKind kind = ndshader::CompositionErrorKind::kNone;
        ndshader::VariantPtr variant = ctx->cache.get_or_compose(key, &error, &kind);
        if (!variant) {
            ctx->last_error = error;
            return to_error(kind);
        }
        *out_variant = make_handle(variant);
        return NDSHADER_OK;
    } catch (const std::exception& e) {
        ctx->last_error = e.what();
        return NDSHADER_ERROR_INTERNAL;
    }
}

} // namespace

// Context management
ndshader_context_handle ndshader_context_create(void) {
    return new ndshader_context_t();
}

void ndshader_context_destroy(ndshader_context_handle ctx) {
    delete ctx;
}

void ndshader_default_key(ndshader_variant_key_t* out_key) {
    if (!out_key) {
        return;
    }
    ndshader::VariantKey key;
    out_key->family = static_cast<ndshader_family_t>(key.family);
    out_key->dimension = key.dimension;
    out_key->normals = key.features.normals ? 1 : 0;
    out_key->lighting = key.features.lighting ? 1 : 0;
    out_key->shadows = key.features.shadows ? 1 : 0;
    out_key->ambient_occlusion = key.features.ambient_occlusion ? 1 : 0;
    out_key->fresnel = key.features.fresnel ? 1 : 0;
    out_key->opacity = static_cast<ndshader_opacity_mode_t>(key.features.opacity);
    out_key->color = static_cast<ndshader_color_algorithm_t>(key.features.color);
}

// Composition
ndshader_error_t ndshader_compose(
    ndshader_context_handle ctx,
    const ndshader_variant_key_t* key,
    ndshader_variant_handle* out_variant) {

    if (!ctx || !key || !out_variant) {
        if (ctx) ctx->last_error = "Null pointer argument";
        return NDSHADER_ERROR_NULL_POINTER;
    }
    *out_variant = nullptr;
    return compose_key(ctx, from_c_key(*key), out_variant);
}

ndshader_error_t ndshader_compose_canonical(
    ndshader_context_handle ctx,
    const char* canonical_key,
    ndshader_variant_handle* out_variant) {

    if (!ctx || !canonical_key || !out_variant) {
        if (ctx) ctx->last_error = "Null pointer argument";
        return NDSHADER_ERROR_NULL_POINTER;
    }
    *out_variant = nullptr;

    ndshader::VariantKey key;
    if (!ndshader::parse_variant_key(canonical_key, key)) {
        ctx->last_error = std::string("Malformed variant key: ") + canonical_key;
        return NDSHADER_ERROR_INVALID_KEY;
    }
    return compose_key(ctx, key, out_variant);
}

void ndshader_variant_release(ndshader_variant_handle variant) {
    delete variant;
}

// Variant accessors
const char* ndshader_variant_source(ndshader_variant_handle variant) {
    return variant ? variant->variant->source.c_str() : nullptr;
}

size_t ndshader_variant_source_length(ndshader_variant_handle variant) {
    return variant ? variant->variant->source.size() : 0;
}

const char* ndshader_variant_key_string(ndshader_variant_handle variant) {
    return variant ? variant->canonical.c_str() : nullptr;
}

size_t ndshader_variant_uniform_count(ndshader_variant_handle variant) {
    return variant ? variant->variant->uniform_layout.size() : 0;
}

ndshader_error_t ndshader_variant_uniform_at(
    ndshader_variant_handle variant,
    size_t index,
    ndshader_uniform_t* out_uniform) {

    if (!variant || !out_uniform) {
        return NDSHADER_ERROR_NULL_POINTER;
    }
    const auto& layout = variant->variant->uniform_layout;
    if (index >= layout.size()) {
        return NDSHADER_ERROR_OUT_OF_RANGE;
    }
    out_uniform->name = layout[index].name.c_str();
    out_uniform->type = static_cast<ndshader_uniform_type_t>(layout[index].type);
    out_uniform->arity = layout[index].arity;
    return NDSHADER_OK;
}

// Host link feedback
ndshader_error_t ndshader_report_link_result(
    ndshader_context_handle ctx,
    ndshader_variant_handle variant,
    int success,
    const char* log,
    ndshader_variant_handle* out_fallback) {

    if (!ctx || !variant) {
        if (ctx) ctx->last_error = "Null pointer argument";
        return NDSHADER_ERROR_NULL_POINTER;
    }
    if (out_fallback) {
        *out_fallback = nullptr;
    }

    const ndshader::VariantKey& key = variant->variant->key;
    try {
        if (success) {
            // A variant dropped by a cache clear can no longer become the fallback
            ctx->cache.mark_linked(key);
            return NDSHADER_OK;
        }

        ndshader::VariantPtr fallback = ctx->cache.report_compilation_failure(key, log ? log : "");
        ctx->last_error = "GPU compilation failed for " + variant->canonical;
        if (fallback && out_fallback) {
            *out_fallback = make_handle(fallback);
        }
        return NDSHADER_ERROR_COMPILATION_FAILED;
    } catch (const std::exception& e) {
        ctx->last_error = e.what();
        return NDSHADER_ERROR_INTERNAL;
    }
}

ndshader_variant_state_t ndshader_variant_state(
    ndshader_context_handle ctx,
    const ndshader_variant_key_t* key) {

    if (!ctx || !key) {
        return NDSHADER_STATE_UNCACHED;
    }
    return static_cast<ndshader_variant_state_t>(ctx->cache.state(from_c_key(*key)));
}

// Cache control
size_t ndshader_cache_clear(ndshader_context_handle ctx) {
    return ctx ? ctx->cache.clear() : 0;
}

size_t ndshader_cache_size(ndshader_context_handle ctx) {
    return ctx ? ctx->cache.size() : 0;
}

void ndshader_set_glsl_version(ndshader_context_handle ctx, const char* version) {
    if (!ctx || !version) {
        return;
    }
    ndshader::ComposerOptions options = ctx->cache.options();
    options.glsl_version = version;
    ctx->cache.set_options(options);
}

void ndshader_set_module_markers(ndshader_context_handle ctx, int enabled) {
    if (!ctx) {
        return;
    }
    ndshader::ComposerOptions options = ctx->cache.options();
    options.module_markers = enabled != 0;
    ctx->cache.set_options(options);
}

// Error handling
const char* ndshader_error_string(ndshader_error_t error) {
    switch (error) {
        case NDSHADER_OK:
            return "Success";
        case NDSHADER_ERROR_INVALID_DIMENSION:
            return "Dimension outside supported range";
        case NDSHADER_ERROR_INCOMPATIBLE_FEATURES:
            return "Incompatible feature combination";
        case NDSHADER_ERROR_MISSING_DEPENDENCY:
            return "Missing feature dependency";
        case NDSHADER_ERROR_ORDER:
            return "Module order violation";
        case NDSHADER_ERROR_CONFLICT:
            return "Conflicting module or uniform";
        case NDSHADER_ERROR_COMPILATION_FAILED:
            return "GPU compilation failed";
        case NDSHADER_ERROR_INVALID_KEY:
            return "Malformed variant key";
        case NDSHADER_ERROR_NULL_POINTER:
            return "Null pointer";
        case NDSHADER_ERROR_OUT_OF_RANGE:
            return "Index out of range";
        case NDSHADER_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

const char* ndshader_get_last_error_message(ndshader_context_handle ctx) {
    if (!ctx) {
        return "Invalid context";
    }
    return ctx->last_error.c_str();
}
