#include "ndshader/variant_key.h"
#include <sstream>
#include <vector>

namespace ndshader {

namespace {

const char* const kOpacityNames[kOpacityModeCount] = {
    "solid", "simpleAlpha", "layeredSurfaces", "volumetricDensity"
};

const char* const kColorNames[kColorAlgorithmCount] = {
    "monochromatic", "cosine", "normal", "distance", "orbitTrap"
};

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == separator) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

// Parses "<prefix><digits>" into value; no sign, no leading junk
bool parse_prefixed(const std::string& field, const std::string& prefix, size_t& value) {
    if (field.size() <= prefix.size() || field.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    size_t result = 0;
    for (size_t i = prefix.size(); i < field.size(); ++i) {
        char c = field[i];
        if (c < '0' || c > '9') {
            return false;
        }
        result = result * 10 + static_cast<size_t>(c - '0');
        if (result > 1000) {
            return false;
        }
    }
    value = result;
    return true;
}

bool parse_flag(const std::string& field, const std::string& prefix, bool& value) {
    size_t raw = 0;
    if (!parse_prefixed(field, prefix, raw) || raw > 1) {
        return false;
    }
    value = raw == 1;
    return true;
}

} // namespace

std::string VariantKey::canonical() const {
    std::ostringstream out;
    out << 'v' << kVariantKeyVersion
        << '|' << ndslice::family_name(family)
        << "|d" << dimension
        << "|n" << (features.normals ? 1 : 0)
        << "|l" << (features.lighting ? 1 : 0)
        << "|s" << (features.shadows ? 1 : 0)
        << "|ao" << (features.ambient_occlusion ? 1 : 0)
        << "|f" << (features.fresnel ? 1 : 0)
        << '|' << opacity_mode_name(features.opacity)
        << '|' << color_algorithm_name(features.color);
    return out.str();
}

bool operator==(const VariantKey& a, const VariantKey& b) {
    return a.family == b.family &&
           a.dimension == b.dimension &&
           a.features.normals == b.features.normals &&
           a.features.lighting == b.features.lighting &&
           a.features.shadows == b.features.shadows &&
           a.features.ambient_occlusion == b.features.ambient_occlusion &&
           a.features.fresnel == b.features.fresnel &&
           a.features.opacity == b.features.opacity &&
           a.features.color == b.features.color;
}

bool operator!=(const VariantKey& a, const VariantKey& b) {
    return !(a == b);
}

bool parse_variant_key(const std::string& text, VariantKey& out) {
    std::vector<std::string> fields = split(text, '|');
    if (fields.size() != 10) {
        return false;
    }

    size_t version = 0;
    if (!parse_prefixed(fields[0], "v", version) || version != static_cast<size_t>(kVariantKeyVersion)) {
        return false;
    }

    VariantKey key;
    if (!ndslice::parse_family(fields[1], key.family)) {
        return false;
    }
    if (!parse_prefixed(fields[2], "d", key.dimension)) {
        return false;
    }
    if (!parse_flag(fields[3], "n", key.features.normals) ||
        !parse_flag(fields[4], "l", key.features.lighting) ||
        !parse_flag(fields[5], "s", key.features.shadows) ||
        !parse_flag(fields[6], "ao", key.features.ambient_occlusion) ||
        !parse_flag(fields[7], "f", key.features.fresnel)) {
        return false;
    }
    if (!parse_opacity_mode(fields[8], key.features.opacity) ||
        !parse_color_algorithm(fields[9], key.features.color)) {
        return false;
    }
    // Rejects non-canonical spellings such as leading zeros
    if (key.canonical() != text) {
        return false;
    }

    out = key;
    return true;
}

const char* opacity_mode_name(OpacityMode mode) {
    size_t index = static_cast<size_t>(mode);
    return index < kOpacityModeCount ? kOpacityNames[index] : "unknown";
}

bool parse_opacity_mode(const std::string& name, OpacityMode& out) {
    for (size_t i = 0; i < kOpacityModeCount; ++i) {
        if (name == kOpacityNames[i]) {
            out = static_cast<OpacityMode>(i);
            return true;
        }
    }
    return false;
}

const char* color_algorithm_name(ColorAlgorithm algorithm) {
    size_t index = static_cast<size_t>(algorithm);
    return index < kColorAlgorithmCount ? kColorNames[index] : "unknown";
}

bool parse_color_algorithm(const std::string& name, ColorAlgorithm& out) {
    for (size_t i = 0; i < kColorAlgorithmCount; ++i) {
        if (name == kColorNames[i]) {
            out = static_cast<ColorAlgorithm>(i);
            return true;
        }
    }
    return false;
}

} // namespace ndshader
