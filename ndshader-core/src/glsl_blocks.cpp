#include "glsl_blocks.h"

namespace ndshader {
namespace glsl {

const char* const kHeader = R"GLSL(precision highp float;
precision highp int;

#define MARCH_HIT 0
#define MARCH_MISS 1
#define MARCH_STEP_EXHAUSTED 2

#define OPACITY_SOLID 0
#define OPACITY_SIMPLE_ALPHA 1
#define OPACITY_LAYERED_SURFACES 2
#define OPACITY_VOLUMETRIC_DENSITY 3

#define SAFE_EPSILON 0.0001
#define SAFE_EPSILON_SQ 0.00000001
#define MAX_DERIVATIVE 1.0e30
#define FIELD_SAFETY_LIMIT 0.9

in vec3 vPosition;
out vec4 fragColor;
)GLSL";

const char* const kSliceMath = R"GLSL(void sliceToND(vec3 p, out float point[DIMENSION]) {
    for (int i = 0; i < DIMENSION; ++i) {
        point[i] = uOrigin[i] + p.x * uBasisX[i] + p.y * uBasisY[i] + p.z * uBasisZ[i];
    }
}

float dotND(float a[DIMENSION], float b[DIMENSION]) {
    float sum = 0.0;
    for (int i = 0; i < DIMENSION; ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

// i + 1 - log(log r / log bailout) / log degree
float smoothEscape(int iteration, float radius, float bailout, float degree) {
    float base = float(iteration);
    if (radius <= 1.0 || bailout <= 1.0 || degree <= 1.0) {
        return base;
    }
    float ratio = log(radius) / log(bailout);
    if (ratio <= 0.0) {
        return base;
    }
    return base + 1.0 - log(ratio) / log(degree);
}

float surfaceThreshold(float t) {
    return uSurfaceEpsilon * (1.0 + uThresholdGrowth * abs(t));
}
)GLSL";

const char* const kSphereEstimator = R"GLSL(float sceneDE(vec3 pos, out float trap, out float smoothIter) {
    float z[DIMENSION];
    sliceToND(pos, z);
    float r2 = dotND(z, z);
    trap = r2;
    smoothIter = 0.0;
    return sqrt(r2) - uSphereRadius;
}
)GLSL";

const char* const kHyperbulbEstimator = R"GLSL(// r -> r^power, every hyperspherical angle -> angle * power
void hyperbulbPowerMap(inout float z[DIMENSION], float power) {
    float r2 = dotND(z, z);
    float r = sqrt(r2);
    if (r < 1.0e-6) {
        for (int i = 0; i < DIMENSION; ++i) {
            z[i] = 0.0;
        }
        return;
    }

    float theta[DIMENSION];
    float tail2 = r2;
    for (int i = 0; i < DIMENSION - 2; ++i) {
        float tail = sqrt(max(tail2, SAFE_EPSILON_SQ));
        theta[i] = acos(clamp(z[i] / tail, -1.0, 1.0));
        tail2 -= z[i] * z[i];
    }
    theta[DIMENSION - 2] = atan(z[DIMENSION - 1], z[DIMENSION - 2]);

    float radius = pow(r, power);
    float sinProduct = 1.0;
    for (int i = 0; i < DIMENSION - 2; ++i) {
        float angle = theta[i] * power;
        z[i] = radius * sinProduct * cos(angle);
        sinProduct *= sin(angle);
    }
    float last = theta[DIMENSION - 2] * power;
    z[DIMENSION - 2] = radius * sinProduct * cos(last);
    z[DIMENSION - 1] = radius * sinProduct * sin(last);
}

float sceneDE(vec3 pos, out float trap, out float smoothIter) {
    float c[DIMENSION];
    sliceToND(pos, c);
    float z[DIMENSION];
    for (int i = 0; i < DIMENSION; ++i) {
        z[i] = c[i];
    }

    float bailout2 = uEscapeRadius * uEscapeRadius;
    float r2 = dotND(z, z);
    float dr = 1.0;
    bool escaped = false;
    int iteration = 0;
    trap = r2;

    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        if (i >= uIterations) {
            break;
        }
        if (r2 > bailout2) {
            escaped = true;
            break;
        }
        float r = sqrt(r2);
        dr = min(uPower * pow(max(r, 1.0e-6), uPower - 1.0) * dr + 1.0, MAX_DERIVATIVE);
        hyperbulbPowerMap(z, uPower);
        for (int k = 0; k < DIMENSION; ++k) {
            z[k] += c[k];
        }
        r2 = dotND(z, z);
        trap = min(trap, r2);
        iteration++;
    }
    if (r2 > bailout2) {
        escaped = true;
    }

    float r = sqrt(r2);
    smoothIter = escaped ? smoothEscape(iteration, r, uEscapeRadius, uPower) : float(iteration);
    return 0.5 * log(max(r, 1.0e-6)) * r / max(dr, SAFE_EPSILON_SQ);
}
)GLSL";

const char* const kMandelboxEstimator = R"GLSL(void boxFold(inout float z[DIMENSION]) {
    for (int i = 0; i < DIMENSION; ++i) {
        z[i] = clamp(z[i], -uFoldingLimit, uFoldingLimit) * 2.0 - z[i];
    }
}

// Returns the factor applied so the caller can scale dr
float sphereFold(inout float z[DIMENSION]) {
    float r2 = dotND(z, z);
    float inner2 = max(uMinRadius2, SAFE_EPSILON_SQ);
    float factor = 1.0;
    if (r2 < inner2) {
        factor = uFixedRadius2 / inner2;
    } else if (r2 < uFixedRadius2) {
        factor = uFixedRadius2 / max(r2, SAFE_EPSILON_SQ);
    }
    for (int i = 0; i < DIMENSION; ++i) {
        z[i] *= factor;
    }
    return factor;
}

float sceneDE(vec3 pos, out float trap, out float smoothIter) {
    float z[DIMENSION];
    sliceToND(pos, z);
    float c[DIMENSION];
    for (int i = 0; i < DIMENSION; ++i) {
        c[i] = uJuliaMode != 0 ? uJuliaC[i] : z[i];
    }

    float bailout2 = uEscapeRadius * uEscapeRadius;
    float absScale = abs(uScale);
    float r2 = dotND(z, z);
    float dr = 1.0;
    bool escaped = false;
    int iteration = 0;
    trap = r2;

    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        if (i >= uIterations) {
            break;
        }
        boxFold(z);
        dr *= sphereFold(z);
        for (int k = 0; k < DIMENSION; ++k) {
            z[k] = uScale * z[k] + c[k];
        }
        dr = min(dr * absScale + (uJuliaMode != 0 ? 0.0 : 1.0), MAX_DERIVATIVE);

        r2 = dotND(z, z);
        trap = min(trap, r2);
        iteration++;
        if (r2 > bailout2) {
            escaped = true;
            break;
        }
    }

    float r = sqrt(r2);
    smoothIter = escaped ? smoothEscape(iteration, r, uEscapeRadius, max(absScale, 2.0)) : float(iteration);
    return r / max(abs(dr), SAFE_EPSILON_SQ);
}
)GLSL";

const char* const kKaliEstimator = R"GLSL(// z <- gain * |z| / max(z.z, eps) + c. Field value only, cut to the bounding ball:
// escaped orbits use the log-radius estimate, bounded ones their trap against the shell.
float sceneDE(vec3 pos, out float trap, out float smoothIter) {
    float z[DIMENSION];
    sliceToND(pos, z);

    float bailout2 = uEscapeRadius * uEscapeRadius;
    float epsilon = max(uKaliEpsilon, SAFE_EPSILON_SQ);
    float r2 = dotND(z, z);
    float bound = sqrt(r2) - uKaliBoundRadius;
    float dr = 1.0;
    bool escaped = false;
    int iteration = 0;
    trap = 3.0e38;

    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        if (i >= uIterations) {
            break;
        }
        float inverse = uReciprocalGain / max(r2, epsilon);
        for (int k = 0; k < DIMENSION; ++k) {
            z[k] = abs(z[k]) * inverse + uKaliConstant[k];
        }
        dr = min(dr * abs(inverse), MAX_DERIVATIVE);

        r2 = dotND(z, z);
        trap = min(trap, r2);
        iteration++;
        if (r2 > bailout2) {
            escaped = true;
            break;
        }
    }

    float r = sqrt(r2);
    smoothIter = escaped ? smoothEscape(iteration, r, uEscapeRadius, 2.0) : float(iteration);
    float structure = escaped
        ? 0.5 * log(max(r, 1.0e-6)) * r / max(dr, SAFE_EPSILON_SQ)
        : sqrt(trap) - uKaliShellRadius;
    return max(bound, structure);
}
)GLSL";

const char* const kRaymarch = R"GLSL(struct MarchResult {
    float t;
    int steps;
    int outcome;
    float trap;
    float smoothIter;
    float density;
};

// Field estimators never step at full length, whatever the host uploads
float marchSafety() {
#ifdef FAMILY_KALI
    return min(uSafetyFactor, FIELD_SAFETY_LIMIT);
#else
    return uSafetyFactor;
#endif
}

MarchResult raymarch(vec3 ro, vec3 rd) {
    MarchResult result;
    result.t = 0.0;
    result.steps = 0;
    result.outcome = MARCH_STEP_EXHAUSTED;
    result.trap = 0.0;
    result.smoothIter = 0.0;
    result.density = 0.0;

    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        if (i >= uMaxSteps) {
            break;
        }
        vec3 p = ro + rd * result.t;
        float trap;
        float smoothIter;
        float d = sceneDE(p, trap, smoothIter);

        result.steps = i + 1;
        result.trap = trap;
        result.smoothIter = smoothIter;
        result.density += 1.0 / (1.0 + 100.0 * d * d);

        if (d < surfaceThreshold(result.t)) {
            result.outcome = MARCH_HIT;
            return result;
        }
        result.t += d * marchSafety();
        if (result.t > uMaxDistance) {
            result.outcome = MARCH_MISS;
            return result;
        }
    }
    return result;
}
)GLSL";

const char* const kNormals = R"GLSL(// Central differences of the scalar field, step proportional to the hit threshold
vec3 estimateNormal(vec3 p, float h) {
    float trap;
    float smoothIter;
    vec3 ex = vec3(h, 0.0, 0.0);
    vec3 ey = vec3(0.0, h, 0.0);
    vec3 ez = vec3(0.0, 0.0, h);
    vec3 gradient = vec3(
        sceneDE(p + ex, trap, smoothIter) - sceneDE(p - ex, trap, smoothIter),
        sceneDE(p + ey, trap, smoothIter) - sceneDE(p - ey, trap, smoothIter),
        sceneDE(p + ez, trap, smoothIter) - sceneDE(p - ez, trap, smoothIter));
    float len = length(gradient);
    if (len < SAFE_EPSILON_SQ) {
        return vec3(0.0, 0.0, 1.0);
    }
    return gradient / len;
}
)GLSL";

const char* const kLighting = R"GLSL(vec3 getLightDirection() {
    vec3 dir = uLightDirection;
    float len = length(dir);
    return len > SAFE_EPSILON ? dir / len : vec3(0.0, 1.0, 0.0);
}

// Blinn-Phong with an ambient floor
vec3 shadeSurface(vec3 albedo, vec3 n, vec3 viewDir) {
    vec3 l = getLightDirection();
    vec3 h = normalize(l + viewDir);
    float diffuse = max(dot(n, l), 0.0);
    float specular = pow(max(dot(n, h), 0.0), max(uSpecularPower, 1.0));
    return albedo * (uAmbientStrength + diffuse * uLightColor) + specular * uLightColor;
}
)GLSL";

const char* const kFresnel = R"GLSL(float fresnelTerm(vec3 n, vec3 viewDir) {
    float cosTheta = clamp(dot(n, viewDir), 0.0, 1.0);
    return uFresnelIntensity * pow(1.0 - cosTheta, 5.0);
}
)GLSL";

const char* const kShadows = R"GLSL(// Soft shadow toward the light; 1 is fully lit
float softShadow(vec3 ro, vec3 rd, float mint, float maxt) {
    float shadow = 1.0;
    float t = mint;
    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        if (i >= uShadowSteps) {
            break;
        }
        float trap;
        float smoothIter;
        float d = sceneDE(ro + rd * t, trap, smoothIter);
        if (d < SAFE_EPSILON) {
            return 0.0;
        }
        shadow = min(shadow, uShadowSoftness * d / t);
        t += clamp(d * marchSafety(), 0.01, 0.5);
        if (t > maxt) {
            break;
        }
    }
    return clamp(shadow, 0.0, 1.0);
}
)GLSL";

const char* const kAmbientOcclusion = R"GLSL(float ambientOcclusion(vec3 p, vec3 n) {
    float occlusion = 0.0;
    float weight = 1.0;
    for (int i = 1; i <= 5; ++i) {
        float h = 0.02 * float(i);
        float trap;
        float smoothIter;
        float d = sceneDE(p + n * h, trap, smoothIter);
        occlusion += (h - d) * weight;
        weight *= 0.6;
    }
    return clamp(1.0 - uAOStrength * occlusion * 4.0, 0.0, 1.0);
}
)GLSL";

const char* const kColorMonochromatic = R"GLSL(vec3 surfaceColor(MarchResult march, vec3 n) {
    float shade = clamp(march.smoothIter / float(max(uIterations, 1)), 0.0, 1.0);
    return uBaseColor * (0.35 + 0.65 * shade);
}
)GLSL";

const char* const kColorCosine = R"GLSL(vec3 cosinePalette(float t, vec3 a, vec3 b, vec3 c, vec3 d) {
    return a + b * cos(6.28318 * (c * t + d));
}

vec3 surfaceColor(MarchResult march, vec3 n) {
    float t = fract(march.smoothIter / float(max(uIterations, 1)));
    return cosinePalette(t, uPaletteA, uPaletteB, uPaletteC, uPaletteD);
}
)GLSL";

const char* const kColorNormal = R"GLSL(vec3 surfaceColor(MarchResult march, vec3 n) {
    return mix(uBaseColor, n * 0.5 + 0.5, 0.75);
}
)GLSL";

const char* const kColorDistance = R"GLSL(vec3 surfaceColor(MarchResult march, vec3 n) {
    float t = clamp(march.t / max(uMaxDistance, SAFE_EPSILON), 0.0, 1.0);
    return uBaseColor * (1.0 - 0.8 * t);
}
)GLSL";

const char* const kColorOrbitTrap = R"GLSL(vec3 surfaceColor(MarchResult march, vec3 n) {
    float t = clamp(sqrt(max(march.trap, 0.0)), 0.0, 1.0);
    return mix(uBaseColor, vec3(1.0) - uBaseColor, t);
}
)GLSL";

const char* const kOpacitySolid = R"GLSL(float computeOpacity(MarchResult march) {
    return 1.0;
}
)GLSL";

const char* const kOpacitySimpleAlpha = R"GLSL(float computeOpacity(MarchResult march) {
    return clamp(uSimpleAlpha, 0.0, 1.0);
}
)GLSL";

const char* const kOpacityLayeredSurfaces = R"GLSL(float computeOpacity(MarchResult march) {
    float layer = clamp(uLayerOpacity, 0.0, 1.0);
    return 1.0 - pow(1.0 - layer, float(clamp(uLayerCount, 1, 4)));
}
)GLSL";

const char* const kOpacityVolumetricDensity = R"GLSL(float computeOpacity(MarchResult march) {
    return 1.0 - exp(-max(uVolumetricDensity, 0.0) * march.density);
}
)GLSL";

const char* const kMain = R"GLSL(void main() {
    vec3 ro = uCameraPosition;
    vec3 rd = normalize(vPosition - uCameraPosition);
    MarchResult march = raymarch(ro, rd);
    float alpha = computeOpacity(march);

#if OPACITY_MODE != OPACITY_VOLUMETRIC_DENSITY
    if (march.outcome != MARCH_HIT) {
        discard;
    }
#endif

    vec3 pos = ro + rd * march.t;
    vec3 n = vec3(0.0);
#ifdef USE_NORMALS
    n = estimateNormal(pos, surfaceThreshold(march.t));
#endif

    vec3 color = surfaceColor(march, n);
#ifdef USE_LIGHTING
    color = shadeSurface(color, n, -rd);
#endif
#ifdef USE_SHADOWS
    color *= mix(0.25, 1.0, softShadow(pos + n * surfaceThreshold(march.t) * 2.0, getLightDirection(), 0.01, uMaxDistance));
#endif
#ifdef USE_AO
    color *= ambientOcclusion(pos, n);
#endif
#ifdef USE_FRESNEL
    color += fresnelTerm(n, -rd) * uLightColor;
#endif

    fragColor = vec4(color, alpha);
}
)GLSL";

} // namespace glsl
} // namespace ndshader
