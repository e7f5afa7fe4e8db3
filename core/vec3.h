/**
 * @file vec3.h
 * @brief 3D vector mathematics for the slab tracer
 *
 * Plain C value type shared by the core and the C++ engine. Colors and
 * points reuse the same struct.
 */

#ifndef SLABRAY_VEC3_H
#define SLABRAY_VEC3_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief 3D vector structure
 */
typedef struct vec3 {
    double x;
    double y;
    double z;
} vec3;

/**
 * @brief Color alias for vec3 (r, g, b stored in x, y, z)
 */
typedef vec3 color;

/**
 * @brief Point alias for vec3
 */
typedef vec3 point3;

/* Construction */
vec3 vec3_create(double x, double y, double z);
vec3 vec3_zero(void);

/* Basic operations */
vec3 vec3_add(vec3 a, vec3 b);
vec3 vec3_sub(vec3 a, vec3 b);
vec3 vec3_mul(vec3 a, vec3 b);
vec3 vec3_scale(vec3 v, double t);
vec3 vec3_negate(vec3 v);

/* Vector products */
double vec3_dot(vec3 a, vec3 b);
vec3 vec3_cross(vec3 a, vec3 b);

/* Length operations */
double vec3_length(vec3 v);
double vec3_length_squared(vec3 v);

/**
 * @brief Unit vector in the direction of v
 *
 * v must not be zero length; the result is undefined (NaN) otherwise.
 */
vec3 vec3_normalize(vec3 v);

/* Reflection and refraction */

/**
 * @brief Mirror v about n: v - n * 2 * dot(v, n)
 *
 * n must be unit length. The result is not renormalized.
 */
vec3 vec3_reflect(vec3 v, vec3 n);

/**
 * @brief Refract a unit incident direction through a surface
 *
 * @param incident Unit incident direction
 * @param n Unit normal facing against the incident ray
 * @param eta Ratio of indices n_incident / n_transmitted
 * @param out Refracted direction, written only on success
 * @return false on total internal reflection
 */
bool vec3_refract(vec3 incident, vec3 n, double eta, vec3* out);

/* Utility */
vec3 vec3_lerp(vec3 a, vec3 b, double t);
vec3 vec3_clamp(vec3 v, double min_val, double max_val);

#ifdef __cplusplus
}
#endif

#endif /* SLABRAY_VEC3_H */
