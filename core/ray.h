/**
 * @file ray.h
 * @brief Ray structure and operations
 */

#ifndef SLABRAY_RAY_H
#define SLABRAY_RAY_H

#include "vec3.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Ray with origin and unit direction
 */
typedef struct ray {
    point3 origin;
    vec3 direction;
} ray;

/**
 * @brief Create a new ray
 *
 * The direction is always normalized, so every consumer may assume a unit
 * direction. A zero-length direction is a caller error and trips an
 * assertion.
 *
 * @param origin Ray origin point
 * @param direction Ray direction vector (any non-zero length)
 * @return New ray
 */
ray ray_create(point3 origin, vec3 direction);

/**
 * @brief Get point along ray at parameter t
 * @param r The ray
 * @param t Parameter value (distance along ray)
 * @return Point at r.origin + t * r.direction
 */
point3 ray_at(ray r, double t);

#ifdef __cplusplus
}
#endif

#endif /* SLABRAY_RAY_H */
