/**
 * @file hit.h
 * @brief Hit record structure for ray-object intersections
 */

#ifndef SLABRAY_HIT_H
#define SLABRAY_HIT_H

#include "vec3.h"
#include "ray.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Hit record containing intersection information
 */
typedef struct hit_record {
    point3 point;      /**< Point of intersection */
    vec3 normal;       /**< Unit normal, always facing against the ray */
    double t;          /**< Ray parameter at intersection */
    double u;          /**< Surface U coordinate in [0, 1] */
    double v;          /**< Surface V coordinate in [0, 1] */
    bool front_face;   /**< True if ray hit the outward side */
    int material_id;   /**< Index into the scene material table */
} hit_record;

/**
 * @brief Initialize a hit record
 * @return Default hit record
 */
hit_record hit_record_init(void);

/**
 * @brief Set the face normal based on ray direction
 *
 * When dot(direction, outward_normal) >= 0 the ray is leaving the surface:
 * the stored normal is flipped and front_face is cleared. Shading code can
 * therefore always assume the normal opposes the incoming ray.
 *
 * @param rec Hit record to modify
 * @param r The ray
 * @param outward_normal The outward-pointing unit surface normal
 */
void hit_record_set_face_normal(hit_record* rec, ray r, vec3 outward_normal);

#ifdef __cplusplus
}
#endif

#endif /* SLABRAY_HIT_H */
