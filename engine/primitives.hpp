/**
 * @file primitives.hpp
 * @brief Geometric primitives: axis-aligned box and infinite plane
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include <cmath>
#include <algorithm>
#include <limits>
#include <utility>

namespace slabray {

inline double axis_of(vec3 v, int axis) {
    return axis == 0 ? v.x : (axis == 1 ? v.y : v.z);
}

/**
 * @brief Axis-aligned box primitive
 *
 * Defined by its center and half-extents along x, y and z.
 */
struct Box {
    point3 center;
    vec3 half;
    int material_id;

    Box(point3 c, vec3 half_extents, int mat_id = 0)
        : center(c), half(half_extents), material_id(mat_id) {}

    /**
     * @brief Create a box spanning two corners
     */
    static Box from_corners(point3 min_pt, point3 max_pt, int mat_id = 0) {
        point3 c = vec3_scale(vec3_add(min_pt, max_pt), 0.5);
        vec3 h = vec3_scale(vec3_sub(max_pt, min_pt), 0.5);
        return Box(c, {std::fabs(h.x), std::fabs(h.y), std::fabs(h.z)}, mat_id);
    }

    point3 box_min() const { return vec3_sub(center, half); }
    point3 box_max() const { return vec3_add(center, half); }

    /**
     * @brief Test ray-box intersection using the slab method
     *
     * Zero direction components give infinite slab distances through
     * IEEE division; they are handled by the comparisons below. When the
     * ray starts inside the box the exit distance is reported.
     */
    bool hit(ray r, double t_min, double t_max, hit_record& rec) const {
        double t_enter = -std::numeric_limits<double>::infinity();
        double t_exit = std::numeric_limits<double>::infinity();

        for (int axis = 0; axis < 3; ++axis) {
            double origin = axis_of(r.origin, axis);
            double inv_d = 1.0 / axis_of(r.direction, axis);
            double c = axis_of(center, axis);
            double h = axis_of(half, axis);

            double t0 = (c - h - origin) * inv_d;
            double t1 = (c + h - origin) * inv_d;
            if (inv_d < 0.0) {
                std::swap(t0, t1);
            }

            if (t0 > t_enter) t_enter = t0;
            if (t1 < t_exit) t_exit = t1;
        }

        if (t_exit < t_enter || t_exit < 0.0) {
            return false;
        }

        double t = t_enter > t_min ? t_enter : t_exit;
        if (t <= t_min || t > t_max) {
            return false;
        }

        rec.t = t;
        rec.point = ray_at(r, t);
        rec.material_id = material_id;

        vec3 outward = face_normal(rec.point, rec.u, rec.v);
        hit_record_set_face_normal(&rec, r, outward);
        return true;
    }

    /**
     * @brief Outward normal of the face containing p, plus its UV
     *
     * The face is the axis with the largest box-local coordinate; ties go
     * to x, then y, then z.
     */
    vec3 face_normal(point3 p, double& u, double& v) const {
        vec3 rel = vec3_sub(p, center);
        vec3 local = {rel.x / half.x, rel.y / half.y, rel.z / half.z};

        double ax = std::fabs(local.x);
        double ay = std::fabs(local.y);
        double az = std::fabs(local.z);

        vec3 normal;
        if (ax >= ay && ax >= az) {
            normal = {local.x > 0.0 ? 1.0 : -1.0, 0.0, 0.0};
            u = local.z;
            v = local.y;
        } else if (ay >= az) {
            normal = {0.0, local.y > 0.0 ? 1.0 : -1.0, 0.0};
            u = local.x;
            v = local.z;
        } else {
            normal = {0.0, 0.0, local.z > 0.0 ? 1.0 : -1.0};
            u = local.x;
            v = local.y;
        }

        u = std::clamp((u + 1.0) * 0.5, 0.0, 1.0);
        v = std::clamp((v + 1.0) * 0.5, 0.0, 1.0);
        return normal;
    }
};

/**
 * @brief Infinite plane primitive
 *
 * Defined by a point on the plane and a normal vector.
 */
struct Plane {
    point3 point;
    vec3 normal;
    int material_id;

    // In-plane frame for UV
    vec3 tangent;
    vec3 bitangent;

    Plane(point3 p, vec3 n, int mat_id = 0)
        : point(p), normal(vec3_normalize(n)), material_id(mat_id)
    {
        vec3 up = (std::fabs(normal.y) < 0.999) ? vec3{0, 1, 0} : vec3{1, 0, 0};
        tangent = vec3_normalize(vec3_cross(up, normal));
        bitangent = vec3_cross(normal, tangent);
    }

    /**
     * @brief Test ray-plane intersection within [t_min, t_max]
     */
    bool hit(ray r, double t_min, double t_max, hit_record& rec) const {
        double denom = vec3_dot(normal, r.direction);

        // Ray is parallel to the plane
        if (std::fabs(denom) < 1e-8) {
            return false;
        }

        double t = vec3_dot(vec3_sub(point, r.origin), normal) / denom;
        if (t < t_min || t > t_max) {
            return false;
        }

        rec.t = t;
        rec.point = ray_at(r, t);
        rec.material_id = material_id;
        hit_record_set_face_normal(&rec, r, normal);

        // One world unit per UV tile
        vec3 d = vec3_sub(rec.point, point);
        double pu = vec3_dot(d, tangent);
        double pv = vec3_dot(d, bitangent);
        rec.u = pu - std::floor(pu);
        rec.v = pv - std::floor(pv);
        return true;
    }
};

} // namespace slabray
