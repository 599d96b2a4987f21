#pragma once

/// @file scene.hpp
/// @brief Minimal scene graph: a flat list of point-cloud nodes with transforms.

#include "core/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace latentsky::rendering
{
    /// @brief Scene node for one instanced point primitive.
    ///
    /// Holds CPU-side state only (transform, bounds, instance count). GPU
    /// resources are owned by the renderer.
    struct PointCloud
    {
        std::string name;
        Vec3f rotation{0.0f};           ///< Euler angles (radians), applied X then Y then Z
        u32 instance_count = 0;
        f32 bounding_radius = 0.0f;     ///< Object-space sphere around the origin
        bool frustum_culled = true;     ///< Skip drawing when the bounds leave the frustum

        /// @brief Object → world transform.
        [[nodiscard]] Mat4f model_matrix() const;
    };

    /// @brief Flat scene container. Owns its nodes.
    class Scene
    {
    public:
        Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        /// @brief Take ownership of a node and return a stable reference to it.
        PointCloud& add(std::unique_ptr<PointCloud> node);

        /// @brief Remove every node.
        void clear();

        [[nodiscard]] std::size_t child_count() const { return m_children.size(); }
        [[nodiscard]] const std::vector<std::unique_ptr<PointCloud>>& children() const { return m_children; }

        /// @brief Rotate every node by the given Euler increment.
        void rotate_all(const Vec3f& delta_rotation);

        /// @brief Nodes that should be drawn with the given camera.
        /// Nodes with frustum_culled == false are always returned.
        [[nodiscard]] std::vector<const PointCloud*> visible_nodes(const Mat4f& view,
                                                                   const Mat4f& projection) const;

    private:
        std::vector<std::unique_ptr<PointCloud>> m_children;
    };

    /// @brief True if a sphere (centre, radius) intersects the frustum of a clip matrix.
    ///
    /// Expects Vulkan clip space (0 <= z <= w).
    [[nodiscard]] bool sphere_in_frustum(const Mat4f& clip_from_world, const Vec3f& centre, f32 radius);

} // namespace latentsky::rendering
