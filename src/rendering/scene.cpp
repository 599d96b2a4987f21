/// @file scene.cpp
/// @brief Scene container and frustum test.

#include "rendering/scene.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <array>
#include <cmath>

namespace latentsky::rendering
{

Mat4f PointCloud::model_matrix() const
{
    Mat4f model{1.0f};
    model = glm::rotate(model, rotation.x, Vec3f{1.0f, 0.0f, 0.0f});
    model = glm::rotate(model, rotation.y, Vec3f{0.0f, 1.0f, 0.0f});
    model = glm::rotate(model, rotation.z, Vec3f{0.0f, 0.0f, 1.0f});
    return model;
}

PointCloud& Scene::add(std::unique_ptr<PointCloud> node)
{
    m_children.push_back(std::move(node));
    return *m_children.back();
}

void Scene::clear()
{
    m_children.clear();
}

void Scene::rotate_all(const Vec3f& delta_rotation)
{
    for (auto& node : m_children)
    {
        node->rotation += delta_rotation;
    }
}

std::vector<const PointCloud*> Scene::visible_nodes(const Mat4f& view, const Mat4f& projection) const
{
    std::vector<const PointCloud*> visible;
    visible.reserve(m_children.size());

    for (const auto& node : m_children)
    {
        if (node->frustum_culled)
        {
            const Mat4f clip_from_world = projection * view * node->model_matrix();
            if (!sphere_in_frustum(clip_from_world, Vec3f{0.0f}, node->bounding_radius))
            {
                continue;
            }
        }
        visible.push_back(node.get());
    }

    return visible;
}

// -----------------------------------------------------------------
// Gribb/Hartmann plane extraction. Planes are normalized so the
// signed distance can be compared against the sphere radius.
// -----------------------------------------------------------------

bool sphere_in_frustum(const Mat4f& m, const Vec3f& centre, f32 radius)
{
    const Vec4f row0{m[0][0], m[1][0], m[2][0], m[3][0]};
    const Vec4f row1{m[0][1], m[1][1], m[2][1], m[3][1]};
    const Vec4f row2{m[0][2], m[1][2], m[2][2], m[3][2]};
    const Vec4f row3{m[0][3], m[1][3], m[2][3], m[3][3]};

    const std::array<Vec4f, 6> planes = {
        row3 + row0,    // left
        row3 - row0,    // right
        row3 + row1,    // top/bottom
        row3 - row1,
        row2,           // near (z >= 0)
        row3 - row2,    // far
    };

    for (const auto& plane : planes)
    {
        const f32 normal_length = glm::length(Vec3f{plane});
        if (normal_length <= 0.0f)
        {
            continue;
        }
        const f32 distance = (glm::dot(Vec3f{plane}, centre) + plane.w) / normal_length;
        if (distance < -radius)
        {
            return false;
        }
    }

    return true;
}

} // namespace latentsky::rendering
