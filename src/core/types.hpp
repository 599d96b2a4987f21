#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace latentsky
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (float: everything here ends up on the GPU)
    using Vec2f = glm::vec2;
    using Vec3f = glm::vec3;
    using Vec4f = glm::vec4;
    using Mat4f = glm::mat4;

    // Physical constants (SI)
    namespace astro_constants
    {
        constexpr f64 kPi                      = glm::pi<f64>();
        constexpr f64 kStefanBoltzmann         = 5.670374419e-8;  // W m^-2 K^-4
        constexpr f64 kSolarLuminosity         = 3.828e26;        // W
        constexpr f64 kSolarAbsoluteMagnitude  = 4.83;
        constexpr f64 kSolarRadius             = 6.957e8;         // m
        constexpr f64 kSolarTemperature        = 5778.0;          // K
    }
}
