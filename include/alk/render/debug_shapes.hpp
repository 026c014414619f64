#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: debug_shapes.hpp
    MODULE: render
    PURPOSE: Immediate debug cubes and lines drawn with the utility debug
            technique. The technique is mandatory for this path.
*/


#include <array>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <glm/glm.hpp>

#include "alk/core/result.hpp"
#include "alk/render/render_context.hpp"
#include "alk/tfx/scope_registry.hpp"
#include "alk/tfx/technique_binder.hpp"

namespace alk
{
    struct DebugShapeScope
    {
        glm::mat4 model_to_world{1.0f};
        glm::vec4 color{1.0f};
    };

    enum class DebugShapeKind : uint8_t
    {
        Cube = 0,
        Line = 1
    };

    // Scene component drawn by the renderer while the debug view is on.
    struct DebugShape
    {
        DebugShapeKind kind = DebugShapeKind::Cube;
        glm::mat4 model_to_world{1.0f};
        glm::vec3 from{0.0f};
        glm::vec3 to{0.0f};
        glm::vec4 color{1.0f};
    };

    class DebugShapeRenderer
    {
    public:
        DebugShapeRenderer() = default;

        static Result<DebugShapeRenderer> create(IGpuDevice& gpu)
        {
            static const std::array<glm::vec3, 8> kCubeVertices{{
                {-0.5f, -0.5f, -0.5f}, { 0.5f, -0.5f, -0.5f}, { 0.5f,  0.5f, -0.5f}, {-0.5f,  0.5f, -0.5f},
                {-0.5f, -0.5f,  0.5f}, { 0.5f, -0.5f,  0.5f}, { 0.5f,  0.5f,  0.5f}, {-0.5f,  0.5f,  0.5f},
            }};
            static const std::array<uint16_t, 36> kCubeIndices{{
                0, 2, 1, 0, 3, 2,
                4, 5, 6, 4, 6, 7,
                0, 1, 5, 0, 5, 4,
                3, 6, 2, 3, 7, 6,
                0, 4, 7, 0, 7, 3,
                1, 2, 6, 1, 6, 5,
            }};
            static const std::array<glm::vec3, 2> kLineVertices{{{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}}};

            DebugShapeRenderer out{};
            out.gpu_ = &gpu;

            BufferDesc vb{};
            vb.kind = BufferKind::Vertex;
            vb.size_bytes = sizeof(kCubeVertices);
            vb.stride = sizeof(glm::vec3);
            vb.debug_name = "debug_cube_vertices";
            auto cube_vb = gpu.create_buffer(vb, kCubeVertices.data());
            if (!cube_vb.ok) return Result<DebugShapeRenderer>::failure(vb.debug_name + ": " + cube_vb.error);
            out.cube_vertices_ = cube_vb.value;

            BufferDesc ib{};
            ib.kind = BufferKind::Index;
            ib.size_bytes = sizeof(kCubeIndices);
            ib.stride = sizeof(uint16_t);
            ib.debug_name = "debug_cube_indices";
            auto cube_ib = gpu.create_buffer(ib, kCubeIndices.data());
            if (!cube_ib.ok) return Result<DebugShapeRenderer>::failure(ib.debug_name + ": " + cube_ib.error);
            out.cube_indices_ = cube_ib.value;

            vb.size_bytes = sizeof(kLineVertices);
            vb.debug_name = "debug_line_vertices";
            auto line_vb = gpu.create_buffer(vb, kLineVertices.data());
            if (!line_vb.ok) return Result<DebugShapeRenderer>::failure(vb.debug_name + ": " + line_vb.error);
            out.line_vertices_ = line_vb.value;

            BufferDesc cb{};
            cb.kind = BufferKind::Constant;
            cb.size_bytes = sizeof(DebugShapeScope);
            cb.debug_name = "debug_shape_constants";
            auto cbuf = gpu.create_buffer(cb, nullptr);
            if (!cbuf.ok) return Result<DebugShapeRenderer>::failure(cb.debug_name + ": " + cbuf.error);
            out.constants_ = cbuf.value;

            return Result<DebugShapeRenderer>::success(std::move(out));
        }

        ~DebugShapeRenderer() { release(); }

        DebugShapeRenderer(DebugShapeRenderer&& o) noexcept { take(std::move(o)); }
        DebugShapeRenderer& operator=(DebugShapeRenderer&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        DebugShapeRenderer(const DebugShapeRenderer&) = delete;
        DebugShapeRenderer& operator=(const DebugShapeRenderer&) = delete;

        void draw_cube(RenderContext& ctx, const glm::mat4& model_to_world, const glm::vec4& color)
        {
            prepare(ctx, DebugShapeScope{model_to_world, color});
            ctx.gpu.bind_vertex_buffer(0, cube_vertices_, sizeof(glm::vec3), 0);
            ctx.gpu.bind_index_buffer(cube_indices_, IndexFormat::U16);
            ctx.gpu.set_topology(PrimitiveTopology::TriangleList);
            ctx.gpu.draw_indexed(36, 0, 0);
        }

        void draw(RenderContext& ctx, const DebugShape& shape)
        {
            if (shape.kind == DebugShapeKind::Line) draw_line(ctx, shape.from, shape.to, shape.color);
            else draw_cube(ctx, shape.model_to_world, shape.color);
        }

        void draw_line(RenderContext& ctx, const glm::vec3& from, const glm::vec3& to, const glm::vec4& color)
        {
            // Maps the unit segment (0,0,0)-(1,0,0) onto from-to.
            glm::mat4 m{1.0f};
            m[0] = glm::vec4(to - from, 0.0f);
            m[3] = glm::vec4(from, 1.0f);

            prepare(ctx, DebugShapeScope{m, color});
            ctx.gpu.bind_vertex_buffer(0, line_vertices_, sizeof(glm::vec3), 0);
            ctx.gpu.set_topology(PrimitiveTopology::LineList);
            ctx.gpu.draw(2, 0);
        }

    private:
        void prepare(RenderContext& ctx, const DebugShapeScope& scope)
        {
            const TechniqueHandle technique = ctx.assets.technique(ctx.shaders.debug_shape_technique);
            if (!technique)
            {
                throw std::logic_error("debug shape technique " + to_string(ctx.shaders.debug_shape_technique) + " is not loaded");
            }

            const Status st = ctx.gpu.write_buffer(constants_, &scope, sizeof(scope));
            if (!st.ok) log_error("debug shapes: " + st.error);

            auto d = ctx.data.lock();
            TechniqueBindContext bind{ctx.gpu, ctx.scopes, d->externs};
            const Status bound = technique->bind(bind, nullptr);
            if (!bound.ok) log_error("debug shapes: " + bound.error);

            ctx.gpu.bind_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::RigidModel), constants_);
            ctx.gpu.bind_constant_buffer(ShaderStage::Pixel, scope_slot(Scope::RigidModel), constants_);
            if (ctx.shaders.debug_shape_vs.valid()) ctx.gpu.bind_vertex_shader_override(ctx.shaders.debug_shape_vs);
        }

        void release()
        {
            if (!gpu_) return;
            if (cube_vertices_.valid()) gpu_->destroy_buffer(cube_vertices_);
            if (cube_indices_.valid()) gpu_->destroy_buffer(cube_indices_);
            if (line_vertices_.valid()) gpu_->destroy_buffer(line_vertices_);
            if (constants_.valid()) gpu_->destroy_buffer(constants_);
            gpu_ = nullptr;
        }

        void take(DebugShapeRenderer&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            cube_vertices_ = std::exchange(o.cube_vertices_, BufferHandle{});
            cube_indices_ = std::exchange(o.cube_indices_, BufferHandle{});
            line_vertices_ = std::exchange(o.line_vertices_, BufferHandle{});
            constants_ = std::exchange(o.constants_, BufferHandle{});
        }

        IGpuDevice* gpu_ = nullptr;
        BufferHandle cube_vertices_{};
        BufferHandle cube_indices_{};
        BufferHandle line_vertices_{};
        BufferHandle constants_{};
    };
}
