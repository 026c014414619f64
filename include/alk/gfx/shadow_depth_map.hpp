#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: shadow_depth_map.hpp
    MODULE: gfx
    PURPOSE: Layered square depth texture for one shadow-casting light. Each layer
            gets its own depth view; shaders sample the whole array.
*/


#include <string>
#include <utility>
#include <vector>

#include "alk/core/result.hpp"
#include "alk/gfx/extent.hpp"
#include "alk/gfx/gpu_device.hpp"

namespace alk
{
    class ShadowDepthMap
    {
    public:
        ShadowDepthMap() = default;

        static Result<ShadowDepthMap> create(IGpuDevice& gpu, uint32_t resolution, uint32_t layers, std::string name)
        {
            const Extent2D size = clamp_extent(Extent2D{resolution, resolution}, 1, name);
            if (layers == 0) layers = 1;

            ShadowDepthMap out{};
            out.gpu_ = &gpu;
            out.resolution_ = size.width;
            out.name_ = std::move(name);

            TextureDesc desc{};
            desc.width = size.width;
            desc.height = size.height;
            desc.layers = layers;
            desc.format = PixelFormat::R32_TYPELESS;
            desc.usage = TextureUsage_DepthStencil | TextureUsage_ShaderResource;
            desc.debug_name = out.name_;
            const auto tex = gpu.create_texture(desc);
            if (!tex.ok) return Result<ShadowDepthMap>::failure(out.name_ + ": shadow texture: " + tex.error);
            out.texture_ = tex.value;

            out.layer_dsvs_.reserve(layers);
            for (uint32_t i = 0; i < layers; ++i)
            {
                const auto dsv = gpu.create_view(ViewDesc{out.texture_, ViewKind::DepthStencil, PixelFormat::D32_FLOAT, i, 1});
                if (!dsv.ok)
                {
                    return Result<ShadowDepthMap>::failure(out.name_ + ": layer " + std::to_string(i) + " depth view: " + dsv.error);
                }
                out.layer_dsvs_.push_back(dsv.value);
            }

            const auto srv = gpu.create_view(ViewDesc{out.texture_, ViewKind::ShaderResource, PixelFormat::R32_FLOAT, 0, layers});
            if (!srv.ok) return Result<ShadowDepthMap>::failure(out.name_ + ": array shader view: " + srv.error);
            out.array_srv_ = srv.value;

            // Normal (reverse-Z) and flipped comparison for light-space projections.
            const auto normal = gpu.create_depth_stencil_state(DepthStencilDesc{true, true, CompareFunc::GreaterEqual});
            if (!normal.ok) return Result<ShadowDepthMap>::failure(out.name_ + ": depth state: " + normal.error);
            out.state_normal_ = normal.value;

            const auto flipped = gpu.create_depth_stencil_state(DepthStencilDesc{true, true, CompareFunc::LessEqual});
            if (!flipped.ok) return Result<ShadowDepthMap>::failure(out.name_ + ": flipped depth state: " + flipped.error);
            out.state_flipped_ = flipped.value;

            return Result<ShadowDepthMap>::success(std::move(out));
        }

        ~ShadowDepthMap() { release(); }

        ShadowDepthMap(ShadowDepthMap&& o) noexcept { take(std::move(o)); }
        ShadowDepthMap& operator=(ShadowDepthMap&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        ShadowDepthMap(const ShadowDepthMap&) = delete;
        ShadowDepthMap& operator=(const ShadowDepthMap&) = delete;

        void clear_layer(uint32_t layer, float depth) const
        {
            if (gpu_ && layer < layer_dsvs_.size()) gpu_->clear_depth_stencil(layer_dsvs_[layer], depth, 0);
        }

        void copy_layer(uint32_t dst_layer, uint32_t src_layer) const
        {
            if (gpu_) gpu_->copy_texture_layer(texture_, dst_layer, texture_, src_layer);
        }

        Viewport viewport() const
        {
            Viewport vp{};
            vp.width = (float)resolution_;
            vp.height = (float)resolution_;
            return vp;
        }

        bool valid() const { return texture_.valid(); }
        uint32_t resolution() const { return resolution_; }
        uint32_t layer_count() const { return (uint32_t)layer_dsvs_.size(); }
        TextureHandle texture() const { return texture_; }
        ViewHandle layer_dsv(uint32_t layer) const { return layer < layer_dsvs_.size() ? layer_dsvs_[layer] : ViewHandle{}; }
        ViewHandle array_srv() const { return array_srv_; }
        DepthStencilStateHandle state(bool flipped) const { return flipped ? state_flipped_ : state_normal_; }
        const std::string& name() const { return name_; }

    private:
        void release()
        {
            if (gpu_)
            {
                if (state_flipped_.valid()) gpu_->destroy_depth_stencil_state(state_flipped_);
                if (state_normal_.valid()) gpu_->destroy_depth_stencil_state(state_normal_);
                if (array_srv_.valid()) gpu_->destroy_view(array_srv_);
                for (ViewHandle v : layer_dsvs_) gpu_->destroy_view(v);
                if (texture_.valid()) gpu_->destroy_texture(texture_);
            }
            state_flipped_ = DepthStencilStateHandle{};
            state_normal_ = DepthStencilStateHandle{};
            array_srv_ = ViewHandle{};
            layer_dsvs_.clear();
            texture_ = TextureHandle{};
        }

        void take(ShadowDepthMap&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            texture_ = std::exchange(o.texture_, TextureHandle{});
            layer_dsvs_ = std::move(o.layer_dsvs_);
            o.layer_dsvs_.clear();
            array_srv_ = std::exchange(o.array_srv_, ViewHandle{});
            state_normal_ = std::exchange(o.state_normal_, DepthStencilStateHandle{});
            state_flipped_ = std::exchange(o.state_flipped_, DepthStencilStateHandle{});
            resolution_ = o.resolution_;
            name_ = std::move(o.name_);
        }

        IGpuDevice* gpu_ = nullptr;
        TextureHandle texture_{};
        std::vector<ViewHandle> layer_dsvs_{};
        ViewHandle array_srv_{};
        DepthStencilStateHandle state_normal_{};
        DepthStencilStateHandle state_flipped_{};
        uint32_t resolution_ = 0;
        std::string name_{};
    };
}
