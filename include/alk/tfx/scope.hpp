#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: scope.hpp
    MODULE: tfx
    PURPOSE: Named constant-buffer groups a technique may require at bind time.
*/


#include <cstdint>

namespace alk
{
    enum class Scope : uint8_t
    {
        Frame = 0,
        View = 1,
        RigidModel = 2,
        EditorMesh = 3,
        EditorTerrain = 4,
        CuiView = 5,
        CuiObject = 6,
        Skinning = 7,
        Speedtree = 8,
        ChunkModel = 9,
        Decal = 10,
        Instances = 11,
        SpeedtreeLodDrawcallData = 12,
        Transparent = 13,
        TransparentAdvanced = 14,
        SdsmBiasAndScaleTextures = 15,
        Terrain = 16,
        Postprocess = 17,
        CuiBitmap = 18,
        CuiStandard = 19,
        UiFont = 20,
        CuiHud = 21,
        ParticleTransforms = 22,
        ParticleLocationMetadata = 23,
        CubemapVolume = 24,
        GearPlatedTextures = 25,
        GearDye0 = 26,
        GearDye1 = 27,
        GearDye2 = 28,
        GearDyeDecal = 29,
        GenericArray = 30,
        Weather = 31
    };

    constexpr uint32_t kScopeCount = 32;

    inline const char* scope_name(Scope s)
    {
        switch (s)
        {
            case Scope::Frame: return "frame";
            case Scope::View: return "view";
            case Scope::RigidModel: return "rigid_model";
            case Scope::EditorMesh: return "editor_mesh";
            case Scope::EditorTerrain: return "editor_terrain";
            case Scope::CuiView: return "cui_view";
            case Scope::CuiObject: return "cui_object";
            case Scope::Skinning: return "skinning";
            case Scope::Speedtree: return "speedtree";
            case Scope::ChunkModel: return "chunk_model";
            case Scope::Decal: return "decal";
            case Scope::Instances: return "instances";
            case Scope::SpeedtreeLodDrawcallData: return "speedtree_lod_drawcall_data";
            case Scope::Transparent: return "transparent";
            case Scope::TransparentAdvanced: return "transparent_advanced";
            case Scope::SdsmBiasAndScaleTextures: return "sdsm_bias_and_scale_textures";
            case Scope::Terrain: return "terrain";
            case Scope::Postprocess: return "postprocess";
            case Scope::CuiBitmap: return "cui_bitmap";
            case Scope::CuiStandard: return "cui_standard";
            case Scope::UiFont: return "ui_font";
            case Scope::CuiHud: return "cui_hud";
            case Scope::ParticleTransforms: return "particle_transforms";
            case Scope::ParticleLocationMetadata: return "particle_location_metadata";
            case Scope::CubemapVolume: return "cubemap_volume";
            case Scope::GearPlatedTextures: return "gear_plated_textures";
            case Scope::GearDye0: return "gear_dye_0";
            case Scope::GearDye1: return "gear_dye_1";
            case Scope::GearDye2: return "gear_dye_2";
            case Scope::GearDyeDecal: return "gear_dye_decal";
            case Scope::GenericArray: return "generic_array";
            case Scope::Weather: return "weather";
        }
        return "unknown";
    }

    class ScopeBits
    {
    public:
        static constexpr uint32_t bit(Scope s) { return 1u << static_cast<uint32_t>(s); }

        constexpr ScopeBits() = default;
        constexpr explicit ScopeBits(uint32_t bits) : bits_(bits) {}

        static constexpr ScopeBits of(Scope s) { return ScopeBits(bit(s)); }

        constexpr bool contains(Scope s) const { return (bits_ & bit(s)) != 0; }
        constexpr bool empty() const { return bits_ == 0; }
        constexpr uint32_t bits() const { return bits_; }

        ScopeBits& insert(Scope s)
        {
            bits_ |= bit(s);
            return *this;
        }

        constexpr ScopeBits operator|(ScopeBits o) const { return ScopeBits(bits_ | o.bits_); }
        ScopeBits& operator|=(ScopeBits o)
        {
            bits_ |= o.bits_;
            return *this;
        }

        friend constexpr bool operator==(ScopeBits a, ScopeBits b) { return a.bits_ == b.bits_; }
        friend constexpr bool operator!=(ScopeBits a, ScopeBits b) { return a.bits_ != b.bits_; }

    private:
        uint32_t bits_ = 0;
    };
}
