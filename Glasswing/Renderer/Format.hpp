//------------------------------------------------------------------------------
// Format.hpp
//
// Texel format tokens shared by textures, surfaces and pipeline targets
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Base.hpp"

namespace Glasswing
{
	enum class TexelFormat
	{
		// Color formats
		R8,
		RG8,
		RGBA8,
		BGRA8,

		// HDR formats
		R16F,
		RG16F,
		RGBA16F,
		R32F,
		RG32F,
		RGB32F,
		RGBA32F,

		// Depth/Stencil formats
		Depth16,
		Depth32F,
		Depth24Stencil8
	};

	// What a surface of a given format can be attached as
	enum class SurfaceType
	{
		Color,
		Depth,
		Stencil,
		DepthStencil
	};

	// Size in bytes of a single texel
	uint8 GetTexelSize(TexelFormat format);

	SurfaceType GetSurfaceType(TexelFormat format);

	inline bool IsColorFormat(TexelFormat format)
	{
		return GetSurfaceType(format) == SurfaceType::Color;
	}

	inline bool IsDepthOrStencilFormat(TexelFormat format)
	{
		return !IsColorFormat(format);
	}

	inline bool HasDepth(TexelFormat format)
	{
		SurfaceType type = GetSurfaceType(format);
		return type == SurfaceType::Depth || type == SurfaceType::DepthStencil;
	}

	inline bool HasStencil(TexelFormat format)
	{
		SurfaceType type = GetSurfaceType(format);
		return type == SurfaceType::Stencil || type == SurfaceType::DepthStencil;
	}

	const char* ToString(TexelFormat format);
}
