//------------------------------------------------------------------------------
// Format.cpp
//
// Texel format queries
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Format.hpp"
#include "Glasswing/Core/Assert.hpp"

namespace Glasswing
{
	uint8 GetTexelSize(TexelFormat format)
	{
		switch (format)
		{
		case TexelFormat::R8:              return 1;
		case TexelFormat::RG8:             return 2;
		case TexelFormat::RGBA8:           return 4;
		case TexelFormat::BGRA8:           return 4;
		case TexelFormat::R16F:            return 2;
		case TexelFormat::RG16F:           return 4;
		case TexelFormat::RGBA16F:         return 8;
		case TexelFormat::R32F:            return 4;
		case TexelFormat::RG32F:           return 8;
		case TexelFormat::RGB32F:          return 12;
		case TexelFormat::RGBA32F:         return 16;
		case TexelFormat::Depth16:         return 2;
		case TexelFormat::Depth32F:        return 4;
		case TexelFormat::Depth24Stencil8: return 4;
		}

		ASSERT_NOT_REACHED("Unknown texel format {}", static_cast<int>(format));
		return 0;
	}

	SurfaceType GetSurfaceType(TexelFormat format)
	{
		switch (format)
		{
		case TexelFormat::Depth16:
		case TexelFormat::Depth32F:
			return SurfaceType::Depth;
		case TexelFormat::Depth24Stencil8:
			return SurfaceType::DepthStencil;
		default:
			return SurfaceType::Color;
		}
	}

	const char* ToString(TexelFormat format)
	{
		switch (format)
		{
		case TexelFormat::R8:              return "R8";
		case TexelFormat::RG8:             return "RG8";
		case TexelFormat::RGBA8:           return "RGBA8";
		case TexelFormat::BGRA8:           return "BGRA8";
		case TexelFormat::R16F:            return "R16F";
		case TexelFormat::RG16F:           return "RG16F";
		case TexelFormat::RGBA16F:         return "RGBA16F";
		case TexelFormat::R32F:            return "R32F";
		case TexelFormat::RG32F:           return "RG32F";
		case TexelFormat::RGB32F:          return "RGB32F";
		case TexelFormat::RGBA32F:         return "RGBA32F";
		case TexelFormat::Depth16:         return "Depth16";
		case TexelFormat::Depth32F:        return "Depth32F";
		case TexelFormat::Depth24Stencil8: return "Depth24Stencil8";
		}
		return "Unknown";
	}
}
