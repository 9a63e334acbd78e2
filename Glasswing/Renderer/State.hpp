//------------------------------------------------------------------------------
// State.hpp
//
// Backend-agnostic fixed-function state carried by pipeline descriptors
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Base.hpp"
#include <optional>

namespace Glasswing
{
	enum class PrimitiveTopology
	{
		PointList,
		LineList,
		LineStrip,
		TriangleList,
		TriangleStrip
	};

	enum class PolygonMode
	{
		Fill,
		Line,
		Point
	};

	enum class CullMode
	{
		None,
		Front,
		Back,
		FrontAndBack
	};

	enum class FrontFace
	{
		Clockwise,
		CounterClockwise
	};

	enum class CompareOp
	{
		Never,
		Less,
		Equal,
		LessOrEqual,
		Greater,
		NotEqual,
		GreaterOrEqual,
		Always
	};

	enum class BlendFactor
	{
		Zero,
		One,
		SrcColor,
		OneMinusSrcColor,
		DstColor,
		OneMinusDstColor,
		SrcAlpha,
		OneMinusSrcAlpha,
		DstAlpha,
		OneMinusDstAlpha,
		ConstantColor,
		OneMinusConstantColor
	};

	enum class BlendEquation
	{
		Add,
		Subtract,
		ReverseSubtract,
		Min,
		Max
	};

	enum class StencilOp
	{
		Keep,
		Zero,
		Replace,
		IncrementClamp,
		IncrementWrap,
		DecrementClamp,
		DecrementWrap,
		Invert
	};

	// ============================================================================
	// Rasterizer
	// ============================================================================

	struct DepthOffset
	{
		float slope = 0.0f;
		int32 units = 0;
	};

	struct Rasterizer
	{
		FrontFace frontFace = FrontFace::CounterClockwise;
		CullMode cullMode = CullMode::None;
		PolygonMode polygonMode = PolygonMode::Fill;
		float lineWidth = 1.0f;
		std::optional<DepthOffset> offset;
		bool samples = false;

		// Filled polygons, no culling, no multisampling
		static Rasterizer Fill() { return Rasterizer{}; }

		Rasterizer WithSamples() const
		{
			Rasterizer copy = *this;
			copy.samples = true;
			return copy;
		}

		Rasterizer WithCullBack() const
		{
			Rasterizer copy = *this;
			copy.cullMode = CullMode::Back;
			return copy;
		}

		Rasterizer WithOffset(float slope, int32 units) const
		{
			Rasterizer copy = *this;
			copy.offset = DepthOffset{ slope, units };
			return copy;
		}
	};

	// ============================================================================
	// Depth / stencil
	// ============================================================================

	struct Depth
	{
		CompareOp compare = CompareOp::Always;
		bool write = false;

		static Depth LessEqualWrite() { return Depth{ CompareOp::LessOrEqual, true }; }
		static Depth LessEqualTest() { return Depth{ CompareOp::LessOrEqual, false }; }
	};

	struct StencilSide
	{
		CompareOp compare = CompareOp::Always;
		uint8 readMask = 0xFF;
		uint8 writeMask = 0xFF;
		StencilOp opFail = StencilOp::Keep;
		StencilOp opDepthFail = StencilOp::Keep;
		StencilOp opPass = StencilOp::Keep;
	};

	struct Stencil
	{
		StencilSide front;
		StencilSide back;

		static Stencil Both(const StencilSide& side) { return Stencil{ side, side }; }
	};

	// ============================================================================
	// Blending
	// ============================================================================

	struct BlendChannel
	{
		BlendEquation equation = BlendEquation::Add;
		BlendFactor source = BlendFactor::One;
		BlendFactor destination = BlendFactor::Zero;
	};

	struct Blend
	{
		BlendChannel color;
		BlendChannel alpha;

		static Blend Alpha()
		{
			BlendChannel channel{ BlendEquation::Add, BlendFactor::SrcAlpha, BlendFactor::OneMinusSrcAlpha };
			return Blend{ channel, channel };
		}

		static Blend Additive()
		{
			BlendChannel channel{ BlendEquation::Add, BlendFactor::One, BlendFactor::One };
			return Blend{ channel, channel };
		}
	};

	enum class ColorMask : uint8
	{
		None = 0x0,
		Red = 0x1,
		Green = 0x2,
		Blue = 0x4,
		Alpha = 0x8,
		All = Red | Green | Blue | Alpha
	};

	inline ColorMask operator|(ColorMask a, ColorMask b)
	{
		return static_cast<ColorMask>(static_cast<uint8>(a) | static_cast<uint8>(b));
	}

	inline ColorMask operator&(ColorMask a, ColorMask b)
	{
		return static_cast<ColorMask>(static_cast<uint8>(a) & static_cast<uint8>(b));
	}

	// Write mask plus optional blend state of one color target
	struct ColorInfo
	{
		ColorMask mask = ColorMask::All;
		std::optional<Blend> blend;
	};

	// ============================================================================
	// Misc
	// ============================================================================

	struct Rect
	{
		uint16 x = 0;
		uint16 y = 0;
		uint16 width = 0;
		uint16 height = 0;

		bool operator==(const Rect& other) const = default;
	};
}
