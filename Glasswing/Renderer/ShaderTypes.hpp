//------------------------------------------------------------------------------
// ShaderTypes.hpp
//
// Shader stages and the introspection catalog a linked program reports
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Base.hpp"
#include <string>
#include <vector>

namespace Glasswing
{
	enum class ShaderStage
	{
		Vertex,
		Geometry,
		Pixel
	};

	// Bitmask of the stages a program variable is used in
	enum class ShaderUsage : uint8
	{
		None = 0x00,
		Vertex = 0x01,
		Geometry = 0x02,
		Pixel = 0x04,

		// Common combinations
		VertexPixel = Vertex | Pixel
	};

	inline ShaderUsage operator|(ShaderUsage a, ShaderUsage b)
	{
		return static_cast<ShaderUsage>(static_cast<uint8>(a) | static_cast<uint8>(b));
	}

	inline ShaderUsage operator&(ShaderUsage a, ShaderUsage b)
	{
		return static_cast<ShaderUsage>(static_cast<uint8>(a) & static_cast<uint8>(b));
	}

	inline bool HasUsage(ShaderUsage flags, ShaderUsage bit)
	{
		return (flags & bit) != ShaderUsage::None;
	}

	ShaderUsage ToUsage(ShaderStage stage);
	const char* ToString(ShaderStage stage);

	enum class BaseType
	{
		I32,
		U32,
		F32,
		F64,
		Bool
	};

	// Scalar, vector (dim1 > 1) or matrix (dim1 > 1 and dim2 > 1) of a base type
	struct VarType
	{
		BaseType baseType = BaseType::F32;
		uint8 dim1 = 1;
		uint8 dim2 = 1;

		size_t GetSize() const;
		bool IsScalar() const { return dim1 == 1 && dim2 == 1; }
		bool IsVector() const { return dim1 > 1 && dim2 == 1; }
		bool IsMatrix() const { return dim1 > 1 && dim2 > 1; }

		static VarType Scalar(BaseType type) { return VarType{ type, 1, 1 }; }
		static VarType Vector(BaseType type, uint8 count) { return VarType{ type, count, 1 }; }
		static VarType Matrix(BaseType type, uint8 columns, uint8 rows) { return VarType{ type, columns, rows }; }

		bool operator==(const VarType& other) const = default;
	};

	enum class TextureVarType
	{
		Buffer,
		D1,
		D1Array,
		D2,
		D2Array,
		D2Multisample,
		D2ArrayMultisample,
		D3,
		Cube,
		CubeArray
	};

	// Buffer and multisample textures can only be fetched, not sampled
	bool CanSample(TextureVarType type);

	// ============================================================================
	// Introspected program variables
	// ============================================================================

	struct AttributeVar
	{
		std::string name;
		uint8 loc = 0;
		VarType type;
	};

	struct ConstVar
	{
		std::string name;
		uint8 loc = 0;
		uint8 count = 1;
		VarType type;
		ShaderUsage usage = ShaderUsage::None;
	};

	struct ConstBufferVar
	{
		std::string name;
		uint8 loc = 0;
		size_t size = 0;
		ShaderUsage usage = ShaderUsage::None;
	};

	struct TextureVar
	{
		std::string name;
		uint8 loc = 0;
		BaseType baseType = BaseType::F32;
		TextureVarType type = TextureVarType::D2;
		ShaderUsage usage = ShaderUsage::None;
	};

	struct SamplerVar
	{
		std::string name;
		uint8 slot = 0;
		bool isRect = false;
		bool isCompare = false;
		ShaderUsage usage = ShaderUsage::None;
	};

	struct OutputVar
	{
		std::string name;
		uint8 index = 0;
		VarType type;
	};

	// Produced once when a program is linked, read-only afterwards
	struct ProgramVars
	{
		std::vector<AttributeVar> attributes;
		std::vector<ConstVar> consts;
		std::vector<ConstBufferVar> constBuffers;
		std::vector<TextureVar> textures;
		std::vector<SamplerVar> samplers;
		std::vector<OutputVar> outputs;
	};
}
