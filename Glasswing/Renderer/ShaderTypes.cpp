//------------------------------------------------------------------------------
// ShaderTypes.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/ShaderTypes.hpp"
#include "Glasswing/Core/Assert.hpp"

namespace Glasswing
{
	ShaderUsage ToUsage(ShaderStage stage)
	{
		switch (stage)
		{
		case ShaderStage::Vertex:   return ShaderUsage::Vertex;
		case ShaderStage::Geometry: return ShaderUsage::Geometry;
		case ShaderStage::Pixel:    return ShaderUsage::Pixel;
		}

		ASSERT_NOT_REACHED("Unknown shader stage {}", static_cast<int>(stage));
		return ShaderUsage::None;
	}

	const char* ToString(ShaderStage stage)
	{
		switch (stage)
		{
		case ShaderStage::Vertex:   return "Vertex";
		case ShaderStage::Geometry: return "Geometry";
		case ShaderStage::Pixel:    return "Pixel";
		}
		return "Unknown";
	}

	size_t VarType::GetSize() const
	{
		size_t baseSize = 0;
		switch (baseType)
		{
		case BaseType::I32:
		case BaseType::U32:
		case BaseType::F32:
			baseSize = 4;
			break;
		case BaseType::F64:
			baseSize = 8;
			break;
		case BaseType::Bool:
			baseSize = 1;
			break;
		}
		return static_cast<size_t>(dim1) * dim2 * baseSize;
	}

	bool CanSample(TextureVarType type)
	{
		switch (type)
		{
		case TextureVarType::Buffer:
		case TextureVarType::D2Multisample:
		case TextureVarType::D2ArrayMultisample:
			return false;
		default:
			return true;
		}
	}
}
