//------------------------------------------------------------------------------
// VertexFormat.hpp
//
// Runtime description of a vertex struct: one element per shader attribute
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/PipelineState/PipelineDescriptor.hpp"

#include <string>
#include <vector>

namespace Glasswing
{
	struct VertexElement
	{
		std::string name;   // attribute name in the vertex shader
		VarType type;
		size_t offset = 0;
		BindingSlot slot;   // explicit location, or resolved at pin time
	};

	struct VertexFormat
	{
		size_t stride = 0;
		std::vector<VertexElement> elements;

		VertexFormat() = default;
		explicit VertexFormat(size_t vertexStride) : stride(vertexStride) {}

		VertexFormat& Add(std::string name, VarType type, size_t offset, BindingSlot slot = std::nullopt)
		{
			elements.push_back(VertexElement{ std::move(name), type, offset, slot });
			return *this;
		}
	};
}
