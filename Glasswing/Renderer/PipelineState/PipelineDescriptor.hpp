//------------------------------------------------------------------------------
// PipelineDescriptor.hpp
//
// Backend-independent description of a pipeline's bindings. The order of
// every list is fixed when the descriptor is built from a PipelineLayout and
// is the order data sets are assembled in.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Base.hpp"
#include "Glasswing/Renderer/Format.hpp"
#include "Glasswing/Renderer/ShaderTypes.hpp"
#include "Glasswing/Renderer/State.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Glasswing
{
	// Binding index of a shader variable; empty until resolved against
	// the program's introspection data
	using BindingSlot = std::optional<uint8>;

	// Placement of one vertex attribute inside its vertex buffer
	struct StructField
	{
		VarType type;
		size_t offset = 0;
		size_t size = 0;
		size_t stride = 0;
	};

	struct VertexAttribDesc
	{
		std::string name;
		BindingSlot slot;
		StructField field;
		uint8 instanceRate = 0; // 0 = per vertex
	};

	struct ConstantBlockDesc
	{
		std::string name;
		BindingSlot slot;
	};

	struct ResourceViewDesc
	{
		std::string name;
		BindingSlot slot;
		TexelFormat format = TexelFormat::RGBA8;
	};

	struct SamplerDesc
	{
		std::string name;
		BindingSlot slot;
	};

	struct ColorTargetDesc
	{
		std::string name;
		BindingSlot slot;
		TexelFormat format = TexelFormat::RGBA8;
		ColorInfo info;
	};

	struct DepthStencilDesc
	{
		SurfaceType surface = SurfaceType::Depth;
		std::optional<Depth> depth;
		std::optional<Stencil> stencil;
	};

	struct PipelineDescriptor
	{
		PrimitiveTopology primitive = PrimitiveTopology::TriangleList;
		Rasterizer rasterizer;
		bool scissor = false;

		std::vector<VertexAttribDesc> vertexAttribs;
		std::vector<ConstantBlockDesc> constantBlocks;
		std::vector<ResourceViewDesc> resourceViews;
		std::vector<SamplerDesc> samplers;
		std::vector<ColorTargetDesc> colorTargets;
		std::optional<DepthStencilDesc> depthStencil;

		// True while any entry of the five lists has no slot
		bool NeedsSlotResolution() const;
	};

	// Copies the slot of the same-named introspected variable into every
	// unresolved entry. Throws BindingNotFoundError naming the entry and
	// pipelineName when a variable is missing; descriptor may then be
	// partially resolved.
	void ResolveSlots(PipelineDescriptor& descriptor, const ProgramVars& vars, const std::string& pipelineName);
}
