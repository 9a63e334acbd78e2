//------------------------------------------------------------------------------
// PipelineLayout.hpp
//
// Declarative shape of a pipeline. Fields are registered in order through the
// Add* calls; that order fixes both the descriptor lists and the order a
// PipelineData must supply its resources in.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/PipelineState/PipelineDescriptor.hpp"
#include "Glasswing/Renderer/PipelineState/VertexFormat.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Glasswing
{
	enum class FieldKind
	{
		VertexInput,
		ConstantBlock,
		ResourceView,
		Sampler,
		ColorOutput,
		BlendOutput,
		DepthOutput,
		StencilOutput,
		DepthStencilOutput,
		Scissor
	};

	const char* ToString(FieldKind kind);

	struct LayoutField
	{
		FieldKind kind = FieldKind::VertexInput;
		std::string name;
		BindingSlot slot;
		TexelFormat format = TexelFormat::RGBA8;

		// VertexInput
		VertexFormat vertex;
		uint8 instanceRate = 0;

		// ColorOutput / BlendOutput
		ColorInfo color;

		// DepthOutput / StencilOutput / DepthStencilOutput
		std::optional<Depth> depth;
		std::optional<Stencil> stencil;
	};

	class PipelineLayout
	{
	public:
		// name shows up in resolution errors and logs
		explicit PipelineLayout(std::string name);

		PipelineLayout& AddVertexInput(const VertexFormat& format, uint8 instanceRate = 0);
		PipelineLayout& AddConstantBlock(std::string name, BindingSlot slot = std::nullopt);
		PipelineLayout& AddResourceView(std::string name, TexelFormat format, BindingSlot slot = std::nullopt);
		PipelineLayout& AddSampler(std::string name, BindingSlot slot = std::nullopt);
		PipelineLayout& AddColorOutput(std::string name, TexelFormat format, ColorMask mask = ColorMask::All,
			BindingSlot slot = std::nullopt);
		PipelineLayout& AddBlendOutput(std::string name, TexelFormat format, const Blend& blend,
			ColorMask mask = ColorMask::All, BindingSlot slot = std::nullopt);
		PipelineLayout& AddDepthOutput(TexelFormat format, const Depth& depth);
		PipelineLayout& AddStencilOutput(TexelFormat format, const Stencil& stencil);
		PipelineLayout& AddDepthStencilOutput(TexelFormat format, const Depth& depth, const Stencil& stencil);
		PipelineLayout& AddScissor();

		const std::string& GetName() const { return m_Name; }
		const std::vector<LayoutField>& GetFields() const { return m_Fields; }

		// Throws ConfigurationError for more than one depth/stencil field,
		// more than one scissor field, or a format that does not fit its
		// field. Slots not given explicitly are left unresolved.
		PipelineDescriptor BuildDescriptor(PrimitiveTopology primitive, const Rasterizer& rasterizer) const;

	private:
		std::string m_Name;
		std::vector<LayoutField> m_Fields;
	};

	// Throws ConfigurationError when the layout has more than one
	// depth/stencil field or more than one scissor field
	void ValidateLayout(const PipelineLayout& layout);
}
