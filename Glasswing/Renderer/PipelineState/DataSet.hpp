//------------------------------------------------------------------------------
// DataSet.hpp
//
// Per-draw resources. A PipelineData lists the caller's handles in layout
// field order; PipelineState::MakeDataSet turns it into a RawDataSet sorted
// by binding category.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/Buffer.hpp"
#include "Glasswing/Renderer/Sampler.hpp"
#include "Glasswing/Renderer/View.hpp"
#include "Glasswing/Renderer/PipelineState/PipelineLayout.hpp"
#include "Glasswing/Renderer/PipelineState/ResourceSet.hpp"

#include <glm/glm.hpp>
#include <array>
#include <memory>
#include <vector>

namespace Glasswing
{
	using VertexBufferSet = ResourceSet<Buffer>;
	using ConstantBlockSet = ResourceSet<Buffer>;
	using ResourceViewSet = ResourceSet<ShaderResourceView>;
	using SamplerSet = ResourceSet<Sampler>;
	using ColorTargetSet = ResourceSet<RenderTargetView>;

	// Front/back stencil reference values
	using StencilRef = std::array<uint8, 2>;

	// Render targets written by one draw
	struct PixelTargetSet
	{
		ColorTargetSet colors;
		std::shared_ptr<DepthStencilView> depth;
		std::shared_ptr<DepthStencilView> stencil;

		// Rendering dimensions, taken from the first target added
		uint16 width = 0;
		uint16 height = 0;

		void AddColor(std::shared_ptr<RenderTargetView> view);
		void SetDepth(std::shared_ptr<DepthStencilView> view);
		void SetStencil(std::shared_ptr<DepthStencilView> view);
	};

	struct RawDataSet
	{
		VertexBufferSet vertexBuffers;
		ConstantBlockSet constantBlocks;
		ResourceViewSet resourceViews;
		SamplerSet samplers;
		PixelTargetSet pixelTargets;
		Rect scissor;
		glm::vec4 blendRef = glm::vec4(0.0f);
		StencilRef stencilRef = { 0, 0 };
	};

	class PipelineData
	{
	public:
		// One entry per layout field. Color targets fill both ColorOutput and
		// BlendOutput fields.
		struct Entry
		{
			FieldKind kind = FieldKind::VertexInput;
			std::shared_ptr<Buffer> buffer;
			std::shared_ptr<ShaderResourceView> view;
			std::shared_ptr<Sampler> sampler;
			std::shared_ptr<RenderTargetView> colorTarget;
			std::shared_ptr<DepthStencilView> depthStencil;
			StencilRef stencilRef = { 0, 0 };
			Rect scissor;
		};

		PipelineData& AddVertexBuffer(std::shared_ptr<Buffer> buffer);
		PipelineData& AddConstantBlock(std::shared_ptr<Buffer> buffer);
		PipelineData& AddResourceView(std::shared_ptr<ShaderResourceView> view);
		PipelineData& AddSampler(std::shared_ptr<Sampler> sampler);
		PipelineData& AddColorTarget(std::shared_ptr<RenderTargetView> view);
		PipelineData& AddDepthTarget(std::shared_ptr<DepthStencilView> view);
		PipelineData& AddStencilTarget(std::shared_ptr<DepthStencilView> view, const StencilRef& ref);
		PipelineData& AddDepthStencilTarget(std::shared_ptr<DepthStencilView> view, const StencilRef& ref);
		PipelineData& AddScissor(const Rect& scissor);

		// Not a layout field, copied as is into the data set
		PipelineData& SetBlendRef(const glm::vec4& blendRef);

		const std::vector<Entry>& GetEntries() const { return m_Entries; }
		const glm::vec4& GetBlendRef() const { return m_BlendRef; }

	private:
		std::vector<Entry> m_Entries;
		glm::vec4 m_BlendRef = glm::vec4(0.0f);
	};

	// True when an entry of kind entryKind can fill a field of kind fieldKind
	bool IsEntryCompatible(FieldKind entryKind, FieldKind fieldKind);

	// Positional assembly: entry i fills field i, no name lookup involved.
	// Throws PreconditionError when counts or kinds disagree.
	RawDataSet AssembleDataSet(const PipelineLayout& layout, const PipelineData& data);
}
