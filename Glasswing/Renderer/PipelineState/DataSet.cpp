//------------------------------------------------------------------------------
// DataSet.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/PipelineState/DataSet.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"

namespace Glasswing
{
	namespace
	{
		void UpdateDimensions(PixelTargetSet& targets, uint16 width, uint16 height)
		{
			if (targets.width == 0 && targets.height == 0)
			{
				targets.width = width;
				targets.height = height;
			}
		}

		PipelineData::Entry MakeEntry(FieldKind kind)
		{
			PipelineData::Entry entry;
			entry.kind = kind;
			return entry;
		}
	}

	// ============================================================================
	// PixelTargetSet
	// ============================================================================

	void PixelTargetSet::AddColor(std::shared_ptr<RenderTargetView> view)
	{
		GLASSWING_CHECK_PRECONDITION(view != nullptr, "Null color target");
		UpdateDimensions(*this, view->GetWidth(), view->GetHeight());
		colors.Add(std::move(view));
	}

	void PixelTargetSet::SetDepth(std::shared_ptr<DepthStencilView> view)
	{
		GLASSWING_CHECK_PRECONDITION(view != nullptr, "Null depth target");
		UpdateDimensions(*this, view->GetWidth(), view->GetHeight());
		depth = std::move(view);
	}

	void PixelTargetSet::SetStencil(std::shared_ptr<DepthStencilView> view)
	{
		GLASSWING_CHECK_PRECONDITION(view != nullptr, "Null stencil target");
		UpdateDimensions(*this, view->GetWidth(), view->GetHeight());
		stencil = std::move(view);
	}

	// ============================================================================
	// PipelineData
	// ============================================================================

	PipelineData& PipelineData::AddVertexBuffer(std::shared_ptr<Buffer> buffer)
	{
		Entry entry = MakeEntry(FieldKind::VertexInput);
		entry.buffer = std::move(buffer);
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddConstantBlock(std::shared_ptr<Buffer> buffer)
	{
		Entry entry = MakeEntry(FieldKind::ConstantBlock);
		entry.buffer = std::move(buffer);
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddResourceView(std::shared_ptr<ShaderResourceView> view)
	{
		Entry entry = MakeEntry(FieldKind::ResourceView);
		entry.view = std::move(view);
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddSampler(std::shared_ptr<Sampler> sampler)
	{
		Entry entry = MakeEntry(FieldKind::Sampler);
		entry.sampler = std::move(sampler);
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddColorTarget(std::shared_ptr<RenderTargetView> view)
	{
		Entry entry = MakeEntry(FieldKind::ColorOutput);
		entry.colorTarget = std::move(view);
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddDepthTarget(std::shared_ptr<DepthStencilView> view)
	{
		Entry entry = MakeEntry(FieldKind::DepthOutput);
		entry.depthStencil = std::move(view);
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddStencilTarget(std::shared_ptr<DepthStencilView> view, const StencilRef& ref)
	{
		Entry entry = MakeEntry(FieldKind::StencilOutput);
		entry.depthStencil = std::move(view);
		entry.stencilRef = ref;
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddDepthStencilTarget(std::shared_ptr<DepthStencilView> view, const StencilRef& ref)
	{
		Entry entry = MakeEntry(FieldKind::DepthStencilOutput);
		entry.depthStencil = std::move(view);
		entry.stencilRef = ref;
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::AddScissor(const Rect& scissor)
	{
		Entry entry = MakeEntry(FieldKind::Scissor);
		entry.scissor = scissor;
		m_Entries.push_back(std::move(entry));
		return *this;
	}

	PipelineData& PipelineData::SetBlendRef(const glm::vec4& blendRef)
	{
		m_BlendRef = blendRef;
		return *this;
	}

	// ============================================================================
	// Assembly
	// ============================================================================

	bool IsEntryCompatible(FieldKind entryKind, FieldKind fieldKind)
	{
		if (entryKind == FieldKind::ColorOutput)
			return fieldKind == FieldKind::ColorOutput || fieldKind == FieldKind::BlendOutput;
		return entryKind == fieldKind;
	}

	RawDataSet AssembleDataSet(const PipelineLayout& layout, const PipelineData& data)
	{
		const std::vector<LayoutField>& fields = layout.GetFields();
		const std::vector<PipelineData::Entry>& entries = data.GetEntries();

		ValidateLayout(layout);

		GLASSWING_CHECK_PRECONDITION(entries.size() == fields.size(),
			"Pipeline {} declares {} fields, data supplies {}", layout.GetName(), fields.size(), entries.size());

		RawDataSet result;
		result.blendRef = data.GetBlendRef();

		// Entries are consumed in declaration order, the order the descriptor
		// lists were built in
		for (size_t i = 0; i < fields.size(); ++i)
		{
			const LayoutField& field = fields[i];
			const PipelineData::Entry& entry = entries[i];

			GLASSWING_CHECK_PRECONDITION(IsEntryCompatible(entry.kind, field.kind),
				"Pipeline {}: entry {} is a {}, field '{}' expects a {}",
				layout.GetName(), i, ToString(entry.kind), field.name, ToString(field.kind));

			switch (field.kind)
			{
			case FieldKind::VertexInput:
				// One buffer per attribute, matching the descriptor's attribute list
				for (size_t element = 0; element < field.vertex.elements.size(); ++element)
					result.vertexBuffers.Add(entry.buffer);
				break;
			case FieldKind::ConstantBlock:
				result.constantBlocks.Add(entry.buffer);
				break;
			case FieldKind::ResourceView:
				result.resourceViews.Add(entry.view);
				break;
			case FieldKind::Sampler:
				result.samplers.Add(entry.sampler);
				break;
			case FieldKind::ColorOutput:
			case FieldKind::BlendOutput:
				result.pixelTargets.AddColor(entry.colorTarget);
				break;
			case FieldKind::DepthOutput:
				result.pixelTargets.SetDepth(entry.depthStencil);
				break;
			case FieldKind::StencilOutput:
				result.pixelTargets.SetStencil(entry.depthStencil);
				result.stencilRef = entry.stencilRef;
				break;
			case FieldKind::DepthStencilOutput:
				result.pixelTargets.SetDepth(entry.depthStencil);
				result.pixelTargets.SetStencil(entry.depthStencil);
				result.stencilRef = entry.stencilRef;
				break;
			case FieldKind::Scissor:
				result.scissor = entry.scissor;
				break;
			}
		}

		return result;
	}
}
