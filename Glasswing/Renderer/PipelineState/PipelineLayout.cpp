//------------------------------------------------------------------------------
// PipelineLayout.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/PipelineState/PipelineLayout.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

#include <format>

namespace Glasswing
{
	const char* ToString(FieldKind kind)
	{
		switch (kind)
		{
		case FieldKind::VertexInput: return "VertexInput";
		case FieldKind::ConstantBlock: return "ConstantBlock";
		case FieldKind::ResourceView: return "ResourceView";
		case FieldKind::Sampler: return "Sampler";
		case FieldKind::ColorOutput: return "ColorOutput";
		case FieldKind::BlendOutput: return "BlendOutput";
		case FieldKind::DepthOutput: return "DepthOutput";
		case FieldKind::StencilOutput: return "StencilOutput";
		case FieldKind::DepthStencilOutput: return "DepthStencilOutput";
		case FieldKind::Scissor: return "Scissor";
		}
		return "Unknown";
	}

	namespace
	{
		[[noreturn]] void ThrowConfigurationError(const std::string& message)
		{
			LOG_ERROR("{}", message);
			throw ConfigurationError(message);
		}

		LayoutField MakeField(FieldKind kind, std::string name, BindingSlot slot)
		{
			LayoutField field;
			field.kind = kind;
			field.name = std::move(name);
			field.slot = slot;
			return field;
		}

		void CheckTargetFormat(const std::string& pipeline, const LayoutField& field)
		{
			bool fits = true;
			switch (field.kind)
			{
			case FieldKind::ColorOutput:
			case FieldKind::BlendOutput:
				fits = IsColorFormat(field.format);
				break;
			case FieldKind::DepthOutput:
				fits = HasDepth(field.format);
				break;
			case FieldKind::StencilOutput:
				fits = HasStencil(field.format);
				break;
			case FieldKind::DepthStencilOutput:
				fits = HasDepth(field.format) && HasStencil(field.format);
				break;
			default:
				break;
			}

			if (!fits)
			{
				ThrowConfigurationError(std::format("Pipeline {}: {} field '{}' cannot use format {}",
					pipeline, ToString(field.kind), field.name, ToString(field.format)));
			}
		}
	}

	PipelineLayout::PipelineLayout(std::string name)
		: m_Name(std::move(name))
	{
	}

	PipelineLayout& PipelineLayout::AddVertexInput(const VertexFormat& format, uint8 instanceRate)
	{
		LayoutField field = MakeField(FieldKind::VertexInput, "vertex input", std::nullopt);
		field.vertex = format;
		field.instanceRate = instanceRate;
		m_Fields.push_back(std::move(field));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddConstantBlock(std::string name, BindingSlot slot)
	{
		m_Fields.push_back(MakeField(FieldKind::ConstantBlock, std::move(name), slot));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddResourceView(std::string name, TexelFormat format, BindingSlot slot)
	{
		LayoutField field = MakeField(FieldKind::ResourceView, std::move(name), slot);
		field.format = format;
		m_Fields.push_back(std::move(field));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddSampler(std::string name, BindingSlot slot)
	{
		m_Fields.push_back(MakeField(FieldKind::Sampler, std::move(name), slot));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddColorOutput(std::string name, TexelFormat format, ColorMask mask, BindingSlot slot)
	{
		LayoutField field = MakeField(FieldKind::ColorOutput, std::move(name), slot);
		field.format = format;
		field.color = ColorInfo{ mask, std::nullopt };
		m_Fields.push_back(std::move(field));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddBlendOutput(std::string name, TexelFormat format, const Blend& blend,
		ColorMask mask, BindingSlot slot)
	{
		LayoutField field = MakeField(FieldKind::BlendOutput, std::move(name), slot);
		field.format = format;
		field.color = ColorInfo{ mask, blend };
		m_Fields.push_back(std::move(field));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddDepthOutput(TexelFormat format, const Depth& depth)
	{
		LayoutField field = MakeField(FieldKind::DepthOutput, "depth", std::nullopt);
		field.format = format;
		field.depth = depth;
		m_Fields.push_back(std::move(field));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddStencilOutput(TexelFormat format, const Stencil& stencil)
	{
		LayoutField field = MakeField(FieldKind::StencilOutput, "stencil", std::nullopt);
		field.format = format;
		field.stencil = stencil;
		m_Fields.push_back(std::move(field));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddDepthStencilOutput(TexelFormat format, const Depth& depth, const Stencil& stencil)
	{
		LayoutField field = MakeField(FieldKind::DepthStencilOutput, "depth-stencil", std::nullopt);
		field.format = format;
		field.depth = depth;
		field.stencil = stencil;
		m_Fields.push_back(std::move(field));
		return *this;
	}

	PipelineLayout& PipelineLayout::AddScissor()
	{
		m_Fields.push_back(MakeField(FieldKind::Scissor, "scissor", std::nullopt));
		return *this;
	}

	void ValidateLayout(const PipelineLayout& layout)
	{
		size_t depthStencilFields = 0;
		size_t scissorFields = 0;

		for (const LayoutField& field : layout.GetFields())
		{
			switch (field.kind)
			{
			case FieldKind::DepthOutput:
			case FieldKind::StencilOutput:
			case FieldKind::DepthStencilOutput:
				++depthStencilFields;
				break;
			case FieldKind::Scissor:
				++scissorFields;
				break;
			default:
				break;
			}
		}

		if (depthStencilFields > 1)
		{
			ThrowConfigurationError(std::format(
				"Pipeline {} has too many depth-stencil targets (should be one at most)", layout.GetName()));
		}

		if (scissorFields > 1)
			ThrowConfigurationError(std::format("Pipeline {}: one scissor field allowed", layout.GetName()));
	}

	PipelineDescriptor PipelineLayout::BuildDescriptor(PrimitiveTopology primitive, const Rasterizer& rasterizer) const
	{
		ValidateLayout(*this);

		PipelineDescriptor descriptor;
		descriptor.primitive = primitive;
		descriptor.rasterizer = rasterizer;

		for (const LayoutField& field : m_Fields)
		{
			CheckTargetFormat(m_Name, field);

			switch (field.kind)
			{
			case FieldKind::VertexInput:
				if (field.vertex.elements.empty())
					ThrowConfigurationError(std::format("Pipeline {}: vertex input without elements", m_Name));

				for (const VertexElement& element : field.vertex.elements)
				{
					StructField structField;
					structField.type = element.type;
					structField.offset = element.offset;
					structField.size = element.type.GetSize();
					structField.stride = field.vertex.stride;

					if (structField.offset + structField.size > structField.stride)
					{
						ThrowConfigurationError(std::format("Pipeline {}: attribute '{}' ({} bytes at offset {}) overflows a {}-byte vertex",
							m_Name, element.name, structField.size, structField.offset, structField.stride));
					}

					descriptor.vertexAttribs.push_back(
						VertexAttribDesc{ element.name, element.slot, structField, field.instanceRate });
				}
				break;

			case FieldKind::ConstantBlock:
				descriptor.constantBlocks.push_back(ConstantBlockDesc{ field.name, field.slot });
				break;

			case FieldKind::ResourceView:
				descriptor.resourceViews.push_back(ResourceViewDesc{ field.name, field.slot, field.format });
				break;

			case FieldKind::Sampler:
				descriptor.samplers.push_back(SamplerDesc{ field.name, field.slot });
				break;

			// Plain and blended outputs share the color list in declaration order
			case FieldKind::ColorOutput:
			case FieldKind::BlendOutput:
				descriptor.colorTargets.push_back(ColorTargetDesc{ field.name, field.slot, field.format, field.color });
				break;

			case FieldKind::DepthOutput:
			case FieldKind::StencilOutput:
			case FieldKind::DepthStencilOutput:
				descriptor.depthStencil = DepthStencilDesc{ GetSurfaceType(field.format), field.depth, field.stencil };
				break;

			case FieldKind::Scissor:
				descriptor.scissor = true;
				break;
			}
		}

		return descriptor;
	}
}
