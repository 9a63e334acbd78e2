//------------------------------------------------------------------------------
// PipelineState.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/PipelineState/PipelineState.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

#include <format>

namespace Glasswing
{
	PipelineState::PipelineState(std::shared_ptr<Program> program, PrimitiveTopology primitive,
		const Rasterizer& rasterizer, PipelineLayout layout)
		: m_Layout(std::move(layout))
		, m_Program(std::move(program))
	{
		GLASSWING_CHECK_PRECONDITION(m_Program != nullptr, "Pipeline {} has no program", m_Layout.GetName());

		m_Descriptor = m_Layout.BuildDescriptor(primitive, rasterizer);
		SetDebugName(m_Layout.GetName());
	}

	RawDataSet PipelineState::MakeDataSet(const PipelineData& data) const
	{
		RequirePinned("MakeDataSet");
		return AssembleDataSet(m_Layout, data);
	}

	void PipelineState::Bind()
	{
		RequirePinned("Bind");
		m_Res->Bind();
	}

	void PipelineState::PinResources(Context& context)
	{
		PipelineDescriptor descriptor = m_Descriptor;
		bool resolve = descriptor.NeedsSlotResolution();

		// Reported before any backend object is created
		if (resolve && !context.GetCaps().introspection)
		{
			std::string message = std::format(
				"Pipeline {} has unresolved slots but the context cannot introspect programs", GetName());
			LOG_ERROR("{}", message);
			throw CapabilityError(message);
		}

		if (!m_Program->IsPinned())
			m_Program->Pin(context);

		if (resolve)
		{
			ResolveSlots(descriptor, m_Program->GetVars(), GetName());
			VERIFY(!descriptor.NeedsSlotResolution(), "Pipeline {} still has unresolved slots", GetName());
		}

		m_Res = BackendRef<PipelineRes>(context.MakePipeline(*m_Program->GetRes(), descriptor));
		VERIFY(static_cast<bool>(m_Res), "Context returned a null pipeline");

		m_Descriptor = std::move(descriptor);
	}

	void PipelineState::ReleaseResources()
	{
		m_Res.Reset();
		m_Program.reset();
	}
}
