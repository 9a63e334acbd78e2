//------------------------------------------------------------------------------
// Sampler.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Sampler.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"

namespace Glasswing
{
	Sampler::Sampler(std::shared_ptr<ShaderResourceView> view, const SamplerInfo& info)
		: m_View(std::move(view))
		, m_Info(info)
	{
		GLASSWING_CHECK_PRECONDITION(m_View != nullptr, "Sampler over a null view");
		GLASSWING_CHECK_PRECONDITION(info.maxAnisotropy >= 1, "Sampler anisotropy must be at least 1");
		GLASSWING_CHECK_PRECONDITION(info.minLod <= info.maxLod,
			"Sampler lod range [{}, {}] is empty", info.minLod, info.maxLod);
		GLASSWING_CHECK_PRECONDITION(m_View->GetTexture() != nullptr || !info.comparison,
			"Comparison samplers need a texture view");
	}

	void Sampler::PinResources(Context& context)
	{
		if (!m_View->IsPinned())
			m_View->Pin(context);

		m_Res = BackendRef<SamplerRes>(context.MakeSampler(*m_View->GetRes(), m_Info));
		VERIFY(static_cast<bool>(m_Res), "Context returned a null sampler");
	}

	void Sampler::ReleaseResources()
	{
		m_Res.Reset();
	}
}
