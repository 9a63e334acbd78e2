//------------------------------------------------------------------------------
// Surface.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Surface.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"

namespace Glasswing
{
	Surface::Surface(TexelFormat format, uint16 width, uint16 height, uint8 samples)
	{
		GLASSWING_CHECK_PRECONDITION(width > 0 && height > 0, "Surface extent must be non-zero ({}x{})", width, height);
		GLASSWING_CHECK_PRECONDITION(samples > 0, "Surface needs at least one sample");

		m_Desc.usage = GetSurfaceUsage(format);
		m_Desc.width = width;
		m_Desc.height = height;
		m_Desc.format = format;
		m_Desc.samples = samples;
	}

	void Surface::Bind()
	{
		RequirePinned("Bind");
		m_Res->Bind();
	}

	void Surface::PinResources(Context& context)
	{
		m_Res = BackendRef<SurfaceRes>(context.MakeSurface(m_Desc));
		VERIFY(static_cast<bool>(m_Res), "Context returned a null surface");
	}

	void Surface::ReleaseResources()
	{
		m_Res.Reset();
	}
}
