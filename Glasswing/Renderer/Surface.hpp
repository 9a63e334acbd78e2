//------------------------------------------------------------------------------
// Surface.hpp
//
// Off-screen render-target or depth-stencil storage that is never sampled
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/Resource.hpp"
#include "Glasswing/Renderer/RenderContext.hpp"

namespace Glasswing
{
	inline SurfaceUsage GetSurfaceUsage(TexelFormat format)
	{
		return IsColorFormat(format) ? SurfaceUsage::RenderTarget : SurfaceUsage::DepthStencil;
	}

	class Surface : public Resource
	{
	public:
		Surface(TexelFormat format, uint16 width, uint16 height, uint8 samples = 1);
		~Surface() override = default;

		const char* GetKindName() const override { return "Surface"; }

		TexelFormat GetFormat() const { return m_Desc.format; }
		SurfaceUsage GetUsage() const { return m_Desc.usage; }
		uint16 GetWidth() const { return m_Desc.width; }
		uint16 GetHeight() const { return m_Desc.height; }
		uint8 GetSamples() const { return m_Desc.samples; }

		void Bind();

		SurfaceRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		SurfaceCreationDesc m_Desc;

		BackendRef<SurfaceRes> m_Res;
	};
}
