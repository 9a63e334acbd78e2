//------------------------------------------------------------------------------
// View.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/View.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"

namespace Glasswing
{
	namespace
	{
		void PinIfNeeded(Resource& source, Context& context)
		{
			if (!source.IsPinned())
				source.Pin(context);
		}

		// Number of addressable layers of a texture level
		uint32 GetLayerCount(const Texture& texture)
		{
			if (IsArrayType(texture.GetType()))
				return static_cast<uint32>(texture.GetNumSlices()) * texture.GetNumFaces();
			if (IsCubeType(texture.GetType()))
				return 6;
			return texture.GetDepth();
		}

		void CheckTargetLevel(const Texture& texture, uint8 level, const std::optional<uint16>& layer)
		{
			GLASSWING_CHECK_PRECONDITION(level < texture.GetLevels(),
				"View level {} out of range, texture has {} levels", level, texture.GetLevels());
			GLASSWING_CHECK_PRECONDITION(!layer || *layer < GetLayerCount(texture),
				"View layer {} out of range, texture has {} layers", layer.value_or(0), GetLayerCount(texture));
		}
	}

	// ============================================================================
	// ShaderResourceView
	// ============================================================================

	ShaderResourceView::ShaderResourceView(std::shared_ptr<Texture> texture, const TexSRVDesc& desc)
		: m_Texture(std::move(texture))
		, m_Desc(desc)
	{
		GLASSWING_CHECK_PRECONDITION(m_Texture != nullptr, "Shader resource view over a null texture");
		GLASSWING_CHECK_PRECONDITION(HasUsage(m_Texture->GetUsage(), TextureUsage::ShaderResource),
			"Texture was not created with ShaderResource usage");
		GLASSWING_CHECK_PRECONDITION(desc.minLevel <= desc.maxLevel && desc.maxLevel < m_Texture->GetLevels(),
			"Level range [{}, {}] invalid for a texture with {} levels",
			desc.minLevel, desc.maxLevel, m_Texture->GetLevels());
	}

	ShaderResourceView::ShaderResourceView(std::shared_ptr<Texture> texture)
		: ShaderResourceView(texture, TexSRVDesc{ 0, static_cast<uint8>(texture ? texture->GetLevels() - 1 : 0) })
	{
	}

	ShaderResourceView::ShaderResourceView(std::shared_ptr<Buffer> buffer)
		: m_Buffer(std::move(buffer))
	{
		GLASSWING_CHECK_PRECONDITION(m_Buffer != nullptr, "Shader resource view over a null buffer");
	}

	size_t ShaderResourceView::GetWidth() const
	{
		if (m_Texture)
			return m_Texture->GetLevelWidth(m_Desc.minLevel);
		return m_Buffer->GetCount();
	}

	size_t ShaderResourceView::GetHeight() const
	{
		return m_Texture ? m_Texture->GetLevelHeight(m_Desc.minLevel) : 1;
	}

	void ShaderResourceView::PinResources(Context& context)
	{
		if (m_Texture)
		{
			PinIfNeeded(*m_Texture, context);
			m_Res = BackendRef<ShaderResourceViewRes>(context.ViewAsShaderResource(*m_Texture->GetRes(), m_Desc));
		}
		else
		{
			PinIfNeeded(*m_Buffer, context);
			m_Res = BackendRef<ShaderResourceViewRes>(context.ViewAsShaderResource(*m_Buffer->GetRes()));
		}
		VERIFY(static_cast<bool>(m_Res), "Context returned a null shader resource view");
	}

	void ShaderResourceView::ReleaseResources()
	{
		m_Res.Reset();
	}

	// ============================================================================
	// RenderTargetView
	// ============================================================================

	RenderTargetView::RenderTargetView(std::shared_ptr<Texture> texture, const TexRTVDesc& desc)
		: m_Texture(std::move(texture))
		, m_Desc(desc)
	{
		GLASSWING_CHECK_PRECONDITION(m_Texture != nullptr, "Render target view over a null texture");
		GLASSWING_CHECK_PRECONDITION(HasUsage(m_Texture->GetUsage(), TextureUsage::RenderTarget),
			"Texture was not created with RenderTarget usage");
		GLASSWING_CHECK_PRECONDITION(IsColorFormat(m_Texture->GetFormat()),
			"Render target view needs a color format, got {}", ToString(m_Texture->GetFormat()));
		CheckTargetLevel(*m_Texture, desc.level, desc.layer);
	}

	RenderTargetView::RenderTargetView(std::shared_ptr<Surface> surface)
		: m_Surface(std::move(surface))
	{
		GLASSWING_CHECK_PRECONDITION(m_Surface != nullptr, "Render target view over a null surface");
		GLASSWING_CHECK_PRECONDITION(m_Surface->GetUsage() == SurfaceUsage::RenderTarget,
			"Surface of format {} cannot be a render target", ToString(m_Surface->GetFormat()));
	}

	TexelFormat RenderTargetView::GetFormat() const
	{
		return m_Texture ? m_Texture->GetFormat() : m_Surface->GetFormat();
	}

	uint16 RenderTargetView::GetWidth() const
	{
		return m_Texture ? m_Texture->GetLevelWidth(m_Desc.level) : m_Surface->GetWidth();
	}

	uint16 RenderTargetView::GetHeight() const
	{
		return m_Texture ? m_Texture->GetLevelHeight(m_Desc.level) : m_Surface->GetHeight();
	}

	void RenderTargetView::PinResources(Context& context)
	{
		if (m_Texture)
		{
			PinIfNeeded(*m_Texture, context);
			m_Res = BackendRef<RenderTargetViewRes>(context.ViewAsRenderTarget(*m_Texture->GetRes(), m_Desc));
		}
		else
		{
			PinIfNeeded(*m_Surface, context);
			m_Res = BackendRef<RenderTargetViewRes>(context.ViewAsRenderTarget(*m_Surface->GetRes()));
		}
		VERIFY(static_cast<bool>(m_Res), "Context returned a null render target view");
	}

	void RenderTargetView::ReleaseResources()
	{
		m_Res.Reset();
	}

	// ============================================================================
	// DepthStencilView
	// ============================================================================

	DepthStencilView::DepthStencilView(std::shared_ptr<Texture> texture, const TexDSVDesc& desc)
		: m_Texture(std::move(texture))
		, m_Desc(desc)
	{
		GLASSWING_CHECK_PRECONDITION(m_Texture != nullptr, "Depth-stencil view over a null texture");
		GLASSWING_CHECK_PRECONDITION(HasUsage(m_Texture->GetUsage(), TextureUsage::DepthStencil),
			"Texture was not created with DepthStencil usage");
		GLASSWING_CHECK_PRECONDITION(IsDepthOrStencilFormat(m_Texture->GetFormat()),
			"Depth-stencil view needs a depth or stencil format, got {}", ToString(m_Texture->GetFormat()));
		GLASSWING_CHECK_PRECONDITION(!desc.readOnly.stencil || HasStencil(m_Texture->GetFormat()),
			"Read-only stencil requested on {} which has no stencil", ToString(m_Texture->GetFormat()));
		CheckTargetLevel(*m_Texture, desc.level, desc.layer);
	}

	DepthStencilView::DepthStencilView(std::shared_ptr<Surface> surface)
		: m_Surface(std::move(surface))
	{
		GLASSWING_CHECK_PRECONDITION(m_Surface != nullptr, "Depth-stencil view over a null surface");
		GLASSWING_CHECK_PRECONDITION(m_Surface->GetUsage() == SurfaceUsage::DepthStencil,
			"Surface of format {} cannot be a depth-stencil target", ToString(m_Surface->GetFormat()));
	}

	TexelFormat DepthStencilView::GetFormat() const
	{
		return m_Texture ? m_Texture->GetFormat() : m_Surface->GetFormat();
	}

	uint16 DepthStencilView::GetWidth() const
	{
		return m_Texture ? m_Texture->GetLevelWidth(m_Desc.level) : m_Surface->GetWidth();
	}

	uint16 DepthStencilView::GetHeight() const
	{
		return m_Texture ? m_Texture->GetLevelHeight(m_Desc.level) : m_Surface->GetHeight();
	}

	void DepthStencilView::PinResources(Context& context)
	{
		if (m_Texture)
		{
			PinIfNeeded(*m_Texture, context);
			m_Res = BackendRef<DepthStencilViewRes>(context.ViewAsDepthStencil(*m_Texture->GetRes(), m_Desc));
		}
		else
		{
			PinIfNeeded(*m_Surface, context);
			m_Res = BackendRef<DepthStencilViewRes>(context.ViewAsDepthStencil(*m_Surface->GetRes()));
		}
		VERIFY(static_cast<bool>(m_Res), "Context returned a null depth-stencil view");
	}

	void DepthStencilView::ReleaseResources()
	{
		m_Res.Reset();
	}
}
