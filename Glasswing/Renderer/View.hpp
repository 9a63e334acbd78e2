//------------------------------------------------------------------------------
// View.hpp
//
// Views select how a texture, buffer or surface is bound to a pipeline.
// A view keeps its source alive and pins it on demand.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/Buffer.hpp"
#include "Glasswing/Renderer/Surface.hpp"
#include "Glasswing/Renderer/Texture.hpp"

#include <memory>

namespace Glasswing
{
	class ShaderResourceView : public Resource
	{
	public:
		ShaderResourceView(std::shared_ptr<Texture> texture, const TexSRVDesc& desc);
		explicit ShaderResourceView(std::shared_ptr<Texture> texture);
		explicit ShaderResourceView(std::shared_ptr<Buffer> buffer);
		~ShaderResourceView() override = default;

		const char* GetKindName() const override { return "ShaderResourceView"; }

		const std::shared_ptr<Texture>& GetTexture() const { return m_Texture; }
		const std::shared_ptr<Buffer>& GetBuffer() const { return m_Buffer; }
		const TexSRVDesc& GetDesc() const { return m_Desc; }

		// Extent of the most detailed visible level, element count for buffers
		size_t GetWidth() const;
		size_t GetHeight() const;

		ShaderResourceViewRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		std::shared_ptr<Texture> m_Texture;
		std::shared_ptr<Buffer> m_Buffer;
		TexSRVDesc m_Desc;

		BackendRef<ShaderResourceViewRes> m_Res;
	};

	class RenderTargetView : public Resource
	{
	public:
		RenderTargetView(std::shared_ptr<Texture> texture, const TexRTVDesc& desc = {});
		explicit RenderTargetView(std::shared_ptr<Surface> surface);
		~RenderTargetView() override = default;

		const char* GetKindName() const override { return "RenderTargetView"; }

		TexelFormat GetFormat() const;
		uint16 GetWidth() const;
		uint16 GetHeight() const;

		RenderTargetViewRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		std::shared_ptr<Texture> m_Texture;
		std::shared_ptr<Surface> m_Surface;
		TexRTVDesc m_Desc;

		BackendRef<RenderTargetViewRes> m_Res;
	};

	class DepthStencilView : public Resource
	{
	public:
		DepthStencilView(std::shared_ptr<Texture> texture, const TexDSVDesc& desc = {});
		explicit DepthStencilView(std::shared_ptr<Surface> surface);
		~DepthStencilView() override = default;

		const char* GetKindName() const override { return "DepthStencilView"; }

		TexelFormat GetFormat() const;
		uint16 GetWidth() const;
		uint16 GetHeight() const;
		const DSVReadOnly& GetReadOnly() const { return m_Desc.readOnly; }

		DepthStencilViewRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		std::shared_ptr<Texture> m_Texture;
		std::shared_ptr<Surface> m_Surface;
		TexDSVDesc m_Desc;

		BackendRef<DepthStencilViewRes> m_Res;
	};
}
