//------------------------------------------------------------------------------
// ViewTests.cpp
//
// Views, samplers and surfaces
//------------------------------------------------------------------------------

#include "TestHelpers.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Renderer/Sampler.hpp"
#include "Glasswing/Renderer/Surface.hpp"
#include "Glasswing/Renderer/View.hpp"

namespace Glasswing
{
	class ViewTest : public GfxTest
	{
	protected:
		std::shared_ptr<Texture2D> MakeColorTexture(TextureUsage usage, uint8 levels = 1)
		{
			return std::make_shared<Texture2D>(TexelFormat::RGBA8, usage, levels, 16, 8);
		}
	};

	TEST_F(ViewTest, ShaderResourceViewPinsItsTexture)
	{
		auto texture = MakeColorTexture(TextureUsage::ShaderResource);
		ShaderResourceView view(texture);

		view.Pin(m_Context);

		EXPECT_TRUE(texture->IsPinned());
		EXPECT_EQ(Stats().texturesCreated, 1u);
		EXPECT_EQ(Stats().viewsCreated, 1u);
		EXPECT_EQ(view.GetWidth(), 16);
		EXPECT_EQ(view.GetHeight(), 8);
	}

	TEST_F(ViewTest, AlreadyPinnedSourceIsReused)
	{
		auto texture = MakeColorTexture(TextureUsage::ShaderResource);
		texture->Pin(m_Context);

		ShaderResourceView view(texture);
		EXPECT_NO_THROW(view.Pin(m_Context));
		EXPECT_EQ(Stats().texturesCreated, 1u);
	}

	TEST_F(ViewTest, ShaderResourceViewChecksUsageAndLevels)
	{
		EXPECT_THROW(ShaderResourceView(MakeColorTexture(TextureUsage::RenderTarget)), PreconditionError);

		auto texture = MakeColorTexture(TextureUsage::ShaderResource, 3);
		EXPECT_NO_THROW(ShaderResourceView(texture, TexSRVDesc{ 1, 2 }));
		EXPECT_THROW(ShaderResourceView(texture, TexSRVDesc{ 2, 1 }), PreconditionError);
		EXPECT_THROW(ShaderResourceView(texture, TexSRVDesc{ 0, 3 }), PreconditionError);
	}

	TEST_F(ViewTest, BufferView)
	{
		auto buffer = std::make_shared<Buffer>(BufferRole::Other, BufferUsage::Dynamic, 16, 32);
		ShaderResourceView view(buffer);
		view.Pin(m_Context);

		EXPECT_TRUE(buffer->IsPinned());
		EXPECT_EQ(view.GetWidth(), 32);
		EXPECT_EQ(view.GetHeight(), 1);
	}

	TEST_F(ViewTest, BufferViewReportsFullElementCount)
	{
		auto buffer = std::make_shared<Buffer>(BufferRole::Other, BufferUsage::Dynamic, 4, 70000);
		ShaderResourceView view(buffer);

		EXPECT_EQ(view.GetWidth(), size_t(70000));
	}

	TEST_F(ViewTest, CubeArrayLayerCountDoesNotWrap)
	{
		// 10923 cubes hold 65538 layers, past the range of a 16-bit count
		auto cubes = std::make_shared<TextureCubeArray>(TexelFormat::RGBA8, TextureUsage::RenderTarget, 1, 4, 10923);

		EXPECT_NO_THROW(RenderTargetView(cubes, TexRTVDesc{ 0, uint16(40000) }));
		EXPECT_NO_THROW(RenderTargetView(cubes, TexRTVDesc{ 0, uint16(65535) }));
	}

	TEST_F(ViewTest, RenderTargetViewLevelExtent)
	{
		auto texture = MakeColorTexture(TextureUsage::RenderTarget | TextureUsage::ShaderResource, 3);
		RenderTargetView view(texture, TexRTVDesc{ 1, std::nullopt });

		EXPECT_EQ(view.GetWidth(), 8);
		EXPECT_EQ(view.GetHeight(), 4);
		EXPECT_EQ(view.GetFormat(), TexelFormat::RGBA8);

		EXPECT_THROW(RenderTargetView(texture, TexRTVDesc{ 3, std::nullopt }), PreconditionError);
		EXPECT_THROW(RenderTargetView(texture, TexRTVDesc{ 0, uint16(1) }), PreconditionError);
	}

	TEST_F(ViewTest, TargetFormatsMustMatchTheView)
	{
		auto depth = std::make_shared<Texture2D>(TexelFormat::Depth32F, TextureUsage::DepthStencil | TextureUsage::RenderTarget, 1, 4, 4);
		EXPECT_THROW(RenderTargetView{ depth }, PreconditionError);

		auto color = MakeColorTexture(TextureUsage::DepthStencil);
		EXPECT_THROW(DepthStencilView{ color }, PreconditionError);

		auto depthOnly = std::make_shared<Texture2D>(TexelFormat::Depth32F, TextureUsage::DepthStencil, 1, 4, 4);
		TexDSVDesc readOnlyStencil;
		readOnlyStencil.readOnly.stencil = true;
		EXPECT_THROW(DepthStencilView(depthOnly, readOnlyStencil), PreconditionError);
	}

	TEST_F(ViewTest, ArrayLayerSelection)
	{
		auto shadowMaps = std::make_shared<Texture2DArray>(TexelFormat::Depth32F,
			TextureUsage::DepthStencil | TextureUsage::ShaderResource, 1, 512, 512, 4);

		TexDSVDesc desc;
		desc.layer = 3;
		DepthStencilView view(shadowMaps, desc);
		view.Pin(m_Context);
		EXPECT_EQ(view.GetWidth(), 512);

		desc.layer = 4;
		EXPECT_THROW(DepthStencilView(shadowMaps, desc), PreconditionError);
	}

	TEST_F(ViewTest, SurfaceUsageFollowsFormat)
	{
		auto color = std::make_shared<Surface>(TexelFormat::BGRA8, 640, 480);
		auto depth = std::make_shared<Surface>(TexelFormat::Depth24Stencil8, 640, 480);

		EXPECT_EQ(color->GetUsage(), SurfaceUsage::RenderTarget);
		EXPECT_EQ(depth->GetUsage(), SurfaceUsage::DepthStencil);

		EXPECT_THROW(RenderTargetView{ depth }, PreconditionError);
		EXPECT_THROW(DepthStencilView{ color }, PreconditionError);

		RenderTargetView rtv(color);
		DepthStencilView dsv(depth);
		rtv.Pin(m_Context);
		dsv.Pin(m_Context);

		EXPECT_TRUE(color->IsPinned());
		EXPECT_TRUE(depth->IsPinned());
		EXPECT_EQ(Stats().surfacesCreated, 2u);
		EXPECT_EQ(rtv.GetWidth(), 640);
		EXPECT_EQ(dsv.GetHeight(), 480);
	}

	TEST_F(ViewTest, SamplerPinsTheWholeChain)
	{
		auto texture = MakeColorTexture(TextureUsage::ShaderResource);
		auto view = std::make_shared<ShaderResourceView>(texture);

		SamplerInfo info;
		info.filter = FilterMethod::Trilinear;
		info.wrap = { WrapMode::Tile, WrapMode::Tile, WrapMode::Clamp };
		Sampler sampler(view, info);
		sampler.Pin(m_Context);

		EXPECT_TRUE(view->IsPinned());
		EXPECT_TRUE(texture->IsPinned());
		EXPECT_EQ(Stats().samplersCreated, 1u);
		EXPECT_EQ(sampler.GetInfo().filter, FilterMethod::Trilinear);
	}

	TEST_F(ViewTest, SamplerValidation)
	{
		auto texture = MakeColorTexture(TextureUsage::ShaderResource);
		auto view = std::make_shared<ShaderResourceView>(texture);

		SamplerInfo emptyRange;
		emptyRange.minLod = 4.0f;
		emptyRange.maxLod = 1.0f;
		EXPECT_THROW(Sampler(view, emptyRange), PreconditionError);

		auto bufferView = std::make_shared<ShaderResourceView>(
			std::make_shared<Buffer>(BufferRole::Other, BufferUsage::Dynamic, 4, 4));
		EXPECT_THROW(Sampler(bufferView, SamplerInfo().WithComparison(CompareOp::LessOrEqual)), PreconditionError);
	}

	TEST_F(ViewTest, DroppingTheChainReleasesEverything)
	{
		{
			auto texture = MakeColorTexture(TextureUsage::ShaderResource);
			auto view = std::make_shared<ShaderResourceView>(texture);
			auto sampler = std::make_shared<Sampler>(view);
			sampler->Pin(m_Context);

			EXPECT_EQ(Stats().liveObjects, 3u);
		}

		EXPECT_EQ(Stats().liveObjects, 0u);
		EXPECT_EQ(Stats().releaseCalls, 3u);
		EXPECT_EQ(Stats().destroyedUnreleased, 0u);
	}
}
