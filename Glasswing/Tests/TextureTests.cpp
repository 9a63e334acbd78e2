//------------------------------------------------------------------------------
// TextureTests.cpp
//------------------------------------------------------------------------------

#include "TestHelpers.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Renderer/Texture.hpp"

namespace Glasswing
{
	namespace
	{
		ImageSliceInfo Region(uint16 x, uint16 y, uint16 z, uint16 w, uint16 h, uint16 d)
		{
			ImageSliceInfo slice;
			slice.xoffset = x;
			slice.yoffset = y;
			slice.zoffset = z;
			slice.width = w;
			slice.height = h;
			slice.depth = d;
			return slice;
		}
	}

	class TextureTest : public GfxTest
	{
	};

	TEST_F(TextureTest, UpdateChecksPayloadAndRegion)
	{
		Texture2D texture(TexelFormat::RGBA8, TextureUsage::ShaderResource, 1, 4, 4);
		ASSERT_EQ(texture.GetTexelSize(), 4);
		texture.Pin(m_Context);

		ByteBuffer exact(16);
		ByteBuffer short15(15);

		EXPECT_NO_THROW(texture.UpdateRaw(Region(0, 0, 0, 2, 2, 1), exact.data(), exact.size()));
		EXPECT_THROW(texture.UpdateRaw(Region(0, 0, 0, 2, 2, 1), short15.data(), short15.size()), PreconditionError);
		EXPECT_THROW(texture.UpdateRaw(Region(3, 3, 0, 2, 2, 1), exact.data(), exact.size()), PreconditionError);
		EXPECT_THROW(texture.UpdateRaw(Region(3, 3, 0, 2, 2, 1), short15.data(), short15.size()), PreconditionError);

		EXPECT_EQ(Stats().textureUpdates, 1u);
		EXPECT_EQ(Stats().lastTextureUpdateSize, 16u);
	}

	TEST_F(TextureTest, RegionMustFitEveryAxis)
	{
		Texture3D texture(TexelFormat::R8, TextureUsage::ShaderResource, 1, 4, 4, 4);
		texture.Pin(m_Context);

		ByteBuffer bytes(8);
		EXPECT_NO_THROW(texture.UpdateRaw(Region(2, 2, 2, 2, 2, 2), bytes.data(), bytes.size()));
		EXPECT_THROW(texture.UpdateRaw(Region(3, 2, 2, 2, 2, 2), bytes.data(), bytes.size()), PreconditionError);
		EXPECT_THROW(texture.UpdateRaw(Region(2, 3, 2, 2, 2, 2), bytes.data(), bytes.size()), PreconditionError);
		EXPECT_THROW(texture.UpdateRaw(Region(2, 2, 3, 2, 2, 2), bytes.data(), bytes.size()), PreconditionError);
	}

	TEST_F(TextureTest, TypedUpdate)
	{
		Texture2D texture(TexelFormat::RGBA8, TextureUsage::ShaderResource, 1, 4, 4);
		texture.Pin(m_Context);

		std::vector<uint32> texels(4, 0xff00ff00u);
		texture.Update(Region(1, 1, 0, 2, 2, 1), texels);

		ASSERT_TRUE(Stats().lastTextureUpdate.has_value());
		EXPECT_EQ(Stats().lastTextureUpdate->xoffset, 1);
		EXPECT_EQ(Stats().lastTextureUpdateSize, 16u);

		std::vector<uint32> tooMany(5);
		EXPECT_THROW(texture.Update(Region(1, 1, 0, 2, 2, 1), tooMany), PreconditionError);
	}

	TEST_F(TextureTest, UpdateBeforePinFails)
	{
		Texture2D texture(TexelFormat::RGBA8, TextureUsage::ShaderResource, 1, 4, 4);
		ByteBuffer bytes(16);

		EXPECT_THROW(texture.UpdateRaw(Region(0, 0, 0, 2, 2, 1), bytes.data(), bytes.size()), PreconditionError);
		EXPECT_THROW(texture.Bind(), PreconditionError);
	}

	TEST_F(TextureTest, UpdateUsesTheMipLevelExtent)
	{
		Texture2D texture(TexelFormat::RGBA8, TextureUsage::ShaderResource, 3, 8, 8);
		texture.Pin(m_Context);

		ImageSliceInfo level2 = Region(0, 0, 0, 2, 2, 1);
		level2.level = 2;
		ByteBuffer bytes(16);
		EXPECT_NO_THROW(texture.UpdateRaw(level2, bytes.data(), bytes.size()));

		ImageSliceInfo tooWide = Region(0, 0, 0, 3, 3, 1);
		tooWide.level = 2;
		ByteBuffer bigger(36);
		EXPECT_THROW(texture.UpdateRaw(tooWide, bigger.data(), bigger.size()), PreconditionError);

		ImageSliceInfo missingLevel = Region(0, 0, 0, 1, 1, 1);
		missingLevel.level = 3;
		ByteBuffer one(4);
		EXPECT_THROW(texture.UpdateRaw(missingLevel, one.data(), one.size()), PreconditionError);
	}

	TEST_F(TextureTest, CubeUpdatesAddressAFace)
	{
		TextureCube cube(TexelFormat::RGBA8, TextureUsage::ShaderResource, 1, 2);
		cube.Pin(m_Context);

		ByteBuffer bytes(16);
		ImageSliceInfo slice = Region(0, 0, 0, 2, 2, 1);
		EXPECT_THROW(cube.UpdateRaw(slice, bytes.data(), bytes.size()), PreconditionError);

		slice.face = CubeFace::NegY;
		EXPECT_NO_THROW(cube.UpdateRaw(slice, bytes.data(), bytes.size()));

		Texture2D flat(TexelFormat::RGBA8, TextureUsage::ShaderResource, 1, 2, 2);
		flat.Pin(m_Context);
		EXPECT_THROW(flat.UpdateRaw(slice, bytes.data(), bytes.size()), PreconditionError);
	}

	TEST_F(TextureTest, ArrayLayersAreAddressedAlongZ)
	{
		Texture2DArray texture(TexelFormat::R32F, TextureUsage::ShaderResource, 1, 4, 4, 3);
		texture.Pin(m_Context);

		ByteBuffer layer(64);
		EXPECT_NO_THROW(texture.UpdateRaw(Region(0, 0, 2, 4, 4, 1), layer.data(), layer.size()));
		EXPECT_THROW(texture.UpdateRaw(Region(0, 0, 3, 4, 4, 1), layer.data(), layer.size()), PreconditionError);
	}

	TEST_F(TextureTest, InitSliceCountMustMatch)
	{
		std::vector<ByteBuffer> oneSlice{ ByteBuffer(64) };
		EXPECT_THROW(Texture2D(TexelFormat::RGBA8, TextureUsage::ShaderResource, 2, 4, 4, oneSlice), PreconditionError);

		std::vector<ByteBuffer> fullChain{ ByteBuffer(64), ByteBuffer(16) };
		EXPECT_NO_THROW(Texture2D(TexelFormat::RGBA8, TextureUsage::ShaderResource, 2, 4, 4, fullChain));

		std::vector<ByteBuffer> wrongLevelSize{ ByteBuffer(64), ByteBuffer(64) };
		EXPECT_THROW(Texture2D(TexelFormat::RGBA8, TextureUsage::ShaderResource, 2, 4, 4, wrongLevelSize), PreconditionError);
	}

	TEST_F(TextureTest, SliceIndexOrder)
	{
		TextureCubeArray cubes(TexelFormat::RGBA8, TextureUsage::ShaderResource, 2, 4, 3);
		EXPECT_EQ(cubes.GetNumImages(), 3);
		EXPECT_EQ(cubes.GetNumFaces(), 6);
		EXPECT_EQ(cubes.GetSliceIndex(0, 0, 0), 0u);
		EXPECT_EQ(cubes.GetSliceIndex(0, 0, 1), 1u);
		EXPECT_EQ(cubes.GetSliceIndex(0, 1, 0), 2u);
		EXPECT_EQ(cubes.GetSliceIndex(1, 2, 1), 17u);

		// Image and face collapse to 0 on a plain 2D texture
		Texture2D flat(TexelFormat::RGBA8, TextureUsage::ShaderResource, 3, 8, 8);
		EXPECT_EQ(flat.GetSliceIndex(5, 3, 2), 2u);
	}

	TEST_F(TextureTest, CubeInitDataIsHandedOverOnceAndDropped)
	{
		std::vector<ByteBuffer> faces;
		for (uint8 face = 0; face < 6; ++face)
			faces.push_back(ByteBuffer(16, face));

		TextureCube cube(TexelFormat::RGBA8, TextureUsage::ShaderResource, 1, 2, faces);
		EXPECT_EQ(cube.GetPendingInitSliceCount(), 6u);
		EXPECT_EQ(cube.GetDepth(), 1);

		cube.Pin(m_Context);

		EXPECT_EQ(cube.GetPendingInitSliceCount(), 0u);
		ASSERT_EQ(Stats().lastTextureInitData.size(), 6u);
		EXPECT_EQ(Stats().lastTextureInitData[4][0], 4);
	}

	TEST_F(TextureTest, CreationDescriptorIsForwarded)
	{
		Texture2DArray texture(TexelFormat::Depth32F, TextureUsage::DepthStencil | TextureUsage::ShaderResource, 1, 512, 256, 4);
		texture.Pin(m_Context);

		const TextureCreationDesc& desc = Stats().lastTextureDesc;
		EXPECT_EQ(desc.type, TextureType::D2Array);
		EXPECT_EQ(desc.format, TexelFormat::Depth32F);
		EXPECT_EQ(desc.imgInfo.width, 512);
		EXPECT_EQ(desc.imgInfo.height, 256);
		EXPECT_EQ(desc.imgInfo.numSlices, 4);
		EXPECT_TRUE(HasUsage(desc.usage, TextureUsage::DepthStencil));
		EXPECT_TRUE(Stats().lastTextureInitData.empty());
	}

	TEST_F(TextureTest, MultisampleTextures)
	{
		Texture2DMultisample texture(TexelFormat::RGBA8, TextureUsage::RenderTarget, 64, 64, 4);
		EXPECT_EQ(texture.GetSamples(), 4);
		texture.Pin(m_Context);

		ByteBuffer bytes(4);
		EXPECT_THROW(texture.UpdateRaw(Region(0, 0, 0, 1, 1, 1), bytes.data(), bytes.size()), PreconditionError);

		EXPECT_THROW(Texture2DMultisample(TexelFormat::RGBA8, TextureUsage::RenderTarget, 64, 64, 0), PreconditionError);
	}

	TEST_F(TextureTest, ZeroExtentIsRejected)
	{
		EXPECT_THROW(Texture2D(TexelFormat::RGBA8, TextureUsage::ShaderResource, 1, 0, 4), PreconditionError);
		EXPECT_THROW(Texture1D(TexelFormat::RGBA8, TextureUsage::ShaderResource, 0, 4), PreconditionError);
	}

	TEST_F(TextureTest, TypeHelpers)
	{
		EXPECT_TRUE(IsArrayType(TextureType::CubeArray));
		EXPECT_FALSE(IsArrayType(TextureType::Cube));
		EXPECT_TRUE(IsCubeType(TextureType::Cube));
		EXPECT_TRUE(IsMultisampleType(TextureType::D2ArrayMultisample));
		EXPECT_STREQ(ToString(TextureType::D1Array), "1DArray");
	}
}
