//------------------------------------------------------------------------------
// Texture.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Texture.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"

#include <algorithm>

namespace Glasswing
{
	bool IsArrayType(TextureType type)
	{
		switch (type)
		{
		case TextureType::D1Array:
		case TextureType::D2Array:
		case TextureType::D2ArrayMultisample:
		case TextureType::CubeArray:
			return true;
		default:
			return false;
		}
	}

	bool IsCubeType(TextureType type)
	{
		return type == TextureType::Cube || type == TextureType::CubeArray;
	}

	bool IsMultisampleType(TextureType type)
	{
		return type == TextureType::D2Multisample || type == TextureType::D2ArrayMultisample;
	}

	const char* ToString(TextureType type)
	{
		switch (type)
		{
		case TextureType::D1: return "1D";
		case TextureType::D1Array: return "1DArray";
		case TextureType::D2: return "2D";
		case TextureType::D2Array: return "2DArray";
		case TextureType::D2Multisample: return "2DMultisample";
		case TextureType::D2ArrayMultisample: return "2DArrayMultisample";
		case TextureType::D3: return "3D";
		case TextureType::Cube: return "Cube";
		case TextureType::CubeArray: return "CubeArray";
		}
		return "Unknown";
	}

	namespace
	{
		uint16 MipExtent(uint16 extent, uint8 level)
		{
			return static_cast<uint16>(std::max(1, extent >> level));
		}
	}

	Texture::Texture(TextureType type, TexelFormat format, const ImageInfo& imgInfo, uint8 samples,
		TextureUsage usage, std::vector<ByteBuffer> initData)
		: m_Type(type)
		, m_Format(format)
		, m_ImgInfo(imgInfo)
		, m_Samples(samples)
		, m_TexelSize(GetTexelSize(format))
		, m_Usage(usage)
		, m_InitData(std::move(initData))
	{
		GLASSWING_CHECK_PRECONDITION(imgInfo.width > 0 && imgInfo.height > 0 && imgInfo.depth > 0,
			"{} texture extent must be non-zero ({}x{}x{})", ToString(type), imgInfo.width, imgInfo.height, imgInfo.depth);
		GLASSWING_CHECK_PRECONDITION(imgInfo.numSlices > 0 && imgInfo.levels > 0,
			"{} texture needs at least one slice and one level", ToString(type));
		GLASSWING_CHECK_PRECONDITION(!IsCubeType(type) || imgInfo.width == imgInfo.height,
			"Cube texture faces must be square ({}x{})", imgInfo.width, imgInfo.height);
		GLASSWING_CHECK_PRECONDITION(samples > 0 && (samples == 1 || IsMultisampleType(type)),
			"{} texture cannot have {} samples", ToString(type), samples);
		GLASSWING_CHECK_PRECONDITION(!IsMultisampleType(type) || m_InitData.empty(),
			"Multisample textures cannot be initialized from the CPU");

		if (m_InitData.empty())
			return;

		size_t expected = static_cast<size_t>(GetNumImages()) * GetNumFaces() * imgInfo.levels;
		GLASSWING_CHECK_PRECONDITION(m_InitData.size() == expected,
			"{} texture expects {} init slices, got {}", ToString(type), expected, m_InitData.size());

		for (uint16 image = 0; image < GetNumImages(); ++image)
		{
			for (uint8 face = 0; face < GetNumFaces(); ++face)
			{
				for (uint8 level = 0; level < imgInfo.levels; ++level)
				{
					size_t index = GetSliceIndex(image, face, level);
					size_t bytes = static_cast<size_t>(m_TexelSize) * GetLevelWidth(level) *
						GetLevelHeight(level) * GetLevelDepth(level);
					GLASSWING_CHECK_PRECONDITION(m_InitData[index].size() == bytes,
						"Init slice {} (image {}, face {}, level {}) holds {} bytes, expected {}",
						index, image, face, level, m_InitData[index].size(), bytes);
				}
			}
		}
	}

	uint16 Texture::GetNumImages() const
	{
		return IsArrayType(m_Type) ? m_ImgInfo.numSlices : 1;
	}

	uint8 Texture::GetNumFaces() const
	{
		return IsCubeType(m_Type) ? 6 : 1;
	}

	uint16 Texture::GetLevelWidth(uint8 level) const
	{
		return MipExtent(m_ImgInfo.width, level);
	}

	uint16 Texture::GetLevelHeight(uint8 level) const
	{
		return MipExtent(m_ImgInfo.height, level);
	}

	uint16 Texture::GetLevelDepth(uint8 level) const
	{
		return MipExtent(m_ImgInfo.depth, level);
	}

	size_t Texture::GetSliceIndex(uint16 imageIndex, uint8 faceIndex, uint8 level) const
	{
		ASSERT(level < m_ImgInfo.levels, "Mip level {} out of range ({} levels)", level, m_ImgInfo.levels);

		// Non-array and non-cube textures collapse the image/face axis to 0
		size_t image = IsArrayType(m_Type) ? imageIndex : 0;
		size_t face = IsCubeType(m_Type) ? faceIndex : 0;
		return (image * GetNumFaces() + face) * m_ImgInfo.levels + level;
	}

	void Texture::Bind()
	{
		RequirePinned("Bind");
		m_Res->Bind();
	}

	void Texture::UpdateRaw(const ImageSliceInfo& slice, const void* texels, size_t size)
	{
		RequirePinned("Update");

		GLASSWING_CHECK_PRECONDITION(!IsMultisampleType(m_Type),
			"Multisample textures cannot be updated from the CPU");
		GLASSWING_CHECK_PRECONDITION(slice.level < m_ImgInfo.levels,
			"Level {} out of range, texture has {} levels", slice.level, m_ImgInfo.levels);
		GLASSWING_CHECK_PRECONDITION(IsCubeType(m_Type) == (slice.face != CubeFace::None),
			"{} texture update {} a cube face", ToString(m_Type), IsCubeType(m_Type) ? "requires" : "cannot address");

		// Array textures address layers along z
		uint32 extentX = GetLevelWidth(slice.level);
		uint32 extentY = GetLevelHeight(slice.level);
		uint32 extentZ = IsArrayType(m_Type) ? m_ImgInfo.numSlices : GetLevelDepth(slice.level);

		GLASSWING_CHECK_PRECONDITION(
			uint32(slice.xoffset) + slice.width <= extentX &&
			uint32(slice.yoffset) + slice.height <= extentY &&
			uint32(slice.zoffset) + slice.depth <= extentZ,
			"Region ({},{},{}) + ({}x{}x{}) exceeds level {} extent {}x{}x{}",
			slice.xoffset, slice.yoffset, slice.zoffset, slice.width, slice.height, slice.depth,
			slice.level, extentX, extentY, extentZ);

		size_t expected = static_cast<size_t>(m_TexelSize) * slice.width * slice.height * slice.depth;
		GLASSWING_CHECK_PRECONDITION(size == expected,
			"Texture update expects {} bytes for the region, got {}", expected, size);
		GLASSWING_CHECK_PRECONDITION(texels != nullptr || size == 0, "Texture update without data");

		m_Res->Update(slice, texels, size);
	}

	void Texture::PinResources(Context& context)
	{
		TextureCreationDesc desc;
		desc.type = m_Type;
		desc.format = m_Format;
		desc.imgInfo = m_ImgInfo;
		desc.samples = m_Samples;
		desc.usage = m_Usage;

		m_Res = BackendRef<TextureRes>(context.MakeTexture(desc, m_InitData));
		VERIFY(static_cast<bool>(m_Res), "Context returned a null texture");

		// Never read again
		m_InitData.clear();
		m_InitData.shrink_to_fit();
	}

	void Texture::ReleaseResources()
	{
		m_Res.Reset();
		m_InitData.clear();
		m_InitData.shrink_to_fit();
	}
}
