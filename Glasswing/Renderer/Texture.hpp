//------------------------------------------------------------------------------
// Texture.hpp
//
// Front-end texture handles. One class per dimensionality, all sharing the
// untyped Texture base which owns the init payload until pinned.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/Resource.hpp"
#include "Glasswing/Renderer/RenderContext.hpp"

#include <type_traits>
#include <vector>

namespace Glasswing
{
	bool IsArrayType(TextureType type);
	bool IsCubeType(TextureType type);
	bool IsMultisampleType(TextureType type);
	const char* ToString(TextureType type);

	class Texture : public Resource
	{
	public:
		// initData is either empty (storage left to the driver) or holds one
		// blob per (image, face, level), ordered as GetSliceIndex describes.
		// Each blob must hold exactly texelSize * width * height * depth bytes
		// of its mip level.
		Texture(TextureType type, TexelFormat format, const ImageInfo& imgInfo, uint8 samples,
			TextureUsage usage, std::vector<ByteBuffer> initData);
		~Texture() override = default;

		const char* GetKindName() const override { return "Texture"; }

		TextureType GetType() const { return m_Type; }
		const ImageInfo& GetImageInfo() const { return m_ImgInfo; }
		uint16 GetWidth() const { return m_ImgInfo.width; }
		uint16 GetHeight() const { return m_ImgInfo.height; }
		uint16 GetDepth() const { return m_ImgInfo.depth; }
		uint16 GetNumSlices() const { return m_ImgInfo.numSlices; }
		uint8 GetLevels() const { return m_ImgInfo.levels; }
		uint8 GetSamples() const { return m_Samples; }
		TexelFormat GetFormat() const { return m_Format; }
		uint8 GetTexelSize() const { return m_TexelSize; }
		TextureUsage GetUsage() const { return m_Usage; }

		// 1 for non-array textures
		uint16 GetNumImages() const;
		// 6 for cube textures, 1 otherwise
		uint8 GetNumFaces() const;

		uint16 GetLevelWidth(uint8 level) const;
		uint16 GetLevelHeight(uint8 level) const;
		uint16 GetLevelDepth(uint8 level) const;

		// (imageIndex * numFaces + faceIndex) * levels + level
		size_t GetSliceIndex(uint16 imageIndex, uint8 faceIndex, uint8 level) const;

		// Init blobs still waiting for Pin (always 0 once pinned)
		size_t GetPendingInitSliceCount() const { return m_InitData.size(); }

		void Bind();

		// Writes texels into slice. Requires a pinned texture, a region that
		// fits the addressed level on every axis (the z axis addresses layers
		// of array textures) and exactly texelSize * w * h * d bytes.
		void UpdateRaw(const ImageSliceInfo& slice, const void* texels, size_t size);

		template<typename T>
		void Update(const ImageSliceInfo& slice, const std::vector<T>& texels)
		{
			static_assert(std::is_trivially_copyable_v<T>, "texels must be plain data");
			UpdateRaw(slice, texels.data(), texels.size() * sizeof(T));
		}

		TextureRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		TextureType m_Type;
		TexelFormat m_Format;
		ImageInfo m_ImgInfo;
		uint8 m_Samples;
		uint8 m_TexelSize;
		TextureUsage m_Usage;
		std::vector<ByteBuffer> m_InitData; // emptied by Pin

		BackendRef<TextureRes> m_Res;
	};

	// ============================================================================
	// Typed textures
	// ============================================================================

	class Texture1D : public Texture
	{
	public:
		Texture1D(TexelFormat format, TextureUsage usage, uint8 levels, uint16 width,
			std::vector<ByteBuffer> texels = {})
			: Texture(TextureType::D1, format, ImageInfo{ width, 1, 1, 1, levels }, 1, usage, std::move(texels))
		{
		}
	};

	class Texture1DArray : public Texture
	{
	public:
		Texture1DArray(TexelFormat format, TextureUsage usage, uint8 levels, uint16 width, uint16 numSlices,
			std::vector<ByteBuffer> texels = {})
			: Texture(TextureType::D1Array, format, ImageInfo{ width, 1, 1, numSlices, levels }, 1, usage, std::move(texels))
		{
		}
	};

	class Texture2D : public Texture
	{
	public:
		Texture2D(TexelFormat format, TextureUsage usage, uint8 levels, uint16 width, uint16 height,
			std::vector<ByteBuffer> texels = {})
			: Texture(TextureType::D2, format, ImageInfo{ width, height, 1, 1, levels }, 1, usage, std::move(texels))
		{
		}
	};

	class Texture2DArray : public Texture
	{
	public:
		Texture2DArray(TexelFormat format, TextureUsage usage, uint8 levels, uint16 width, uint16 height,
			uint16 numSlices, std::vector<ByteBuffer> texels = {})
			: Texture(TextureType::D2Array, format, ImageInfo{ width, height, 1, numSlices, levels }, 1, usage, std::move(texels))
		{
		}
	};

	class Texture2DMultisample : public Texture
	{
	public:
		Texture2DMultisample(TexelFormat format, TextureUsage usage, uint16 width, uint16 height, uint8 samples)
			: Texture(TextureType::D2Multisample, format, ImageInfo{ width, height, 1, 1, 1 }, samples, usage, {})
		{
		}
	};

	class Texture2DArrayMultisample : public Texture
	{
	public:
		Texture2DArrayMultisample(TexelFormat format, TextureUsage usage, uint16 width, uint16 height,
			uint16 numSlices, uint8 samples)
			: Texture(TextureType::D2ArrayMultisample, format, ImageInfo{ width, height, 1, numSlices, 1 }, samples, usage, {})
		{
		}
	};

	class Texture3D : public Texture
	{
	public:
		Texture3D(TexelFormat format, TextureUsage usage, uint8 levels, uint16 width, uint16 height, uint16 depth,
			std::vector<ByteBuffer> texels = {})
			: Texture(TextureType::D3, format, ImageInfo{ width, height, depth, 1, levels }, 1, usage, std::move(texels))
		{
		}
	};

	class TextureCube : public Texture
	{
	public:
		TextureCube(TexelFormat format, TextureUsage usage, uint8 levels, uint16 width,
			std::vector<ByteBuffer> texels = {})
			: Texture(TextureType::Cube, format, ImageInfo{ width, width, 1, 1, levels }, 1, usage, std::move(texels))
		{
		}
	};

	class TextureCubeArray : public Texture
	{
	public:
		TextureCubeArray(TexelFormat format, TextureUsage usage, uint8 levels, uint16 width, uint16 numSlices,
			std::vector<ByteBuffer> texels = {})
			: Texture(TextureType::CubeArray, format, ImageInfo{ width, width, 1, numSlices, levels }, 1, usage, std::move(texels))
		{
		}
	};
}
