//------------------------------------------------------------------------------
// RenderContext.hpp
//
// Backend-facing contract: creation descriptors, backend resource interfaces
// and the Context every driver (OpenGL, Vulkan, D3D, test double) implements.
// The front-end object model never constructs a backend resource itself.
//------------------------------------------------------------------------------

#pragma once

#include "Glasswing/Core/Base.hpp"
#include "Glasswing/Renderer/Format.hpp"
#include "Glasswing/Renderer/ShaderTypes.hpp"
#include "Glasswing/Renderer/State.hpp"

#include <glm/glm.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Glasswing
{
	struct PipelineDescriptor;

	// ============================================================================
	// Buffers
	// ============================================================================

	enum class BufferRole
	{
		Vertex,
		Index,
		Constant,
		Other
	};

	enum class BufferUsage
	{
		GpuOnly,  // written once at creation
		Const,    // never written after creation
		Dynamic,  // updated frequently from the CPU
		CpuOnly   // staging
	};

	// Byte range of a buffer
	struct BufferSliceInfo
	{
		size_t offset = 0;
		size_t size = 0;
	};

	struct BufferCreationDesc
	{
		BufferRole role = BufferRole::Vertex;
		BufferUsage usage = BufferUsage::GpuOnly;
		size_t size = 0;
	};

	// ============================================================================
	// Textures
	// ============================================================================

	enum class TextureType
	{
		D1,
		D1Array,
		D2,
		D2Array,
		D2Multisample,
		D2ArrayMultisample,
		D3,
		Cube,
		CubeArray
	};

	enum class TextureUsage : uint8
	{
		None = 0x00,
		RenderTarget = 0x01,
		DepthStencil = 0x02,
		ShaderResource = 0x04,
		UnorderedAccess = 0x08
	};

	// Allow bitwise operations for TextureUsage
	inline TextureUsage operator|(TextureUsage a, TextureUsage b)
	{
		return static_cast<TextureUsage>(static_cast<uint8>(a) | static_cast<uint8>(b));
	}

	inline TextureUsage operator&(TextureUsage a, TextureUsage b)
	{
		return static_cast<TextureUsage>(static_cast<uint8>(a) & static_cast<uint8>(b));
	}

	inline bool HasUsage(TextureUsage flags, TextureUsage bit)
	{
		return (flags & bit) != TextureUsage::None;
	}

	enum class CubeFace
	{
		None,
		PosX,
		NegX,
		PosY,
		NegY,
		PosZ,
		NegZ
	};

	struct ImageInfo
	{
		uint16 width = 1;
		uint16 height = 1;
		uint16 depth = 1;
		uint16 numSlices = 1;
		uint8 levels = 1;
	};

	// Region of one mip level (and one cube face) of a texture
	struct ImageSliceInfo
	{
		uint16 xoffset = 0;
		uint16 yoffset = 0;
		uint16 zoffset = 0;
		uint16 width = 0;
		uint16 height = 0;
		uint16 depth = 1;
		uint8 level = 0;
		CubeFace face = CubeFace::None;
	};

	struct TextureCreationDesc
	{
		TextureType type = TextureType::D1;
		TexelFormat format = TexelFormat::RGBA8;
		ImageInfo imgInfo;
		uint8 samples = 1;
		TextureUsage usage = TextureUsage::ShaderResource;
	};

	// ============================================================================
	// Surfaces and views
	// ============================================================================

	enum class SurfaceUsage : uint8
	{
		None = 0x00,
		RenderTarget = 0x01,
		DepthStencil = 0x02
	};

	struct SurfaceCreationDesc
	{
		SurfaceUsage usage = SurfaceUsage::None;
		uint16 width = 0;
		uint16 height = 0;
		TexelFormat format = TexelFormat::RGBA8;
		uint8 samples = 1;
	};

	struct TexSRVDesc
	{
		uint8 minLevel = 0;
		uint8 maxLevel = 0;
	};

	struct TexRTVDesc
	{
		uint8 level = 0;
		std::optional<uint16> layer;  // empty = every layer
	};

	struct DSVReadOnly
	{
		bool depth = false;
		bool stencil = false;
	};

	struct TexDSVDesc
	{
		uint8 level = 0;
		std::optional<uint16> layer;
		DSVReadOnly readOnly;
	};

	enum class FilterMethod
	{
		Scale,
		Mipmap,
		Bilinear,
		Trilinear,
		Anisotropic
	};

	enum class WrapMode
	{
		Tile,
		Mirror,
		Clamp,
		Border
	};

	struct SamplerInfo
	{
		FilterMethod filter = FilterMethod::Bilinear;
		uint8 maxAnisotropy = 1;
		std::array<WrapMode, 3> wrap = { WrapMode::Clamp, WrapMode::Clamp, WrapMode::Clamp };
		float lodBias = 0.0f;
		float minLod = 0.0f;
		float maxLod = 1000.0f;
		std::optional<CompareOp> comparison;
		glm::vec4 border = glm::vec4(0.0f);

		SamplerInfo WithComparison(CompareOp op) const
		{
			SamplerInfo copy = *this;
			copy.comparison = op;
			return copy;
		}
	};

	// ============================================================================
	// Backend resource interfaces
	// ============================================================================

	// Driver-owned object. Release frees the driver side and is called exactly
	// once by the owning front-end handle, before the object is deleted.
	class BackendResource
	{
	public:
		virtual ~BackendResource() = default;
		virtual void Release() = 0;
	};

	class BindableResource : public BackendResource
	{
	public:
		virtual void Bind() = 0;
	};

	class BufferRes : public BindableResource
	{
	public:
		virtual void Update(const BufferSliceInfo& slice, const void* data, size_t size) = 0;
	};

	class TextureRes : public BindableResource
	{
	public:
		virtual void Update(const ImageSliceInfo& slice, const void* data, size_t size) = 0;
	};

	class ShaderRes : public BackendResource
	{
	public:
		virtual ShaderStage GetStage() const = 0;
	};

	class ProgramRes : public BindableResource {};
	class PipelineRes : public BindableResource {};
	class SurfaceRes : public BindableResource {};
	class ShaderResourceViewRes : public BackendResource {};
	class RenderTargetViewRes : public BackendResource {};
	class DepthStencilViewRes : public BackendResource {};
	class SamplerRes : public BackendResource {};

	// ============================================================================
	// Context Interface
	// ============================================================================

	struct ContextCaps
	{
		// Can report slots of a linked program's variables (ProgramVars)
		bool introspection = false;
	};

	struct LinkedProgram
	{
		std::unique_ptr<ProgramRes> program;
		ProgramVars vars;
	};

	// Factory for every backend resource. All calls are synchronous; failures
	// are reported by throwing BackendError.
	class Context
	{
	public:
		Context() = default;
		virtual ~Context() = default;

		virtual const ContextCaps& GetCaps() const = 0;

		virtual std::unique_ptr<BufferRes> MakeBuffer(const BufferCreationDesc& desc, const ByteBuffer& initData) = 0;

		// initData is empty or holds one blob per (image, face, level)
		virtual std::unique_ptr<TextureRes> MakeTexture(const TextureCreationDesc& desc,
			const std::vector<ByteBuffer>& initData) = 0;

		// source is passed through unmodified
		virtual std::unique_ptr<ShaderRes> MakeShader(ShaderStage stage, const std::string& source) = 0;

		virtual LinkedProgram MakeProgram(const std::vector<ShaderRes*>& shaders) = 0;

		virtual std::unique_ptr<PipelineRes> MakePipeline(ProgramRes& program, const PipelineDescriptor& descriptor) = 0;

		virtual std::unique_ptr<SurfaceRes> MakeSurface(const SurfaceCreationDesc& desc) = 0;

		// Views
		virtual std::unique_ptr<ShaderResourceViewRes> ViewAsShaderResource(BufferRes& buffer) = 0;
		virtual std::unique_ptr<ShaderResourceViewRes> ViewAsShaderResource(TextureRes& texture, const TexSRVDesc& desc) = 0;
		virtual std::unique_ptr<RenderTargetViewRes> ViewAsRenderTarget(TextureRes& texture, const TexRTVDesc& desc) = 0;
		virtual std::unique_ptr<RenderTargetViewRes> ViewAsRenderTarget(SurfaceRes& surface) = 0;
		virtual std::unique_ptr<DepthStencilViewRes> ViewAsDepthStencil(TextureRes& texture, const TexDSVDesc& desc) = 0;
		virtual std::unique_ptr<DepthStencilViewRes> ViewAsDepthStencil(SurfaceRes& surface) = 0;

		virtual std::unique_ptr<SamplerRes> MakeSampler(ShaderResourceViewRes& view, const SamplerInfo& info) = 0;

	protected:
		// prevent copying and assignment
		Context(const Context&) = delete;
		Context& operator=(const Context&) = delete;
	};
}
