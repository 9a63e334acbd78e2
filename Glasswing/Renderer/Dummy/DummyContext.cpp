//------------------------------------------------------------------------------
// DummyContext.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Dummy/DummyContext.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

#include <algorithm>
#include <cstring>
#include <format>

namespace Glasswing
{
	namespace
	{
		class DummyShader : public DummyObject<ShaderRes>
		{
		public:
			DummyShader(std::shared_ptr<DummyStats> stats, ShaderStage stage)
				: DummyObject(std::move(stats))
				, m_Stage(stage)
			{
			}

			ShaderStage GetStage() const override { return m_Stage; }

		private:
			ShaderStage m_Stage;
		};

		using DummyProgram = DummyBindable<ProgramRes>;
		using DummyPipeline = DummyBindable<PipelineRes>;
		using DummySurface = DummyBindable<SurfaceRes>;
		using DummyShaderResourceView = DummyObject<ShaderResourceViewRes>;
		using DummyRenderTargetView = DummyObject<RenderTargetViewRes>;
		using DummyDepthStencilView = DummyObject<DepthStencilViewRes>;
		using DummySampler = DummyObject<SamplerRes>;

		[[noreturn]] void ThrowBackendError(const std::string& message)
		{
			LOG_ERROR("{}", message);
			throw BackendError(message);
		}
	}

	// ============================================================================
	// Resources
	// ============================================================================

	DummyBuffer::DummyBuffer(std::shared_ptr<DummyStats> stats, const BufferCreationDesc& desc, const ByteBuffer& initData)
		: DummyBindable(std::move(stats))
		, m_Data(desc.size, 0)
	{
		if (!initData.empty())
			std::memcpy(m_Data.data(), initData.data(), std::min(initData.size(), m_Data.size()));
	}

	void DummyBuffer::Update(const BufferSliceInfo& slice, const void* data, size_t size)
	{
		VERIFY(slice.offset + size <= m_Data.size(), "Buffer update past the end of the allocation");
		if (size > 0)
			std::memcpy(m_Data.data() + slice.offset, data, size);
		++m_Stats->bufferUpdates;
	}

	DummyTexture::DummyTexture(std::shared_ptr<DummyStats> stats, const TextureCreationDesc& desc)
		: DummyBindable(std::move(stats))
		, m_Desc(desc)
	{
	}

	void DummyTexture::Update(const ImageSliceInfo& slice, const void* data, size_t size)
	{
		UNUSED(data);
		++m_Stats->textureUpdates;
		m_Stats->lastTextureUpdate = slice;
		m_Stats->lastTextureUpdateSize = size;
	}

	// ============================================================================
	// DummyContext
	// ============================================================================

	DummyContext::DummyContext(DummyContextConfig config)
		: m_Config(std::move(config))
		, m_Stats(std::make_shared<DummyStats>())
	{
		m_Caps.introspection = m_Config.introspection;
		LOG_DEBUG("Dummy context created (introspection: {})", m_Caps.introspection);
	}

	void DummyContext::SetIntrospection(bool enabled)
	{
		m_Config.introspection = enabled;
		m_Caps.introspection = enabled;
	}

	std::unique_ptr<BufferRes> DummyContext::MakeBuffer(const BufferCreationDesc& desc, const ByteBuffer& initData)
	{
		if (m_Config.failAllocation)
			ThrowBackendError(std::format("Dummy backend: cannot allocate a {}-byte buffer", desc.size));

		++m_Stats->buffersCreated;
		m_Stats->lastBufferDesc = desc;
		m_Stats->lastBufferInitData = initData;
		return std::make_unique<DummyBuffer>(m_Stats, desc, initData);
	}

	std::unique_ptr<TextureRes> DummyContext::MakeTexture(const TextureCreationDesc& desc,
		const std::vector<ByteBuffer>& initData)
	{
		if (m_Config.failAllocation)
		{
			ThrowBackendError(std::format("Dummy backend: cannot allocate a {}x{}x{} texture",
				desc.imgInfo.width, desc.imgInfo.height, desc.imgInfo.depth));
		}

		++m_Stats->texturesCreated;
		m_Stats->lastTextureDesc = desc;
		m_Stats->lastTextureInitData = initData;
		return std::make_unique<DummyTexture>(m_Stats, desc);
	}

	std::unique_ptr<ShaderRes> DummyContext::MakeShader(ShaderStage stage, const std::string& source)
	{
		if (m_Config.failShaderCompile)
			ThrowBackendError(std::format("Dummy backend: {} shader failed to compile", ToString(stage)));

		++m_Stats->shadersCreated;
		m_Stats->shaderSources.push_back(source);
		return std::make_unique<DummyShader>(m_Stats, stage);
	}

	LinkedProgram DummyContext::MakeProgram(const std::vector<ShaderRes*>& shaders)
	{
		for (ShaderRes* shader : shaders)
		{
			if (shader == nullptr)
				ThrowBackendError("Dummy backend: cannot link a null shader");
		}

		if (m_Config.failProgramLink)
			ThrowBackendError(std::format("Dummy backend: program with {} stages failed to link", shaders.size()));

		++m_Stats->programsCreated;

		LinkedProgram linked;
		linked.program = std::make_unique<DummyProgram>(m_Stats);
		linked.vars = m_Config.programVars;
		return linked;
	}

	std::unique_ptr<PipelineRes> DummyContext::MakePipeline(ProgramRes& program, const PipelineDescriptor& descriptor)
	{
		UNUSED(program);
		++m_Stats->pipelinesCreated;
		m_Stats->lastPipelineDescriptor = descriptor;
		return std::make_unique<DummyPipeline>(m_Stats);
	}

	std::unique_ptr<SurfaceRes> DummyContext::MakeSurface(const SurfaceCreationDesc& desc)
	{
		if (m_Config.failAllocation)
			ThrowBackendError(std::format("Dummy backend: cannot allocate a {}x{} surface", desc.width, desc.height));

		++m_Stats->surfacesCreated;
		return std::make_unique<DummySurface>(m_Stats);
	}

	std::unique_ptr<ShaderResourceViewRes> DummyContext::ViewAsShaderResource(BufferRes& buffer)
	{
		UNUSED(buffer);
		++m_Stats->viewsCreated;
		return std::make_unique<DummyShaderResourceView>(m_Stats);
	}

	std::unique_ptr<ShaderResourceViewRes> DummyContext::ViewAsShaderResource(TextureRes& texture, const TexSRVDesc& desc)
	{
		UNUSED(texture);
		UNUSED(desc);
		++m_Stats->viewsCreated;
		return std::make_unique<DummyShaderResourceView>(m_Stats);
	}

	std::unique_ptr<RenderTargetViewRes> DummyContext::ViewAsRenderTarget(TextureRes& texture, const TexRTVDesc& desc)
	{
		UNUSED(texture);
		UNUSED(desc);
		++m_Stats->viewsCreated;
		return std::make_unique<DummyRenderTargetView>(m_Stats);
	}

	std::unique_ptr<RenderTargetViewRes> DummyContext::ViewAsRenderTarget(SurfaceRes& surface)
	{
		UNUSED(surface);
		++m_Stats->viewsCreated;
		return std::make_unique<DummyRenderTargetView>(m_Stats);
	}

	std::unique_ptr<DepthStencilViewRes> DummyContext::ViewAsDepthStencil(TextureRes& texture, const TexDSVDesc& desc)
	{
		UNUSED(texture);
		UNUSED(desc);
		++m_Stats->viewsCreated;
		return std::make_unique<DummyDepthStencilView>(m_Stats);
	}

	std::unique_ptr<DepthStencilViewRes> DummyContext::ViewAsDepthStencil(SurfaceRes& surface)
	{
		UNUSED(surface);
		++m_Stats->viewsCreated;
		return std::make_unique<DummyDepthStencilView>(m_Stats);
	}

	std::unique_ptr<SamplerRes> DummyContext::MakeSampler(ShaderResourceViewRes& view, const SamplerInfo& info)
	{
		UNUSED(view);
		UNUSED(info);
		++m_Stats->samplersCreated;
		return std::make_unique<DummySampler>(m_Stats);
	}
}
