//------------------------------------------------------------------------------
// DummyContext.hpp
//
// In-memory backend. Implements every Context operation without a GPU,
// counts the objects it hands out and records what it was asked to do.
// Used by the tests and the headless sample.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Renderer/RenderContext.hpp"
#include "Glasswing/Renderer/PipelineState/PipelineDescriptor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Glasswing
{
	struct DummyContextConfig
	{
		bool introspection = true;
		ProgramVars programVars;     // reported for every linked program

		// Failure injection, each raises BackendError
		bool failShaderCompile = false;
		bool failProgramLink = false;
		bool failAllocation = false; // buffers, textures and surfaces
	};

	struct DummyStats
	{
		size_t liveObjects = 0;
		size_t releaseCalls = 0;
		size_t destroyedUnreleased = 0;
		size_t bindCalls = 0;

		size_t buffersCreated = 0;
		size_t texturesCreated = 0;
		size_t shadersCreated = 0;
		size_t programsCreated = 0;
		size_t pipelinesCreated = 0;
		size_t surfacesCreated = 0;
		size_t viewsCreated = 0;
		size_t samplersCreated = 0;

		BufferCreationDesc lastBufferDesc;
		ByteBuffer lastBufferInitData;
		TextureCreationDesc lastTextureDesc;
		std::vector<ByteBuffer> lastTextureInitData;
		std::vector<std::string> shaderSources;
		std::optional<PipelineDescriptor> lastPipelineDescriptor;

		size_t bufferUpdates = 0;
		size_t textureUpdates = 0;
		std::optional<ImageSliceInfo> lastTextureUpdate;
		size_t lastTextureUpdateSize = 0;
	};

	// Backend object bookkeeping shared by every dummy resource
	template<typename Base>
	class DummyObject : public Base
	{
	public:
		explicit DummyObject(std::shared_ptr<DummyStats> stats)
			: m_Stats(std::move(stats))
		{
			++m_Stats->liveObjects;
		}

		~DummyObject() override
		{
			if (!m_Released)
				++m_Stats->destroyedUnreleased;
		}

		void Release() override;

		bool IsReleased() const { return m_Released; }

	protected:
		std::shared_ptr<DummyStats> m_Stats;

	private:
		bool m_Released = false;
	};

	template<typename Base>
	void DummyObject<Base>::Release()
	{
		VERIFY(!m_Released, "Backend object released twice");
		m_Released = true;
		--m_Stats->liveObjects;
		++m_Stats->releaseCalls;
	}

	template<typename Base>
	class DummyBindable : public DummyObject<Base>
	{
	public:
		using DummyObject<Base>::DummyObject;

		void Bind() override { ++this->m_Stats->bindCalls; }
	};

	// Keeps a CPU copy of its contents so updates can be inspected
	class DummyBuffer : public DummyBindable<BufferRes>
	{
	public:
		DummyBuffer(std::shared_ptr<DummyStats> stats, const BufferCreationDesc& desc, const ByteBuffer& initData);

		void Update(const BufferSliceInfo& slice, const void* data, size_t size) override;

		const ByteBuffer& GetData() const { return m_Data; }

	private:
		ByteBuffer m_Data;
	};

	class DummyTexture : public DummyBindable<TextureRes>
	{
	public:
		DummyTexture(std::shared_ptr<DummyStats> stats, const TextureCreationDesc& desc);

		void Update(const ImageSliceInfo& slice, const void* data, size_t size) override;

		const TextureCreationDesc& GetDesc() const { return m_Desc; }

	private:
		TextureCreationDesc m_Desc;
	};

	class DummyContext : public Context
	{
	public:
		explicit DummyContext(DummyContextConfig config = {});
		~DummyContext() override = default;

		const ContextCaps& GetCaps() const override { return m_Caps; }

		std::unique_ptr<BufferRes> MakeBuffer(const BufferCreationDesc& desc, const ByteBuffer& initData) override;
		std::unique_ptr<TextureRes> MakeTexture(const TextureCreationDesc& desc,
			const std::vector<ByteBuffer>& initData) override;
		std::unique_ptr<ShaderRes> MakeShader(ShaderStage stage, const std::string& source) override;
		LinkedProgram MakeProgram(const std::vector<ShaderRes*>& shaders) override;
		std::unique_ptr<PipelineRes> MakePipeline(ProgramRes& program, const PipelineDescriptor& descriptor) override;
		std::unique_ptr<SurfaceRes> MakeSurface(const SurfaceCreationDesc& desc) override;

		std::unique_ptr<ShaderResourceViewRes> ViewAsShaderResource(BufferRes& buffer) override;
		std::unique_ptr<ShaderResourceViewRes> ViewAsShaderResource(TextureRes& texture, const TexSRVDesc& desc) override;
		std::unique_ptr<RenderTargetViewRes> ViewAsRenderTarget(TextureRes& texture, const TexRTVDesc& desc) override;
		std::unique_ptr<RenderTargetViewRes> ViewAsRenderTarget(SurfaceRes& surface) override;
		std::unique_ptr<DepthStencilViewRes> ViewAsDepthStencil(TextureRes& texture, const TexDSVDesc& desc) override;
		std::unique_ptr<DepthStencilViewRes> ViewAsDepthStencil(SurfaceRes& surface) override;

		std::unique_ptr<SamplerRes> MakeSampler(ShaderResourceViewRes& view, const SamplerInfo& info) override;

		// Shared with every object created here, outlives the context if needed
		const DummyStats& GetStats() const { return *m_Stats; }

		// Failure flags and program vars may be changed between calls,
		// introspection goes through SetIntrospection
		DummyContextConfig& GetConfig() { return m_Config; }
		void SetIntrospection(bool enabled);

	private:
		DummyContextConfig m_Config;
		ContextCaps m_Caps;
		std::shared_ptr<DummyStats> m_Stats;
	};
}
