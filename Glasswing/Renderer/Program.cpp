//------------------------------------------------------------------------------
// Program.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Program.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

namespace Glasswing
{
	// ============================================================================
	// Shader
	// ============================================================================

	Shader::Shader(ShaderStage stage, std::string source)
		: m_Stage(stage)
		, m_Source(std::move(source))
	{
	}

	void Shader::PinResources(Context& context)
	{
		m_Res = BackendRef<ShaderRes>(context.MakeShader(m_Stage, m_Source));
		VERIFY(static_cast<bool>(m_Res), "Context returned a null shader");
		VERIFY(m_Res->GetStage() == m_Stage, "Backend compiled a {} shader for a {} stage",
			ToString(m_Res->GetStage()), ToString(m_Stage));
	}

	void Shader::ReleaseResources()
	{
		m_Res.Reset();
	}

	std::vector<std::shared_ptr<Shader>> ShaderSet::VertexPixel(const std::string& vertexSource,
		const std::string& pixelSource)
	{
		return {
			std::make_shared<Shader>(ShaderStage::Vertex, vertexSource),
			std::make_shared<Shader>(ShaderStage::Pixel, pixelSource)
		};
	}

	std::vector<std::shared_ptr<Shader>> ShaderSet::VertexGeometryPixel(const std::string& vertexSource,
		const std::string& geometrySource, const std::string& pixelSource)
	{
		return {
			std::make_shared<Shader>(ShaderStage::Vertex, vertexSource),
			std::make_shared<Shader>(ShaderStage::Geometry, geometrySource),
			std::make_shared<Shader>(ShaderStage::Pixel, pixelSource)
		};
	}

	// ============================================================================
	// Program
	// ============================================================================

	Program::Program(std::vector<std::shared_ptr<Shader>> shaders)
		: m_Shaders(std::move(shaders))
	{
		GLASSWING_CHECK_PRECONDITION(!m_Shaders.empty(), "A program needs at least one shader");

		ShaderUsage seen = ShaderUsage::None;
		for (const auto& shader : m_Shaders)
		{
			GLASSWING_CHECK_PRECONDITION(shader != nullptr, "Null shader handed to a program");

			ShaderUsage stage = ToUsage(shader->GetStage());
			GLASSWING_CHECK_PRECONDITION(!HasUsage(seen, stage),
				"Program has more than one {} shader", ToString(shader->GetStage()));
			seen = seen | stage;
		}
	}

	const ProgramVars& Program::GetVars() const
	{
		RequirePinned("GetVars");
		return m_Vars;
	}

	void Program::Bind()
	{
		RequirePinned("Bind");
		m_Res->Bind();
	}

	void Program::PinResources(Context& context)
	{
		std::vector<ShaderRes*> stages;
		stages.reserve(m_Shaders.size());

		for (const auto& shader : m_Shaders)
		{
			if (!shader->IsPinned())
				shader->Pin(context);
			stages.push_back(shader->GetRes());
		}

		LinkedProgram linked = context.MakeProgram(stages);
		VERIFY(linked.program != nullptr, "Context returned a null program");

		m_Res = BackendRef<ProgramRes>(std::move(linked.program));
		m_Vars = std::move(linked.vars);

		LOG_DEBUG("Linked program '{}': {} attributes, {} constant blocks, {} textures, {} samplers, {} outputs",
			GetDebugName(), m_Vars.attributes.size(), m_Vars.constBuffers.size(), m_Vars.textures.size(),
			m_Vars.samplers.size(), m_Vars.outputs.size());

		m_Shaders.clear();
	}

	void Program::ReleaseResources()
	{
		m_Res.Reset();
		m_Shaders.clear();
		m_Vars = ProgramVars();
	}
}
