//------------------------------------------------------------------------------
// Program.hpp
//
// Shader stages and the linked program built from them
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/Resource.hpp"
#include "Glasswing/Renderer/RenderContext.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Glasswing
{
	class Shader : public Resource
	{
	public:
		// source is handed to the backend unmodified
		Shader(ShaderStage stage, std::string source);
		~Shader() override = default;

		const char* GetKindName() const override { return "Shader"; }

		ShaderStage GetStage() const { return m_Stage; }
		const std::string& GetSource() const { return m_Source; }

		ShaderRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		ShaderStage m_Stage;
		std::string m_Source;

		BackendRef<ShaderRes> m_Res;
	};

	// Helpers for the usual stage combinations
	struct ShaderSet
	{
		static std::vector<std::shared_ptr<Shader>> VertexPixel(const std::string& vertexSource,
			const std::string& pixelSource);

		static std::vector<std::shared_ptr<Shader>> VertexGeometryPixel(const std::string& vertexSource,
			const std::string& geometrySource, const std::string& pixelSource);
	};

	// A linked program. Pinning pins every stage that is not pinned yet, links
	// them and then drops the stage references: the backend program keeps
	// whatever compiled state it needs.
	class Program : public Resource
	{
	public:
		explicit Program(std::vector<std::shared_ptr<Shader>> shaders);
		~Program() override = default;

		const char* GetKindName() const override { return "Program"; }

		// Introspection result of the link, only valid once pinned
		const ProgramVars& GetVars() const;

		// Stages still referenced (empty once pinned)
		const std::vector<std::shared_ptr<Shader>>& GetShaders() const { return m_Shaders; }

		void Bind();

		ProgramRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		std::vector<std::shared_ptr<Shader>> m_Shaders;
		ProgramVars m_Vars;

		BackendRef<ProgramRes> m_Res;
	};
}
