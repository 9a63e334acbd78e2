//------------------------------------------------------------------------------
// main.cpp
//
// Headless triangle: builds the classic vertex-color pipeline against the
// dummy backend, pins it and assembles one data set
//------------------------------------------------------------------------------

#include "Glasswing/Core/Engine.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"
#include "Glasswing/Renderer/Buffer.hpp"
#include "Glasswing/Renderer/Program.hpp"
#include "Glasswing/Renderer/Surface.hpp"
#include "Glasswing/Renderer/View.hpp"
#include "Glasswing/Renderer/Dummy/DummyContext.hpp"
#include "Glasswing/Renderer/PipelineState/PipelineState.hpp"

#include <glm/glm.hpp>
#include <cstddef>
#include <exception>

using namespace Glasswing;

namespace
{
	struct Vertex
	{
		glm::vec2 pos;
		glm::vec3 color;
	};

	const char* kVertexSource = R"(#version 330
in vec2 a_Pos;
in vec3 a_Color;
out vec3 v_Color;
void main() {
    v_Color = a_Color;
    gl_Position = vec4(a_Pos, 0.0, 1.0);
})";

	const char* kPixelSource = R"(#version 330
in vec3 v_Color;
out vec4 o_Color;
void main() {
    o_Color = vec4(v_Color, 1.0);
})";

	// What a GL driver would report after linking the two stages above
	ProgramVars TriangleVars()
	{
		ProgramVars vars;
		vars.attributes.push_back(AttributeVar{ "a_Pos", 0, VarType::Vector(BaseType::F32, 2) });
		vars.attributes.push_back(AttributeVar{ "a_Color", 1, VarType::Vector(BaseType::F32, 3) });
		vars.outputs.push_back(OutputVar{ "o_Color", 0, VarType::Vector(BaseType::F32, 4) });
		return vars;
	}

	void LogDescriptor(const PipelineState& pipeline)
	{
		const PipelineDescriptor& descriptor = pipeline.GetDescriptor();

		LOG_INFO("Pipeline {}:", pipeline.GetName());
		for (const VertexAttribDesc& attrib : descriptor.vertexAttribs)
		{
			LOG_INFO("  attribute {} -> slot {} (offset {}, stride {})",
				attrib.name, attrib.slot.value_or(0), attrib.field.offset, attrib.field.stride);
		}
		for (const ColorTargetDesc& target : descriptor.colorTargets)
		{
			LOG_INFO("  color target {} -> slot {} ({})", target.name, target.slot.value_or(0), ToString(target.format));
		}
	}

	void RunTriangle()
	{
		DummyContextConfig config;
		config.programVars = TriangleVars();
		DummyContext context(config);

		auto colorSurface = std::make_shared<Surface>(TexelFormat::RGBA8, 640, 480);
		auto colorRtv = std::make_shared<RenderTargetView>(colorSurface);

		auto vertices = MakeVertexBuffer(std::vector<Vertex>{
			{ { -0.5f, -0.5f }, { 1.0f, 0.0f, 0.0f } },
			{ { 0.5f, -0.5f }, { 0.0f, 1.0f, 0.0f } },
			{ { 0.0f, 0.5f }, { 0.0f, 0.0f, 1.0f } },
		});
		vertices->SetDebugName("Triangle vertices");

		auto program = std::make_shared<Program>(ShaderSet::VertexPixel(kVertexSource, kPixelSource));
		program->SetDebugName("Vertex color");

		PipelineLayout layout("Triangle");
		layout.AddVertexInput(VertexFormat(sizeof(Vertex))
				.Add("a_Pos", VarType::Vector(BaseType::F32, 2), offsetof(Vertex, pos))
				.Add("a_Color", VarType::Vector(BaseType::F32, 3), offsetof(Vertex, color)))
			.AddColorOutput("o_Color", TexelFormat::RGBA8);

		PipelineState pipeline(program, PrimitiveTopology::TriangleList, Rasterizer::Fill().WithSamples(), layout);

		vertices->Pin(context);
		colorRtv->Pin(context);
		pipeline.Pin(context);

		LogDescriptor(pipeline);

		RawDataSet data = pipeline.MakeDataSet(PipelineData()
			.AddVertexBuffer(vertices)
			.AddColorTarget(colorRtv));

		LOG_INFO("Data set: {} vertex buffers, {} color targets, {}x{} pixels",
			data.vertexBuffers.Size(), data.pixelTargets.colors.Size(),
			data.pixelTargets.width, data.pixelTargets.height);

		pipeline.Bind();
		for (const auto& buffer : data.vertexBuffers)
			buffer->Bind();

		LOG_INFO("Backend objects alive: {}", context.GetStats().liveObjects);
	}
}

int main()
{
	EngineConfig config;
	config.logLevel = LogLevel::Debug;
	GlasswingInit(config);

	int result = 0;
	try
	{
		RunTriangle();
	}
	catch (const std::exception& e)
	{
		LOG_ERROR("Triangle sample failed: {}", e.what());
		result = 1;
	}

	GlasswingShutdown();
	return result;
}
