//------------------------------------------------------------------------------
// PipelineDescriptorTests.cpp
//
// Layout -> descriptor construction and slot resolution
//------------------------------------------------------------------------------

#include "TestHelpers.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Renderer/PipelineState/PipelineLayout.hpp"

#include <cstddef>

namespace Glasswing
{
	namespace
	{
		struct Vertex
		{
			float pos[2];
			float color[3];
		};

		VertexFormat TriangleVertex()
		{
			return VertexFormat(sizeof(Vertex))
				.Add("a_Pos", VarType::Vector(BaseType::F32, 2), offsetof(Vertex, pos))
				.Add("a_Color", VarType::Vector(BaseType::F32, 3), offsetof(Vertex, color));
		}
	}

	class PipelineDescriptorTest : public GfxTest
	{
	};

	TEST_F(PipelineDescriptorTest, ListsFollowDeclarationOrder)
	{
		PipelineLayout layout("Forward");
		layout.AddVertexInput(TriangleVertex())
			.AddConstantBlock("Globals")
			.AddResourceView("u_Albedo", TexelFormat::RGBA8)
			.AddSampler("s_Albedo")
			.AddConstantBlock("Material")
			.AddColorOutput("o_Color", TexelFormat::RGBA8)
			.AddBlendOutput("o_Accum", TexelFormat::RGBA16F, Blend::Additive())
			.AddColorOutput("o_Normal", TexelFormat::RGBA8);

		PipelineDescriptor descriptor = layout.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill());

		ASSERT_EQ(descriptor.vertexAttribs.size(), 2u);
		EXPECT_EQ(descriptor.vertexAttribs[0].name, "a_Pos");
		EXPECT_EQ(descriptor.vertexAttribs[1].name, "a_Color");

		ASSERT_EQ(descriptor.constantBlocks.size(), 2u);
		EXPECT_EQ(descriptor.constantBlocks[0].name, "Globals");
		EXPECT_EQ(descriptor.constantBlocks[1].name, "Material");

		ASSERT_EQ(descriptor.resourceViews.size(), 1u);
		EXPECT_EQ(descriptor.resourceViews[0].format, TexelFormat::RGBA8);
		ASSERT_EQ(descriptor.samplers.size(), 1u);

		ASSERT_EQ(descriptor.colorTargets.size(), 3u);
		EXPECT_EQ(descriptor.colorTargets[0].name, "o_Color");
		EXPECT_EQ(descriptor.colorTargets[1].name, "o_Accum");
		EXPECT_EQ(descriptor.colorTargets[2].name, "o_Normal");
		EXPECT_FALSE(descriptor.colorTargets[0].info.blend.has_value());
		EXPECT_TRUE(descriptor.colorTargets[1].info.blend.has_value());

		EXPECT_FALSE(descriptor.depthStencil.has_value());
		EXPECT_FALSE(descriptor.scissor);
		EXPECT_TRUE(descriptor.NeedsSlotResolution());
	}

	TEST_F(PipelineDescriptorTest, VertexAttributesDescribeTheirField)
	{
		PipelineLayout layout("Instanced");
		layout.AddVertexInput(TriangleVertex(), 1);

		PipelineDescriptor descriptor = layout.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill());

		const VertexAttribDesc& color = descriptor.vertexAttribs[1];
		EXPECT_EQ(color.field.offset, offsetof(Vertex, color));
		EXPECT_EQ(color.field.size, 12u);
		EXPECT_EQ(color.field.stride, sizeof(Vertex));
		EXPECT_EQ(color.field.type, VarType::Vector(BaseType::F32, 3));
		EXPECT_EQ(color.instanceRate, 1);
	}

	TEST_F(PipelineDescriptorTest, TwoColorTargetsAndOneDepthStencil)
	{
		PipelineLayout layout("Deferred");
		layout.AddColorOutput("o_Albedo", TexelFormat::RGBA8)
			.AddColorOutput("o_Normal", TexelFormat::RGBA16F)
			.AddDepthStencilOutput(TexelFormat::Depth24Stencil8, Depth::LessEqualWrite(), Stencil());

		PipelineDescriptor descriptor = layout.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill());

		ASSERT_EQ(descriptor.colorTargets.size(), 2u);
		EXPECT_EQ(descriptor.colorTargets[0].name, "o_Albedo");
		EXPECT_EQ(descriptor.colorTargets[1].name, "o_Normal");
		ASSERT_TRUE(descriptor.depthStencil.has_value());
		EXPECT_EQ(descriptor.depthStencil->surface, SurfaceType::DepthStencil);
		EXPECT_TRUE(descriptor.depthStencil->depth.has_value());
		EXPECT_TRUE(descriptor.depthStencil->stencil.has_value());
	}

	TEST_F(PipelineDescriptorTest, OnlyOneDepthStencilField)
	{
		PipelineLayout twoDepth("TwoDepth");
		twoDepth.AddDepthOutput(TexelFormat::Depth32F, Depth::LessEqualWrite())
			.AddDepthOutput(TexelFormat::Depth32F, Depth::LessEqualTest());
		EXPECT_THROW(twoDepth.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);
		EXPECT_TRUE(m_Sink->Contains(LogLevel::Error, "too many depth-stencil targets"));

		PipelineLayout depthAndStencil("DepthAndStencil");
		depthAndStencil.AddDepthOutput(TexelFormat::Depth24Stencil8, Depth::LessEqualWrite())
			.AddStencilOutput(TexelFormat::Depth24Stencil8, Stencil());
		EXPECT_THROW(depthAndStencil.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);
	}

	TEST_F(PipelineDescriptorTest, OnlyOneScissorField)
	{
		PipelineLayout layout("Scissored");
		layout.AddScissor();
		EXPECT_TRUE(layout.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()).scissor);

		layout.AddScissor();
		EXPECT_THROW(layout.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);
	}

	TEST_F(PipelineDescriptorTest, FormatsMustFitTheirField)
	{
		PipelineLayout colorAsDepth("ColorAsDepth");
		colorAsDepth.AddDepthOutput(TexelFormat::RGBA8, Depth::LessEqualWrite());
		EXPECT_THROW(colorAsDepth.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);

		PipelineLayout depthAsColor("DepthAsColor");
		depthAsColor.AddColorOutput("o_Color", TexelFormat::Depth16);
		EXPECT_THROW(depthAsColor.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);

		PipelineLayout stencilWithoutStencil("NoStencil");
		stencilWithoutStencil.AddStencilOutput(TexelFormat::Depth32F, Stencil());
		EXPECT_THROW(stencilWithoutStencil.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);
	}

	TEST_F(PipelineDescriptorTest, MalformedVertexInput)
	{
		PipelineLayout empty("Empty");
		empty.AddVertexInput(VertexFormat(16));
		EXPECT_THROW(empty.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);

		PipelineLayout overflow("Overflow");
		overflow.AddVertexInput(VertexFormat(8).Add("a_Pos", VarType::Vector(BaseType::F32, 3), 0));
		EXPECT_THROW(overflow.BuildDescriptor(PrimitiveTopology::TriangleList, Rasterizer::Fill()), ConfigurationError);
	}

	TEST_F(PipelineDescriptorTest, ExplicitSlotsNeedNoResolution)
	{
		PipelineLayout layout("Explicit");
		layout.AddVertexInput(VertexFormat(sizeof(Vertex))
				.Add("a_Pos", VarType::Vector(BaseType::F32, 2), offsetof(Vertex, pos), uint8(0)))
			.AddConstantBlock("Globals", uint8(1))
			.AddColorOutput("o_Color", TexelFormat::RGBA8, ColorMask::All, uint8(0));

		PipelineDescriptor descriptor = layout.BuildDescriptor(PrimitiveTopology::TriangleStrip, Rasterizer::Fill().WithCullBack());

		EXPECT_FALSE(descriptor.NeedsSlotResolution());
		EXPECT_EQ(descriptor.primitive, PrimitiveTopology::TriangleStrip);
		EXPECT_EQ(descriptor.rasterizer.cullMode, CullMode::Back);
		EXPECT_EQ(descriptor.constantBlocks[0].slot, uint8(1));
	}

	TEST_F(PipelineDescriptorTest, ResolveCopiesIntrospectedSlots)
	{
		PipelineDescriptor descriptor;
		descriptor.vertexAttribs.push_back(VertexAttribDesc{ "a_Pos", std::nullopt, {}, 0 });
		descriptor.constantBlocks.push_back(ConstantBlockDesc{ "Globals", std::nullopt });
		descriptor.resourceViews.push_back(ResourceViewDesc{ "u_Tex", std::nullopt, TexelFormat::RGBA8 });
		descriptor.samplers.push_back(SamplerDesc{ "s_Tex", std::nullopt });
		descriptor.colorTargets.push_back(ColorTargetDesc{ "o_Color", std::nullopt, TexelFormat::RGBA8, {} });
		ASSERT_TRUE(descriptor.NeedsSlotResolution());

		ProgramVars vars;
		vars.attributes.push_back(AttributeVar{ "a_Normal", 1, VarType::Vector(BaseType::F32, 3) });
		vars.attributes.push_back(AttributeVar{ "a_Pos", 2, VarType::Vector(BaseType::F32, 3) });
		vars.constBuffers.push_back(ConstBufferVar{ "Globals", 3, 64, ShaderUsage::VertexPixel });
		vars.textures.push_back(TextureVar{ "u_Tex", 4, BaseType::F32, TextureVarType::D2, ShaderUsage::Pixel });
		vars.samplers.push_back(SamplerVar{ "s_Tex", 5, false, false, ShaderUsage::Pixel });
		vars.outputs.push_back(OutputVar{ "o_Color", 6, VarType::Vector(BaseType::F32, 4) });

		ResolveSlots(descriptor, vars, "Resolved");

		EXPECT_EQ(descriptor.vertexAttribs[0].slot, uint8(2));
		EXPECT_EQ(descriptor.constantBlocks[0].slot, uint8(3));
		EXPECT_EQ(descriptor.resourceViews[0].slot, uint8(4));
		EXPECT_EQ(descriptor.samplers[0].slot, uint8(5));
		EXPECT_EQ(descriptor.colorTargets[0].slot, uint8(6));
		EXPECT_FALSE(descriptor.NeedsSlotResolution());
	}

	TEST_F(PipelineDescriptorTest, ResolveKeepsExplicitSlots)
	{
		PipelineDescriptor descriptor;
		descriptor.vertexAttribs.push_back(VertexAttribDesc{ "a_Pos", uint8(7), {}, 0 });

		ProgramVars vars;
		vars.attributes.push_back(AttributeVar{ "a_Pos", 2, VarType::Vector(BaseType::F32, 2) });

		ResolveSlots(descriptor, vars, "Explicit");
		EXPECT_EQ(descriptor.vertexAttribs[0].slot, uint8(7));
	}

	TEST_F(PipelineDescriptorTest, MissingVariableNamesFieldAndPipeline)
	{
		PipelineDescriptor descriptor;
		descriptor.vertexAttribs.push_back(VertexAttribDesc{ "a_Pos", std::nullopt, {}, 0 });

		ProgramVars vars;
		vars.attributes.push_back(AttributeVar{ "a_Position", 0, VarType::Vector(BaseType::F32, 2) });

		try
		{
			ResolveSlots(descriptor, vars, "Triangle");
			FAIL() << "resolution should have failed";
		}
		catch (const BindingNotFoundError& e)
		{
			EXPECT_EQ(e.GetFieldName(), "a_Pos");
			EXPECT_EQ(e.GetPipelineName(), "Triangle");
			EXPECT_STREQ(e.what(), "cannot find attribute a_Pos in pipeline Triangle");
		}
	}
}
