//------------------------------------------------------------------------------
// PipelineState.hpp
//
// A program plus the fixed-function state and binding layout it is drawn
// with. The descriptor is built from the layout at construction and gets its
// missing slots from the program's introspection data when pinned.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/Program.hpp"
#include "Glasswing/Renderer/PipelineState/DataSet.hpp"
#include "Glasswing/Renderer/PipelineState/PipelineDescriptor.hpp"
#include "Glasswing/Renderer/PipelineState/PipelineLayout.hpp"

#include <memory>

namespace Glasswing
{
	class PipelineState : public Resource
	{
	public:
		// Throws ConfigurationError when layout is malformed
		PipelineState(std::shared_ptr<Program> program, PrimitiveTopology primitive,
			const Rasterizer& rasterizer, PipelineLayout layout);
		~PipelineState() override = default;

		const char* GetKindName() const override { return "PipelineState"; }

		const std::string& GetName() const { return m_Layout.GetName(); }
		const PipelineLayout& GetLayout() const { return m_Layout; }
		const PipelineDescriptor& GetDescriptor() const { return m_Descriptor; }

		// Empty after Release
		const std::shared_ptr<Program>& GetProgram() const { return m_Program; }

		// Assembles the bindings of one draw from handles given in layout
		// field order. The pipeline must be pinned.
		RawDataSet MakeDataSet(const PipelineData& data) const;

		void Bind();

		PipelineRes* GetRes() const { return m_Res.Get(); }

	protected:
		// Resolves missing slots (CapabilityError when the context has no
		// introspection, BindingNotFoundError when a name is unknown), pins
		// the program if needed, then creates the backend pipeline. On
		// failure the descriptor is left as it was.
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		PipelineLayout m_Layout;
		PipelineDescriptor m_Descriptor;
		std::shared_ptr<Program> m_Program;

		// Declared last: the backend pipeline goes before the program
		BackendRef<PipelineRes> m_Res;
	};
}
