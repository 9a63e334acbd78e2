//------------------------------------------------------------------------------
// PipelineDescriptor.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/PipelineState/PipelineDescriptor.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

#include <algorithm>
#include <format>

namespace Glasswing
{
	namespace
	{
		template<typename Desc>
		bool AnyUnresolved(const std::vector<Desc>& entries)
		{
			return std::any_of(entries.begin(), entries.end(), [](const Desc& entry) { return !entry.slot; });
		}

		template<typename Desc, typename Var, typename SlotOf>
		void ResolveList(std::vector<Desc>& entries, const std::vector<Var>& vars, SlotOf slotOf,
			const char* category, const std::string& pipelineName)
		{
			for (Desc& entry : entries)
			{
				if (entry.slot)
					continue;

				auto it = std::find_if(vars.begin(), vars.end(),
					[&entry](const Var& var) { return var.name == entry.name; });

				if (it == vars.end())
				{
					std::string message = std::format("cannot find {} {} in pipeline {}", category, entry.name, pipelineName);
					LOG_ERROR("{}", message);
					throw BindingNotFoundError(message, entry.name, pipelineName);
				}

				entry.slot = slotOf(*it);
				LOG_DEBUG("Pipeline {}: {} '{}' bound to slot {}", pipelineName, category, entry.name, *entry.slot);
			}
		}
	}

	bool PipelineDescriptor::NeedsSlotResolution() const
	{
		return AnyUnresolved(vertexAttribs) ||
			AnyUnresolved(constantBlocks) ||
			AnyUnresolved(resourceViews) ||
			AnyUnresolved(samplers) ||
			AnyUnresolved(colorTargets);
	}

	void ResolveSlots(PipelineDescriptor& descriptor, const ProgramVars& vars, const std::string& pipelineName)
	{
		ResolveList(descriptor.vertexAttribs, vars.attributes,
			[](const AttributeVar& var) { return var.loc; }, "attribute", pipelineName);
		ResolveList(descriptor.constantBlocks, vars.constBuffers,
			[](const ConstBufferVar& var) { return var.loc; }, "block", pipelineName);
		ResolveList(descriptor.resourceViews, vars.textures,
			[](const TextureVar& var) { return var.loc; }, "texture", pipelineName);
		ResolveList(descriptor.samplers, vars.samplers,
			[](const SamplerVar& var) { return var.slot; }, "sampler", pipelineName);
		ResolveList(descriptor.colorTargets, vars.outputs,
			[](const OutputVar& var) { return var.index; }, "color target", pipelineName);
	}
}
