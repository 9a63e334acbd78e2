//------------------------------------------------------------------------------
// Sampler.hpp
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/View.hpp"

namespace Glasswing
{
	// Filtering state bound to one shader resource view
	class Sampler : public Resource
	{
	public:
		Sampler(std::shared_ptr<ShaderResourceView> view, const SamplerInfo& info = {});
		~Sampler() override = default;

		const char* GetKindName() const override { return "Sampler"; }

		const std::shared_ptr<ShaderResourceView>& GetView() const { return m_View; }
		const SamplerInfo& GetInfo() const { return m_Info; }

		SamplerRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		std::shared_ptr<ShaderResourceView> m_View;
		SamplerInfo m_Info;

		BackendRef<SamplerRes> m_Res;
	};
}
