//------------------------------------------------------------------------------
// Resource.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Resource.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

#include <format>

namespace Glasswing
{
	namespace
	{
		const char* DisplayName(const std::string& name)
		{
			return name.empty() ? "<unnamed>" : name.c_str();
		}
	}

	void Resource::Pin(Context& context)
	{
		if (m_State == ResourceState::Pinned)
		{
			std::string message = std::format("{} '{}' is already pinned",
				GetKindName(), DisplayName(m_DebugName));
			LOG_ERROR("{}", message);
			throw AlreadyPinnedError(message);
		}

		GLASSWING_CHECK_PRECONDITION(m_State != ResourceState::Released,
			"{} '{}' was released and cannot be pinned again", GetKindName(), DisplayName(m_DebugName));

		PinResources(context);
		m_State = ResourceState::Pinned;

		LOG_TRACE("Pinned {} '{}'", GetKindName(), DisplayName(m_DebugName));
	}

	void Resource::Release()
	{
		if (m_State == ResourceState::Released)
			return;

		ReleaseResources();
		m_State = ResourceState::Released;
	}

	void Resource::RequirePinned(const char* operation) const
	{
		GLASSWING_CHECK_PRECONDITION(m_State == ResourceState::Pinned,
			"{} on {} '{}' requires a pinned resource", operation, GetKindName(), DisplayName(m_DebugName));
	}
}
