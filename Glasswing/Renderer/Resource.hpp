//------------------------------------------------------------------------------
// Resource.hpp
//
// Base class of every front-end resource handle and the RAII owner of the
// backend resource a handle creates when it is pinned.
//
// Lifecycle: Unpinned -> Pinned -> Released. A handle is pinned exactly once;
// CPU-side initialization data is dropped as soon as the pin succeeds.
//
// Threading: handles follow a single-writer discipline. Pin, Update and
// Release must not race with any other use of the same handle; once pinned,
// a handle may be bound/sampled from several threads as long as nobody
// mutates it meanwhile. Shared ownership goes through std::shared_ptr.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Base.hpp"
#include <memory>
#include <string>

namespace Glasswing
{
	class Context;

	// Exclusive owner of a backend resource. Calls Release() on the driver
	// object exactly once, then deletes it.
	template<typename T>
	class BackendRef
	{
	public:
		BackendRef() = default;
		explicit BackendRef(std::unique_ptr<T> res) : m_Res(std::move(res)) {}
		~BackendRef() { Reset(); }

		BackendRef(BackendRef&& other) noexcept : m_Res(std::move(other.m_Res)) {}
		BackendRef& operator=(BackendRef&& other) noexcept
		{
			if (this != &other)
			{
				Reset();
				m_Res = std::move(other.m_Res);
			}
			return *this;
		}

		GLASSWING_DISABLE_COPY(BackendRef)

		void Reset()
		{
			if (m_Res)
			{
				m_Res->Release();
				m_Res.reset();
			}
		}

		T* Get() const { return m_Res.get(); }
		T* operator->() const { return m_Res.get(); }
		T& operator*() const { return *m_Res; }
		explicit operator bool() const { return m_Res != nullptr; }

	private:
		std::unique_ptr<T> m_Res;
	};

	enum class ResourceState
	{
		Unpinned,
		Pinned,
		Released
	};

	class Resource
	{
	public:
		virtual ~Resource() = default;

		GLASSWING_DISABLE_COPY_AND_MOVE(Resource)

		// Creates the backend resource through context. Throws
		// AlreadyPinnedError when called twice and PreconditionError after
		// Release. Backend failures propagate and leave the handle unpinned.
		void Pin(Context& context);

		// Drops the backend resource (and any pending init data).
		// Calling it again is a no-op.
		void Release();

		bool IsPinned() const { return m_State == ResourceState::Pinned; }
		ResourceState GetState() const { return m_State; }

		void SetDebugName(const std::string& name) { m_DebugName = name; }
		const std::string& GetDebugName() const { return m_DebugName; }

		// Family name used in diagnostics ("Texture", "Program", ...)
		virtual const char* GetKindName() const = 0;

	protected:
		Resource() = default;

		virtual void PinResources(Context& context) = 0;
		virtual void ReleaseResources() = 0;

		// Throws PreconditionError unless the handle is pinned
		void RequirePinned(const char* operation) const;

	private:
		ResourceState m_State = ResourceState::Unpinned;
		std::string m_DebugName;
	};
}
