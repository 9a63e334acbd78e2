//------------------------------------------------------------------------------
// ResourceSet.hpp
//
// Ordered list of shared resource handles. Every element stays alive for at
// least as long as the set (or any copy of it) does.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Assert.hpp"

#include <memory>
#include <vector>

namespace Glasswing
{
	template<typename T>
	class ResourceSet
	{
	public:
		using Handle = std::shared_ptr<T>;
		using const_iterator = typename std::vector<Handle>::const_iterator;

		void Add(Handle handle)
		{
			GLASSWING_CHECK_PRECONDITION(handle != nullptr, "Null handle added to a resource set");
			m_Elements.push_back(std::move(handle));
		}

		void Clear() { m_Elements.clear(); }

		size_t Size() const { return m_Elements.size(); }
		bool IsEmpty() const { return m_Elements.empty(); }

		const Handle& operator[](size_t index) const { return m_Elements.at(index); }

		const_iterator begin() const { return m_Elements.begin(); }
		const_iterator end() const { return m_Elements.end(); }

		const std::vector<Handle>& GetElements() const { return m_Elements; }

	private:
		std::vector<Handle> m_Elements;
	};
}
