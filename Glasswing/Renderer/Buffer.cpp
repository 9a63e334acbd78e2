//------------------------------------------------------------------------------
// Buffer.cpp
//------------------------------------------------------------------------------

#include "Glasswing/Renderer/Buffer.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"

#include <limits>

namespace Glasswing
{
	const char* ToString(BufferRole role)
	{
		switch (role)
		{
		case BufferRole::Vertex: return "Vertex";
		case BufferRole::Index: return "Index";
		case BufferRole::Constant: return "Constant";
		case BufferRole::Other: return "Other";
		}
		return "Unknown";
	}

	Buffer::Buffer(BufferRole role, BufferUsage usage, size_t stride, size_t count, ByteBuffer initData)
		: m_Role(role)
		, m_Usage(usage)
		, m_Stride(stride)
		, m_Count(count)
		, m_InitData(std::move(initData))
	{
		GLASSWING_CHECK_PRECONDITION(stride > 0 && count > 0,
			"{} buffer needs a non-zero stride and count ({} x {})", ToString(role), stride, count);
		GLASSWING_CHECK_PRECONDITION(count <= std::numeric_limits<size_t>::max() / stride,
			"{} buffer of {} x {} bytes overflows its size", ToString(role), count, stride);
		GLASSWING_CHECK_PRECONDITION(m_InitData.empty() || m_InitData.size() == GetSize(),
			"{} buffer init data holds {} bytes, expected {}", ToString(role), m_InitData.size(), GetSize());
		GLASSWING_CHECK_PRECONDITION(usage != BufferUsage::Const || !m_InitData.empty(),
			"Const buffers must be created with their contents");
	}

	void Buffer::Bind()
	{
		RequirePinned("Bind");
		m_Res->Bind();
	}

	void Buffer::Update(const BufferSliceInfo& slice, const void* data, size_t size)
	{
		RequirePinned("Update");

		GLASSWING_CHECK_PRECONDITION(m_Usage != BufferUsage::Const,
			"Const buffers cannot be updated");
		GLASSWING_CHECK_PRECONDITION(slice.offset <= GetSize() && slice.size <= GetSize() - slice.offset,
			"Range [{}, {}) exceeds buffer size {}", slice.offset, slice.offset + slice.size, GetSize());
		GLASSWING_CHECK_PRECONDITION(size == slice.size,
			"Buffer update expects {} bytes for the range, got {}", slice.size, size);
		GLASSWING_CHECK_PRECONDITION(data != nullptr || size == 0, "Buffer update without data");

		m_Res->Update(slice, data, size);
	}

	void Buffer::UpdateElements(size_t first, size_t count, const void* data, size_t size)
	{
		RequirePinned("UpdateElements");
		GLASSWING_CHECK_PRECONDITION(first <= m_Count && count <= m_Count - first,
			"Elements [{}, {}) exceed buffer count {}", first, first + count, m_Count);

		BufferSliceInfo slice;
		slice.offset = first * m_Stride;
		slice.size = count * m_Stride;
		Update(slice, data, size);
	}

	void Buffer::PinResources(Context& context)
	{
		BufferCreationDesc desc;
		desc.role = m_Role;
		desc.usage = m_Usage;
		desc.size = GetSize();

		m_Res = BackendRef<BufferRes>(context.MakeBuffer(desc, m_InitData));
		VERIFY(static_cast<bool>(m_Res), "Context returned a null buffer");

		m_InitData.clear();
		m_InitData.shrink_to_fit();
	}

	void Buffer::ReleaseResources()
	{
		m_Res.Reset();
		m_InitData.clear();
		m_InitData.shrink_to_fit();
	}
}
