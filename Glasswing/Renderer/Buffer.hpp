//------------------------------------------------------------------------------
// Buffer.hpp
//
// Front-end buffer handle: a role, a usage and an array of fixed-stride elements
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Renderer/Resource.hpp"
#include "Glasswing/Renderer/RenderContext.hpp"

#include <cstring>
#include <memory>
#include <type_traits>
#include <vector>

namespace Glasswing
{
	const char* ToString(BufferRole role);

	class Buffer : public Resource
	{
	public:
		// initData is empty or exactly stride * count bytes
		Buffer(BufferRole role, BufferUsage usage, size_t stride, size_t count, ByteBuffer initData = {});
		~Buffer() override = default;

		const char* GetKindName() const override { return "Buffer"; }

		BufferRole GetRole() const { return m_Role; }
		BufferUsage GetUsage() const { return m_Usage; }
		size_t GetStride() const { return m_Stride; }
		size_t GetCount() const { return m_Count; }
		size_t GetSize() const { return m_Stride * m_Count; }

		bool HasPendingInitData() const { return !m_InitData.empty(); }

		void Bind();

		// Byte-addressed write; slice must lie inside the buffer and size must
		// equal slice.size
		void Update(const BufferSliceInfo& slice, const void* data, size_t size);

		// Element-addressed write of count elements starting at first
		void UpdateElements(size_t first, size_t count, const void* data, size_t size);

		template<typename T>
		void UpdateElements(size_t first, const std::vector<T>& elements)
		{
			static_assert(std::is_trivially_copyable_v<T>, "buffer elements must be plain data");
			UpdateElements(first, elements.size(), elements.data(), elements.size() * sizeof(T));
		}

		BufferRes* GetRes() const { return m_Res.Get(); }

	protected:
		void PinResources(Context& context) override;
		void ReleaseResources() override;

	private:
		BufferRole m_Role;
		BufferUsage m_Usage;
		size_t m_Stride;
		size_t m_Count;
		ByteBuffer m_InitData; // emptied by Pin

		BackendRef<BufferRes> m_Res;
	};

	namespace Detail
	{
		template<typename T>
		ByteBuffer ToBytes(const std::vector<T>& elements)
		{
			static_assert(std::is_trivially_copyable_v<T>, "buffer elements must be plain data");
			ByteBuffer bytes(elements.size() * sizeof(T));
			if (!bytes.empty())
				std::memcpy(bytes.data(), elements.data(), bytes.size());
			return bytes;
		}
	}

	template<typename V>
	std::shared_ptr<Buffer> MakeVertexBuffer(const std::vector<V>& vertices, BufferUsage usage = BufferUsage::GpuOnly)
	{
		return std::make_shared<Buffer>(BufferRole::Vertex, usage, sizeof(V), vertices.size(), Detail::ToBytes(vertices));
	}

	template<typename I>
	std::shared_ptr<Buffer> MakeIndexBuffer(const std::vector<I>& indices, BufferUsage usage = BufferUsage::GpuOnly)
	{
		static_assert(std::is_same_v<I, uint16> || std::is_same_v<I, uint32>, "index type must be uint16 or uint32");
		return std::make_shared<Buffer>(BufferRole::Index, usage, sizeof(I), indices.size(), Detail::ToBytes(indices));
	}

	// Single-element constant block, left uninitialized when no value is given
	template<typename T>
	std::shared_ptr<Buffer> MakeConstBuffer(BufferUsage usage = BufferUsage::Dynamic)
	{
		return std::make_shared<Buffer>(BufferRole::Constant, usage, sizeof(T), 1);
	}

	template<typename T>
	std::shared_ptr<Buffer> MakeConstBuffer(const T& value, BufferUsage usage = BufferUsage::Dynamic)
	{
		return std::make_shared<Buffer>(BufferRole::Constant, usage, sizeof(T), 1, Detail::ToBytes(std::vector<T>{ value }));
	}
}
