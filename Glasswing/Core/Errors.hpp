//------------------------------------------------------------------------------
// Errors.hpp
//
// Exception types raised by the front-end object model
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

#include <stdexcept>
#include <string>

namespace Glasswing
{
	// Base class for every recoverable failure reported by Glasswing
	class GfxError : public std::runtime_error
	{
	public:
		explicit GfxError(const std::string& message)
			: std::runtime_error(message)
		{
		}
	};

	// Malformed pipeline layout (e.g. two depth-stencil fields)
	class ConfigurationError : public GfxError
	{
	public:
		using GfxError::GfxError;
	};

	// The backend is missing a capability the caller relies on
	class CapabilityError : public GfxError
	{
	public:
		using GfxError::GfxError;
	};

	// A layout field names a shader variable the program does not have
	class BindingNotFoundError : public GfxError
	{
	public:
		BindingNotFoundError(const std::string& message, std::string fieldName, std::string pipelineName)
			: GfxError(message)
			, m_FieldName(std::move(fieldName))
			, m_PipelineName(std::move(pipelineName))
		{
		}

		const std::string& GetFieldName() const { return m_FieldName; }
		const std::string& GetPipelineName() const { return m_PipelineName; }

	private:
		std::string m_FieldName;
		std::string m_PipelineName;
	};

	// Shader compile, program link or allocation failure inside a backend.
	// Glasswing never catches these, they reach the caller of Pin unchanged.
	class BackendError : public GfxError
	{
	public:
		using GfxError::GfxError;
	};

	// Caller bug: unpinned handle, mis-sized payload, out-of-bounds region...
	class PreconditionError : public std::logic_error
	{
	public:
		explicit PreconditionError(const std::string& message)
			: std::logic_error(message)
		{
		}
	};

	// Pin called on a handle that already owns a backend resource
	class AlreadyPinnedError : public PreconditionError
	{
	public:
		using PreconditionError::PreconditionError;
	};
}
