#pragma once
#include <stdexcept>
#include <string>

namespace srng {
	// Thrown when a seed cannot be turned into a valid engine state:
	// either the byte count is wrong, or the decoded words violate a
	// precondition of the engine (e.g. a degenerate MSWS stream constant).
	// Construction is the only place an engine can fail.
	class seed_error final : public std::invalid_argument{
	public:
		explicit seed_error(const std::string& what_arg) : std::invalid_argument(what_arg){}
		explicit seed_error(const char* what_arg) : std::invalid_argument(what_arg){}
	};
} // namespace srng
