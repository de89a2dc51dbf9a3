#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace ibmvideo {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Caller errors
	invalid_argument = 10,
	invalid_format,

	// Persisted video data
	bad_json = 20,
	invalid_key_set,

	// Remote API / network
	transport_error = 30,
	bad_upstream_response,

	// Local cache
	configuration_error = 40,
	file_write_failed,

	unknown = 100
};

IBMVIDEO_EXPORT const std::error_category &ibmvideo_category();

IBMVIDEO_EXPORT std::error_code make_error_code(errc e);

}  // namespace ibmvideo

namespace std {
template <>
struct is_error_code_enum<ibmvideo::errc> : true_type {};
}  // namespace std

namespace ibmvideo {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace ibmvideo
