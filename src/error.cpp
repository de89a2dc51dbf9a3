#include <ibmvideo/result.hpp>
#include <string>

namespace ibmvideo {

struct ibmvideo_error_category : std::error_category {
	const char *name() const noexcept override { return "ibmvideo"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::invalid_argument: return "Invalid argument";
			case errc::invalid_format: return "Invalid format";
			case errc::bad_json: return "Malformed JSON";
			case errc::invalid_key_set: return "Invalid JSON key set";
			case errc::transport_error: return "HTTP transport error";
			case errc::bad_upstream_response:
				return "Bad response from the IBM Video API";
			case errc::configuration_error: return "Invalid configuration";
			case errc::file_write_failed: return "File write failed";
			default: return "Unknown error";
		}
	}
};

const std::error_category &ibmvideo_category() {
	static ibmvideo_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), ibmvideo_category()};
}

}  // namespace ibmvideo
