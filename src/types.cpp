#include <ibmvideo/types.hpp>
#include <stdexcept>

namespace ibmvideo {

EmbedUrlParameters &EmbedUrlParameters::set_initial_volume(int volume) {
	if (!is_initial_volume_valid(volume)) {
		throw std::invalid_argument("initial volume must be within [0, 100]");
	}
	m_initial_volume = volume;
	return *this;
}

}  // namespace ibmvideo
