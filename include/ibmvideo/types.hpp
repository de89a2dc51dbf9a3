#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <nlohmann/json.hpp>
#include <string>

namespace ibmvideo {

// Identity of an embedded video: a video ID for recorded videos, or a
// channel ID for streams.
struct IBMVIDEO_EXPORT EmbedReference {
	std::string id;
	bool is_recorded = false;

	bool operator==(const EmbedReference &other) const {
		return id == other.id && is_recorded == other.is_recorded;
	}
	bool operator!=(const EmbedReference &other) const {
		return !(*this == other);
	}
};

enum class DefaultQuality { low, medium, high, unspecified };

enum class WMode { direct, opaque, transparent, window, unspecified };

// Player parameters serialized into the query string of an embed URL.
class IBMVIDEO_EXPORT EmbedUrlParameters {
   public:
	static constexpr int kMinVolume = 0;
	static constexpr int kMaxVolume = 100;

	[[nodiscard]] DefaultQuality default_quality() const {
		return m_default_quality;
	}
	[[nodiscard]] bool display_controls() const { return m_display_controls; }
	[[nodiscard]] int initial_volume() const { return m_initial_volume; }
	[[nodiscard]] bool show_title() const { return m_show_title; }
	[[nodiscard]] bool use_autoplay() const { return m_use_autoplay; }
	[[nodiscard]] bool use_html5_ui() const { return m_use_html5_ui; }
	[[nodiscard]] WMode wmode() const { return m_wmode; }

	EmbedUrlParameters &set_default_quality(DefaultQuality quality) {
		m_default_quality = quality;
		return *this;
	}
	EmbedUrlParameters &set_display_controls(bool display) {
		m_display_controls = display;
		return *this;
	}
	/// Throws std::invalid_argument if volume is outside [0, 100].
	EmbedUrlParameters &set_initial_volume(int volume);
	EmbedUrlParameters &set_show_title(bool show) {
		m_show_title = show;
		return *this;
	}
	EmbedUrlParameters &set_use_autoplay(bool autoplay) {
		m_use_autoplay = autoplay;
		return *this;
	}
	EmbedUrlParameters &set_use_html5_ui(bool html5) {
		m_use_html5_ui = html5;
		return *this;
	}
	EmbedUrlParameters &set_wmode(WMode mode) {
		m_wmode = mode;
		return *this;
	}

	static bool is_initial_volume_valid(int volume) {
		return volume >= kMinVolume && volume <= kMaxVolume;
	}

   private:
	DefaultQuality m_default_quality = DefaultQuality::unspecified;
	bool m_display_controls = true;
	int m_initial_volume = 50;
	bool m_show_title = true;
	bool m_use_autoplay = false;
	bool m_use_html5_ui = true;
	WMode m_wmode = WMode::unspecified;
};

// Validated contents of a persisted video data value.
struct IBMVIDEO_EXPORT VideoData {
	std::string id;
	bool is_recorded = false;
	std::string thumbnail_reference_id;

	[[nodiscard]] EmbedReference reference() const { return {id, is_recorded}; }
};

// Structurally valid but semantically unchecked video data: the key set is
// right, the values may still be of the wrong type.
struct IBMVIDEO_EXPORT RawVideoData {
	nlohmann::json id;
	nlohmann::json is_recorded;
	nlohmann::json thumbnail_reference_id;
};

struct IBMVIDEO_EXPORT FieldViolation {
	std::string field;
	std::string message;
};

}  // namespace ibmvideo
