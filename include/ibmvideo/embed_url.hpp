#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <ibmvideo/result.hpp>
#include <ibmvideo/types.hpp>
#include <string>
#include <string_view>

namespace ibmvideo::url {

/// Embed URL grammar, as an ECMAScript-compatible pattern. The scheme must be
/// "https://", "http://", "//" or empty, followed by
/// "video.ibm.com/embed/", an optional "recorded/", a non-empty path segment
/// and an optional query and fragment. Matched case-insensitively.
IBMVIDEO_EXPORT const std::string &embed_url_pattern();

/// Whether the whole of `embed_url` matches the embed URL grammar.
IBMVIDEO_EXPORT bool is_valid(std::string_view embed_url);

/// Extracts the (percent-decoded) video or channel ID and the recorded flag.
/// Fails with errc::invalid_format if the URL does not match the grammar.
IBMVIDEO_EXPORT Result<EmbedReference> parse(std::string_view embed_url);

/// Builds `scheme + base + encoded id [+ "?" + query]`. `scheme` may be
/// empty. Fails with errc::invalid_argument if the ID is empty.
IBMVIDEO_EXPORT Result<std::string> assemble(
	const EmbedReference &ref, std::string_view scheme,
	const EmbedUrlParameters *params = nullptr);

/// Query string for the embed player. Unspecified enum values are omitted.
IBMVIDEO_EXPORT std::string to_query_string(const EmbedUrlParameters &params);

/// Channel video permalink:
/// `scheme + "video.ibm.com/embed/channel/<channel>/video/<video>"`.
IBMVIDEO_EXPORT Result<std::string> assemble_permalink(
	std::string_view channel_id, std::string_view channel_video_id,
	std::string_view scheme = "");

// Legacy channel addressing: numeric channel IDs, alphabetic channel video
// IDs.
IBMVIDEO_EXPORT bool is_channel_id_valid(std::string_view channel_id);
IBMVIDEO_EXPORT bool is_channel_video_id_valid(
	std::string_view channel_video_id);

// Text forms used by the player query string and the CLI.
IBMVIDEO_EXPORT std::string_view to_string(DefaultQuality quality);
IBMVIDEO_EXPORT std::string_view to_string(WMode mode);
IBMVIDEO_EXPORT Result<DefaultQuality> parse_default_quality(
	std::string_view text);
IBMVIDEO_EXPORT Result<WMode> parse_wmode(std::string_view text);

/// RFC 3986 encoding leaving only unreserved characters as-is (space becomes
/// "%20", never "+").
IBMVIDEO_EXPORT std::string raw_encode(std::string_view s);

}  // namespace ibmvideo::url
