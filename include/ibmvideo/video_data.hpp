#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <ibmvideo/result.hpp>
#include <ibmvideo/types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ibmvideo::data {

// JSON keys of a persisted video data value.
inline constexpr const char *kIdKey = "id";
inline constexpr const char *kIsRecordedKey = "is_recorded";
inline constexpr const char *kThumbnailReferenceIdKey = "thumbnail_reference_id";

/// Serializes the reference and thumbnail reference ID into the persisted
/// JSON form. A new thumbnail reference ID is minted if none is given.
/// Fails with errc::invalid_argument if the ID or the given token is empty.
IBMVIDEO_EXPORT Result<std::string> serialize(
	const EmbedReference &ref,
	std::optional<std::string> thumbnail_reference_id = std::nullopt);

/// Structural parse only: fails with errc::bad_json if `raw` is not a JSON
/// object, errc::invalid_key_set if its key set is not exactly the expected
/// one. The values are returned unchecked.
IBMVIDEO_EXPORT Result<RawVideoData> try_deserialize(std::string_view raw);

/// Per-field semantic checks. Empty when the data is usable.
IBMVIDEO_EXPORT std::vector<FieldViolation> validate(const RawVideoData &raw);

/// Fails with errc::invalid_format if validate() reports any violation.
IBMVIDEO_EXPORT Result<VideoData> to_video_data(const RawVideoData &raw);

/// Serializes `ref` for saving, keeping the thumbnail reference ID of
/// `previous_raw` when it holds valid data for the same video or channel, so
/// that an unchanged source keeps its cached thumbnail.
IBMVIDEO_EXPORT Result<std::string> prepare_for_save(
	const EmbedReference &ref, std::string_view previous_raw = "");

/// Base64 of eight cryptographically random bytes.
IBMVIDEO_EXPORT std::string generate_thumbnail_reference_id();

}  // namespace ibmvideo::data
