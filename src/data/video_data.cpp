#include <spdlog/spdlog.h>

#include <ibmvideo/video_data.hpp>
#include <utility>

#include "crypto/crypto.hpp"

namespace ibmvideo::data {

namespace {

constexpr size_t kExpectedKeyCount = 3;
constexpr size_t kThumbnailReferenceIdBytes = 8;

bool is_non_empty_string(const nlohmann::json &j) {
	return j.is_string() && !j.get_ref<const std::string &>().empty();
}

}  // namespace

Result<std::string> serialize(const EmbedReference &ref,
							  std::optional<std::string> thumbnail_reference_id) {
	if (ref.id.empty()) return outcome::failure(errc::invalid_argument);
	if (!thumbnail_reference_id) {
		thumbnail_reference_id = generate_thumbnail_reference_id();
	} else if (thumbnail_reference_id->empty()) {
		return outcome::failure(errc::invalid_argument);
	}

	nlohmann::json j = {
		{kIdKey, ref.id},
		{kIsRecordedKey, ref.is_recorded},
		{kThumbnailReferenceIdKey, std::move(*thumbnail_reference_id)},
	};
	return j.dump();
}

Result<RawVideoData> try_deserialize(std::string_view raw) {
	// Parse without throwing
	auto j = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return outcome::failure(errc::bad_json);
	}

	if (j.size() != kExpectedKeyCount || !j.contains(kIdKey) ||
		!j.contains(kIsRecordedKey) || !j.contains(kThumbnailReferenceIdKey)) {
		return outcome::failure(errc::invalid_key_set);
	}

	RawVideoData data;
	data.id = std::move(j[kIdKey]);
	data.is_recorded = std::move(j[kIsRecordedKey]);
	data.thumbnail_reference_id = std::move(j[kThumbnailReferenceIdKey]);
	return data;
}

std::vector<FieldViolation> validate(const RawVideoData &raw) {
	std::vector<FieldViolation> violations;
	if (!is_non_empty_string(raw.id)) {
		violations.push_back(
			{kIdKey, "The video or channel ID is not a non-empty string."});
	}
	if (!raw.is_recorded.is_boolean()) {
		violations.push_back(
			{kIsRecordedKey, "The \"is recorded\" flag is not a boolean."});
	}
	if (!is_non_empty_string(raw.thumbnail_reference_id)) {
		violations.push_back(
			{kThumbnailReferenceIdKey,
			 "The thumbnail reference ID is not a non-empty string."});
	}
	return violations;
}

Result<VideoData> to_video_data(const RawVideoData &raw) {
	auto violations = validate(raw);
	if (!violations.empty()) {
		for (const auto &v : violations) {
			spdlog::debug("Invalid video data field {}: {}", v.field, v.message);
		}
		return outcome::failure(errc::invalid_format);
	}

	VideoData data;
	data.id = raw.id.get<std::string>();
	data.is_recorded = raw.is_recorded.get<bool>();
	data.thumbnail_reference_id = raw.thumbnail_reference_id.get<std::string>();
	return data;
}

Result<std::string> prepare_for_save(const EmbedReference &ref,
									 std::string_view previous_raw) {
	std::optional<std::string> token;
	if (!previous_raw.empty()) {
		auto raw = try_deserialize(previous_raw);
		if (raw) {
			auto previous = to_video_data(raw.value());
			if (previous && previous.value().reference() == ref) {
				token = std::move(previous.value().thumbnail_reference_id);
			}
		}
	}
	return serialize(ref, std::move(token));
}

std::string generate_thumbnail_reference_id() {
	return crypto::base64_encode(
		crypto::random_bytes(kThumbnailReferenceIdBytes));
}

}  // namespace ibmvideo::data
