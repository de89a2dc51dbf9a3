#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/regex.hpp>
#include <boost/url.hpp>
#include <cctype>
#include <ibmvideo/embed_url.hpp>
#include <utility>
#include <vector>

namespace ibmvideo::url {

namespace {

constexpr std::string_view kEmbedBaseRecorded = "video.ibm.com/embed/recorded/";
constexpr std::string_view kEmbedBaseStream = "video.ibm.com/embed/";
constexpr std::string_view kPermalinkBase = "video.ibm.com/embed/channel/";

// =============================================================================
// EMBED URL GRAMMAR
// =============================================================================
// Path segment characters are the RFC 3986 unreserved and sub-delim sets plus
// ":" and "@" (no "/"). Query and fragment (RFC 3986 3.4 and 3.5) also allow
// "/" and "?". Percent escapes are "%" followed by two hex digits.
// =============================================================================

constexpr std::string_view kSegmentChar =
	R"((?:[a-z0-9._~!$&'()*+,;=:@-]|%[0-9a-f]{2}))";
constexpr std::string_view kQueryChar =
	R"((?:[a-z0-9._~!$&'()*+,;=:@/?-]|%[0-9a-f]{2}))";

// Capture groups
enum EmbedUrlGroup {
	kGroupScheme = 1,
	kGroupRecorded = 2,
	kGroupId = 3,
};

const boost::regex &embed_url_regex() {
	static const boost::regex re(
		embed_url_pattern(), boost::regex::perl | boost::regex::icase);
	return re;
}

using SvMatch = boost::match_results<std::string_view::const_iterator>;

bool match_embed_url(std::string_view embed_url, SvMatch &m) {
	return boost::regex_match(
		embed_url.begin(), embed_url.end(), m, embed_url_regex());
}

template <typename Pred>
bool non_empty_and_all_of(std::string_view s, Pred pred) {
	return !s.empty() && std::all_of(s.begin(), s.end(), [&pred](char c) {
		return pred(static_cast<unsigned char>(c)) != 0;
	});
}

}  // namespace

const std::string &embed_url_pattern() {
	static const std::string pattern = fmt::format(
		R"((https://|http://|//)?video\.ibm\.com/embed/(recorded/)?({0}+))"
		R"((?:\?{1}*)?(?:#{1}*)?)",
		kSegmentChar, kQueryChar);
	return pattern;
}

bool is_valid(std::string_view embed_url) {
	SvMatch m;
	return match_embed_url(embed_url, m);
}

Result<EmbedReference> parse(std::string_view embed_url) {
	if (embed_url.empty()) return outcome::failure(errc::invalid_format);

	SvMatch m;
	if (!match_embed_url(embed_url, m)) {
		spdlog::debug("Not an IBM Video embed URL: {}", embed_url);
		return outcome::failure(errc::invalid_format);
	}

	std::string_view encoded_id(
		&*m[kGroupId].first, static_cast<size_t>(m[kGroupId].length()));
	auto pct = boost::urls::make_pct_string_view(encoded_id);
	if (pct.has_error()) return outcome::failure(errc::invalid_format);

	EmbedReference ref;
	ref.id = pct->decode();
	ref.is_recorded = m[kGroupRecorded].matched;
	if (ref.id.empty()) return outcome::failure(errc::invalid_format);
	return ref;
}

Result<std::string> assemble(const EmbedReference &ref,
							 std::string_view scheme,
							 const EmbedUrlParameters *params) {
	if (ref.id.empty()) return outcome::failure(errc::invalid_argument);

	std::string result(scheme);
	result += ref.is_recorded ? kEmbedBaseRecorded : kEmbedBaseStream;
	result += raw_encode(ref.id);
	if (params) {
		result += '?';
		result += to_query_string(*params);
	}
	return result;
}

std::string to_query_string(const EmbedUrlParameters &params) {
	auto text_bool = [](bool v) -> std::string { return v ? "true" : "false"; };

	// The player documents useHtml5Ui as "1"/"0", unlike the other flags.
	std::vector<std::pair<std::string, std::string>> query = {
		{"initialVolume", std::to_string(params.initial_volume())},
		{"showTitle", text_bool(params.show_title())},
		{"useAutoplay", text_bool(params.use_autoplay())},
		{"useHtml5Ui", params.use_html5_ui() ? "1" : "0"},
	};
	if (params.default_quality() != DefaultQuality::unspecified) {
		query.emplace_back(
			"defaultQuality", std::string(to_string(params.default_quality())));
	}
	if (params.wmode() != WMode::unspecified) {
		query.emplace_back("wMode", std::string(to_string(params.wmode())));
	}

	std::string result;
	for (const auto &[key, value] : query) {
		if (!result.empty()) result += '&';
		result += raw_encode(key);
		result += '=';
		result += raw_encode(value);
	}
	return result;
}

Result<std::string> assemble_permalink(std::string_view channel_id,
									   std::string_view channel_video_id,
									   std::string_view scheme) {
	if (channel_id.empty() || channel_video_id.empty()) {
		return outcome::failure(errc::invalid_argument);
	}
	std::string result(scheme);
	result += kPermalinkBase;
	result += channel_id;
	result += "/video/";
	result += channel_video_id;
	return result;
}

bool is_channel_id_valid(std::string_view channel_id) {
	return non_empty_and_all_of(
		channel_id, [](unsigned char c) { return std::isdigit(c); });
}

bool is_channel_video_id_valid(std::string_view channel_video_id) {
	return non_empty_and_all_of(
		channel_video_id, [](unsigned char c) { return std::isalpha(c); });
}

std::string_view to_string(DefaultQuality quality) {
	switch (quality) {
		case DefaultQuality::low: return "low";
		case DefaultQuality::medium: return "medium";
		case DefaultQuality::high: return "high";
		case DefaultQuality::unspecified: break;
	}
	return "";
}

std::string_view to_string(WMode mode) {
	switch (mode) {
		case WMode::direct: return "direct";
		case WMode::opaque: return "opaque";
		case WMode::transparent: return "transparent";
		case WMode::window: return "window";
		case WMode::unspecified: break;
	}
	return "";
}

Result<DefaultQuality> parse_default_quality(std::string_view text) {
	if (text == "low") return DefaultQuality::low;
	if (text == "medium") return DefaultQuality::medium;
	if (text == "high") return DefaultQuality::high;
	if (text.empty() || text == "unspecified") {
		return DefaultQuality::unspecified;
	}
	return outcome::failure(errc::invalid_argument);
}

Result<WMode> parse_wmode(std::string_view text) {
	if (text == "direct") return WMode::direct;
	if (text == "opaque") return WMode::opaque;
	if (text == "transparent") return WMode::transparent;
	if (text == "window") return WMode::window;
	if (text.empty() || text == "unspecified") return WMode::unspecified;
	return outcome::failure(errc::invalid_argument);
}

std::string raw_encode(std::string_view s) {
	return boost::urls::encode(s, boost::urls::unreserved_chars);
}

}  // namespace ibmvideo::url
