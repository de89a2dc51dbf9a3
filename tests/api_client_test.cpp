#include <gtest/gtest.h>

#include <ibmvideo/api_client.hpp>
#include <memory>

#include "fake_http_client.hpp"

using namespace ibmvideo;

namespace {

constexpr const char *kChannelUrl = "https://api.video.ibm.com/channels/42.json";
constexpr const char *kVideoUrl = "https://api.video.ibm.com/videos/77.json";

class ApiClientTest : public ::testing::Test {
   protected:
	std::shared_ptr<test::FakeHttpClient> http =
		std::make_shared<test::FakeHttpClient>();
	api::ApiClient client{http};
};

}  // namespace

TEST_F(ApiClientTest, PicksLargestChannelPicture) {
	http->on_get(kChannelUrl, 200,
				 R"({"channel": {"picture": {"100x100": "a", "300x200": "b",
				 "50x1000": "c"}}})");

	auto uri = client.get_channel_thumbnail_uri("42");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "b");
	ASSERT_EQ(http->get_calls.size(), 1u);
	EXPECT_EQ(http->get_calls[0], kChannelUrl);
}

TEST_F(ApiClientTest, SkipsMalformedSizeKeys) {
	http->on_get(kChannelUrl, 200,
				 R"({"channel": {"picture": {"big": "x", "10x10": "y",
				 "3x": "z", "20x20x20": "w"}}})");

	auto uri = client.get_channel_thumbnail_uri("42");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "y");
}

TEST_F(ApiClientTest, SkipsOverflowingSizeKeys) {
	http->on_get(kChannelUrl, 200,
				 R"({"channel": {"picture": {"9999999999x9999999999": "huge",
				 "300x200": "valid"}}})");

	auto uri = client.get_channel_thumbnail_uri("42");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "valid");
}

TEST_F(ApiClientTest, SkipsNonPositiveSizeKeys) {
	http->on_get(kChannelUrl, 200,
				 R"({"channel": {"picture": {"10x10": "small",
				 "-100x-200": "negative", "0x500": "zero"}}})");

	auto uri = client.get_channel_thumbnail_uri("42");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "small");
}

TEST_F(ApiClientTest, FallsBackToFirstPictureWhenNoSizeParses) {
	http->on_get(kChannelUrl, 200,
				 R"({"channel": {"picture": {"small": "first",
				 "large": "second"}}})");

	auto uri = client.get_channel_thumbnail_uri("42");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "first");
}

TEST_F(ApiClientTest, SkipsNonStringPictureValues) {
	http->on_get(kChannelUrl, 200,
				 R"({"channel": {"picture": {"900x900": 12, "10x10": "ok"}}})");

	auto uri = client.get_channel_thumbnail_uri("42");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "ok");
}

TEST_F(ApiClientTest, MissingPictureIsNotAnError) {
	for (const char *body :
		 {R"({"channel": {}})", R"({"channel": {"picture": null}})",
		  R"({"channel": {"picture": []}})",
		  R"({"channel": {"picture": {"10x10": ""}}})"}) {
		http->on_get(kChannelUrl, 200, body);
		auto uri = client.get_channel_thumbnail_uri("42");
		ASSERT_TRUE(uri.has_value()) << body;
		EXPECT_FALSE(uri.value().has_value()) << body;
	}
}

TEST_F(ApiClientTest, MalformedChannelEnvelopeIsAnError) {
	for (const char *body :
		 {"{}", R"({"channel": "x"})", R"({"channel": {"picture": 5}})",
		  "[]", "<html>"}) {
		http->on_get(kChannelUrl, 200, body);
		auto uri = client.get_channel_thumbnail_uri("42");
		ASSERT_TRUE(uri.has_error()) << body;
		EXPECT_EQ(uri.error(), errc::bad_upstream_response) << body;
	}
}

TEST_F(ApiClientTest, NonOkStatusIsAnError) {
	http->on_get(kChannelUrl, 404, R"({"channel": {}})");
	auto uri = client.get_channel_thumbnail_uri("42");
	ASSERT_TRUE(uri.has_error());
	EXPECT_EQ(uri.error(), errc::bad_upstream_response);
}

TEST_F(ApiClientTest, TransportFailureIsReported) {
	auto uri = client.get_video_thumbnail_uri("77");
	ASSERT_TRUE(uri.has_error());
	EXPECT_EQ(uri.error(), errc::transport_error);
}

TEST_F(ApiClientTest, EmptyIdIsRejectedWithoutRequest) {
	auto channel = client.get_channel_thumbnail_uri("");
	ASSERT_TRUE(channel.has_error());
	EXPECT_EQ(channel.error(), errc::invalid_argument);

	auto video = client.get_video_thumbnail_uri("");
	ASSERT_TRUE(video.has_error());
	EXPECT_EQ(video.error(), errc::invalid_argument);
	EXPECT_TRUE(http->get_calls.empty());
}

TEST_F(ApiClientTest, IdIsEncodedInEndpoint) {
	auto uri = client.get_video_thumbnail_uri("a b/c");
	ASSERT_TRUE(uri.has_error());
	ASSERT_EQ(http->get_calls.size(), 1u);
	EXPECT_EQ(http->get_calls[0],
			  "https://api.video.ibm.com/videos/a%20b%2Fc.json");
}

TEST_F(ApiClientTest, ReturnsDefaultVideoThumbnail) {
	http->on_get(kVideoUrl, 200,
				 R"({"video": {"thumbnail": {"default": "https://x/t.jpg",
				 "small": "https://x/s.jpg"}}})");

	auto uri = client.get_video_thumbnail_uri("77");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "https://x/t.jpg");
}

TEST_F(ApiClientTest, VideoWithoutDefaultThumbnail) {
	for (const char *body :
		 {R"({"video": {}})", R"({"video": {"thumbnail": {"small": "s"}}})",
		  R"({"video": {"thumbnail": {"default": ""}}})"}) {
		http->on_get(kVideoUrl, 200, body);
		auto uri = client.get_video_thumbnail_uri("77");
		ASSERT_TRUE(uri.has_value()) << body;
		EXPECT_FALSE(uri.value().has_value()) << body;
	}
}

TEST_F(ApiClientTest, MalformedVideoEnvelopeIsAnError) {
	for (const char *body :
		 {R"({"channel": {}})", R"({"video": []})",
		  R"({"video": {"thumbnail": "x"}})"}) {
		http->on_get(kVideoUrl, 200, body);
		auto uri = client.get_video_thumbnail_uri("77");
		ASSERT_TRUE(uri.has_error()) << body;
		EXPECT_EQ(uri.error(), errc::bad_upstream_response) << body;
	}
}

TEST(ApiClientBaseUrlTest, HonoursConfiguredBaseUrl) {
	auto http = std::make_shared<test::FakeHttpClient>();
	api::ApiClient client(http, api::ApiOptions{"http://localhost:8080/api/"});
	http->on_get("http://localhost:8080/api/videos/9.json", 200,
				 R"({"video": {"thumbnail": {"default": "u"}}})");

	auto uri = client.get_video_thumbnail_uri("9");
	ASSERT_TRUE(uri.has_value());
	ASSERT_TRUE(uri.value().has_value());
	EXPECT_EQ(*uri.value(), "u");
}
