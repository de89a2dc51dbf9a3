#include <gtest/gtest.h>

#include <ibmvideo/embed_url.hpp>
#include <ibmvideo/video_data.hpp>
#include <nlohmann/json.hpp>

using namespace ibmvideo;
using nlohmann::json;

TEST(VideoDataTest, SerializeProducesCanonicalKeys) {
	auto result = data::serialize({"abc", true}, std::string("tok"));
	ASSERT_TRUE(result.has_value());

	auto j = json::parse(result.value());
	EXPECT_EQ(j.size(), 3u);
	EXPECT_EQ(j["id"], "abc");
	EXPECT_EQ(j["is_recorded"], true);
	EXPECT_EQ(j["thumbnail_reference_id"], "tok");
}

TEST(VideoDataTest, SerializeMintsTokenWhenMissing) {
	auto first = data::serialize({"abc", false});
	auto second = data::serialize({"abc", false});
	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(second.has_value());

	auto a = json::parse(first.value())["thumbnail_reference_id"].get<std::string>();
	auto b = json::parse(second.value())["thumbnail_reference_id"].get<std::string>();
	EXPECT_FALSE(a.empty());
	EXPECT_NE(a, b);
}

TEST(VideoDataTest, SerializeRejectsEmptyValues) {
	auto no_id = data::serialize({"", true});
	ASSERT_TRUE(no_id.has_error());
	EXPECT_EQ(no_id.error(), errc::invalid_argument);

	auto no_token = data::serialize({"abc", true}, std::string());
	ASSERT_TRUE(no_token.has_error());
	EXPECT_EQ(no_token.error(), errc::invalid_argument);
}

TEST(VideoDataTest, GeneratedTokenIsBase64OfEightBytes) {
	auto token = data::generate_thumbnail_reference_id();
	// 8 bytes -> 12 base64 characters including one "=" of padding.
	EXPECT_EQ(token.size(), 12u);
	EXPECT_EQ(token.back(), '=');
}

TEST(VideoDataTest, TryDeserializeRejectsBadJson) {
	auto result = data::try_deserialize("not json");
	ASSERT_TRUE(result.has_error());
	EXPECT_EQ(result.error(), errc::bad_json);

	auto array = data::try_deserialize("[1, 2, 3]");
	ASSERT_TRUE(array.has_error());
	EXPECT_EQ(array.error(), errc::bad_json);
}

TEST(VideoDataTest, TryDeserializeRejectsWrongKeySet) {
	auto missing = data::try_deserialize(R"({"id":"x","is_recorded":true})");
	ASSERT_TRUE(missing.has_error());
	EXPECT_EQ(missing.error(), errc::invalid_key_set);

	auto extra = data::try_deserialize(
		R"({"id":"x","is_recorded":true,"thumbnail_reference_id":"t","more":1})");
	ASSERT_TRUE(extra.has_error());
	EXPECT_EQ(extra.error(), errc::invalid_key_set);

	auto renamed = data::try_deserialize(
		R"({"id":"x","isRecorded":true,"thumbnail_reference_id":"t"})");
	ASSERT_TRUE(renamed.has_error());
	EXPECT_EQ(renamed.error(), errc::invalid_key_set);
}

TEST(VideoDataTest, TryDeserializeKeepsValuesUnchecked) {
	auto result = data::try_deserialize(
		R"({"id":5,"is_recorded":"yes","thumbnail_reference_id":null})");
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result.value().id, 5);

	auto violations = data::validate(result.value());
	ASSERT_EQ(violations.size(), 3u);
	EXPECT_EQ(violations[0].field, "id");
	EXPECT_EQ(violations[1].field, "is_recorded");
	EXPECT_EQ(violations[2].field, "thumbnail_reference_id");

	auto video = data::to_video_data(result.value());
	ASSERT_TRUE(video.has_error());
	EXPECT_EQ(video.error(), errc::invalid_format);
}

TEST(VideoDataTest, EmptyStringsAreViolations) {
	auto result = data::try_deserialize(
		R"({"id":"","is_recorded":false,"thumbnail_reference_id":""})");
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(data::validate(result.value()).size(), 2u);
}

TEST(VideoDataTest, ToVideoDataOnValidInput) {
	auto raw = data::try_deserialize(
		R"({"thumbnail_reference_id":"tok","id":"abc","is_recorded":false})");
	ASSERT_TRUE(raw.has_value());
	EXPECT_TRUE(data::validate(raw.value()).empty());

	auto video = data::to_video_data(raw.value());
	ASSERT_TRUE(video.has_value());
	EXPECT_EQ(video.value().id, "abc");
	EXPECT_FALSE(video.value().is_recorded);
	EXPECT_EQ(video.value().thumbnail_reference_id, "tok");
}

TEST(VideoDataTest, PrepareForSaveKeepsTokenForSameReference) {
	auto previous = data::serialize({"abc", true}, std::string("keep-me"));
	ASSERT_TRUE(previous.has_value());

	auto saved = data::prepare_for_save({"abc", true}, previous.value());
	ASSERT_TRUE(saved.has_value());
	EXPECT_EQ(json::parse(saved.value())["thumbnail_reference_id"], "keep-me");
}

TEST(VideoDataTest, PrepareForSaveMintsTokenForNewReference) {
	auto previous = data::serialize({"abc", true}, std::string("old"));
	ASSERT_TRUE(previous.has_value());

	auto other_id = data::prepare_for_save({"def", true}, previous.value());
	ASSERT_TRUE(other_id.has_value());
	EXPECT_NE(json::parse(other_id.value())["thumbnail_reference_id"], "old");

	auto other_kind = data::prepare_for_save({"abc", false}, previous.value());
	ASSERT_TRUE(other_kind.has_value());
	EXPECT_NE(json::parse(other_kind.value())["thumbnail_reference_id"], "old");
}

TEST(VideoDataTest, PrepareForSaveIgnoresUnusablePreviousValue) {
	auto saved = data::prepare_for_save({"abc", true}, "garbage");
	ASSERT_TRUE(saved.has_value());

	auto raw = data::try_deserialize(saved.value());
	ASSERT_TRUE(raw.has_value());
	EXPECT_TRUE(data::validate(raw.value()).empty());
}

TEST(VideoDataTest, SubmittedUrlBecomesStoredData) {
	auto ref = url::parse("https://video.ibm.com/embed/recorded/XyZ123?foo=bar");
	ASSERT_TRUE(ref.has_value());
	EXPECT_EQ(ref.value().id, "XyZ123");
	EXPECT_TRUE(ref.value().is_recorded);

	auto stored = data::prepare_for_save(ref.value());
	ASSERT_TRUE(stored.has_value());

	auto raw = data::try_deserialize(stored.value());
	ASSERT_TRUE(raw.has_value());
	auto video = data::to_video_data(raw.value());
	ASSERT_TRUE(video.has_value());
	EXPECT_FALSE(video.value().thumbnail_reference_id.empty());

	auto assembled = url::assemble(video.value().reference(), "//");
	ASSERT_TRUE(assembled.has_value());
	EXPECT_EQ(assembled.value(), "//video.ibm.com/embed/recorded/XyZ123");
}
