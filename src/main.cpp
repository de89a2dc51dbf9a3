#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <ibmvideo/api_client.hpp>
#include <ibmvideo/config.hpp>
#include <ibmvideo/embed_url.hpp>
#include <ibmvideo/http_client.hpp>
#include <ibmvideo/thumbnail_cache.hpp>
#include <ibmvideo/video_data.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr const char *kUsage =
	"Usage: ibmvideo <command> [args] [options]\n"
	"\n"
	"Commands:\n"
	"  validate <url>               Check an embed URL\n"
	"  parse <url>                  Print the ID and recorded flag of an embed "
	"URL\n"
	"  assemble --id <id>           Build an embed URL\n"
	"  encode-data <url>            Print the video data JSON for an embed URL\n"
	"  decode-data <json>           Check and print video data JSON\n"
	"  thumbnail <json>             Download (or find) the local thumbnail\n"
	"  permalink <channel> <video>  Build a channel video permalink\n";

int fail(std::error_code ec) {
	fmt::println(stderr, "ERROR: {}", ec.message());
	return 1;
}

// Positional arguments after the command name
std::vector<std::string> command_args(const po::variables_map &vm) {
	if (!vm.count("args")) return {};
	return vm["args"].as<std::vector<std::string>>();
}

bool expect_args(const std::vector<std::string> &args, size_t count,
				 std::string_view usage) {
	if (args.size() == count) return true;
	fmt::println(stderr, "Usage: ibmvideo {}", usage);
	return false;
}

int cmd_validate(const std::vector<std::string> &args) {
	if (!expect_args(args, 1, "validate <url>")) return 1;
	bool valid = ibmvideo::url::is_valid(args[0]);
	fmt::println("{}", valid ? "valid" : "invalid");
	return valid ? 0 : 1;
}

int cmd_parse(const std::vector<std::string> &args) {
	if (!expect_args(args, 1, "parse <url>")) return 1;
	auto ref = ibmvideo::url::parse(args[0]);
	if (ref.has_error()) return fail(ref.error());
	fmt::println("id: {}", ref.value().id);
	fmt::println("recorded: {}", ref.value().is_recorded);
	return 0;
}

int cmd_assemble(const po::variables_map &vm) {
	if (!vm.count("id")) {
		fmt::println(stderr, "Usage: ibmvideo assemble --id <id> [--recorded] "
							 "[--scheme <scheme>] [--with-params ...]");
		return 1;
	}

	ibmvideo::EmbedReference ref{vm["id"].as<std::string>(),
								 vm.count("recorded") > 0};

	std::optional<ibmvideo::EmbedUrlParameters> params;
	if (vm.count("with-params")) {
		params.emplace();
		if (vm.count("volume")) {
			int volume = vm["volume"].as<int>();
			if (!ibmvideo::EmbedUrlParameters::is_initial_volume_valid(volume)) {
				return fail(make_error_code(ibmvideo::errc::invalid_argument));
			}
			params->set_initial_volume(volume);
		}
		if (vm.count("quality")) {
			auto quality = ibmvideo::url::parse_default_quality(
				vm["quality"].as<std::string>());
			if (quality.has_error()) return fail(quality.error());
			params->set_default_quality(quality.value());
		}
		if (vm.count("wmode")) {
			auto mode = ibmvideo::url::parse_wmode(vm["wmode"].as<std::string>());
			if (mode.has_error()) return fail(mode.error());
			params->set_wmode(mode.value());
		}
		params->set_use_autoplay(vm.count("autoplay") > 0)
			.set_show_title(vm.count("no-title") == 0)
			.set_use_html5_ui(vm.count("no-html5") == 0);
	}

	auto url = ibmvideo::url::assemble(ref, vm["scheme"].as<std::string>(),
									   params ? &*params : nullptr);
	if (url.has_error()) return fail(url.error());
	fmt::println("{}", url.value());
	return 0;
}

int cmd_encode_data(const std::vector<std::string> &args,
					const po::variables_map &vm) {
	if (!expect_args(args, 1, "encode-data <url> [--token <token>]")) return 1;
	auto ref = ibmvideo::url::parse(args[0]);
	if (ref.has_error()) return fail(ref.error());

	std::optional<std::string> token;
	if (vm.count("token")) token = vm["token"].as<std::string>();

	auto json = ibmvideo::data::serialize(ref.value(), token);
	if (json.has_error()) return fail(json.error());
	fmt::println("{}", json.value());
	return 0;
}

int cmd_decode_data(const std::vector<std::string> &args) {
	if (!expect_args(args, 1, "decode-data <json>")) return 1;
	auto raw = ibmvideo::data::try_deserialize(args[0]);
	if (raw.has_error()) return fail(raw.error());

	auto violations = ibmvideo::data::validate(raw.value());
	if (!violations.empty()) {
		for (const auto &v : violations) {
			fmt::println(stderr, "{}: {}", v.field, v.message);
		}
		return fail(make_error_code(ibmvideo::errc::invalid_format));
	}

	auto data = ibmvideo::data::to_video_data(raw.value());
	if (data.has_error()) return fail(data.error());
	fmt::println("id: {}", data.value().id);
	fmt::println("recorded: {}", data.value().is_recorded);
	fmt::println("thumbnail reference id: {}",
				 data.value().thumbnail_reference_id);
	return 0;
}

int cmd_thumbnail(const std::vector<std::string> &args,
				  const ibmvideo::Config &config) {
	if (!expect_args(args, 1, "thumbnail <json>")) return 1;
	auto raw = ibmvideo::data::try_deserialize(args[0]);
	if (raw.has_error()) return fail(raw.error());
	auto data = ibmvideo::data::to_video_data(raw.value());
	if (data.has_error()) return fail(data.error());

	auto http = std::make_shared<ibmvideo::net::BeastHttpClient>(config.http);
	auto api = std::make_shared<ibmvideo::api::ApiClient>(http, config.api);
	ibmvideo::cache::ThumbnailCache cache(config.cache, http, api);

	auto path = cache.resolve(data.value());
	if (path.has_error()) return fail(path.error());
	if (!path.value()) {
		fmt::println(stderr, "No thumbnail available");
		return 1;
	}
	fmt::println("{}", path.value()->string());
	return 0;
}

int cmd_permalink(const std::vector<std::string> &args,
				  const po::variables_map &vm) {
	if (!expect_args(args, 2, "permalink <channel> <video>")) return 1;
	auto url = ibmvideo::url::assemble_permalink(
		args[0], args[1], vm["scheme"].as<std::string>());
	if (url.has_error()) return fail(url.error());
	fmt::println("{}", url.value());
	return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto logger = spdlog::stderr_color_mt("ibmvideo");
		spdlog::set_default_logger(logger);
		spdlog::set_pattern("[%l] %v");

		// Parse command line
		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("command", po::value<std::string>(), "Command to run")
			("args", po::value<std::vector<std::string>>(), "Command arguments")
			("config,c", po::value<std::string>(), "Config file")
			("verbose,v", "Enable verbose logging")
			// assemble / permalink
			("id", po::value<std::string>(), "Video or channel ID")
			("recorded", "The ID is a recorded video ID")
			("scheme", po::value<std::string>()->default_value(""),
			 "URL scheme prefix (https://, http://, // or empty)")
			("with-params", "Append player parameters")
			("volume", po::value<int>(), "Initial volume (0-100)")
			("quality", po::value<std::string>(),
			 "Default quality (low, medium, high)")
			("wmode", po::value<std::string>(),
			 "Flash window mode (direct, opaque, transparent, window)")
			("autoplay", "Start playing automatically")
			("no-title", "Hide the video title")
			("no-html5", "Use the non-HTML5 player UI")
			// encode-data
			("token", po::value<std::string>(), "Thumbnail reference ID");
		// clang-format on
		desc.add(ibmvideo::config_options());

		po::positional_options_description p;
		p.add("command", 1);
		p.add("args", -1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		po::notify(vm);

		if (vm.count("help") || !vm.count("command")) {
			std::cout << kUsage << "\n" << desc << "\n";
			return vm.count("help") ? 0 : 1;
		}

		ibmvideo::Config base = ibmvideo::default_config();
		if (vm.count("config")) {
			auto loaded = ibmvideo::load_config(vm["config"].as<std::string>());
			if (loaded.has_error()) return fail(loaded.error());
			base = std::move(loaded).value();
		}
		auto config = ibmvideo::apply_options(std::move(base), vm);
		if (config.has_error()) return fail(config.error());

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else {
			spdlog::set_level(spdlog::level::from_str(config.value().log_level));
		}

		const auto command = vm["command"].as<std::string>();
		const auto args = command_args(vm);

		if (command == "validate") return cmd_validate(args);
		if (command == "parse") return cmd_parse(args);
		if (command == "assemble") return cmd_assemble(vm);
		if (command == "encode-data") return cmd_encode_data(args, vm);
		if (command == "decode-data") return cmd_decode_data(args);
		if (command == "thumbnail") return cmd_thumbnail(args, config.value());
		if (command == "permalink") return cmd_permalink(args, vm);

		fmt::println(stderr, "Unknown command: {}\n\n{}", command, kUsage);
		return 1;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
