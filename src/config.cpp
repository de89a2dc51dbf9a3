#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <fstream>
#include <ibmvideo/config.hpp>

namespace po = boost::program_options;

namespace ibmvideo {

namespace {

bool is_known_log_level(const std::string &name) {
	return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

}  // namespace

Config default_config() { return Config{}; }

po::options_description config_options() {
	po::options_description desc("Configuration");
	// clang-format off
	desc.add_options()
		("cache.thumbnails_directory", po::value<std::string>(),
		 "Directory of the local thumbnail cache")
		("cache.max_index_entries", po::value<int>(),
		 "Cached file paths kept in memory (0 disables the index)")
		("http.timeout_seconds", po::value<int>(),
		 "Per-request HTTP timeout in seconds")
		("http.max_redirects", po::value<int>(),
		 "Maximum number of redirects followed per request")
		("http.user_agent", po::value<std::string>(),
		 "User-Agent sent with every request")
		("api.base_url", po::value<std::string>(),
		 "Base URL of the IBM Video REST API")
		("log.level", po::value<std::string>(),
		 "Log level (trace, debug, info, warn, error, critical, off)");
	// clang-format on
	return desc;
}

Result<Config> apply_options(Config base, const po::variables_map &vm) {
	if (vm.count("cache.thumbnails_directory")) {
		base.cache.thumbnails_directory =
			vm["cache.thumbnails_directory"].as<std::string>();
		if (base.cache.thumbnails_directory.empty()) {
			spdlog::error("cache.thumbnails_directory must not be empty");
			return outcome::failure(errc::configuration_error);
		}
	}

	if (vm.count("cache.max_index_entries")) {
		int entries = vm["cache.max_index_entries"].as<int>();
		if (entries < 0) {
			spdlog::error("cache.max_index_entries must not be negative, got {}",
						  entries);
			return outcome::failure(errc::configuration_error);
		}
		base.cache.max_index_entries = static_cast<std::size_t>(entries);
	}

	if (vm.count("http.timeout_seconds")) {
		int seconds = vm["http.timeout_seconds"].as<int>();
		if (seconds <= 0) {
			spdlog::error("http.timeout_seconds must be positive, got {}",
						  seconds);
			return outcome::failure(errc::configuration_error);
		}
		base.http.timeout = std::chrono::seconds(seconds);
	}

	if (vm.count("http.max_redirects")) {
		int redirects = vm["http.max_redirects"].as<int>();
		if (redirects < 0) {
			spdlog::error("http.max_redirects must not be negative, got {}",
						  redirects);
			return outcome::failure(errc::configuration_error);
		}
		base.http.max_redirects = redirects;
	}

	if (vm.count("http.user_agent")) {
		base.http.user_agent = vm["http.user_agent"].as<std::string>();
	}

	if (vm.count("api.base_url")) {
		base.api.base_url = vm["api.base_url"].as<std::string>();
		if (base.api.base_url.empty()) {
			spdlog::error("api.base_url must not be empty");
			return outcome::failure(errc::configuration_error);
		}
	}

	if (vm.count("log.level")) {
		base.log_level = vm["log.level"].as<std::string>();
		if (!is_known_log_level(base.log_level)) {
			spdlog::error("Unknown log.level '{}'", base.log_level);
			return outcome::failure(errc::configuration_error);
		}
	}

	return base;
}

Result<Config> load_config(const std::filesystem::path &path) {
	std::ifstream file(path);
	if (!file) {
		spdlog::error("Cannot open config file {}", path.string());
		return outcome::failure(errc::configuration_error);
	}

	po::variables_map vm;
	try {
		po::store(po::parse_config_file(file, config_options(), false), vm);
		po::notify(vm);
	} catch (const po::error &e) {
		spdlog::error("Invalid config file {}: {}", path.string(), e.what());
		return outcome::failure(errc::configuration_error);
	}

	spdlog::debug("Loaded config file {}", path.string());
	return apply_options(default_config(), vm);
}

}  // namespace ibmvideo
