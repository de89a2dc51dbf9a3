#pragma once

#include <ibmvideo/ibmvideo_export.h>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <filesystem>
#include <ibmvideo/api_client.hpp>
#include <ibmvideo/http_client.hpp>
#include <ibmvideo/result.hpp>
#include <ibmvideo/thumbnail_cache.hpp>
#include <string>

namespace ibmvideo {

struct IBMVIDEO_EXPORT Config {
	cache::CacheConfig cache;
	net::HttpOptions http;
	api::ApiOptions api;
	std::string log_level = "info";
};

IBMVIDEO_EXPORT Config default_config();

/// The settings shared by config files and the command line:
/// cache.thumbnails_directory, cache.max_index_entries, http.timeout_seconds,
/// http.max_redirects, http.user_agent, api.base_url and log.level. None has a default value,
/// so only what was actually given overrides a Config.
IBMVIDEO_EXPORT boost::program_options::options_description config_options();

/// Copies every setting present in `vm` over `base`. Fails with
/// errc::configuration_error on an out-of-range or unknown value.
IBMVIDEO_EXPORT Result<Config> apply_options(
	Config base, const boost::program_options::variables_map &vm);

/// Reads an INI-style file ("[http]\ntimeout_seconds = 10") on top of
/// default_config(). Unknown keys are rejected with errc::configuration_error.
IBMVIDEO_EXPORT Result<Config> load_config(const std::filesystem::path &path);

}  // namespace ibmvideo
