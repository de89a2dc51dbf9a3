#pragma once

#include <boost/charconv.hpp>
#include <ibmvideo/result.hpp>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace ibmvideo::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

// The whole of `sv` must be consumed.
template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	const char *last = sv.data() + sv.size();
	auto res = boost::charconv::from_chars(sv.data(), last, val);
	if (res.ec == std::errc{} && res.ptr == last) { return val; }
	return make_error_code(errc::invalid_format);
}

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

// =============================================================================
// JSON Traversal Utilities
// =============================================================================

namespace detail {

template <typename Json>
const Json *traverse(const Json *j,
					 std::initializer_list<std::string_view> path) {
	for (const auto &key : path) {
		if (!j || !j->is_object()) return nullptr;
		auto it = j->find(std::string(key));
		if (it == j->end()) return nullptr;
		j = &*it;
	}
	return j;
}

}  // namespace detail

/// Node at the given key path, or nullptr if any step is missing or is not
/// an object.
///
/// Usage:
///   const auto *picture = find_node(doc, {"channel", "picture"});
template <typename Json>
const Json *find_node(const Json &j,
					  std::initializer_list<std::string_view> path) {
	return detail::traverse(&j, path);
}

/// Traverse a JSON object (nlohmann::json or ordered_json) using a path of
/// keys.
/// Returns std::nullopt if path doesn't exist or the value has another type.
template <typename T, typename Json>
std::optional<T> traverse_obj(const Json &j,
							  std::initializer_list<std::string_view> path) {
	const Json *result = detail::traverse(&j, path);
	if (!result) return std::nullopt;

	try {
		return result->template get<T>();
	} catch (const nlohmann::json::exception &) { return std::nullopt; }
}

}  // namespace ibmvideo::utils
