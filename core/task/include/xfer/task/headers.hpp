#pragma once

/**
 * @file headers.hpp
 * @brief Request headers carried as a JSON object string
 */

#include <xfer/common/error.hpp>

#include <map>
#include <string>
#include <string_view>

namespace xfer::task {

using HeaderMap = std::map<std::string, std::string>;

/**
 * @brief Strict parse: MALFORMED_DATA for bad JSON, FORMAT_INVALID for a non-object
 *
 * An empty string is an empty map. Members whose value is not a string are skipped.
 */
common::Result<HeaderMap> try_parse_headers_json(std::string_view json);

/**
 * @brief Tolerant parse: anything try_parse_headers_json() rejects becomes an empty
 *        map and a warning
 */
HeaderMap parse_headers_json(std::string_view json);

/// Compact JSON object
std::string headers_to_json(const HeaderMap& headers);

}  // namespace xfer::task
