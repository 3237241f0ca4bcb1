/**
 * @file record.hpp
 * @brief Content-store record format and request pieces
 *
 * One object per measurement, never overwritten:
 *   PUT {contents}/_posts/{id}/{stamp}_{id}.html
 *   {"message": "Updating <path>", "content": base64(record)}
 */

#pragma once

#include <core/result.hpp>
#include <sensor/measurement.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace report {

namespace content_store {
inline constexpr std::string_view POSTS_DIR = "_posts";
inline constexpr std::string_view OBJECT_SUFFIX = ".html";
inline constexpr std::string_view ACCEPT_HEADER = "Accept";
inline constexpr std::string_view ACCEPT = "application/vnd.github + json";

inline constexpr uint16_t STATUS_UPDATED = 200;
inline constexpr uint16_t STATUS_CREATED = 201;
} // namespace content_store

/// Only 200 and 201 count as stored
[[nodiscard]] constexpr bool is_stored(uint16_t status_code) {
  return status_code == content_store::STATUS_UPDATED ||
         status_code == content_store::STATUS_CREATED;
}

/// The token is published reversed: drop newlines, then reverse
[[nodiscard]] std::string recover_token(std::string_view body);

/// Shortest text that reads back as the same float; whole values keep
/// one decimal
[[nodiscard]] std::string format_celsius(float celsius);

/// Front-matter text block for one measurement
[[nodiscard]] std::string render_record(const sensor::Measurement &m);

/// "_posts/{id}/{stamp}_{id}.html"
[[nodiscard]] std::string object_path(std::string_view sensor_id,
                                      std::string_view stamp);

/// Standard base64 with padding
[[nodiscard]] core::Result<std::string> encode_base64(std::string_view data);

/// JSON body of the PUT
[[nodiscard]] std::string put_body(std::string_view path,
                                   std::string_view content);

} // namespace report
