/**
 * @file record.cpp
 * @brief Record rendering and encoding
 */

#include "report/record.hpp"

#include <mbedtls/base64.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <iterator>

namespace report {

namespace {

void append_json_string(std::string &out, std::string_view text) {
  out.push_back('"');
  for (char c : text) {
    switch (c) {
    case '"':
      out.append("\\\"");
      break;
    case '\\':
      out.append("\\\\");
      break;
    case '\n':
      out.append("\\n");
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char escaped[7];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                      static_cast<unsigned>(c));
        out.append(escaped);
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  out.push_back('"');
}

} // namespace

std::string recover_token(std::string_view body) {
  std::string token;
  token.reserve(body.size());
  std::copy_if(body.rbegin(), body.rend(), std::back_inserter(token),
               [](char c) { return c != '\n'; });
  return token;
}

std::string format_celsius(float celsius) {
  std::array<char, 32> text{};
  auto [end, ec] =
      std::to_chars(text.data(), text.data() + text.size(), celsius);
  if (ec != std::errc{}) {
    return "nan";
  }
  std::string out(text.data(), end);
  // Whole degrees keep one decimal: 25.0, not 25
  if (out.find_first_of(".en") == std::string::npos) {
    out.append(".0");
  }
  return out;
}

std::string render_record(const sensor::Measurement &m) {
  auto stamp = core::format_stamp(m.timestamp);
  std::string record = "---\nsensor_id: ";
  record.append(m.sensor_id);
  record.append("\ntemperature: ");
  record.append(format_celsius(m.temperature));
  record.append("\nmeasurement_time: ");
  record.append(stamp.data());
  record.append("\n---\n{}\n");
  return record;
}

std::string object_path(std::string_view sensor_id, std::string_view stamp) {
  std::string path(content_store::POSTS_DIR);
  path.push_back('/');
  path.append(sensor_id);
  path.push_back('/');
  path.append(stamp);
  path.push_back('_');
  path.append(sensor_id);
  path.append(content_store::OBJECT_SUFFIX);
  return path;
}

core::Result<std::string> encode_base64(std::string_view data) {
  const auto *src = reinterpret_cast<const unsigned char *>(data.data());

  // First call reports the required size, terminator included
  size_t needed = 0;
  int rc = mbedtls_base64_encode(nullptr, 0, &needed, src, data.size());
  if (rc != 0 && rc != MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL) {
    return core::Err(ESP_FAIL);
  }

  std::string encoded(needed, '\0');
  size_t written = 0;
  rc = mbedtls_base64_encode(reinterpret_cast<unsigned char *>(encoded.data()),
                             encoded.size(), &written, src, data.size());
  if (rc != 0) {
    return core::Err(ESP_ERR_NO_MEM);
  }
  encoded.resize(written);
  return encoded;
}

std::string put_body(std::string_view path, std::string_view content) {
  std::string message = "Updating ";
  message.append(path);

  std::string body = "{\"message\":";
  append_json_string(body, message);
  body.append(",\"content\":");
  append_json_string(body, content);
  body.push_back('}');
  return body;
}

} // namespace report
