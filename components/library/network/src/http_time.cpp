/**
 * @file http_time.cpp
 * @brief HTTP time service client
 */

#include <network/http_time.hpp>

#include <esp_log.h>

#include <charconv>

namespace network {

namespace {

constexpr const char *TAG = "http_time";

/// Raw value text after "name": (quotes stripped for strings)
std::string_view extract_value(std::string_view json, std::string_view name) {
  size_t pos = 0;
  while (pos < json.size()) {
    auto quote = json.find('"', pos);
    if (quote == std::string_view::npos) {
      break;
    }
    auto end_quote = json.find('"', quote + 1);
    if (end_quote == std::string_view::npos) {
      break;
    }

    if (json.substr(quote + 1, end_quote - quote - 1) != name) {
      pos = end_quote + 1;
      continue;
    }

    auto value = json.find_first_not_of(" \t\r\n", end_quote + 1);
    if (value == std::string_view::npos || json[value] != ':') {
      pos = end_quote + 1;
      continue; // a string value equal to name, not a key
    }
    value = json.find_first_not_of(" \t\r\n", value + 1);
    if (value == std::string_view::npos) {
      break;
    }

    if (json[value] == '"') {
      auto close = json.find('"', value + 1);
      if (close == std::string_view::npos) {
        break;
      }
      return json.substr(value + 1, close - value - 1);
    }

    auto end = json.find_first_of(",} \t\r\n", value);
    return json.substr(value, end == std::string_view::npos ? end
                                                            : end - value);
  }
  return {};
}

template <typename T> bool parse_integer(std::string_view text, T &out) {
  if (text.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

core::Result<TimeApiReply> parse_time_api(std::string_view json) {
  TimeApiReply reply{};

  if (!parse_integer(extract_value(json, "unixtime"), reply.unixtime)) {
    ESP_LOGW(TAG, "No usable 'unixtime' in response");
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }

  reply.datetime = std::string(extract_value(json, "datetime"));
  if (!parse_integer(extract_value(json, "raw_offset"), reply.raw_offset)) {
    reply.raw_offset = 0;
  }
  return reply;
}

core::Result<int64_t> HttpTimeSource::fetch_unix_time() {
  auto response = transport_.send(transport::Request{
      .method = transport::HttpMethod::Get,
      .url = url_,
  });
  if (!response) {
    return core::Err(response.error());
  }
  if (!response->is_success()) {
    ESP_LOGW(TAG, "Time service returned %u", response->status_code());
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }

  auto reply = parse_time_api(response->body_str());
  if (!reply) {
    return core::Err(reply.error());
  }

  ESP_LOGD(TAG, "Service time %s (raw_offset %ld)", reply->datetime.c_str(),
           static_cast<long>(reply->raw_offset));
  return reply->unixtime;
}

} // namespace network
