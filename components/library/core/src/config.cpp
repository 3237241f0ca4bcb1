/**
 * @file config.cpp
 * @brief Configuration list parsing
 */

#include <core/config.hpp>

#include <esp_log.h>

#include <utility>

namespace core {

namespace {

constexpr const char *TAG = "config";

std::vector<std::string_view> split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t end = text.find(separator, start);
    if (end == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, end - start));
    start = end + 1;
  }
}

} // namespace

std::string_view trim(std::string_view text) {
  constexpr std::string_view whitespace = " \t\r\n";
  auto first = text.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

Result<std::vector<Record>> parse_records(std::string_view text,
                                          size_t field_count) {
  auto body = trim(text);
  if (body.empty()) {
    return Err(ESP_ERR_INVALID_ARG);
  }

  auto raw_records = split(body, RECORD_SEPARATOR);
  if (raw_records.size() > 1 && trim(raw_records.back()).empty()) {
    raw_records.pop_back();
  }

  std::vector<Record> records;
  records.reserve(raw_records.size());

  for (size_t i = 0; i < raw_records.size(); ++i) {
    auto fields = split(raw_records[i], FIELD_SEPARATOR);
    if (fields.size() != field_count) {
      ESP_LOGE(TAG, "Entry %zu has %zu field(s), expected %zu", i,
               fields.size(), field_count);
      return Err(ESP_ERR_INVALID_ARG);
    }

    Record record;
    record.reserve(field_count);
    for (auto field : fields) {
      record.emplace_back(trim(field));
    }
    records.push_back(std::move(record));
  }

  return records;
}

std::vector<std::string> parse_list(std::string_view text) {
  std::vector<std::string> items;
  for (auto item : split(text, FIELD_SEPARATOR)) {
    auto trimmed = trim(item);
    if (!trimmed.empty()) {
      items.emplace_back(trimmed);
    }
  }
  return items;
}

} // namespace core
