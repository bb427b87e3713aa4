#include "hermit/store/transcript.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/json_util.hpp"
#include "hermit/common/time.hpp"

#include <deque>
#include <fstream>
#include <sstream>

namespace hermit::store {

std::string role_to_string(const TranscriptRole role) {
  switch (role) {
  case TranscriptRole::User:
    return "user";
  case TranscriptRole::Assistant:
    return "assistant";
  case TranscriptRole::System:
    return "system";
  }
  return "user";
}

TranscriptRole role_from_string(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "assistant") {
    return TranscriptRole::Assistant;
  }
  if (normalized == "system") {
    return TranscriptRole::System;
  }
  return TranscriptRole::User;
}

std::string encode_transcript_entry_jsonl(const TranscriptEntry &entry) {
  std::ostringstream out;
  out << "{\"role\":" << common::json_quote(role_to_string(entry.role))
      << ",\"content\":" << common::json_quote(entry.content)
      << ",\"timestamp\":" << common::json_quote(entry.timestamp);
  if (!entry.metadata.empty()) {
    out << ",\"metadata\":{";
    bool first = true;
    for (const auto &[key, value] : entry.metadata) {
      if (!first) {
        out << ",";
      }
      first = false;
      out << common::json_quote(key) << ":" << common::json_quote(value);
    }
    out << "}";
  }
  out << "}";
  return out.str();
}

common::Result<TranscriptEntry> parse_transcript_entry_jsonl(const std::string &line) {
  if (common::trim(line).empty()) {
    return common::Result<TranscriptEntry>::failure("empty transcript line");
  }
  if (!common::json_is_object(line)) {
    return common::Result<TranscriptEntry>::failure("transcript line is not a JSON object");
  }
  const auto fields = common::json_parse_flat(line);
  const auto role = fields.find("role");
  if (role == fields.end() || role->second.empty()) {
    return common::Result<TranscriptEntry>::failure("transcript role missing");
  }

  TranscriptEntry entry;
  entry.role = role_from_string(role->second);
  if (const auto it = fields.find("content"); it != fields.end()) {
    entry.content = it->second;
  }
  if (const auto it = fields.find("timestamp"); it != fields.end()) {
    entry.timestamp = it->second;
  }
  if (const auto it = fields.find("metadata"); it != fields.end()) {
    for (auto &[key, value] : common::json_parse_flat(it->second)) {
      entry.metadata.emplace(key, value);
    }
  }
  return common::Result<TranscriptEntry>::success(std::move(entry));
}

common::Status append_transcript(const std::filesystem::path &path, TranscriptEntry entry) {
  if (entry.timestamp.empty()) {
    entry.timestamp = common::now_rfc3339();
  }
  return common::append_line(path, encode_transcript_entry_jsonl(entry));
}

common::Result<std::vector<TranscriptEntry>>
read_transcript_tail(const std::filesystem::path &path, const std::size_t limit) {
  std::vector<TranscriptEntry> out;
  std::error_code ec;
  if (limit == 0 || !std::filesystem::exists(path, ec)) {
    return common::Result<std::vector<TranscriptEntry>>::success(std::move(out));
  }

  std::ifstream in(path);
  if (!in) {
    return common::Result<std::vector<TranscriptEntry>>::failure("Unable to open transcript: " +
                                                                 path.string());
  }
  std::deque<TranscriptEntry> window;
  std::string line;
  while (std::getline(in, line)) {
    auto parsed = parse_transcript_entry_jsonl(line);
    if (!parsed.ok()) {
      continue;
    }
    window.push_back(std::move(parsed.value()));
    if (window.size() > limit) {
      window.pop_front();
    }
  }
  out.assign(std::make_move_iterator(window.begin()), std::make_move_iterator(window.end()));
  return common::Result<std::vector<TranscriptEntry>>::success(std::move(out));
}

} // namespace hermit::store
