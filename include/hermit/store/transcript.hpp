#pragma once

#include "hermit/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hermit::store {

enum class TranscriptRole {
  User,
  Assistant,
  System,
};

[[nodiscard]] std::string role_to_string(TranscriptRole role);
[[nodiscard]] TranscriptRole role_from_string(std::string_view value);

/// One line of a workspace's `history.jsonl`.
struct TranscriptEntry {
  TranscriptRole role = TranscriptRole::User;
  std::string content;
  std::string timestamp;
  std::map<std::string, std::string> metadata;
};

[[nodiscard]] std::string encode_transcript_entry_jsonl(const TranscriptEntry &entry);
[[nodiscard]] common::Result<TranscriptEntry> parse_transcript_entry_jsonl(const std::string &line);

/// Appends `entry`, stamping the timestamp when it is empty.
[[nodiscard]] common::Status append_transcript(const std::filesystem::path &path,
                                               TranscriptEntry entry);

/// Last `limit` well-formed entries, oldest first. A missing file is empty.
[[nodiscard]] common::Result<std::vector<TranscriptEntry>>
read_transcript_tail(const std::filesystem::path &path, std::size_t limit);

} // namespace hermit::store
