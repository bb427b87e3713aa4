#pragma once

#include "hermit/common/result.hpp"
#include "hermit/common/time.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace hermit::store {

/// A conversation workspace ("group"). `root` is owned by this workspace
/// alone and is the only host directory the agent may write to.
struct Workspace {
  std::string name;
  std::string folder;
  std::filesystem::path root;
  std::string created_at;
};

struct Session {
  std::string id;
  std::string updated_at;
};

struct WorkspaceSummary {
  Workspace workspace;
  std::optional<Session> session;
  std::size_t active_tasks = 0;
};

enum class TaskStatus {
  Active,
  Completed,
};

[[nodiscard]] std::string task_status_to_string(TaskStatus status);

struct Task {
  std::string id;
  std::string workspace;
  std::string trigger;
  std::string prompt;
  common::TimePoint next_run{};
  std::optional<common::TimePoint> last_run;
  std::string last_result;
  TaskStatus status = TaskStatus::Active;
  std::string created_at;
};

struct NewTask {
  std::string workspace;
  std::string trigger;
  std::string prompt;
  common::TimePoint next_run{};
};

constexpr std::size_t MAX_TASK_RESULT_BYTES = 500;

/// Rejects empty names, path tricks and characters outside [A-Za-z0-9 _.-].
[[nodiscard]] common::Status validate_workspace_name(const std::string &name);

/// Folder derived from a workspace name: lower-cased, spaces become '-'.
[[nodiscard]] std::string workspace_folder(const std::string &name);

[[nodiscard]] std::filesystem::path transcript_path(const Workspace &workspace);
[[nodiscard]] std::filesystem::path memory_path(const Workspace &workspace);
[[nodiscard]] std::filesystem::path state_path(const Workspace &workspace);

/// Durable workspaces, sessions and scheduled tasks in one SQLite file.
/// All methods are safe to call from multiple threads.
class Store {
public:
  Store(std::filesystem::path db_path, std::filesystem::path groups_dir);
  ~Store();

  Store(const Store &) = delete;
  Store &operator=(const Store &) = delete;

  /// Whether the database opened and its schema is in place.
  [[nodiscard]] common::Status status() const;
  [[nodiscard]] const std::filesystem::path &groups_dir() const { return groups_dir_; }

  [[nodiscard]] common::Result<Workspace> get_or_create_workspace(const std::string &name);
  [[nodiscard]] common::Result<std::optional<Workspace>> find_workspace(const std::string &name);
  [[nodiscard]] common::Result<std::vector<WorkspaceSummary>> list_workspaces();
  /// Name of the workspace that owns `folder`, if any.
  [[nodiscard]] common::Result<std::optional<std::string>> folder_owner(const std::string &folder);

  [[nodiscard]] common::Result<std::optional<Session>> get_session(const std::string &name);
  [[nodiscard]] common::Status set_session(const std::string &name, const std::string &session_id);
  /// Returns true when a session existed and was removed.
  [[nodiscard]] common::Result<bool> clear_session(const std::string &name);

  [[nodiscard]] common::Result<std::string> add_task(const NewTask &task);
  [[nodiscard]] common::Result<std::optional<Task>> get_task(const std::string &id);
  [[nodiscard]] common::Result<std::vector<Task>>
  list_tasks(const std::optional<std::string> &workspace = std::nullopt);
  [[nodiscard]] common::Result<std::vector<Task>> due_tasks(common::TimePoint now);
  [[nodiscard]] common::Result<bool> delete_task(const std::string &id);

  /// Records a firing before the agent runs. One-shot tasks (no `next_run`)
  /// become completed; recurring ones move to `next_run`. Returns false when
  /// the task was no longer active and due, so each firing is claimed once.
  [[nodiscard]] common::Result<bool> claim_task(const std::string &id, common::TimePoint now,
                                                std::optional<common::TimePoint> next_run);
  [[nodiscard]] common::Status defer_task(const std::string &id, common::TimePoint next_run);
  [[nodiscard]] common::Status record_task_result(const std::string &id,
                                                  const std::string &result);

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status ensure_layout(const Workspace &workspace) const;
  [[nodiscard]] common::Result<std::optional<Workspace>> find_locked(const std::string &name);
  [[nodiscard]] common::Result<std::vector<Task>> read_tasks(sqlite3_stmt *stmt);
  [[nodiscard]] Workspace make_workspace(std::string name, std::string folder,
                                         std::string created_at) const;

  std::filesystem::path db_path_;
  std::filesystem::path groups_dir_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  mutable std::mutex mutex_;
};

} // namespace hermit::store
