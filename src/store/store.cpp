#include "hermit/store/store.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/random.hpp"

#include <cctype>
#include <fstream>

namespace hermit::store {

namespace {

constexpr const char *NOT_OPEN = "store not initialized";
constexpr std::size_t MAX_NAME_LENGTH = 64;
constexpr int TASK_ID_ATTEMPTS = 8;

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

/// Finalizes the wrapped statement on scope exit.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      error_ = sqlite3_errmsg(db);
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

  void bind(int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(int index, std::int64_t value) { sqlite3_bind_int64(stmt_, index, value); }

private:
  sqlite3_stmt *stmt_ = nullptr;
  std::string error_;
};

/// BEGIN IMMEDIATE on construction, ROLLBACK unless committed.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) {
    begin_status_ = exec_sql(db_, "BEGIN IMMEDIATE");
  }
  ~Transaction() {
    if (begin_status_.ok() && !done_) {
      (void)exec_sql(db_, "ROLLBACK");
    }
  }
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  [[nodiscard]] const common::Status &begin_status() const { return begin_status_; }
  [[nodiscard]] common::Status commit() {
    done_ = true;
    return exec_sql(db_, "COMMIT");
  }

private:
  sqlite3 *db_;
  common::Status begin_status_ = common::Status::success();
  bool done_ = false;
};

std::string column_text(sqlite3_stmt *stmt, int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  return text == nullptr ? std::string() : std::string(text);
}

std::string truncate_utf8(const std::string &text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

TaskStatus task_status_from_string(const std::string &value) {
  return value == "completed" ? TaskStatus::Completed : TaskStatus::Active;
}

constexpr const char *TASK_COLUMNS =
    "id, group_name, cron, prompt, next_run, last_run, last_result, status, created_at";

} // namespace

std::string task_status_to_string(const TaskStatus status) {
  switch (status) {
  case TaskStatus::Active:
    return "active";
  case TaskStatus::Completed:
    return "completed";
  }
  return "active";
}

common::Status validate_workspace_name(const std::string &name) {
  if (name.empty()) {
    return common::Status::error("workspace name is empty");
  }
  if (name.size() > MAX_NAME_LENGTH) {
    return common::Status::error("workspace name is longer than 64 characters");
  }
  if (std::isalnum(static_cast<unsigned char>(name.front())) == 0) {
    return common::Status::error("workspace name must start with a letter or digit");
  }
  if (name.find("..") != std::string::npos) {
    return common::Status::error("workspace name must not contain '..'");
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) == 0 && ch != ' ' && ch != '_' && ch != '.' && ch != '-') {
      return common::Status::error("workspace name contains an invalid character");
    }
  }
  return common::Status::success();
}

std::string workspace_folder(const std::string &name) {
  std::string folder = common::to_lower(name);
  for (auto &ch : folder) {
    if (ch == ' ') {
      ch = '-';
    }
  }
  return folder;
}

std::filesystem::path transcript_path(const Workspace &workspace) {
  return workspace.root / "history.jsonl";
}

std::filesystem::path memory_path(const Workspace &workspace) {
  return workspace.root / "CLAUDE.md";
}

std::filesystem::path state_path(const Workspace &workspace) { return workspace.root / ".state"; }

Store::Store(std::filesystem::path db_path, std::filesystem::path groups_dir)
    : db_path_(std::move(db_path)), groups_dir_(common::normalize_path(groups_dir)) {
  if (!db_path_.parent_path().empty()) {
    if (auto dir = common::ensure_dir(db_path_.parent_path()); !dir.ok()) {
      open_error_ = dir.error();
      return;
    }
  }
  if (auto dir = common::ensure_dir(groups_dir_); !dir.ok()) {
    open_error_ = dir.error();
    return;
  }
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 5000);
  if (auto schema = init_schema(); !schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

Store::~Store() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status Store::status() const {
  if (db_ == nullptr) {
    return common::Status::error(open_error_.empty() ? NOT_OPEN : open_error_);
  }
  return common::Status::success();
}

common::Status Store::init_schema() {
  return exec_sql(db_, R"(
PRAGMA foreign_keys = ON;
PRAGMA journal_mode = WAL;
CREATE TABLE IF NOT EXISTS groups (
  name TEXT PRIMARY KEY,
  folder TEXT NOT NULL UNIQUE,
  session_id TEXT,
  session_updated_at TEXT,
  created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS tasks (
  id TEXT PRIMARY KEY,
  group_name TEXT NOT NULL REFERENCES groups(name) ON DELETE CASCADE,
  cron TEXT NOT NULL,
  prompt TEXT NOT NULL,
  next_run INTEGER NOT NULL,
  last_run INTEGER,
  last_result TEXT,
  status TEXT NOT NULL DEFAULT 'active',
  created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_tasks_due ON tasks(status, next_run);
)");
}

Workspace Store::make_workspace(std::string name, std::string folder,
                                std::string created_at) const {
  Workspace workspace;
  workspace.root = groups_dir_ / folder;
  workspace.name = std::move(name);
  workspace.folder = std::move(folder);
  workspace.created_at = std::move(created_at);
  return workspace;
}

common::Status Store::ensure_layout(const Workspace &workspace) const {
  if (auto dir = common::ensure_dir(workspace.root); !dir.ok()) {
    return common::Status::error(dir.error());
  }
  if (auto dir = common::ensure_dir(state_path(workspace)); !dir.ok()) {
    return common::Status::error(dir.error());
  }
  std::error_code ec;
  const auto memory = memory_path(workspace);
  if (!std::filesystem::exists(memory, ec)) {
    std::ofstream out(memory);
    if (!out) {
      return common::Status::error("Unable to create " + memory.string());
    }
    out << "# " << workspace.name << "\n\nNotes kept here persist across sessions.\n";
  }
  const auto history = transcript_path(workspace);
  if (!std::filesystem::exists(history, ec)) {
    std::ofstream out(history, std::ios::app);
    if (!out) {
      return common::Status::error("Unable to create " + history.string());
    }
  }
  return common::Status::success();
}

common::Result<std::optional<Workspace>> Store::find_locked(const std::string &name) {
  Statement stmt(db_, "SELECT name, folder, created_at FROM groups WHERE name = ?1");
  if (!stmt.ok()) {
    return common::Result<std::optional<Workspace>>::failure(stmt.error());
  }
  stmt.bind(1, name);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return common::Result<std::optional<Workspace>>::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return common::Result<std::optional<Workspace>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::optional<Workspace>>::success(
      make_workspace(column_text(stmt.get(), 0), column_text(stmt.get(), 1),
                     column_text(stmt.get(), 2)));
}

common::Result<Workspace> Store::get_or_create_workspace(const std::string &name) {
  if (auto valid = validate_workspace_name(name); !valid.ok()) {
    return common::Result<Workspace>::failure(valid.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<Workspace>::failure(NOT_OPEN);
  }

  Transaction tx(db_);
  if (!tx.begin_status().ok()) {
    return common::Result<Workspace>::failure(tx.begin_status().error());
  }

  auto existing = find_locked(name);
  if (!existing.ok()) {
    return common::Result<Workspace>::failure(existing.error());
  }
  if (existing.value().has_value()) {
    Workspace workspace = *existing.value();
    if (auto layout = ensure_layout(workspace); !layout.ok()) {
      return common::Result<Workspace>::failure(layout.error());
    }
    return common::Result<Workspace>::success(std::move(workspace));
  }

  const std::string folder = workspace_folder(name);
  {
    Statement owner(db_, "SELECT name FROM groups WHERE folder = ?1");
    if (!owner.ok()) {
      return common::Result<Workspace>::failure(owner.error());
    }
    owner.bind(1, folder);
    if (sqlite3_step(owner.get()) == SQLITE_ROW) {
      return common::Result<Workspace>::failure("workspace folder '" + folder +
                                                "' already belongs to '" +
                                                column_text(owner.get(), 0) + "'");
    }
  }

  Workspace workspace = make_workspace(name, folder, common::now_rfc3339());
  if (!common::is_subpath(workspace.root, groups_dir_) || workspace.root == groups_dir_) {
    return common::Result<Workspace>::failure("workspace folder escapes the groups directory");
  }
  if (auto layout = ensure_layout(workspace); !layout.ok()) {
    return common::Result<Workspace>::failure(layout.error());
  }

  Statement insert(db_, "INSERT INTO groups(name, folder, created_at) VALUES(?1, ?2, ?3)");
  if (!insert.ok()) {
    return common::Result<Workspace>::failure(insert.error());
  }
  insert.bind(1, workspace.name);
  insert.bind(2, workspace.folder);
  insert.bind(3, workspace.created_at);
  if (sqlite3_step(insert.get()) != SQLITE_DONE) {
    return common::Result<Workspace>::failure(sqlite3_errmsg(db_));
  }
  if (auto committed = tx.commit(); !committed.ok()) {
    return common::Result<Workspace>::failure(committed.error());
  }
  return common::Result<Workspace>::success(std::move(workspace));
}

common::Result<std::optional<Workspace>> Store::find_workspace(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<Workspace>>::failure(NOT_OPEN);
  }
  return find_locked(name);
}

common::Result<std::optional<std::string>> Store::folder_owner(const std::string &folder) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<std::string>>::failure(NOT_OPEN);
  }
  Statement stmt(db_, "SELECT name FROM groups WHERE folder = ?1");
  if (!stmt.ok()) {
    return common::Result<std::optional<std::string>>::failure(stmt.error());
  }
  stmt.bind(1, folder);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return common::Result<std::optional<std::string>>::success(column_text(stmt.get(), 0));
  }
  return common::Result<std::optional<std::string>>::success(std::nullopt);
}

common::Result<std::vector<WorkspaceSummary>> Store::list_workspaces() {
  using ListResult = common::Result<std::vector<WorkspaceSummary>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ListResult::failure(NOT_OPEN);
  }
  Statement stmt(db_, "SELECT g.name, g.folder, g.created_at, g.session_id, g.session_updated_at, "
                      "(SELECT COUNT(*) FROM tasks t WHERE t.group_name = g.name AND "
                      "t.status = 'active') FROM groups g ORDER BY g.name ASC");
  if (!stmt.ok()) {
    return ListResult::failure(stmt.error());
  }

  std::vector<WorkspaceSummary> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    WorkspaceSummary summary;
    summary.workspace = make_workspace(column_text(stmt.get(), 0), column_text(stmt.get(), 1),
                                       column_text(stmt.get(), 2));
    const std::string session_id = column_text(stmt.get(), 3);
    if (!session_id.empty()) {
      summary.session = Session{session_id, column_text(stmt.get(), 4)};
    }
    summary.active_tasks = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 5));
    out.push_back(std::move(summary));
  }
  if (rc != SQLITE_DONE) {
    return ListResult::failure(sqlite3_errmsg(db_));
  }
  return ListResult::success(std::move(out));
}

common::Result<std::optional<Session>> Store::get_session(const std::string &name) {
  using SessionResult = common::Result<std::optional<Session>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return SessionResult::failure(NOT_OPEN);
  }
  Statement stmt(db_, "SELECT session_id, session_updated_at FROM groups WHERE name = ?1");
  if (!stmt.ok()) {
    return SessionResult::failure(stmt.error());
  }
  stmt.bind(1, name);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return SessionResult::failure("unknown workspace: " + name);
  }
  if (rc != SQLITE_ROW) {
    return SessionResult::failure(sqlite3_errmsg(db_));
  }
  const std::string id = column_text(stmt.get(), 0);
  if (id.empty()) {
    return SessionResult::success(std::nullopt);
  }
  return SessionResult::success(Session{id, column_text(stmt.get(), 1)});
}

common::Status Store::set_session(const std::string &name, const std::string &session_id) {
  if (common::trim(session_id).empty()) {
    return common::Status::error("refusing to store an empty session id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  Statement stmt(db_,
                 "UPDATE groups SET session_id = ?2, session_updated_at = ?3 WHERE name = ?1");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, name);
  stmt.bind(2, session_id);
  stmt.bind(3, common::now_rfc3339());
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error("unknown workspace: " + name);
  }
  return common::Status::success();
}

common::Result<bool> Store::clear_session(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(NOT_OPEN);
  }
  Statement stmt(db_, "UPDATE groups SET session_id = NULL, session_updated_at = NULL "
                      "WHERE name = ?1 AND session_id IS NOT NULL");
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  stmt.bind(1, name);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::string> Store::add_task(const NewTask &task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::string>::failure(NOT_OPEN);
  }
  if (common::trim(task.prompt).empty()) {
    return common::Result<std::string>::failure("task prompt is empty");
  }
  auto owner = find_locked(task.workspace);
  if (!owner.ok()) {
    return common::Result<std::string>::failure(owner.error());
  }
  if (!owner.value().has_value()) {
    return common::Result<std::string>::failure("unknown workspace: " + task.workspace);
  }

  for (int attempt = 0; attempt < TASK_ID_ATTEMPTS; ++attempt) {
    auto id = common::random_hex(4);
    if (!id.ok()) {
      return common::Result<std::string>::failure(id.error());
    }
    Statement stmt(db_, "INSERT INTO tasks(id, group_name, cron, prompt, next_run, status, "
                        "created_at) VALUES(?1, ?2, ?3, ?4, ?5, 'active', ?6)");
    if (!stmt.ok()) {
      return common::Result<std::string>::failure(stmt.error());
    }
    stmt.bind(1, id.value());
    stmt.bind(2, task.workspace);
    stmt.bind(3, task.trigger);
    stmt.bind(4, task.prompt);
    stmt.bind(5, common::to_unix_seconds(task.next_run));
    stmt.bind(6, common::now_rfc3339());
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      return common::Result<std::string>::success(id.value());
    }
    if (sqlite3_extended_errcode(db_) != SQLITE_CONSTRAINT_PRIMARYKEY) {
      return common::Result<std::string>::failure(sqlite3_errmsg(db_));
    }
  }
  return common::Result<std::string>::failure("could not allocate a unique task id");
}

common::Result<std::vector<Task>> Store::read_tasks(sqlite3_stmt *stmt) {
  std::vector<Task> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    Task task;
    task.id = column_text(stmt, 0);
    task.workspace = column_text(stmt, 1);
    task.trigger = column_text(stmt, 2);
    task.prompt = column_text(stmt, 3);
    task.next_run = common::from_unix_seconds(sqlite3_column_int64(stmt, 4));
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
      task.last_run = common::from_unix_seconds(sqlite3_column_int64(stmt, 5));
    }
    task.last_result = column_text(stmt, 6);
    task.status = task_status_from_string(column_text(stmt, 7));
    task.created_at = column_text(stmt, 8);
    out.push_back(std::move(task));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<Task>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<Task>>::success(std::move(out));
}

common::Result<std::optional<Task>> Store::get_task(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<Task>>::failure(NOT_OPEN);
  }
  const std::string sql = std::string("SELECT ") + TASK_COLUMNS + " FROM tasks WHERE id = ?1";
  Statement stmt(db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::optional<Task>>::failure(stmt.error());
  }
  stmt.bind(1, id);
  auto rows = read_tasks(stmt.get());
  if (!rows.ok()) {
    return common::Result<std::optional<Task>>::failure(rows.error());
  }
  if (rows.value().empty()) {
    return common::Result<std::optional<Task>>::success(std::nullopt);
  }
  return common::Result<std::optional<Task>>::success(std::move(rows.value().front()));
}

common::Result<std::vector<Task>> Store::list_tasks(const std::optional<std::string> &workspace) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<Task>>::failure(NOT_OPEN);
  }
  std::string sql = std::string("SELECT ") + TASK_COLUMNS + " FROM tasks";
  if (workspace.has_value()) {
    sql += " WHERE group_name = ?1";
  }
  sql += " ORDER BY created_at ASC, id ASC";
  Statement stmt(db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::vector<Task>>::failure(stmt.error());
  }
  if (workspace.has_value()) {
    stmt.bind(1, *workspace);
  }
  return read_tasks(stmt.get());
}

common::Result<std::vector<Task>> Store::due_tasks(common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<Task>>::failure(NOT_OPEN);
  }
  const std::string sql = std::string("SELECT ") + TASK_COLUMNS +
                          " FROM tasks WHERE status = 'active' AND next_run <= ?1 "
                          "ORDER BY next_run ASC, id ASC";
  Statement stmt(db_, sql.c_str());
  if (!stmt.ok()) {
    return common::Result<std::vector<Task>>::failure(stmt.error());
  }
  stmt.bind(1, common::to_unix_seconds(now));
  return read_tasks(stmt.get());
}

common::Result<bool> Store::delete_task(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(NOT_OPEN);
  }
  Statement stmt(db_, "DELETE FROM tasks WHERE id = ?1");
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  stmt.bind(1, id);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<bool> Store::claim_task(const std::string &id, common::TimePoint now,
                                       std::optional<common::TimePoint> next_run) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure(NOT_OPEN);
  }
  const char *sql = next_run.has_value()
                        ? "UPDATE tasks SET last_run = ?2, next_run = ?3 WHERE id = ?1 AND "
                          "status = 'active' AND next_run <= ?2"
                        : "UPDATE tasks SET last_run = ?2, status = 'completed' WHERE id = ?1 "
                          "AND status = 'active' AND next_run <= ?2";
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  stmt.bind(1, id);
  stmt.bind(2, common::to_unix_seconds(now));
  if (next_run.has_value()) {
    stmt.bind(3, common::to_unix_seconds(*next_run));
  }
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Status Store::defer_task(const std::string &id, common::TimePoint next_run) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  Statement stmt(db_, "UPDATE tasks SET next_run = ?2 WHERE id = ?1 AND status = 'active'");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, id);
  stmt.bind(2, common::to_unix_seconds(next_run));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status Store::record_task_result(const std::string &id, const std::string &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(NOT_OPEN);
  }
  Statement stmt(db_, "UPDATE tasks SET last_result = ?2 WHERE id = ?1");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, id);
  stmt.bind(2, truncate_utf8(result, MAX_TASK_RESULT_BYTES));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

} // namespace hermit::store
