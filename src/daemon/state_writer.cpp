#include "hermit/daemon/state_writer.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/time.hpp"
#include "hermit/health/health.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace hermit::daemon {

StateWriter::StateWriter(std::filesystem::path state_file, const std::chrono::seconds interval,
                         ExtraFields extra_fields)
    : state_file_(std::move(state_file)), interval_(interval),
      extra_fields_(std::move(extra_fields)) {}

StateWriter::~StateWriter() { stop(); }

void StateWriter::start() {
  if (running_) {
    return;
  }
  running_ = true;
  started_at_ = std::chrono::steady_clock::now();
  thread_ = std::thread([this]() { write_loop(); });
}

void StateWriter::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (was_running) {
    std::error_code ec;
    std::filesystem::remove(state_file_, ec);
  }
}

bool StateWriter::is_running() const { return running_; }

void StateWriter::write_loop() {
  const long long steps = std::max<long long>(1, interval_.count() * 10);
  while (running_) {
    write_state();
    for (long long i = 0; i < steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

void StateWriter::write_state() const {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();

  std::ostringstream json;
  json << "{";
  json << "\"written_at\":\"" << common::now_rfc3339() << "\",";
  json << "\"pid\":" << getpid() << ",";
  json << "\"uptime_seconds\":" << uptime << ",";
  if (extra_fields_) {
    const std::string extra = extra_fields_();
    if (!extra.empty()) {
      json << extra << ",";
    }
  }
  json << "\"components\":" << health::components_json();
  json << "}";

  auto written = common::write_file_atomic(state_file_, json.str());
  if (!written.ok()) {
    std::cerr << "[daemon] state write failed: " << written.error() << "\n";
  }
}

} // namespace hermit::daemon
