#include "herald/logfile/logfile.hpp"
#include <cerrno>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <system_error>

namespace herald::logfile {

namespace {

logger_t make_writer(spdlog::sink_ptr sink) {
  auto logger = std::make_shared<spdlog::logger>("logfile", std::move(sink));
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::trace);
  return logger;
}

} // namespace

void logging_cache_c::sink_it_(const spdlog::details::log_msg &msg) {
  lines_.emplace_back(msg.payload.data(), msg.payload.size());
}

destination_c::destination_c(bool enable) : target_(enable) {}

destination_c::destination_c(const char *path)
    : target_(std::filesystem::path(path)) {}

destination_c::destination_c(std::string path)
    : target_(std::filesystem::path(std::move(path))) {}

destination_c::destination_c(std::filesystem::path path)
    : target_(std::move(path)) {}

destination_c::destination_c(std::ostream &stream) : target_(&stream) {}

destination_c::destination_c(logging_cache_t cache)
    : target_(std::move(cache)) {}

bool destination_c::enabled() const {
  if (std::holds_alternative<std::monostate>(target_)) {
    return false;
  }
  if (auto *flag = std::get_if<bool>(&target_)) {
    return *flag;
  }
  if (auto *cache = std::get_if<logging_cache_t>(&target_)) {
    return *cache != nullptr;
  }
  return true;
}

bool destination_c::is_default_path() const {
  auto *flag = std::get_if<bool>(&target_);
  return flag && *flag;
}

std::optional<std::filesystem::path> destination_c::path() const {
  if (auto *path = std::get_if<std::filesystem::path>(&target_)) {
    return *path;
  }
  return std::nullopt;
}

std::ostream *destination_c::stream() const {
  if (auto *stream = std::get_if<std::ostream *>(&target_)) {
    return *stream;
  }
  return nullptr;
}

logging_cache_t destination_c::cache() const {
  if (auto *cache = std::get_if<logging_cache_t>(&target_)) {
    return *cache;
  }
  return nullptr;
}

logfile_c::logfile_c(logger_t logger, logging_cache_t cache,
                     std::optional<std::filesystem::path> path)
    : logger_(std::move(logger)), cache_(std::move(cache)),
      path_(std::move(path)) {}

std::unique_ptr<logfile_c> logfile_c::open(const destination_c &destination,
                                           const std::string &prog_name,
                                           const std::string &prev_suffix) {
  if (!destination.enabled()) {
    return nullptr;
  }

  if (auto cache = destination.cache()) {
    return std::unique_ptr<logfile_c>(
        new logfile_c(make_writer(cache), cache, std::nullopt));
  }

  if (auto *stream = destination.stream()) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(*stream);
    return std::unique_ptr<logfile_c>(
        new logfile_c(make_writer(sink), nullptr, std::nullopt));
  }

  std::filesystem::path path;
  if (destination.is_default_path()) {
    path = prog_name.empty() ? ".log" : "." + prog_name + ".log";
  } else {
    path = *destination.path();
  }

  if (!prev_suffix.empty() && std::filesystem::exists(path)) {
    std::filesystem::path previous = path;
    previous += prev_suffix;
    std::filesystem::rename(path, previous);
  }

  try {
    auto sink =
        std::make_shared<spdlog::sinks::basic_file_sink_st>(path.string(),
                                                            true);
    return std::unique_ptr<logfile_c>(
        new logfile_c(make_writer(sink), nullptr, path));
  } catch (const spdlog::spdlog_ex &e) {
    int code = errno ? errno : EIO;
    throw std::filesystem::filesystem_error(
        e.what(), path, std::error_code(code, std::generic_category()));
  }
}

void logfile_c::write(const std::string &text) { logger_->info("{}", text); }

void logfile_c::flush() { logger_->flush(); }

} // namespace herald::logfile
