#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <variant>
#include <vector>

namespace herald::logfile {

typedef std::shared_ptr<spdlog::logger> logger_t;

/*
    Stands in for a logfile that is not known yet. Every line written is
    kept, in order, until the session replays them into the real logfile.
*/
class logging_cache_c
    : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
public:
  const std::vector<std::string> &lines() const { return lines_; }
  void clear() { lines_.clear(); }

protected:
  void sink_it_(const spdlog::details::log_msg &msg) override;
  void flush_() override {}

private:
  std::vector<std::string> lines_;
};

using logging_cache_t = std::shared_ptr<logging_cache_c>;

/*
    Where log lines go: nowhere (false / default), the default file
    ".<prog>.log" (true), an explicit path, a caller owned stream, or a
    logging cache.
*/
class destination_c {
public:
  destination_c() = default;
  destination_c(bool enable);
  destination_c(const char *path);
  destination_c(std::string path);
  destination_c(std::filesystem::path path);
  destination_c(std::ostream &stream);
  destination_c(logging_cache_t cache);

  bool enabled() const;
  bool is_default_path() const;
  std::optional<std::filesystem::path> path() const;
  std::ostream *stream() const;
  logging_cache_t cache() const;

private:
  std::variant<std::monostate, bool, std::filesystem::path, std::ostream *,
               logging_cache_t>
      target_;
};

class logfile_c {
public:
  /*
      Opens the destination. Returns nullptr when the destination is
      disabled. An existing file is first moved aside to
      "<path><prev_suffix>" when prev_suffix is not empty.
      Raises std::filesystem::filesystem_error when the file cannot be
      moved or opened.
  */
  static std::unique_ptr<logfile_c> open(const destination_c &destination,
                                         const std::string &prog_name,
                                         const std::string &prev_suffix = "");

  logfile_c(const logfile_c &) = delete;
  logfile_c &operator=(const logfile_c &) = delete;

  // One call is one entry; the writer terminates it with a newline
  void write(const std::string &text);
  void flush();

  bool is_cache() const { return cache_ != nullptr; }
  logging_cache_t cache() const { return cache_; }
  const std::optional<std::filesystem::path> &path() const { return path_; }

private:
  logfile_c(logger_t logger, logging_cache_t cache,
            std::optional<std::filesystem::path> path);

  logger_t logger_;
  logging_cache_t cache_;
  std::optional<std::filesystem::path> path_;
};

} // namespace herald::logfile
