#include "faultline/error/log.hpp"

#include "faultline/codec/dump.hpp"
#include "faultline/core/settings.hpp"
#include "faultline/error/serialize.hpp"

namespace faultline {

std::string format_log_line(const Error& error) {
  codec::DumpOptions options;
  options.multiline = false;

  std::string line = error.to_string();
  line.append(" ").append(codec::dump_record(to_record(error), options));
  return line;
}

bool log_error(const Error& error, core::LogLevel level) {
  const auto& config = core::settings();
  if (!config.log_errors || level < config.log_level || !core::should_log(level)) {
    return false;
  }
  core::write_log(level, format_log_line(error));
  return true;
}

}  // namespace faultline
