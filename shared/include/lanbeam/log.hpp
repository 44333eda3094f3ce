#pragma once

#include <string>

namespace lanbeam {

// thread-safe console log, optionally mirrored to a file
void log_info(const std::string &msg);
void log_warning(const std::string &msg);
void log_error(const std::string &msg);

void set_log_file(const std::string &path);
void set_log_quiet(const bool &quiet);

} // namespace lanbeam
