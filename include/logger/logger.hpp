#ifndef JIGSAW_LOGGER_HPP
#define JIGSAW_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace jigsaw::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a file sink (and optionally a console sink) on the logging core.
// Any sinks installed earlier are removed first.
void init_logging(const std::string& log_file = "jigsaw.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Adjust the minimum severity passed to the sinks
void set_log_level(severity_level level);

void enable_logging();
void disable_logging();

// Verbosity 1 is the most talkative, every other level logs at info
severity_level severity_for_verbosity(unsigned int verbosity);

} // namespace jigsaw::logging

#endif // JIGSAW_LOGGER_HPP
