#ifndef CRUNCH_LOGGER_HPP
#define CRUNCH_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace crunch::logging {

// Routes Boost.Log records to the console and, when log_file is non-empty,
// to that file as well. Records below min_level are dropped.
void init(const std::string& log_file = "",
          boost::log::trivial::severity_level min_level = boost::log::trivial::info);

// Adjusts the minimum severity after init
void set_log_level(boost::log::trivial::severity_level min_level);

} // namespace crunch::logging

#endif // CRUNCH_LOGGER_HPP
