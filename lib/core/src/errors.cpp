#include <core/errors.hpp>

#include <utility>

namespace devicecheck::core {

upstream_error::upstream_error(unsigned status_code, std::string description)
  : error(description.empty() ? std::to_string(status_code) : std::to_string(status_code) + " " + description),
    status_code_(status_code), description_(std::move(description))
{}

}// namespace devicecheck::core
