#pragma once

#include <stdexcept>
#include <string>

namespace amo {

/*
  Every error below is fatal to the run. main() reports the message on the
  diagnostic stream and exits non-zero without writing the artifact.
*/

// Transport failure or unexpected HTTP status.
class FetchError : public std::runtime_error {
public:
  explicit FetchError(const std::string &msg, long httpStatus = 0)
      : std::runtime_error(msg), httpStatus_(httpStatus) {}

  long httpStatus() const { return httpStatus_; }

private:
  long httpStatus_;
};

// Search response is not JSON or does not have the envelope shape.
class MalformedEnvelopeError : public std::runtime_error {
public:
  explicit MalformedEnvelopeError(const std::string &msg)
      : std::runtime_error(msg) {}
};

class MissingRequiredFieldError : public std::runtime_error {
public:
  explicit MissingRequiredFieldError(const std::string &field)
      : std::runtime_error("missing required field: " + field),
        field_(field) {}

  MissingRequiredFieldError(const std::string &field, const std::string &msg)
      : std::runtime_error(msg), field_(field) {}

  const std::string &field() const { return field_; }

private:
  std::string field_;
};

class MissingLocaleValueError : public std::runtime_error {
public:
  MissingLocaleValueError(const std::string &field, const std::string &locale)
      : std::runtime_error("field " + field + " has no value for locale " +
                           locale),
        field_(field), locale_(locale) {}

  const std::string &field() const { return field_; }
  const std::string &locale() const { return locale_; }

private:
  std::string field_;
  std::string locale_;
};

class MalformedHashError : public std::runtime_error {
public:
  explicit MalformedHashError(const std::string &msg)
      : std::runtime_error(msg) {}
};

} // namespace amo
