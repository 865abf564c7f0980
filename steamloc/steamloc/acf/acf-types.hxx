#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace steamloc
{
  // Failure kinds raised while parsing or querying an ACF/VDF tree.
  //
  enum class acf_error
  {
    malformed_document, // Grammar violation while parsing.
    schema_mismatch,    // Well-formed tree of the wrong shape.
    not_found           // Requested key/app id/user is absent.
  };

  std::string
  to_string (acf_error);

  inline std::ostream&
  operator<< (std::ostream& os, acf_error e)
  {
    return os << to_string (e);
  }

  // Description of a failure.
  //
  // For malformed_document, position is the index of the offending fragment
  // (or the fragment count if we ran out of input) and expected/found
  // describe the violation. For schema_mismatch, expected holds the root key
  // (or key path) the accessor requires. For not_found, expected holds the
  // key that was looked up.
  //
  struct acf_failure
  {
    acf_error kind = acf_error::malformed_document;
    std::size_t position = 0;
    std::string expected;
    std::string found;

    std::string
    description () const;
  };

  acf_failure
  malformed_document (std::size_t position,
                      std::string expected,
                      std::string found);

  acf_failure
  schema_mismatch (std::string expected_root_key);

  acf_failure
  not_found (std::string key);

  // Thrown by acf_result::value() when the result holds a failure.
  //
  class acf_exception: public std::runtime_error
  {
  public:
    explicit
    acf_exception (acf_failure f)
      : std::runtime_error (f.description ()), failure_ (std::move (f)) {}

    const acf_failure&
    failure () const noexcept
    {
      return failure_;
    }

  private:
    acf_failure failure_;
  };

  // Value or failure.
  //
  template <typename T>
  class acf_result
  {
  public:
    using value_type = T;

    acf_result (T v): value_ (std::move (v)) {}
    acf_result (acf_failure f): failure_ (std::move (f)) {}

    bool
    has_value () const noexcept
    {
      return value_.has_value ();
    }

    explicit operator bool () const noexcept
    {
      return has_value ();
    }

    const T&
    value () const&
    {
      if (!value_)
        throw acf_exception (failure_);

      return *value_;
    }

    T&&
    value () &&
    {
      if (!value_)
        throw acf_exception (failure_);

      return std::move (*value_);
    }

    const T& operator* () const& {return *value_;}
    const T* operator-> () const {return &*value_;}

    // Only meaningful if !has_value().
    //
    const acf_failure&
    failure () const noexcept
    {
      return failure_;
    }

    acf_error
    error () const noexcept
    {
      return failure_.kind;
    }

  private:
    std::optional<T> value_;
    acf_failure failure_;
  };
}
