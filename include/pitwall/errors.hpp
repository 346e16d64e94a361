#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <pitwall/compound.hpp>

namespace pitwall {

// Base for every error the strategy core raises.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Fit requested with fewer usable laps than required.
class InsufficientDataError : public Error {
public:
  InsufficientDataError(const std::string& track_id, Compound compound,
                        std::size_t found, std::size_t required);
  InsufficientDataError(const std::string& track_id, Compound compound,
                        const std::string& reason);

  const std::string& track_id() const { return track_id_; }
  Compound compound() const { return compound_; }
  std::size_t found() const { return found_; }
  std::size_t required() const { return required_; }

private:
  std::string track_id_;
  Compound compound_;
  std::size_t found_ = 0;
  std::size_t required_ = 0;
};

// Prediction or optimization for a (track, compound) with no stored model.
class ModelNotFittedError : public Error {
public:
  ModelNotFittedError(const std::string& track_id, Compound compound);

  const std::string& track_id() const { return track_id_; }
  Compound compound() const { return compound_; }

private:
  std::string track_id_;
  Compound compound_;
};

// Decision point outside the race or otherwise malformed.
class InvalidRaceStateError : public Error {
public:
  using Error::Error;
};

} // namespace pitwall
