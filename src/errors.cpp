#include <pitwall/errors.hpp>

namespace pitwall {

InsufficientDataError::InsufficientDataError(const std::string& track_id, Compound compound,
                                             std::size_t found, std::size_t required)
  : Error("insufficient data for " + track_id + "/" + to_string(compound) + ": " +
          std::to_string(found) + " usable laps, need " + std::to_string(required)),
    track_id_(track_id), compound_(compound), found_(found), required_(required) {}

InsufficientDataError::InsufficientDataError(const std::string& track_id, Compound compound,
                                             const std::string& reason)
  : Error("insufficient data for " + track_id + "/" + to_string(compound) + ": " + reason),
    track_id_(track_id), compound_(compound) {}

ModelNotFittedError::ModelNotFittedError(const std::string& track_id, Compound compound)
  : Error("no fitted degradation model for " + track_id + "/" + to_string(compound)),
    track_id_(track_id), compound_(compound) {}

} // namespace pitwall
