#pragma once

#include "session/SessionSnapshot.hpp"

#include <optional>
#include <string>

namespace letterfall::session {

/// Serialize a snapshot into newline-separated text records of the form
/// "TAG;field;field". Fields are escaped so ';', '\\' and newlines survive.
std::string serialize(const SessionSnapshot& snapshot);

/// Parse text produced by serialize(). Returns std::nullopt on any
/// malformed, missing or unknown record.
std::optional<SessionSnapshot> deserialize(const std::string& text);

} // namespace letterfall::session
