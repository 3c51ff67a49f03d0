#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <gscoach/snapshot.hpp>

namespace gscoach {

// Decode one game-state-integration payload. Returns nullopt (and logs a
// warning) when the text is not JSON or a known field has the wrong type.
// Unknown fields are ignored; absent ones stay empty.
std::optional<Snapshot> decode_snapshot(const std::string& text);
std::optional<Snapshot> decode_snapshot(const nlohmann::json& doc);

// JSON-lines capture: one payload per line, blank lines skipped, undecodable
// lines logged and skipped.
std::vector<Snapshot> load_capture_stream(std::istream& in);

// Wrapper over load_capture_stream; nullopt if the file cannot be opened.
std::optional<std::vector<Snapshot>> load_capture_file(const std::string& path);

} // namespace gscoach
