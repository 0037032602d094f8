#pragma once

#include <cstdint>
#include <string>

namespace resync {

/// Milliseconds since the Unix epoch (wall clock, survives restarts).
int64_t now_epoch_ms();

/// Unique item id of the form "sync_<epoch-ms>_<9 base36 chars>".
std::string generate_sync_id();

/// True if `s` is well-formed UTF-8 (what the JSON snapshots can carry verbatim).
bool is_valid_utf8(const std::string& s);

}  // namespace resync
