#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include "file_info.hpp"

// What to do with a remote FileInfo given what we have locally.
enum class Resolution {
  KeepLocal,          // local equal or newer
  TakeRemote,         // remote strictly newer, or nothing local
  Merge,              // concurrent, same content: adopt the winner's record
  ConflictRemoteWins, // concurrent, different content, remote wins
  ConflictLocalWins   // concurrent, different content, local wins
};

const char* to_string(Resolution resolution);

// Deterministic and commutative: for distinct records exactly one of
// wins_conflict(a, b) and wins_conflict(b, a) holds.
// Valid beats invalid, existing beats deleted, later modification time
// wins, then the larger modified_by device id.
bool wins_conflict(const FileInfo& a, const FileInfo& b);

Resolution resolve(const std::optional<FileInfo>& local, const FileInfo& remote);

// "<stem>.sync-conflict-YYYYMMDD-HHMMSS-<device><.ext>", in the same
// directory as name.
std::string conflict_name(const std::string& name, const std::string& device, std::time_t when);
bool is_conflict_name(const std::string& name);

// A regular file among candidates with exactly target's block sequence.
std::optional<FileInfo> find_rename_source(const std::vector<FileInfo>& candidates,
                                           const FileInfo& target);
