#pragma once

// Identifiers for the placed-structure save document (content::SaveRegistryJson /
// LoadRegistryJson and any tool that reads those files).

namespace outpost::content::savefmt {

inline constexpr const char* kStructuresFormat = "Outpost.Structures";
// Version history
//  v1: structures + storages keyed by resource id, sim clock, next id
inline constexpr int         kStructuresVersion = 1;

} // namespace outpost::content::savefmt
