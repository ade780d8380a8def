#ifndef SWEEP_RETENTIONCLEANUP_HPP
#define SWEEP_RETENTIONCLEANUP_HPP

#include <cstddef>
#include <cstdint>

class ArtifactStore;

// Deletes from disk every artifact whose latest build event is older than `retention_days`,
// then drops those events from the store. Best effort: a failed query aborts quietly.
// Returns the number of directories removed.
std::size_t RunRetentionCleanup(ArtifactStore& store, uint32_t retention_days);

#endif // SWEEP_RETENTIONCLEANUP_HPP
