#ifndef TETHER_MODEL_TYPES_HPP
#define TETHER_MODEL_TYPES_HPP

#include <cstdint>

namespace tether {

// a logical timestamp - one is allocated for each persistence transaction
typedef int64_t listen_sequence_number;

// identifies an active target (query subscription)
typedef int32_t target_id;

// identifies a batch of pending writes within a mutation queue
typedef int32_t batch_id;

// the (server) version of a document or target, in microseconds
typedef int64_t snapshot_version;

} // namespace tether

#endif
