#pragma once

#include <chatmine/model/conversation.h>

namespace chatmine::normalize {

/**
 * @brief Classify the entities of @p current against an earlier snapshot
 *
 * With no previous snapshot every thread and message is new. Otherwise a
 * thread or message is new when its id is absent from @p previous, and a
 * thread is updated when its id is present in both but the records differ.
 * Messages are append-only and never reported as updated. Output keeps the
 * order of @p current.
 *
 * Example usage:
 * @code
 *   if (!isEqual(previous, current)) {
 *       SnapshotDiff d = diff(&previous, current);
 *       push(d.newThreads, d.newMessages, d.updatedThreads);
 *   }
 * @endcode
 */
SnapshotDiff diff(const NormalizationResult* previous, const NormalizationResult& current);

/// True when both the thread and the message sequences are deep-equal
bool isEqual(const NormalizationResult& a, const NormalizationResult& b);

} // namespace chatmine::normalize
