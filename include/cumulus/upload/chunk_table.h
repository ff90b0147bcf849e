#pragma once

#include <cumulus/upload/upload_part.h>
#include <cumulus/types.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cumulus
{

class BackoffTimer;

namespace upload
{

// Tracks a single part of the upload.
struct ChunkEntry
{
    PendingPart mPart;

    PartState mState = PS_PENDING;

    // How many times have we tried to upload this part?
    unsigned int mAttempts = 0u;

    // The part's content, held until the part is confirmed.
    std::shared_ptr<const std::string> mData;

    // What the service told us about the part.
    std::optional<CompletedPart> mCompleted;

    // Why did the last attempt fail?
    Error mLastError = API_OK;

    // Created on the first transient failure.
    std::unique_ptr<BackoffTimer> mBackoff;
}; // ChunkEntry

// Maps each part, by index, to its upload state.
//
// Entries are ordered by offset and partition [0, totalSize) exactly.
class ChunkTable
{
    std::vector<ChunkEntry> mEntries;

    m_off_t mTotalSize = 0;

public:
    ChunkTable();

    ChunkTable(m_off_t totalSize, m_off_t partSize);

    ChunkTable(ChunkTable&& other);

    ~ChunkTable();

    ChunkTable& operator=(ChunkTable&& rhs);

    ChunkEntry& operator[](std::size_t index);

    const ChunkEntry& operator[](std::size_t index) const;

    // Confirmed parts, ordered by offset.
    CompletedPartVector completedParts() const;

    // Forget all parts.
    void clear();

    // Has every part been confirmed?
    bool complete() const;

    // How many parts are in this state?
    std::size_t count(PartState state) const;

    bool empty() const;

    std::size_t size() const;

    m_off_t totalSize() const;
}; // ChunkTable

} // upload
} // cumulus
