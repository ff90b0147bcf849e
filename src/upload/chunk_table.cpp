#include <algorithm>

#include <cumulus/backofftimer.h>
#include <cumulus/upload/chunk_table.h>

namespace cumulus
{
namespace upload
{

ChunkTable::ChunkTable()
  : mEntries()
  , mTotalSize(0)
{
}

ChunkTable::ChunkTable(m_off_t totalSize, m_off_t partSize)
  : mEntries()
  , mTotalSize(totalSize)
{
    auto parts = partition(totalSize, partSize);

    mEntries.resize(parts.size());

    for (std::size_t i = 0; i < parts.size(); ++i)
        mEntries[i].mPart = parts[i];
}

ChunkTable::ChunkTable(ChunkTable&& other) = default;

ChunkTable::~ChunkTable() = default;

ChunkTable& ChunkTable::operator=(ChunkTable&& rhs) = default;

ChunkEntry& ChunkTable::operator[](std::size_t index)
{
    return mEntries.at(index);
}

const ChunkEntry& ChunkTable::operator[](std::size_t index) const
{
    return mEntries.at(index);
}

CompletedPartVector ChunkTable::completedParts() const
{
    CompletedPartVector parts;

    for (auto& entry : mEntries)
    {
        if (entry.mCompleted)
            parts.emplace_back(*entry.mCompleted);
    }

    // The service may not echo our offsets in the order we'd expect.
    std::stable_sort(parts.begin(),
                     parts.end(),
                     [](const CompletedPart& lhs, const CompletedPart& rhs) {
                         return lhs.mOffset < rhs.mOffset;
                     });

    return parts;
}

void ChunkTable::clear()
{
    mEntries.clear();
    mTotalSize = 0;
}

bool ChunkTable::complete() const
{
    return count(PS_COMPLETED) == mEntries.size();
}

std::size_t ChunkTable::count(PartState state) const
{
    return static_cast<std::size_t>(std::count_if(mEntries.begin(),
                                                  mEntries.end(),
                                                  [state](const ChunkEntry& entry) {
                                                      return entry.mState == state;
                                                  }));
}

bool ChunkTable::empty() const
{
    return mEntries.empty();
}

std::size_t ChunkTable::size() const
{
    return mEntries.size();
}

m_off_t ChunkTable::totalSize() const
{
    return mTotalSize;
}

} // upload
} // cumulus
