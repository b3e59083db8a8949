// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "AssignmentTable.h"

namespace abtesting
{
  std::string AssignmentTable::makeKey(const std::string& userId, const std::string& experimentId)
  {
    std::string key;
    key.reserve(experimentId.size() + userId.size() + 1);
    key.append(experimentId);
    key.push_back('\x1f');
    key.append(userId);
    return key;
  }

  const AssignmentTable::Shard& AssignmentTable::shardFor(const std::string& key) const
  {
    return mShards[std::hash<std::string>{}(key) % kNumShards];
  }

  AssignmentTable::Shard& AssignmentTable::shardFor(const std::string& key)
  {
    return mShards[std::hash<std::string>{}(key) % kNumShards];
  }

  std::optional<Assignment> AssignmentTable::find(const std::string& userId,
                                                  const std::string& experimentId) const
  {
    const std::string key = makeKey(userId, experimentId);
    const Shard& shard = shardFor(key);

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.assignments.find(key);
    if (it == shard.assignments.end())
      return std::nullopt;

    return it->second;
  }

  std::pair<Assignment, bool> AssignmentTable::assignIfAbsent(const std::string& userId,
                                                              const std::string& experimentId,
                                                              const AssignmentContext& context,
                                                              const VariantChooser& chooser)
  {
    const std::string key = makeKey(userId, experimentId);
    Shard& shard = shardFor(key);

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.assignments.find(key);
    if (it != shard.assignments.end())
      return { it->second, false };

    Assignment assignment{ userId, experimentId, chooser(), context,
                           boost::posix_time::microsec_clock::universal_time() };
    shard.assignments.emplace(key, assignment);

    {
      std::lock_guard<std::mutex> countsLock(mCountsMutex);
      ++mVariantCounts[experimentId][assignment.variant];
      ++mTotal;
    }

    return { assignment, true };
  }

  std::map<std::string, std::size_t> AssignmentTable::getVariantCounts(const std::string& experimentId) const
  {
    std::lock_guard<std::mutex> lock(mCountsMutex);
    auto it = mVariantCounts.find(experimentId);
    if (it == mVariantCounts.end())
      return {};

    return it->second;
  }

  std::size_t AssignmentTable::size() const
  {
    std::lock_guard<std::mutex> lock(mCountsMutex);
    return mTotal;
  }
}
