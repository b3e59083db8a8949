// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTESTING_ASSIGNMENT_TABLE_H
#define __ABTESTING_ASSIGNMENT_TABLE_H 1

#include <array>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "Experiment.h"

namespace abtesting
{
  struct Assignment
  {
    std::string userId;
    std::string experimentId;
    std::string variant;
    AssignmentContext context;   // kept for contextual bandit reward updates
    boost::posix_time::ptime assignedAt;
  };

  /**
   * @class AssignmentTable
   * @brief Sticky (user, experiment) -> variant map.
   *
   * Keys are spread over a fixed number of lock shards. assignIfAbsent holds
   * the shard lock while the chooser runs, so each pair is assigned at most
   * once even under concurrent requests for the same user.
   */
  class AssignmentTable
  {
  public:
    using VariantChooser = std::function<std::string()>;

    AssignmentTable() = default;
    AssignmentTable(const AssignmentTable&) = delete;
    AssignmentTable& operator=(const AssignmentTable&) = delete;

    std::optional<Assignment> find(const std::string& userId, const std::string& experimentId) const;

    /**
     * @brief Returns the existing assignment, or stores the variant picked by chooser.
     * @return {assignment, true if it was created by this call}
     */
    std::pair<Assignment, bool> assignIfAbsent(const std::string& userId,
                                               const std::string& experimentId,
                                               const AssignmentContext& context,
                                               const VariantChooser& chooser);

    /// Number of users assigned to each variant of the experiment.
    std::map<std::string, std::size_t> getVariantCounts(const std::string& experimentId) const;

    std::size_t size() const;

  private:
    static constexpr std::size_t kNumShards = 32;

    struct Shard
    {
      mutable std::mutex mutex;
      std::unordered_map<std::string, Assignment> assignments;
    };

    static std::string makeKey(const std::string& userId, const std::string& experimentId);
    const Shard& shardFor(const std::string& key) const;
    Shard& shardFor(const std::string& key);

    std::array<Shard, kNumShards> mShards;

    mutable std::mutex mCountsMutex;
    std::map<std::string, std::map<std::string, std::size_t>> mVariantCounts;
    std::size_t mTotal = 0;
  };
}

#endif
